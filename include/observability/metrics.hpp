#ifndef CINEMA_METRICS_HPP_
#define CINEMA_METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cinema {
namespace observability {

/**
 * Metrics collection for the booking engine.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Attach HELP text to a metric. Undescribed metrics export a generic line.
  void describe(const std::string& name, const std::string& help);

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  void incrementGauge(const std::string& name, double value = 1.0);
  void decrementGauge(const std::string& name, double value = 1.0);

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  // Point reads; zero for a metric never touched.
  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  std::size_t histogramCount(const std::string& name) const;

  // Records elapsed seconds into a histogram on destruction.
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  // Reset all metrics
  void reset();

 private:
  struct Counter {
    double value{0.0};
  };

  struct Gauge {
    double value{0.0};
  };

  struct HistogramBucket {
    double upper_bound;
    std::size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const char* fallback) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Counter> counters_;
  std::unordered_map<std::string, Gauge> gauges_;
  std::unordered_map<std::string, Histogram> histograms_;
  std::unordered_map<std::string, std::string> help_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

// Engine metric names
namespace metric {
constexpr const char* kBookingsReserved = "cinema_bookings_reserved_total";
constexpr const char* kSeatConflicts = "cinema_seat_conflicts_total";
constexpr const char* kBookingsCancelled = "cinema_bookings_cancelled_total";
constexpr const char* kBookingsExpired = "cinema_bookings_expired_total";
constexpr const char* kPaymentsRecorded = "cinema_payments_recorded_total";
constexpr const char* kDoublePaymentRejections = "cinema_double_payment_rejections_total";
constexpr const char* kReserveSeconds = "cinema_reserve_seconds";
constexpr const char* kPaymentRecordSeconds = "cinema_payment_record_seconds";
constexpr const char* kQueuedRequests = "cinema_queued_requests";
}  // namespace metric

// Registers HELP text for the engine metrics above.
void describeEngineMetrics(MetricsCollector& metrics);

}  // namespace observability
}  // namespace cinema

#endif  // CINEMA_METRICS_HPP_
