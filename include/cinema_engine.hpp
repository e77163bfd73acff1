#ifndef CINEMA_ENGINE_HPP_
#define CINEMA_ENGINE_HPP_

#include "booking_store.hpp"
#include "catalog_store.hpp"
#include "clock.hpp"
#include "concurrent/request_processor.hpp"
#include "consistency_coordinator.hpp"
#include "observability/metrics.hpp"
#include "payment_ledger.hpp"
#include "reservation_ledger.hpp"
#include "schedule_manager.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace cinema {

/**
 * Wires the configured store, the clock and the four booking components,
 * plus the worker pool that runs requests against them.
 */
class CinemaEngine {
 public:
  /**
   * Configuration for the engine.
   */
  struct Config {
    std::string backend = "memory";  // "memory" or "postgres"
    std::string db_host = "localhost";
    int db_port = 5432;
    std::string db_name = "cinema";
    std::string db_username = "cinema";
    std::string db_password = "";
    int max_connections = 8;
    int connection_timeout = 10;  // seconds
    std::string schema_path = "database/schema.sql";
    std::size_t worker_threads = 4;
    std::string log_level = "info";
    bool seed_demo_data = false;
  };

  explicit CinemaEngine(const Config& config,
                        std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
                        observability::MetricsCollector& metrics =
                            observability::getGlobalMetrics());

  /**
   * Runs over a caller-built store instead of the configured backend.
   */
  CinemaEngine(const Config& config, std::unique_ptr<BookingStore> store,
               std::shared_ptr<const Clock> clock,
               observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  ~CinemaEngine();

  // Non-copyable
  CinemaEngine(const CinemaEngine&) = delete;
  CinemaEngine& operator=(const CinemaEngine&) = delete;

  /**
   * Open the store (connect and apply the schema for postgres), build the
   * components, start the workers and seed demo data if configured.
   */
  bool initialize();

  /**
   * Stop the workers. Pending submissions complete first.
   */
  void shutdown();

  bool isInitialized() const { return initialized_; }

  // Valid after initialize() returned true; throw STORAGE_UNAVAILABLE before.
  CatalogStore& catalog();
  ScheduleManager& schedules();
  ReservationLedger& reservations();
  PaymentLedger& payments();
  ConsistencyCoordinator& coordinator();
  concurrent::RequestProcessor& processor();

  const Clock& clock() const { return *clock_; }
  const Config& config() const { return config_; }
  observability::MetricsCollector& metrics() { return metrics_; }

 private:
  bool openStore();
  void requireInitialized() const;

  Config config_;
  std::shared_ptr<const Clock> clock_;
  observability::MetricsCollector& metrics_;

  std::unique_ptr<BookingStore> store_;
  std::unique_ptr<ConsistencyCoordinator> coordinator_;
  std::unique_ptr<CatalogStore> catalog_;
  std::unique_ptr<ScheduleManager> schedules_;
  std::unique_ptr<ReservationLedger> reservations_;
  std::unique_ptr<PaymentLedger> payments_;
  std::unique_ptr<concurrent::RequestProcessor> processor_;
  bool initialized_ = false;
};

}  // namespace cinema

#endif  // CINEMA_ENGINE_HPP_
