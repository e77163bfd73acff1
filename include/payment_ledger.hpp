#ifndef CINEMA_PAYMENT_LEDGER_HPP_
#define CINEMA_PAYMENT_LEDGER_HPP_

#include "cinema_types.hpp"
#include "clock.hpp"
#include "consistency_coordinator.hpp"
#include "observability/metrics.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cinema {

struct PaymentRequest {
  Id booking_id = 0;
  Id account_id = 0;
  Money amount = 0;
  PaymentMethod method = PaymentMethod::CARD;
  PaymentStatus status = PaymentStatus::PENDING;
  std::optional<std::string> reference;
};

/**
 * Payment attempts against bookings. Any number of PENDING or FAILED
 * attempts may exist per booking, but at most one SUCCESS.
 */
class PaymentLedger {
 public:
  PaymentLedger(ConsistencyCoordinator& coordinator, const Clock& clock,
                observability::MetricsCollector& metrics);

  // Non-copyable
  PaymentLedger(const PaymentLedger&) = delete;
  PaymentLedger& operator=(const PaymentLedger&) = delete;

  /**
   * Records a payment attempt stamped with server time.
   *
   * Throws INVALID_QUANTITY for an amount outside (0, 10,000,000.00],
   * INVALID_INPUT for an over-long reference, REFERENCE_NOT_FOUND for an
   * unknown booking or payer, CONFLICT when the booking is cancelled or
   * expired, ALREADY_PAID when a SUCCESS is recorded for a booking that
   * already has one.
   */
  PaymentView Record(const PaymentRequest& request);

  /**
   * Rewrites payment `id` under the same rules as Record. The payment itself
   * is excluded from the already-paid check and keeps its recorded time.
   */
  PaymentView Update(Id id, const PaymentRequest& request);

  PaymentView Get(Id id);

  // Newest first.
  std::vector<PaymentView> List();
  std::vector<PaymentView> ByAccount(Id account_id);
  std::vector<PaymentView> ByBooking(Id booking_id);

 private:
  void validate(const PaymentRequest& request);
  std::vector<PaymentView> project(const std::vector<Payment>& payments);

  ConsistencyCoordinator& coordinator_;
  const Clock& clock_;
  observability::MetricsCollector& metrics_;
};

}  // namespace cinema

#endif  // CINEMA_PAYMENT_LEDGER_HPP_
