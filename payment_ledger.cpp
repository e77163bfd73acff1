#include "payment_ledger.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"
#include "validation.hpp"

namespace cinema {

using observability::LogLevel;

PaymentLedger::PaymentLedger(ConsistencyCoordinator& coordinator, const Clock& clock,
                             observability::MetricsCollector& metrics)
    : coordinator_(coordinator), clock_(clock), metrics_(metrics) {}

void PaymentLedger::validate(const PaymentRequest& request) {
  requireRange("amount", request.amount, limits::kMinPaymentAmount, limits::kMaxPaymentAmount);
  requireOptionalText("reference", request.reference, limits::kPaymentReference);
  coordinator_.requireReference(EntityKind::BOOKING, request.booking_id);
  coordinator_.requireReference(EntityKind::ACCOUNT, request.account_id);
}

PaymentView PaymentLedger::Record(const PaymentRequest& request) {
  observability::MetricsCollector::Timer timer(metrics_,
                                               observability::metric::kPaymentRecordSeconds);
  validate(request);

  Payment payment;
  payment.booking_id = request.booking_id;
  payment.account_id = request.account_id;
  payment.amount = request.amount;
  payment.method = request.method;
  payment.status = request.status;
  payment.reference = request.reference;
  payment.recorded_at = clock_.now();

  Payment stored;
  try {
    stored = coordinator_.commitPayment(payment);
  } catch (const BookingError& e) {
    if (e.kind() == ErrorKind::ALREADY_PAID) {
      metrics_.incrementCounter(observability::metric::kDoublePaymentRejections);
      LOG_BUILDER(LogLevel::WARN, "Double payment rejected")
          .field("booking_id", request.booking_id)
          .field("account_id", request.account_id);
    }
    throw;
  }

  metrics_.incrementCounter(observability::metric::kPaymentsRecorded);
  LOG_BUILDER(LogLevel::INFO, "Payment recorded")
      .field("payment_id", stored.id)
      .field("booking_id", stored.booking_id)
      .field("status", toString(stored.status))
      .field("method", toString(stored.method));
  return coordinator_.paymentView(stored);
}

PaymentView PaymentLedger::Update(Id id, const PaymentRequest& request) {
  coordinator_.requireTarget(EntityKind::PAYMENT, id);
  validate(request);

  Payment payment;
  payment.id = id;
  payment.booking_id = request.booking_id;
  payment.account_id = request.account_id;
  payment.amount = request.amount;
  payment.method = request.method;
  payment.status = request.status;
  payment.reference = request.reference;

  Payment stored;
  try {
    stored = coordinator_.commitPaymentUpdate(payment);
  } catch (const BookingError& e) {
    if (e.kind() == ErrorKind::ALREADY_PAID) {
      metrics_.incrementCounter(observability::metric::kDoublePaymentRejections);
    }
    throw;
  }

  LOG_BUILDER(LogLevel::INFO, "Payment updated")
      .field("payment_id", id)
      .field("status", toString(stored.status));
  return coordinator_.paymentView(stored);
}

PaymentView PaymentLedger::Get(Id id) {
  auto payment = coordinator_.store().findPayment(id);
  if (!payment) {
    throw BookingError(ErrorKind::NOT_FOUND, "payment " + std::to_string(id) + " not found");
  }
  return coordinator_.paymentView(*payment);
}

std::vector<PaymentView> PaymentLedger::List() {
  return project(coordinator_.store().listPayments());
}

std::vector<PaymentView> PaymentLedger::ByAccount(Id account_id) {
  // Deactivated payers keep their history.
  if (!coordinator_.store().findAccount(account_id)) {
    throw BookingError(ErrorKind::NOT_FOUND,
                       "account " + std::to_string(account_id) + " not found");
  }
  return project(coordinator_.store().paymentsByAccount(account_id));
}

std::vector<PaymentView> PaymentLedger::ByBooking(Id booking_id) {
  coordinator_.requireTarget(EntityKind::BOOKING, booking_id);
  return project(coordinator_.store().paymentsByBooking(booking_id));
}

std::vector<PaymentView> PaymentLedger::project(const std::vector<Payment>& payments) {
  std::vector<PaymentView> views;
  views.reserve(payments.size());
  for (const auto& payment : payments) {
    views.push_back(coordinator_.paymentView(payment));
  }
  return views;
}

}  // namespace cinema
