#ifndef CINEMA_CONSISTENCY_COORDINATOR_HPP_
#define CINEMA_CONSISTENCY_COORDINATOR_HPP_

#include "booking_error.hpp"
#include "booking_store.hpp"
#include "cinema_types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace cinema {

/**
 * Shared existence and uniqueness predicates used by both ledgers, plus the
 * commit wrappers that run the store's atomic check-and-write primitives and
 * translate their outcome into BookingError.
 *
 * The predicates are advisory reads. Only the commit* calls decide; a
 * predicate answer may be stale by the time a caller acts on it.
 */
class ConsistencyCoordinator {
 public:
  explicit ConsistencyCoordinator(BookingStore& store);

  // Non-copyable
  ConsistencyCoordinator(const ConsistencyCoordinator&) = delete;
  ConsistencyCoordinator& operator=(const ConsistencyCoordinator&) = delete;

  bool Exists(EntityKind kind, Id id);
  bool SeatFree(Id schedule_id, const std::string& seat_code,
                std::optional<Id> exclude_booking_id = std::nullopt);
  bool NoSuccessfulPayment(Id booking_id, std::optional<Id> exclude_payment_id = std::nullopt);

  // Throws REFERENCE_NOT_FOUND when `id` does not resolve as a foreign key.
  void requireReference(EntityKind kind, Id id);

  // Throws NOT_FOUND when the operation's own target does not exist.
  void requireTarget(EntityKind kind, Id id);

  Booking commitReservation(const Booking& booking);
  Booking commitSeatChange(Id booking_id, Id schedule_id, const std::string& seat_code);
  // Second member is false when the booking was already terminal.
  std::pair<Booking, bool> commitTransition(Id booking_id, BookingEvent event);
  Payment commitPayment(const Payment& payment);
  Payment commitPaymentUpdate(const Payment& payment);

  // Projections, joined on identifiers at call time.
  ScheduleView scheduleView(const Schedule& schedule);
  BookingView bookingView(const Booking& booking);
  PaymentView paymentView(const Payment& payment);

  BookingStore& store() { return store_; }

 private:
  BookingStore& store_;
};

}  // namespace cinema

#endif  // CINEMA_CONSISTENCY_COORDINATOR_HPP_
