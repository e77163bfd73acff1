#ifndef CINEMA_RESERVATION_LEDGER_HPP_
#define CINEMA_RESERVATION_LEDGER_HPP_

#include "cinema_types.hpp"
#include "clock.hpp"
#include "consistency_coordinator.hpp"
#include "observability/metrics.hpp"

#include <string>
#include <vector>

namespace cinema {

/**
 * Seat bookings for screenings.
 *
 * At most one ACTIVE booking exists per (schedule, seat). CANCELLED and
 * EXPIRED are terminal and release the seat.
 */
class ReservationLedger {
 public:
  ReservationLedger(ConsistencyCoordinator& coordinator, const Clock& clock,
                    observability::MetricsCollector& metrics);

  // Non-copyable
  ReservationLedger(const ReservationLedger&) = delete;
  ReservationLedger& operator=(const ReservationLedger&) = delete;

  /**
   * Books `seat_code` for `account_id` at `schedule_id`. Throws SEAT_TAKEN if
   * an active booking already holds the slot; nothing is written then.
   */
  BookingView Reserve(Id schedule_id, Id account_id, const std::string& seat_code);

  /**
   * Moves an active booking to another slot, keeping its id.
   */
  BookingView ChangeSeat(Id booking_id, Id new_schedule_id, const std::string& new_seat_code);

  // Idempotent: a terminal booking is returned unchanged. If a concurrent
  // schedule delete removes the booking right after the transition commits,
  // the returned view carries only the booking row and its account.
  BookingView Cancel(Id booking_id);
  BookingView Expire(Id booking_id);

  BookingView Get(Id id);
  std::vector<BookingView> List();

  bool IsSeatFree(Id schedule_id, const std::string& seat_code);

 private:
  BookingView transition(Id booking_id, BookingEvent event);

  // View of a committed, released booking whose schedule is already gone.
  // Only the booking row and the account are filled in.
  BookingView releasedView(const Booking& booking);

  ConsistencyCoordinator& coordinator_;
  const Clock& clock_;
  observability::MetricsCollector& metrics_;
};

}  // namespace cinema

#endif  // CINEMA_RESERVATION_LEDGER_HPP_
