#include "reservation_ledger.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"
#include "validation.hpp"

namespace cinema {

using observability::LogLevel;

ReservationLedger::ReservationLedger(ConsistencyCoordinator& coordinator, const Clock& clock,
                                     observability::MetricsCollector& metrics)
    : coordinator_(coordinator), clock_(clock), metrics_(metrics) {}

BookingView ReservationLedger::Reserve(Id schedule_id, Id account_id,
                                       const std::string& seat_code) {
  observability::MetricsCollector::Timer timer(metrics_, observability::metric::kReserveSeconds);

  requireText("seat_code", seat_code, limits::kSeatCode);
  coordinator_.requireReference(EntityKind::SCHEDULE, schedule_id);
  coordinator_.requireReference(EntityKind::ACCOUNT, account_id);

  Booking booking;
  booking.schedule_id = schedule_id;
  booking.account_id = account_id;
  booking.seat_code = seat_code;
  booking.status = BookingStatus::ACTIVE;
  booking.booked_at = clock_.now();

  Booking stored;
  try {
    stored = coordinator_.commitReservation(booking);
  } catch (const BookingError& e) {
    if (e.kind() == ErrorKind::SEAT_TAKEN) {
      metrics_.incrementCounter(observability::metric::kSeatConflicts);
      LOG_BUILDER(LogLevel::WARN, "Seat already taken")
          .field("schedule_id", schedule_id)
          .field("seat_code", seat_code)
          .field("account_id", account_id);
    }
    throw;
  }

  metrics_.incrementCounter(observability::metric::kBookingsReserved);
  LOG_BUILDER(LogLevel::INFO, "Seat reserved")
      .field("booking_id", stored.id)
      .field("schedule_id", schedule_id)
      .field("seat_code", seat_code);
  return coordinator_.bookingView(stored);
}

BookingView ReservationLedger::ChangeSeat(Id booking_id, Id new_schedule_id,
                                          const std::string& new_seat_code) {
  requireText("seat_code", new_seat_code, limits::kSeatCode);
  coordinator_.requireTarget(EntityKind::BOOKING, booking_id);
  coordinator_.requireReference(EntityKind::SCHEDULE, new_schedule_id);

  Booking moved;
  try {
    moved = coordinator_.commitSeatChange(booking_id, new_schedule_id, new_seat_code);
  } catch (const BookingError& e) {
    if (e.kind() == ErrorKind::SEAT_TAKEN) {
      metrics_.incrementCounter(observability::metric::kSeatConflicts);
    }
    throw;
  }

  LOG_BUILDER(LogLevel::INFO, "Seat changed")
      .field("booking_id", booking_id)
      .field("schedule_id", new_schedule_id)
      .field("seat_code", new_seat_code);
  return coordinator_.bookingView(moved);
}

BookingView ReservationLedger::Cancel(Id booking_id) {
  return transition(booking_id, BookingEvent::CANCEL);
}

BookingView ReservationLedger::Expire(Id booking_id) {
  return transition(booking_id, BookingEvent::EXPIRE);
}

BookingView ReservationLedger::transition(Id booking_id, BookingEvent event) {
  auto [booking, changed] = coordinator_.commitTransition(booking_id, event);

  if (changed) {
    metrics_.incrementCounter(event == BookingEvent::CANCEL
                                  ? observability::metric::kBookingsCancelled
                                  : observability::metric::kBookingsExpired);
    LOG_BUILDER(LogLevel::INFO, "Booking released")
        .field("booking_id", booking_id)
        .field("status", toString(booking.status));
  } else {
    LOG_BUILDER(LogLevel::DEBUG, "Booking already terminal")
        .field("booking_id", booking_id)
        .field("event", toString(event));
  }

  try {
    return coordinator_.bookingView(booking);
  } catch (const BookingError& e) {
    if (e.kind() != ErrorKind::NOT_FOUND) throw;
    // A schedule delete cascaded over the released booking after commit.
    return releasedView(booking);
  }
}

BookingView ReservationLedger::releasedView(const Booking& booking) {
  BookingView view;
  view.booking = booking;
  view.schedule.schedule.id = booking.schedule_id;
  view.account.id = booking.account_id;
  if (auto account = coordinator_.store().findAccount(booking.account_id)) {
    view.account = AccountView::from(*account);
  }
  LOG_BUILDER(LogLevel::DEBUG, "Released booking removed with its schedule")
      .field("booking_id", booking.id)
      .field("schedule_id", booking.schedule_id);
  return view;
}

BookingView ReservationLedger::Get(Id id) {
  auto booking = coordinator_.store().findBooking(id);
  if (!booking) {
    throw BookingError(ErrorKind::NOT_FOUND, "booking " + std::to_string(id) + " not found");
  }
  return coordinator_.bookingView(*booking);
}

std::vector<BookingView> ReservationLedger::List() {
  std::vector<BookingView> views;
  for (const auto& booking : coordinator_.store().listBookings()) {
    views.push_back(coordinator_.bookingView(booking));
  }
  return views;
}

bool ReservationLedger::IsSeatFree(Id schedule_id, const std::string& seat_code) {
  return coordinator_.SeatFree(schedule_id, seat_code);
}

}  // namespace cinema
