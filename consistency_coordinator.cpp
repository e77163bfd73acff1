#include "consistency_coordinator.hpp"

#include <utility>

namespace cinema {

namespace {

std::string describe(EntityKind kind, Id id) {
  return std::string(entityKindName(kind)) + " " + std::to_string(id);
}

BookingError toError(WriteStatus status, const std::string& subject) {
  switch (status) {
    case WriteStatus::NOT_FOUND:
      return BookingError(ErrorKind::NOT_FOUND, subject + " not found");
    case WriteStatus::MISSING_REFERENCE:
      return BookingError(ErrorKind::REFERENCE_NOT_FOUND,
                          subject + " references a record that does not exist");
    case WriteStatus::SEAT_TAKEN:
      return BookingError(ErrorKind::SEAT_TAKEN, subject + ": seat is already booked");
    case WriteStatus::ALREADY_PAID:
      return BookingError(ErrorKind::ALREADY_PAID, subject + ": booking is already paid");
    case WriteStatus::BOOKING_INACTIVE:
      return BookingError(ErrorKind::CONFLICT, subject + ": booking is no longer active");
    case WriteStatus::HAS_DEPENDENTS:
      return BookingError(ErrorKind::CONFLICT, subject + " is still referenced");
    case WriteStatus::DUPLICATE:
      return BookingError(ErrorKind::CONFLICT, subject + " already exists");
    case WriteStatus::APPLIED:
      break;
  }
  return BookingError(ErrorKind::STORAGE_UNAVAILABLE, subject + ": unexpected store outcome");
}

template <typename T>
T unwrap(WriteResult<T> result, const std::string& subject) {
  if (!result.ok() || !result.record) {
    throw toError(result.status, subject);
  }
  return std::move(*result.record);
}

}  // namespace

ConsistencyCoordinator::ConsistencyCoordinator(BookingStore& store) : store_(store) {}

bool ConsistencyCoordinator::Exists(EntityKind kind, Id id) {
  return store_.exists(kind, id);
}

bool ConsistencyCoordinator::SeatFree(Id schedule_id, const std::string& seat_code,
                                      std::optional<Id> exclude_booking_id) {
  return store_.seatFree(schedule_id, seat_code, exclude_booking_id);
}

bool ConsistencyCoordinator::NoSuccessfulPayment(Id booking_id,
                                                 std::optional<Id> exclude_payment_id) {
  return !store_.hasSuccessfulPayment(booking_id, exclude_payment_id);
}

void ConsistencyCoordinator::requireReference(EntityKind kind, Id id) {
  if (!store_.exists(kind, id)) {
    throw BookingError(ErrorKind::REFERENCE_NOT_FOUND, describe(kind, id) + " does not exist");
  }
}

void ConsistencyCoordinator::requireTarget(EntityKind kind, Id id) {
  if (!store_.exists(kind, id)) {
    throw BookingError(ErrorKind::NOT_FOUND, describe(kind, id) + " not found");
  }
}

Booking ConsistencyCoordinator::commitReservation(const Booking& booking) {
  return unwrap(store_.insertBookingIfSeatFree(booking),
                "seat " + booking.seat_code + " of " +
                    describe(EntityKind::SCHEDULE, booking.schedule_id));
}

Booking ConsistencyCoordinator::commitSeatChange(Id booking_id, Id schedule_id,
                                                 const std::string& seat_code) {
  return unwrap(store_.moveBookingIfSeatFree(booking_id, schedule_id, seat_code),
                describe(EntityKind::BOOKING, booking_id));
}

std::pair<Booking, bool> ConsistencyCoordinator::commitTransition(Id booking_id,
                                                                  BookingEvent event) {
  auto result = store_.transitionBooking(booking_id, event);
  bool changed = result.changed;
  return {unwrap(std::move(result), describe(EntityKind::BOOKING, booking_id)), changed};
}

Payment ConsistencyCoordinator::commitPayment(const Payment& payment) {
  return unwrap(store_.insertPaymentChecked(payment),
                "payment for " + describe(EntityKind::BOOKING, payment.booking_id));
}

Payment ConsistencyCoordinator::commitPaymentUpdate(const Payment& payment) {
  return unwrap(store_.updatePaymentChecked(payment),
                describe(EntityKind::PAYMENT, payment.id));
}

ScheduleView ConsistencyCoordinator::scheduleView(const Schedule& schedule) {
  auto auditorium = store_.findAuditorium(schedule.auditorium_id);
  auto film = store_.findFilm(schedule.film_id);
  if (!auditorium || !film) {
    throw BookingError(ErrorKind::NOT_FOUND,
                       describe(EntityKind::SCHEDULE, schedule.id) + " lost its catalog rows");
  }
  return ScheduleView{schedule, *auditorium, *film};
}

BookingView ConsistencyCoordinator::bookingView(const Booking& booking) {
  auto schedule = store_.findSchedule(booking.schedule_id);
  auto account = store_.findAccount(booking.account_id);
  if (!schedule || !account) {
    throw BookingError(ErrorKind::NOT_FOUND,
                       describe(EntityKind::BOOKING, booking.id) + " lost its schedule or account");
  }
  return BookingView{booking, scheduleView(*schedule), AccountView::from(*account)};
}

PaymentView ConsistencyCoordinator::paymentView(const Payment& payment) {
  auto booking = store_.findBooking(payment.booking_id);
  auto account = store_.findAccount(payment.account_id);
  if (!booking || !account) {
    throw BookingError(ErrorKind::NOT_FOUND,
                       describe(EntityKind::PAYMENT, payment.id) + " lost its booking or payer");
  }
  return PaymentView{payment, bookingView(*booking), AccountView::from(*account)};
}

}  // namespace cinema
