#include "test_support.hpp"

using namespace cinema;
using namespace cinema::test;

namespace {

// Removes the booking's schedule straight after a transition commits, as a
// concurrent ScheduleManager::Delete would.
class ScheduleDeletingStore : public InMemoryBookingStore {
 public:
  WriteResult<Booking> transitionBooking(Id booking_id, BookingEvent event) override {
    auto result = InMemoryBookingStore::transitionBooking(booking_id, event);
    if (result.ok() && delete_after_transition_) {
      deleteScheduleIfUnreferenced(result.record->schedule_id);
    }
    return result;
  }

  void deleteScheduleAfterTransition() { delete_after_transition_ = true; }

 private:
  bool delete_after_transition_ = false;
};

}  // namespace

class ReservationLedgerTest : public LedgerTest {
 protected:
  void SetUp() override {
    schedule_ = makeSchedule();
    john_ = makeAccount("johndoe");
    jane_ = makeAccount("janesmith");
  }

  ScheduleView schedule_;
  AccountView john_;
  AccountView jane_;
};

TEST_F(ReservationLedgerTest, ReserveCreatesActiveBooking) {
  clock_.advance(30);
  BookingView view = reservations_.Reserve(schedule_.schedule.id, john_.id, "A1");

  EXPECT_GT(view.booking.id, 0);
  EXPECT_EQ(view.booking.status, BookingStatus::ACTIVE);
  EXPECT_EQ(view.booking.seat_code, "A1");
  EXPECT_EQ(view.booking.booked_at, clock_.now());
  EXPECT_EQ(view.account.login_name, "johndoe");
  EXPECT_EQ(view.schedule.schedule.id, schedule_.schedule.id);
  EXPECT_EQ(view.schedule.film.title, schedule_.film.title);

  EXPECT_FALSE(reservations_.IsSeatFree(schedule_.schedule.id, "A1"));
  EXPECT_TRUE(reservations_.IsSeatFree(schedule_.schedule.id, "A2"));
  EXPECT_EQ(metrics_.counterValue(observability::metric::kBookingsReserved), 1.0);
  EXPECT_EQ(metrics_.histogramCount(observability::metric::kReserveSeconds), 1u);
}

TEST_F(ReservationLedgerTest, SecondReserveOfSameSeatFails) {
  reservations_.Reserve(schedule_.schedule.id, john_.id, "A1");
  expectError(ErrorKind::SEAT_TAKEN,
              [&] { reservations_.Reserve(schedule_.schedule.id, jane_.id, "A1"); });

  EXPECT_EQ(reservations_.List().size(), 1u);
  EXPECT_EQ(metrics_.counterValue(observability::metric::kSeatConflicts), 1.0);
}

TEST_F(ReservationLedgerTest, SameSeatOnOtherScheduleIsIndependent) {
  ScheduleView other = schedules_.Create({schedule_.auditorium.id, schedule_.film.id,
                                          clock_.now() + 2 * kDay, 6000000});
  reservations_.Reserve(schedule_.schedule.id, john_.id, "A1");
  EXPECT_NO_THROW(reservations_.Reserve(other.schedule.id, jane_.id, "A1"));
}

TEST_F(ReservationLedgerTest, UnknownReferencesCreateNothing) {
  expectError(ErrorKind::REFERENCE_NOT_FOUND,
              [&] { reservations_.Reserve(schedule_.schedule.id + 10, john_.id, "A1"); });
  expectError(ErrorKind::REFERENCE_NOT_FOUND,
              [&] { reservations_.Reserve(schedule_.schedule.id, jane_.id + 10, "A1"); });
  EXPECT_TRUE(reservations_.List().empty());
  EXPECT_TRUE(reservations_.IsSeatFree(schedule_.schedule.id, "A1"));
}

TEST_F(ReservationLedgerTest, SeatCodeValidation) {
  expectError(ErrorKind::INVALID_INPUT,
              [&] { reservations_.Reserve(schedule_.schedule.id, john_.id, ""); });
  expectError(ErrorKind::INVALID_INPUT,
              [&] { reservations_.Reserve(schedule_.schedule.id, john_.id, "ROW-A-SEAT-1"); });
}

TEST_F(ReservationLedgerTest, CancelTwiceIsIdempotent) {
  BookingView booking = reservations_.Reserve(schedule_.schedule.id, john_.id, "A1");

  BookingView first = reservations_.Cancel(booking.booking.id);
  EXPECT_EQ(first.booking.status, BookingStatus::CANCELLED);

  BookingView second = reservations_.Cancel(booking.booking.id);
  EXPECT_EQ(second.booking.status, BookingStatus::CANCELLED);
  EXPECT_EQ(metrics_.counterValue(observability::metric::kBookingsCancelled), 1.0);
}

TEST_F(ReservationLedgerTest, TerminalStatesDoNotChange) {
  BookingView booking = reservations_.Reserve(schedule_.schedule.id, john_.id, "A1");
  reservations_.Expire(booking.booking.id);

  BookingView after_cancel = reservations_.Cancel(booking.booking.id);
  EXPECT_EQ(after_cancel.booking.status, BookingStatus::EXPIRED);
  EXPECT_EQ(metrics_.counterValue(observability::metric::kBookingsExpired), 1.0);
  EXPECT_EQ(metrics_.counterValue(observability::metric::kBookingsCancelled), 0.0);
}

TEST_F(ReservationLedgerTest, TransitionUnknownBookingIsNotFound) {
  expectError(ErrorKind::NOT_FOUND, [&] { reservations_.Cancel(77); });
  expectError(ErrorKind::NOT_FOUND, [&] { reservations_.Expire(77); });
  expectError(ErrorKind::NOT_FOUND, [&] { reservations_.Get(77); });
}

TEST_F(ReservationLedgerTest, ReleasedSeatCanBeBookedAgain) {
  BookingView first = reservations_.Reserve(schedule_.schedule.id, john_.id, "B5");
  reservations_.Cancel(first.booking.id);
  BookingView second = reservations_.Reserve(schedule_.schedule.id, jane_.id, "B5");
  EXPECT_NE(second.booking.id, first.booking.id);

  reservations_.Expire(second.booking.id);
  EXPECT_TRUE(reservations_.IsSeatFree(schedule_.schedule.id, "B5"));
  EXPECT_NO_THROW(reservations_.Reserve(schedule_.schedule.id, john_.id, "B5"));
}

TEST_F(ReservationLedgerTest, ChangeSeatKeepsIdAndFreesOldSeat) {
  BookingView booking = reservations_.Reserve(schedule_.schedule.id, john_.id, "A1");

  BookingView moved = reservations_.ChangeSeat(booking.booking.id, schedule_.schedule.id, "A2");
  EXPECT_EQ(moved.booking.id, booking.booking.id);
  EXPECT_EQ(moved.booking.seat_code, "A2");
  EXPECT_TRUE(reservations_.IsSeatFree(schedule_.schedule.id, "A1"));
  EXPECT_FALSE(reservations_.IsSeatFree(schedule_.schedule.id, "A2"));

  // Moving onto its own seat is not a conflict.
  EXPECT_NO_THROW(reservations_.ChangeSeat(booking.booking.id, schedule_.schedule.id, "A2"));
}

TEST_F(ReservationLedgerTest, ChangeSeatErrors) {
  BookingView mine = reservations_.Reserve(schedule_.schedule.id, john_.id, "A1");
  reservations_.Reserve(schedule_.schedule.id, jane_.id, "A2");

  expectError(ErrorKind::SEAT_TAKEN,
              [&] { reservations_.ChangeSeat(mine.booking.id, schedule_.schedule.id, "A2"); });
  expectError(ErrorKind::NOT_FOUND,
              [&] { reservations_.ChangeSeat(mine.booking.id + 10, schedule_.schedule.id, "A3"); });
  expectError(ErrorKind::REFERENCE_NOT_FOUND,
              [&] { reservations_.ChangeSeat(mine.booking.id, schedule_.schedule.id + 10, "A3"); });

  reservations_.Cancel(mine.booking.id);
  expectError(ErrorKind::CONFLICT,
              [&] { reservations_.ChangeSeat(mine.booking.id, schedule_.schedule.id, "A3"); });
  EXPECT_EQ(reservations_.Get(mine.booking.id).booking.seat_code, "A1");
}

TEST(BookingStateMachineTest, ApplyBookingEvent) {
  EXPECT_EQ(applyBookingEvent(BookingStatus::ACTIVE, BookingEvent::CANCEL),
            BookingStatus::CANCELLED);
  EXPECT_EQ(applyBookingEvent(BookingStatus::ACTIVE, BookingEvent::EXPIRE),
            BookingStatus::EXPIRED);
  EXPECT_EQ(applyBookingEvent(BookingStatus::CANCELLED, BookingEvent::EXPIRE),
            BookingStatus::CANCELLED);
  EXPECT_EQ(applyBookingEvent(BookingStatus::EXPIRED, BookingEvent::CANCEL),
            BookingStatus::EXPIRED);
  EXPECT_TRUE(holdsSeat(BookingStatus::ACTIVE));
  EXPECT_FALSE(holdsSeat(BookingStatus::CANCELLED));
}

TEST(ReservationReleaseTest, CancelCommittedBeforeScheduleDeleteStillSucceeds) {
  ManualClock clock;
  observability::MetricsCollector metrics;
  ScheduleDeletingStore store;
  ConsistencyCoordinator coordinator(store);
  CatalogStore catalog(store, clock);
  ScheduleManager schedules(coordinator, clock);
  ReservationLedger reservations(coordinator, clock, metrics);

  Film film;
  film.title = "Parasite";
  film.duration_minutes = 132;
  film = catalog.CreateFilm(film);
  Auditorium auditorium;
  auditorium.name = "Studio Premium";
  auditorium.capacity = 150;
  auditorium = catalog.CreateAuditorium(auditorium);
  AccountRequest request;
  request.display_name = "Jane Smith";
  request.email = "jane.smith@email.com";
  request.login_name = "janesmith";
  request.credential_hash = "hash";
  AccountView account = catalog.RegisterAccount(request);
  ScheduleView schedule = schedules.Create({auditorium.id, film.id, clock.now() + kDay, 6000000});
  BookingView booking = reservations.Reserve(schedule.schedule.id, account.id, "B5");

  store.deleteScheduleAfterTransition();
  BookingView released = reservations.Cancel(booking.booking.id);

  EXPECT_EQ(released.booking.id, booking.booking.id);
  EXPECT_EQ(released.booking.status, BookingStatus::CANCELLED);
  EXPECT_EQ(released.schedule.schedule.id, schedule.schedule.id);
  EXPECT_EQ(released.account.login_name, "janesmith");
  EXPECT_EQ(metrics.counterValue(observability::metric::kBookingsCancelled), 1.0);
  expectError(ErrorKind::NOT_FOUND, [&] { schedules.Get(schedule.schedule.id); });
  expectError(ErrorKind::NOT_FOUND, [&] { reservations.Get(booking.booking.id); });
}
