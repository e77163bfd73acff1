#ifndef CINEMA_TEST_SUPPORT_HPP_
#define CINEMA_TEST_SUPPORT_HPP_

#include "../include/booking_error.hpp"
#include "../include/catalog_store.hpp"
#include "../include/clock.hpp"
#include "../include/consistency_coordinator.hpp"
#include "../include/in_memory_booking_store.hpp"
#include "../include/observability/metrics.hpp"
#include "../include/payment_ledger.hpp"
#include "../include/reservation_ledger.hpp"
#include "../include/schedule_manager.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <string>

namespace cinema {
namespace test {

// Clock whose time only moves when a test says so.
class ManualClock : public Clock {
 public:
  explicit ManualClock(Timestamp start = 1700000000) : now_(start) {}

  Timestamp now() const override { return now_.load(); }
  void set(Timestamp t) { now_.store(t); }
  void advance(Timestamp seconds) { now_.fetch_add(seconds); }

 private:
  std::atomic<Timestamp> now_;
};

constexpr Timestamp kDay = 24 * 60 * 60;

// Runs `fn` and expects a BookingError of `kind`.
template <typename F>
void expectError(ErrorKind kind, F&& fn) {
  try {
    fn();
    ADD_FAILURE() << "expected " << errorKindName(kind) << ", nothing was thrown";
  } catch (const BookingError& e) {
    EXPECT_EQ(e.kind(), kind) << "got " << errorKindName(e.kind()) << ": " << e.what();
  }
}

// Test fixture wiring every component over an in-memory store.
class LedgerTest : public ::testing::Test {
 protected:
  LedgerTest()
      : coordinator_(store_),
        catalog_(store_, clock_),
        schedules_(coordinator_, clock_),
        reservations_(coordinator_, clock_, metrics_),
        payments_(coordinator_, clock_, metrics_) {}

  Film makeFilm(const std::string& title = "Parasite", int minutes = 132) {
    Film film;
    film.title = title;
    film.genre = "Thriller";
    film.duration_minutes = minutes;
    return catalog_.CreateFilm(film);
  }

  Auditorium makeAuditorium(const std::string& name = "Studio Premium", int capacity = 150) {
    Auditorium auditorium;
    auditorium.name = name;
    auditorium.capacity = capacity;
    return catalog_.CreateAuditorium(auditorium);
  }

  AccountView makeAccount(const std::string& login) {
    AccountRequest request;
    request.display_name = login;
    request.email = login + "@example.com";
    request.login_name = login;
    request.credential_hash = "hash-" + login;
    return catalog_.RegisterAccount(request);
  }

  ScheduleView makeSchedule(Money price = 6000000) {
    Film film = makeFilm();
    Auditorium auditorium = makeAuditorium();
    return schedules_.Create({auditorium.id, film.id, clock_.now() + kDay, price});
  }

  PaymentRequest paymentFor(const BookingView& booking, PaymentStatus status,
                            Money amount = 6000000) {
    PaymentRequest request;
    request.booking_id = booking.booking.id;
    request.account_id = booking.account.id;
    request.amount = amount;
    request.method = PaymentMethod::CARD;
    request.status = status;
    return request;
  }

  ManualClock clock_;
  observability::MetricsCollector metrics_;
  InMemoryBookingStore store_;
  ConsistencyCoordinator coordinator_;
  CatalogStore catalog_;
  ScheduleManager schedules_;
  ReservationLedger reservations_;
  PaymentLedger payments_;
};

}  // namespace test
}  // namespace cinema

#endif  // CINEMA_TEST_SUPPORT_HPP_
