#include "seed_data.hpp"

#include "cinema_engine.hpp"
#include "observability/logger.hpp"

#include <string>
#include <vector>

namespace cinema {

namespace {

constexpr Timestamp kSecondsPerDay = 24 * 60 * 60;

// Demo accounts cannot sign in; a real hash is never shipped in source.
const char* const kLockedCredential = "!locked";

Timestamp startOfDay(Timestamp t) {
  return t - (t % kSecondsPerDay);
}

Film film(const std::string& title, const std::string& genre, int minutes,
          const std::string& description) {
  Film f;
  f.title = title;
  f.genre = genre;
  f.duration_minutes = minutes;
  f.description = description;
  return f;
}

Auditorium auditorium(const std::string& name, int capacity, const std::string& facilities) {
  Auditorium a;
  a.name = name;
  a.capacity = capacity;
  a.facilities = facilities;
  return a;
}

AccountRequest account(const std::string& name, const std::string& email,
                       const std::string& login, const std::string& phone,
                       AccountRole role = AccountRole::CUSTOMER) {
  AccountRequest r;
  r.display_name = name;
  r.email = email;
  r.login_name = login;
  r.credential_hash = kLockedCredential;
  r.phone = phone;
  r.role = role;
  return r;
}

PaymentRequest payment(const BookingView& booking, Money amount, PaymentMethod method,
                       PaymentStatus status, const std::string& reference) {
  PaymentRequest r;
  r.booking_id = booking.booking.id;
  r.account_id = booking.account.id;
  r.amount = amount;
  r.method = method;
  r.status = status;
  r.reference = reference;
  return r;
}

}  // namespace

bool seedDemoData(CinemaEngine& engine) {
  CatalogStore& catalog = engine.catalog();
  if (!catalog.ListFilms().empty()) {
    LOG_INFO("Catalog already populated, skipping demo data");
    return false;
  }

  Film endgame = catalog.CreateFilm(film("Avengers: Endgame", "Action", 181,
                                         "The epic conclusion to the Infinity Saga"));
  Film parasite = catalog.CreateFilm(film("Parasite", "Thriller", 132,
                                          "A dark comedy thriller about class conflict"));
  Film no_way_home = catalog.CreateFilm(film("Spider-Man: No Way Home", "Action", 148,
                                             "Peter Parker's multiverse adventure"));

  Auditorium imax = catalog.CreateAuditorium(auditorium("Studio IMAX", 200,
                                                        "IMAX Screen, Dolby Atmos"));
  Auditorium premium = catalog.CreateAuditorium(auditorium("Studio Premium", 150,
                                                           "Reclining Seats, 4K Projection"));
  Auditorium regular = catalog.CreateAuditorium(auditorium("Studio Regular", 100,
                                                           "Standard Screen, Surround Sound"));

  AccountView john = catalog.RegisterAccount(
      account("John Doe", "john.doe@email.com", "johndoe", "081234567890"));
  AccountView jane = catalog.RegisterAccount(
      account("Jane Smith", "jane.smith@email.com", "janesmith", "081234567891"));
  AccountView bob = catalog.RegisterAccount(
      account("Bob Wilson", "bob.wilson@email.com", "bobwilson", "081234567892"));
  catalog.RegisterAccount(
      account("Admin User", "admin@cinema.com", "admin", "081234567999", AccountRole::ADMIN));

  // Screenings tomorrow evening and the afternoon after, so they stay in the
  // future for a day whatever time the engine starts.
  Timestamp tomorrow = startOfDay(engine.clock().now()) + kSecondsPerDay;
  ScheduleManager& schedules = engine.schedules();
  ScheduleView evening = schedules.Create({imax.id, endgame.id, tomorrow + 19 * 3600, 7500000});
  ScheduleView late = schedules.Create({premium.id, parasite.id, tomorrow + 21 * 3600 + 1800,
                                        6000000});
  ScheduleView matinee = schedules.Create({regular.id, no_way_home.id,
                                           tomorrow + kSecondsPerDay + 14 * 3600, 5000000});

  ReservationLedger& reservations = engine.reservations();
  BookingView a1 = reservations.Reserve(evening.schedule.id, john.id, "A1");
  BookingView b5 = reservations.Reserve(late.schedule.id, jane.id, "B5");
  BookingView c3 = reservations.Reserve(matinee.schedule.id, bob.id, "C3");

  PaymentLedger& payments = engine.payments();
  payments.Record(payment(a1, 7500000, PaymentMethod::CARD, PaymentStatus::SUCCESS, "TXN001"));
  payments.Record(payment(b5, 6000000, PaymentMethod::EWALLET, PaymentStatus::SUCCESS, "TXN002"));
  // The failed attempt has to land while C3 is still active.
  payments.Record(payment(c3, 5000000, PaymentMethod::BANK_TRANSFER, PaymentStatus::FAILED,
                          "TXN003"));
  reservations.Cancel(c3.booking.id);

  LOG_INFO("Demo data seeded");
  return true;
}

}  // namespace cinema
