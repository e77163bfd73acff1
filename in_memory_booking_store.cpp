#include "in_memory_booking_store.hpp"

#include <algorithm>
#include <mutex>

namespace cinema {

namespace {

template <typename T>
std::optional<T> findIn(const std::map<Id, T>& table, Id id) {
  auto it = table.find(id);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

template <typename T>
std::vector<T> valuesOf(const std::map<Id, T>& table) {
  std::vector<T> result;
  result.reserve(table.size());
  for (const auto& [id, row] : table) {
    result.push_back(row);
  }
  return result;
}

void sortNewestFirst(std::vector<Payment>& payments) {
  std::sort(payments.begin(), payments.end(), [](const Payment& a, const Payment& b) {
    if (a.recorded_at != b.recorded_at) {
      return a.recorded_at > b.recorded_at;
    }
    return a.id > b.id;
  });
}

}  // namespace

// ---- Films ----

Film InMemoryBookingStore::insertFilm(const Film& film) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  Film stored = film;
  stored.id = next_film_id_++;
  films_[stored.id] = stored;
  return stored;
}

WriteResult<Film> InMemoryBookingStore::updateFilm(const Film& film) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = films_.find(film.id);
  if (it == films_.end()) {
    return WriteResult<Film>::failed(WriteStatus::NOT_FOUND);
  }
  it->second = film;
  return WriteResult<Film>::applied(it->second);
}

WriteStatus InMemoryBookingStore::deleteFilm(Id id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (films_.count(id) == 0) {
    return WriteStatus::NOT_FOUND;
  }
  for (const auto& [schedule_id, schedule] : schedules_) {
    if (schedule.film_id == id) {
      return WriteStatus::HAS_DEPENDENTS;
    }
  }
  films_.erase(id);
  return WriteStatus::APPLIED;
}

std::optional<Film> InMemoryBookingStore::findFilm(Id id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(films_, id);
}

std::vector<Film> InMemoryBookingStore::listFilms() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return valuesOf(films_);
}

// ---- Auditoriums ----

Auditorium InMemoryBookingStore::insertAuditorium(const Auditorium& auditorium) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  Auditorium stored = auditorium;
  stored.id = next_auditorium_id_++;
  auditoriums_[stored.id] = stored;
  return stored;
}

WriteResult<Auditorium> InMemoryBookingStore::updateAuditorium(const Auditorium& auditorium) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = auditoriums_.find(auditorium.id);
  if (it == auditoriums_.end()) {
    return WriteResult<Auditorium>::failed(WriteStatus::NOT_FOUND);
  }
  it->second = auditorium;
  return WriteResult<Auditorium>::applied(it->second);
}

WriteStatus InMemoryBookingStore::deleteAuditorium(Id id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (auditoriums_.count(id) == 0) {
    return WriteStatus::NOT_FOUND;
  }
  for (const auto& [schedule_id, schedule] : schedules_) {
    if (schedule.auditorium_id == id) {
      return WriteStatus::HAS_DEPENDENTS;
    }
  }
  auditoriums_.erase(id);
  return WriteStatus::APPLIED;
}

std::optional<Auditorium> InMemoryBookingStore::findAuditorium(Id id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(auditoriums_, id);
}

std::vector<Auditorium> InMemoryBookingStore::listAuditoriums() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return valuesOf(auditoriums_);
}

// ---- Accounts ----

WriteResult<Account> InMemoryBookingStore::insertAccount(const Account& account) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (const auto& [id, existing] : accounts_) {
    if (existing.login_name == account.login_name) {
      return WriteResult<Account>::failed(WriteStatus::DUPLICATE);
    }
  }
  Account stored = account;
  stored.id = next_account_id_++;
  accounts_[stored.id] = stored;
  return WriteResult<Account>::applied(stored);
}

WriteResult<Account> InMemoryBookingStore::setAccountActive(Id id, bool active) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    return WriteResult<Account>::failed(WriteStatus::NOT_FOUND);
  }
  it->second.active = active;
  return WriteResult<Account>::applied(it->second);
}

std::optional<Account> InMemoryBookingStore::findAccount(Id id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(accounts_, id);
}

std::vector<Account> InMemoryBookingStore::listAccounts() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return valuesOf(accounts_);
}

bool InMemoryBookingStore::exists(EntityKind kind, Id id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return existsLocked(kind, id);
}

bool InMemoryBookingStore::existsLocked(EntityKind kind, Id id) const {
  switch (kind) {
    case EntityKind::FILM: return films_.count(id) > 0;
    case EntityKind::AUDITORIUM: return auditoriums_.count(id) > 0;
    case EntityKind::ACCOUNT: {
      auto it = accounts_.find(id);
      return it != accounts_.end() && it->second.active;
    }
    case EntityKind::SCHEDULE: return schedules_.count(id) > 0;
    case EntityKind::BOOKING: return bookings_.count(id) > 0;
    case EntityKind::PAYMENT: return payments_.count(id) > 0;
  }
  return false;
}

// ---- Schedules ----

WriteResult<Schedule> InMemoryBookingStore::insertSchedule(const Schedule& schedule) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!existsLocked(EntityKind::AUDITORIUM, schedule.auditorium_id) ||
      !existsLocked(EntityKind::FILM, schedule.film_id)) {
    return WriteResult<Schedule>::failed(WriteStatus::MISSING_REFERENCE);
  }
  Schedule stored = schedule;
  stored.id = next_schedule_id_++;
  schedules_[stored.id] = stored;
  return WriteResult<Schedule>::applied(stored);
}

WriteResult<Schedule> InMemoryBookingStore::updateSchedule(const Schedule& schedule) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = schedules_.find(schedule.id);
  if (it == schedules_.end()) {
    return WriteResult<Schedule>::failed(WriteStatus::NOT_FOUND);
  }
  if (!existsLocked(EntityKind::AUDITORIUM, schedule.auditorium_id) ||
      !existsLocked(EntityKind::FILM, schedule.film_id)) {
    return WriteResult<Schedule>::failed(WriteStatus::MISSING_REFERENCE);
  }
  it->second = schedule;
  return WriteResult<Schedule>::applied(it->second);
}

WriteStatus InMemoryBookingStore::deleteScheduleIfUnreferenced(Id id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (schedules_.count(id) == 0) {
    return WriteStatus::NOT_FOUND;
  }

  std::vector<Id> cancelled;
  for (const auto& [booking_id, booking] : bookings_) {
    if (booking.schedule_id != id) {
      continue;
    }
    if (booking.status != BookingStatus::CANCELLED ||
        hasSuccessfulPaymentLocked(booking_id, std::nullopt)) {
      return WriteStatus::HAS_DEPENDENTS;
    }
    cancelled.push_back(booking_id);
  }

  for (Id booking_id : cancelled) {
    for (auto it = payments_.begin(); it != payments_.end();) {
      if (it->second.booking_id == booking_id) {
        it = payments_.erase(it);
      } else {
        ++it;
      }
    }
    bookings_.erase(booking_id);
  }
  schedules_.erase(id);
  return WriteStatus::APPLIED;
}

std::optional<Schedule> InMemoryBookingStore::findSchedule(Id id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(schedules_, id);
}

std::vector<Schedule> InMemoryBookingStore::listSchedules() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return valuesOf(schedules_);
}

// ---- Bookings ----

bool InMemoryBookingStore::seatFree(Id schedule_id, const std::string& seat_code,
                                    std::optional<Id> exclude_booking_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return seatFreeLocked(schedule_id, seat_code, exclude_booking_id);
}

bool InMemoryBookingStore::seatFreeLocked(Id schedule_id, const std::string& seat_code,
                                          std::optional<Id> exclude_booking_id) const {
  for (const auto& [id, booking] : bookings_) {
    if (exclude_booking_id && *exclude_booking_id == id) {
      continue;
    }
    if (booking.schedule_id == schedule_id && booking.seat_code == seat_code &&
        holdsSeat(booking.status)) {
      return false;
    }
  }
  return true;
}

WriteResult<Booking> InMemoryBookingStore::insertBookingIfSeatFree(const Booking& booking) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!existsLocked(EntityKind::SCHEDULE, booking.schedule_id) ||
      !existsLocked(EntityKind::ACCOUNT, booking.account_id)) {
    return WriteResult<Booking>::failed(WriteStatus::MISSING_REFERENCE);
  }
  if (!seatFreeLocked(booking.schedule_id, booking.seat_code, std::nullopt)) {
    return WriteResult<Booking>::failed(WriteStatus::SEAT_TAKEN);
  }
  Booking stored = booking;
  stored.id = next_booking_id_++;
  stored.status = BookingStatus::ACTIVE;
  bookings_[stored.id] = stored;
  return WriteResult<Booking>::applied(stored);
}

WriteResult<Booking> InMemoryBookingStore::moveBookingIfSeatFree(Id booking_id, Id schedule_id,
                                                                 const std::string& seat_code) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = bookings_.find(booking_id);
  if (it == bookings_.end()) {
    return WriteResult<Booking>::failed(WriteStatus::NOT_FOUND);
  }
  if (!existsLocked(EntityKind::SCHEDULE, schedule_id)) {
    return WriteResult<Booking>::failed(WriteStatus::MISSING_REFERENCE);
  }
  if (!holdsSeat(it->second.status)) {
    return WriteResult<Booking>::failed(WriteStatus::BOOKING_INACTIVE);
  }
  if (!seatFreeLocked(schedule_id, seat_code, booking_id)) {
    return WriteResult<Booking>::failed(WriteStatus::SEAT_TAKEN);
  }
  it->second.schedule_id = schedule_id;
  it->second.seat_code = seat_code;
  return WriteResult<Booking>::applied(it->second);
}

WriteResult<Booking> InMemoryBookingStore::transitionBooking(Id booking_id, BookingEvent event) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = bookings_.find(booking_id);
  if (it == bookings_.end()) {
    return WriteResult<Booking>::failed(WriteStatus::NOT_FOUND);
  }
  BookingStatus next = applyBookingEvent(it->second.status, event);
  bool changed = next != it->second.status;
  it->second.status = next;
  return WriteResult<Booking>::applied(it->second, changed);
}

std::optional<Booking> InMemoryBookingStore::findBooking(Id id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(bookings_, id);
}

std::vector<Booking> InMemoryBookingStore::listBookings() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return valuesOf(bookings_);
}

// ---- Payments ----

bool InMemoryBookingStore::hasSuccessfulPayment(Id booking_id,
                                                std::optional<Id> exclude_payment_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return hasSuccessfulPaymentLocked(booking_id, exclude_payment_id);
}

bool InMemoryBookingStore::hasSuccessfulPaymentLocked(Id booking_id,
                                                      std::optional<Id> exclude_payment_id) const {
  for (const auto& [id, payment] : payments_) {
    if (exclude_payment_id && *exclude_payment_id == id) {
      continue;
    }
    if (payment.booking_id == booking_id && payment.status == PaymentStatus::SUCCESS) {
      return true;
    }
  }
  return false;
}

WriteStatus InMemoryBookingStore::checkPaymentLocked(const Payment& payment,
                                                     std::optional<Id> exclude_payment_id) const {
  auto booking = bookings_.find(payment.booking_id);
  if (booking == bookings_.end() || !existsLocked(EntityKind::ACCOUNT, payment.account_id)) {
    return WriteStatus::MISSING_REFERENCE;
  }
  if (!holdsSeat(booking->second.status)) {
    return WriteStatus::BOOKING_INACTIVE;
  }
  if (payment.status == PaymentStatus::SUCCESS &&
      hasSuccessfulPaymentLocked(payment.booking_id, exclude_payment_id)) {
    return WriteStatus::ALREADY_PAID;
  }
  return WriteStatus::APPLIED;
}

WriteResult<Payment> InMemoryBookingStore::insertPaymentChecked(const Payment& payment) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  WriteStatus status = checkPaymentLocked(payment, std::nullopt);
  if (status != WriteStatus::APPLIED) {
    return WriteResult<Payment>::failed(status);
  }
  Payment stored = payment;
  stored.id = next_payment_id_++;
  payments_[stored.id] = stored;
  return WriteResult<Payment>::applied(stored);
}

WriteResult<Payment> InMemoryBookingStore::updatePaymentChecked(const Payment& payment) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = payments_.find(payment.id);
  if (it == payments_.end()) {
    return WriteResult<Payment>::failed(WriteStatus::NOT_FOUND);
  }
  WriteStatus status = checkPaymentLocked(payment, payment.id);
  if (status != WriteStatus::APPLIED) {
    return WriteResult<Payment>::failed(status);
  }
  Timestamp recorded_at = it->second.recorded_at;
  it->second = payment;
  it->second.recorded_at = recorded_at;
  return WriteResult<Payment>::applied(it->second);
}

std::optional<Payment> InMemoryBookingStore::findPayment(Id id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(payments_, id);
}

std::vector<Payment> InMemoryBookingStore::listPayments() {
  std::vector<Payment> result;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    result = valuesOf(payments_);
  }
  sortNewestFirst(result);
  return result;
}

std::vector<Payment> InMemoryBookingStore::paymentsByAccount(Id account_id) {
  std::vector<Payment> result;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [id, payment] : payments_) {
      if (payment.account_id == account_id) {
        result.push_back(payment);
      }
    }
  }
  sortNewestFirst(result);
  return result;
}

std::vector<Payment> InMemoryBookingStore::paymentsByBooking(Id booking_id) {
  std::vector<Payment> result;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [id, payment] : payments_) {
      if (payment.booking_id == booking_id) {
        result.push_back(payment);
      }
    }
  }
  sortNewestFirst(result);
  return result;
}

}  // namespace cinema
