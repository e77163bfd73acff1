#ifndef CINEMA_IN_MEMORY_BOOKING_STORE_HPP_
#define CINEMA_IN_MEMORY_BOOKING_STORE_HPP_

#include "booking_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>

namespace cinema {

/**
 * Process-local BookingStore.
 *
 * One reader/writer lock guards all tables: every check-and-write holds it
 * exclusively for the whole check plus write, reads hold it shared. Rows are
 * kept in id order so listings come back in insertion order.
 */
class InMemoryBookingStore : public BookingStore {
 public:
  InMemoryBookingStore() = default;
  ~InMemoryBookingStore() override = default;

  // Non-copyable
  InMemoryBookingStore(const InMemoryBookingStore&) = delete;
  InMemoryBookingStore& operator=(const InMemoryBookingStore&) = delete;

  Film insertFilm(const Film& film) override;
  WriteResult<Film> updateFilm(const Film& film) override;
  WriteStatus deleteFilm(Id id) override;
  std::optional<Film> findFilm(Id id) override;
  std::vector<Film> listFilms() override;

  Auditorium insertAuditorium(const Auditorium& auditorium) override;
  WriteResult<Auditorium> updateAuditorium(const Auditorium& auditorium) override;
  WriteStatus deleteAuditorium(Id id) override;
  std::optional<Auditorium> findAuditorium(Id id) override;
  std::vector<Auditorium> listAuditoriums() override;

  WriteResult<Account> insertAccount(const Account& account) override;
  WriteResult<Account> setAccountActive(Id id, bool active) override;
  std::optional<Account> findAccount(Id id) override;
  std::vector<Account> listAccounts() override;

  bool exists(EntityKind kind, Id id) override;

  WriteResult<Schedule> insertSchedule(const Schedule& schedule) override;
  WriteResult<Schedule> updateSchedule(const Schedule& schedule) override;
  WriteStatus deleteScheduleIfUnreferenced(Id id) override;
  std::optional<Schedule> findSchedule(Id id) override;
  std::vector<Schedule> listSchedules() override;

  bool seatFree(Id schedule_id, const std::string& seat_code,
                std::optional<Id> exclude_booking_id) override;
  WriteResult<Booking> insertBookingIfSeatFree(const Booking& booking) override;
  WriteResult<Booking> moveBookingIfSeatFree(Id booking_id, Id schedule_id,
                                             const std::string& seat_code) override;
  WriteResult<Booking> transitionBooking(Id booking_id, BookingEvent event) override;
  std::optional<Booking> findBooking(Id id) override;
  std::vector<Booking> listBookings() override;

  bool hasSuccessfulPayment(Id booking_id, std::optional<Id> exclude_payment_id) override;
  WriteResult<Payment> insertPaymentChecked(const Payment& payment) override;
  WriteResult<Payment> updatePaymentChecked(const Payment& payment) override;
  std::optional<Payment> findPayment(Id id) override;
  std::vector<Payment> listPayments() override;
  std::vector<Payment> paymentsByAccount(Id account_id) override;
  std::vector<Payment> paymentsByBooking(Id booking_id) override;

 private:
  // Unlocked helpers; callers hold mutex_.
  bool existsLocked(EntityKind kind, Id id) const;
  bool seatFreeLocked(Id schedule_id, const std::string& seat_code,
                      std::optional<Id> exclude_booking_id) const;
  bool hasSuccessfulPaymentLocked(Id booking_id, std::optional<Id> exclude_payment_id) const;

  // Shared validation for insertPaymentChecked/updatePaymentChecked.
  WriteStatus checkPaymentLocked(const Payment& payment, std::optional<Id> exclude_payment_id) const;

  std::map<Id, Film> films_;
  std::map<Id, Auditorium> auditoriums_;
  std::map<Id, Account> accounts_;
  std::map<Id, Schedule> schedules_;
  std::map<Id, Booking> bookings_;
  std::map<Id, Payment> payments_;

  Id next_film_id_ = 1;
  Id next_auditorium_id_ = 1;
  Id next_account_id_ = 1;
  Id next_schedule_id_ = 1;
  Id next_booking_id_ = 1;
  Id next_payment_id_ = 1;

  mutable std::shared_mutex mutex_;
};

}  // namespace cinema

#endif  // CINEMA_IN_MEMORY_BOOKING_STORE_HPP_
