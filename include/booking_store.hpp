#ifndef CINEMA_BOOKING_STORE_HPP_
#define CINEMA_BOOKING_STORE_HPP_

#include "cinema_types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cinema {

enum class EntityKind {
  FILM,
  AUDITORIUM,
  ACCOUNT,
  SCHEDULE,
  BOOKING,
  PAYMENT
};

const char* entityKindName(EntityKind kind);

/**
 * Outcome of a store write. Anything other than APPLIED means nothing was
 * written.
 */
enum class WriteStatus {
  APPLIED,
  NOT_FOUND,          // target row does not exist
  MISSING_REFERENCE,  // a referenced row does not exist (or account inactive)
  SEAT_TAKEN,         // active-seat uniqueness would be violated
  ALREADY_PAID,       // successful-payment uniqueness would be violated
  BOOKING_INACTIVE,   // booking is cancelled/expired
  HAS_DEPENDENTS,     // delete blocked by referencing rows
  DUPLICATE           // unique natural key (login name) already taken
};

template <typename T>
struct WriteResult {
  WriteStatus status = WriteStatus::APPLIED;
  std::optional<T> record;
  // False when an idempotent write found the row already in the target state.
  bool changed = true;

  static WriteResult applied(T value, bool changed = true) {
    WriteResult result;
    result.record = std::move(value);
    result.changed = changed;
    return result;
  }

  static WriteResult failed(WriteStatus status) {
    WriteResult result;
    result.status = status;
    result.changed = false;
    return result;
  }

  bool ok() const { return status == WriteStatus::APPLIED; }
};

/**
 * Persistence interface consumed by the engine.
 *
 * Every method whose name ends in "IfSeatFree" or "Checked", plus
 * transitionBooking and deleteScheduleIfUnreferenced, is an atomic
 * check-and-write: the uniqueness or state check and the resulting write
 * are indivisible with respect to every other caller of the same store,
 * including other processes sharing the same database.
 *
 * Implementations are thread-safe. Backend failures are reported by throwing
 * BookingError with ErrorKind::STORAGE_UNAVAILABLE.
 */
class BookingStore {
 public:
  virtual ~BookingStore() = default;

  // Reference data
  virtual Film insertFilm(const Film& film) = 0;
  virtual WriteResult<Film> updateFilm(const Film& film) = 0;
  virtual WriteStatus deleteFilm(Id id) = 0;
  virtual std::optional<Film> findFilm(Id id) = 0;
  virtual std::vector<Film> listFilms() = 0;

  virtual Auditorium insertAuditorium(const Auditorium& auditorium) = 0;
  virtual WriteResult<Auditorium> updateAuditorium(const Auditorium& auditorium) = 0;
  virtual WriteStatus deleteAuditorium(Id id) = 0;
  virtual std::optional<Auditorium> findAuditorium(Id id) = 0;
  virtual std::vector<Auditorium> listAuditoriums() = 0;

  virtual WriteResult<Account> insertAccount(const Account& account) = 0;
  virtual WriteResult<Account> setAccountActive(Id id, bool active) = 0;
  virtual std::optional<Account> findAccount(Id id) = 0;
  virtual std::vector<Account> listAccounts() = 0;

  /**
   * Existence oracle. Accounts resolve only while active.
   */
  virtual bool exists(EntityKind kind, Id id) = 0;

  // Schedules
  virtual WriteResult<Schedule> insertSchedule(const Schedule& schedule) = 0;
  virtual WriteResult<Schedule> updateSchedule(const Schedule& schedule) = 0;

  /**
   * Deletes the schedule unless a booking other than a cancelled one
   * references it, or one of its bookings carries a successful payment.
   * Cancelled bookings and their payment attempts go with it.
   */
  virtual WriteStatus deleteScheduleIfUnreferenced(Id id) = 0;
  virtual std::optional<Schedule> findSchedule(Id id) = 0;
  virtual std::vector<Schedule> listSchedules() = 0;

  // Bookings
  virtual bool seatFree(Id schedule_id, const std::string& seat_code,
                        std::optional<Id> exclude_booking_id) = 0;

  /**
   * Inserts `booking` (status ACTIVE) unless an active booking already holds
   * the same (schedule_id, seat_code). Returns the stored row with its id.
   */
  virtual WriteResult<Booking> insertBookingIfSeatFree(const Booking& booking) = 0;

  /**
   * Moves an active booking to (schedule_id, seat_code) in place. The
   * booking's own row does not count as a conflict.
   */
  virtual WriteResult<Booking> moveBookingIfSeatFree(Id booking_id, Id schedule_id,
                                                     const std::string& seat_code) = 0;

  /**
   * Applies applyBookingEvent() to the stored status under the row lock.
   * Repeating an event on a terminal booking is APPLIED with no change.
   */
  virtual WriteResult<Booking> transitionBooking(Id booking_id, BookingEvent event) = 0;
  virtual std::optional<Booking> findBooking(Id id) = 0;
  virtual std::vector<Booking> listBookings() = 0;

  // Payments
  virtual bool hasSuccessfulPayment(Id booking_id, std::optional<Id> exclude_payment_id) = 0;

  /**
   * Inserts `payment` if its booking exists and is active and, when the
   * payment is SUCCESS, no other successful payment exists for the booking.
   */
  virtual WriteResult<Payment> insertPaymentChecked(const Payment& payment) = 0;

  /**
   * Same checks as insertPaymentChecked, excluding `payment.id` itself from
   * the uniqueness scan. `recorded_at` of the stored row is kept.
   */
  virtual WriteResult<Payment> updatePaymentChecked(const Payment& payment) = 0;
  virtual std::optional<Payment> findPayment(Id id) = 0;

  // Payment listings are ordered by recorded_at descending, then id descending.
  virtual std::vector<Payment> listPayments() = 0;
  virtual std::vector<Payment> paymentsByAccount(Id account_id) = 0;
  virtual std::vector<Payment> paymentsByBooking(Id booking_id) = 0;
};

}  // namespace cinema

#endif  // CINEMA_BOOKING_STORE_HPP_
