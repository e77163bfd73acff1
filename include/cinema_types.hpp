#ifndef CINEMA_TYPES_HPP_
#define CINEMA_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace cinema {

// Row identifier shared by every table.
using Id = std::int64_t;

// Seconds since the Unix epoch, UTC.
using Timestamp = std::int64_t;

// Amounts are kept in minor currency units (1/100), e.g. 75000.00 -> 7500000.
using Money = std::int64_t;

enum class AccountRole {
  CUSTOMER,
  ADMIN
};

enum class BookingStatus {
  ACTIVE,
  CANCELLED,
  EXPIRED
};

// Events that drive a booking out of the ACTIVE state.
enum class BookingEvent {
  CANCEL,
  EXPIRE
};

enum class PaymentMethod {
  CARD,
  EWALLET,
  BANK_TRANSFER
};

enum class PaymentStatus {
  PENDING,
  SUCCESS,
  FAILED
};

/**
 * Film reference data.
 */
struct Film {
  Id id = 0;
  std::string title;
  std::optional<std::string> genre;
  int duration_minutes = 0;
  std::optional<std::string> description;
};

/**
 * Auditorium (screening room) reference data.
 */
struct Auditorium {
  Id id = 0;
  std::string name;
  int capacity = 0;
  std::optional<std::string> facilities;
};

/**
 * Customer or staff account. `credential_hash` is write-only: it is stored
 * but never copied into an AccountView.
 */
struct Account {
  Id id = 0;
  std::string display_name;
  std::string email;
  std::string login_name;
  std::string credential_hash;
  std::optional<std::string> phone;
  AccountRole role = AccountRole::CUSTOMER;
  Timestamp created_at = 0;
  bool active = true;
};

struct Schedule {
  Id id = 0;
  Id auditorium_id = 0;
  Id film_id = 0;
  Timestamp show_time = 0;
  Money unit_price = 0;
};

struct Booking {
  Id id = 0;
  Id schedule_id = 0;
  Id account_id = 0;
  std::string seat_code;
  BookingStatus status = BookingStatus::ACTIVE;
  Timestamp booked_at = 0;
};

struct Payment {
  Id id = 0;
  Id booking_id = 0;
  Id account_id = 0;
  Money amount = 0;
  PaymentMethod method = PaymentMethod::CARD;
  PaymentStatus status = PaymentStatus::PENDING;
  Timestamp recorded_at = 0;
  std::optional<std::string> reference;
};

// Read-side projections. Assembled by joining on identifiers when queried;
// every member is a copy taken at that moment.

struct AccountView {
  Id id = 0;
  std::string display_name;
  std::string email;
  std::string login_name;
  std::optional<std::string> phone;
  AccountRole role = AccountRole::CUSTOMER;
  Timestamp created_at = 0;
  bool active = true;

  static AccountView from(const Account& account);
};

struct ScheduleView {
  Schedule schedule;
  Auditorium auditorium;
  Film film;
};

struct BookingView {
  Booking booking;
  ScheduleView schedule;
  AccountView account;
};

struct PaymentView {
  Payment payment;
  BookingView booking;
  AccountView account;
};

/**
 * Booking state machine. ACTIVE moves to the terminal state named by the
 * event; a terminal state never changes again.
 */
BookingStatus applyBookingEvent(BookingStatus current, BookingEvent event);

// True for the only status that occupies a seat.
inline bool holdsSeat(BookingStatus status) {
  return status == BookingStatus::ACTIVE;
}

std::string toString(AccountRole role);
std::string toString(BookingStatus status);
std::string toString(BookingEvent event);
std::string toString(PaymentMethod method);
std::string toString(PaymentStatus status);

// Inverse of toString(); std::nullopt for an unknown token.
std::optional<AccountRole> parseAccountRole(const std::string& text);
std::optional<BookingStatus> parseBookingStatus(const std::string& text);
std::optional<PaymentMethod> parsePaymentMethod(const std::string& text);
std::optional<PaymentStatus> parsePaymentStatus(const std::string& text);

}  // namespace cinema

#endif  // CINEMA_TYPES_HPP_
