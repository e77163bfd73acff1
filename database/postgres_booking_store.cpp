#include "database/postgres_booking_store.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace cinema {
namespace database {

using observability::LogLevel;
using Params = std::vector<PostgresConnection::Param>;

namespace {

constexpr const char* kActiveSeatIndex = "ux_bookings_active_seat";
constexpr const char* kSingleSuccessIndex = "ux_payments_single_success";
constexpr const char* kLoginNameConstraint = "ux_accounts_login_name";

constexpr const char* kFilmColumns = "id, title, genre, duration_minutes, description";
constexpr const char* kAuditoriumColumns = "id, name, capacity, facilities";
constexpr const char* kAccountColumns =
    "id, display_name, email, login_name, credential_hash, phone, role, "
    "EXTRACT(EPOCH FROM created_at)::bigint, is_active";
constexpr const char* kScheduleColumns =
    "id, auditorium_id, film_id, EXTRACT(EPOCH FROM show_time)::bigint, unit_price";
constexpr const char* kBookingColumns =
    "id, schedule_id, account_id, seat_code, status, EXTRACT(EPOCH FROM booked_at)::bigint";
constexpr const char* kPaymentColumns =
    "id, booking_id, account_id, amount, method, status, "
    "EXTRACT(EPOCH FROM recorded_at)::bigint, reference";

std::string str(std::int64_t value) {
  return std::to_string(value);
}

PostgresConnection::Param optionalId(std::optional<Id> id) {
  if (!id) return std::nullopt;
  return std::to_string(*id);
}

BookingError storageError(const char* operation, const QueryResult& result) {
  LOG_BUILDER(LogLevel::ERROR, "Database operation failed")
      .field("operation", operation)
      .field("sqlstate", result.sqlState())
      .field("error", result.errorMessage());
  return BookingError(ErrorKind::STORAGE_UNAVAILABLE,
                      std::string(operation) + " failed: " + result.errorMessage());
}

// Maps the constraint violations a write may legitimately hit; anything else
// is a storage failure.
WriteStatus classify(const char* operation, const QueryResult& result,
                     WriteStatus on_foreign_key) {
  std::string state = result.sqlState();
  if (state == kUniqueViolation) {
    std::string constraint = result.constraintName();
    if (constraint == kActiveSeatIndex) return WriteStatus::SEAT_TAKEN;
    if (constraint == kSingleSuccessIndex) return WriteStatus::ALREADY_PAID;
    if (constraint == kLoginNameConstraint) return WriteStatus::DUPLICATE;
  }
  if (state == kForeignKeyViolation) {
    return on_foreign_key;
  }
  throw storageError(operation, result);
}

template <typename Row>
std::vector<Row> collect(const QueryResult& result, Row (*parse)(const QueryResult&, int)) {
  std::vector<Row> rows;
  rows.reserve(static_cast<std::size_t>(result.rows()));
  for (int i = 0; i < result.rows(); ++i) {
    rows.push_back(parse(result, i));
  }
  return rows;
}

Film filmFromRow(const QueryResult& r, int row) {
  Film film;
  film.id = r.getInt64(row, 0);
  film.title = r.getString(row, 1);
  film.genre = r.getOptionalString(row, 2);
  film.duration_minutes = static_cast<int>(r.getInt64(row, 3));
  film.description = r.getOptionalString(row, 4);
  return film;
}

Auditorium auditoriumFromRow(const QueryResult& r, int row) {
  Auditorium auditorium;
  auditorium.id = r.getInt64(row, 0);
  auditorium.name = r.getString(row, 1);
  auditorium.capacity = static_cast<int>(r.getInt64(row, 2));
  auditorium.facilities = r.getOptionalString(row, 3);
  return auditorium;
}

Account accountFromRow(const QueryResult& r, int row) {
  Account account;
  account.id = r.getInt64(row, 0);
  account.display_name = r.getString(row, 1);
  account.email = r.getString(row, 2);
  account.login_name = r.getString(row, 3);
  account.credential_hash = r.getString(row, 4);
  account.phone = r.getOptionalString(row, 5);
  account.role = parseAccountRole(r.getString(row, 6)).value_or(AccountRole::CUSTOMER);
  account.created_at = r.getInt64(row, 7);
  account.active = r.getBool(row, 8);
  return account;
}

Schedule scheduleFromRow(const QueryResult& r, int row) {
  Schedule schedule;
  schedule.id = r.getInt64(row, 0);
  schedule.auditorium_id = r.getInt64(row, 1);
  schedule.film_id = r.getInt64(row, 2);
  schedule.show_time = r.getInt64(row, 3);
  schedule.unit_price = r.getInt64(row, 4);
  return schedule;
}

Booking bookingFromRow(const QueryResult& r, int row) {
  Booking booking;
  booking.id = r.getInt64(row, 0);
  booking.schedule_id = r.getInt64(row, 1);
  booking.account_id = r.getInt64(row, 2);
  booking.seat_code = r.getString(row, 3);
  auto status = parseBookingStatus(r.getString(row, 4));
  if (!status) {
    throw BookingError(ErrorKind::STORAGE_UNAVAILABLE,
                       "unknown booking status '" + r.getString(row, 4) + "'");
  }
  booking.status = *status;
  booking.booked_at = r.getInt64(row, 5);
  return booking;
}

Payment paymentFromRow(const QueryResult& r, int row) {
  Payment payment;
  payment.id = r.getInt64(row, 0);
  payment.booking_id = r.getInt64(row, 1);
  payment.account_id = r.getInt64(row, 2);
  payment.amount = r.getInt64(row, 3);
  auto method = parsePaymentMethod(r.getString(row, 4));
  auto status = parsePaymentStatus(r.getString(row, 5));
  if (!method || !status) {
    throw BookingError(ErrorKind::STORAGE_UNAVAILABLE,
                       "unknown payment method or status in row " + str(payment.id));
  }
  payment.method = *method;
  payment.status = *status;
  payment.recorded_at = r.getInt64(row, 6);
  payment.reference = r.getOptionalString(row, 7);
  return payment;
}

}  // namespace

PostgresBookingStore::PostgresBookingStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
}

bool PostgresBookingStore::initializeSchema(const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    LOG_BUILDER(LogLevel::ERROR, "Could not open schema file").field("path", schema_path);
    return false;
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();

  // The simple-query protocol accepts the whole multi-statement script.
  auto conn = pool_->acquire();
  if (!conn->executeQuery(buffer.str())) {
    LOG_BUILDER(LogLevel::ERROR, "Schema initialization failed").field("path", schema_path);
    return false;
  }

  LOG_BUILDER(LogLevel::INFO, "Database schema initialized").field("path", schema_path);
  return true;
}

// ---- Cache ----

bool PostgresBookingStore::cachedExists(EntityKind kind, Id id) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  switch (kind) {
    case EntityKind::FILM: return known_films_.count(id) > 0;
    case EntityKind::AUDITORIUM: return known_auditoriums_.count(id) > 0;
    case EntityKind::ACCOUNT: return known_accounts_.count(id) > 0;
    default: return false;
  }
}

void PostgresBookingStore::remember(EntityKind kind, Id id) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  switch (kind) {
    case EntityKind::FILM: known_films_.insert(id); break;
    case EntityKind::AUDITORIUM: known_auditoriums_.insert(id); break;
    case EntityKind::ACCOUNT: known_accounts_.insert(id); break;
    default: break;
  }
}

void PostgresBookingStore::forget(EntityKind kind, Id id) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  switch (kind) {
    case EntityKind::FILM: known_films_.erase(id); break;
    case EntityKind::AUDITORIUM: known_auditoriums_.erase(id); break;
    case EntityKind::ACCOUNT: known_accounts_.erase(id); break;
    default: break;
  }
}

// ---- Films ----

Film PostgresBookingStore::insertFilm(const Film& film) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("INSERT INTO films (title, genre, duration_minutes, description) "
                  "VALUES ($1, $2, $3, $4) RETURNING ") + kFilmColumns,
      Params{film.title, film.genre, str(film.duration_minutes), film.description});
  if (!result.ok() || result.rows() != 1) {
    throw storageError("insertFilm", result);
  }
  Film stored = filmFromRow(result, 0);
  remember(EntityKind::FILM, stored.id);
  return stored;
}

WriteResult<Film> PostgresBookingStore::updateFilm(const Film& film) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("UPDATE films SET title = $2, genre = $3, duration_minutes = $4, "
                  "description = $5 WHERE id = $1 RETURNING ") + kFilmColumns,
      Params{str(film.id), film.title, film.genre, str(film.duration_minutes), film.description});
  if (!result.ok()) {
    throw storageError("updateFilm", result);
  }
  if (result.rows() == 0) {
    return WriteResult<Film>::failed(WriteStatus::NOT_FOUND);
  }
  return WriteResult<Film>::applied(filmFromRow(result, 0));
}

WriteStatus PostgresBookingStore::deleteFilm(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute("DELETE FROM films WHERE id = $1", Params{str(id)});
  if (!result.ok()) {
    return classify("deleteFilm", result, WriteStatus::HAS_DEPENDENTS);
  }
  forget(EntityKind::FILM, id);
  return result.affectedRows() == 0 ? WriteStatus::NOT_FOUND : WriteStatus::APPLIED;
}

std::optional<Film> PostgresBookingStore::findFilm(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kFilmColumns + " FROM films WHERE id = $1",
                              Params{str(id)});
  if (!result.ok()) {
    throw storageError("findFilm", result);
  }
  if (result.rows() == 0) {
    return std::nullopt;
  }
  return filmFromRow(result, 0);
}

std::vector<Film> PostgresBookingStore::listFilms() {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kFilmColumns + " FROM films ORDER BY id");
  if (!result.ok()) {
    throw storageError("listFilms", result);
  }
  return collect<Film>(result, &filmFromRow);
}

// ---- Auditoriums ----

Auditorium PostgresBookingStore::insertAuditorium(const Auditorium& auditorium) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("INSERT INTO auditoriums (name, capacity, facilities) "
                  "VALUES ($1, $2, $3) RETURNING ") + kAuditoriumColumns,
      Params{auditorium.name, str(auditorium.capacity), auditorium.facilities});
  if (!result.ok() || result.rows() != 1) {
    throw storageError("insertAuditorium", result);
  }
  Auditorium stored = auditoriumFromRow(result, 0);
  remember(EntityKind::AUDITORIUM, stored.id);
  return stored;
}

WriteResult<Auditorium> PostgresBookingStore::updateAuditorium(const Auditorium& auditorium) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("UPDATE auditoriums SET name = $2, capacity = $3, facilities = $4 "
                  "WHERE id = $1 RETURNING ") + kAuditoriumColumns,
      Params{str(auditorium.id), auditorium.name, str(auditorium.capacity),
             auditorium.facilities});
  if (!result.ok()) {
    throw storageError("updateAuditorium", result);
  }
  if (result.rows() == 0) {
    return WriteResult<Auditorium>::failed(WriteStatus::NOT_FOUND);
  }
  return WriteResult<Auditorium>::applied(auditoriumFromRow(result, 0));
}

WriteStatus PostgresBookingStore::deleteAuditorium(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute("DELETE FROM auditoriums WHERE id = $1", Params{str(id)});
  if (!result.ok()) {
    return classify("deleteAuditorium", result, WriteStatus::HAS_DEPENDENTS);
  }
  forget(EntityKind::AUDITORIUM, id);
  return result.affectedRows() == 0 ? WriteStatus::NOT_FOUND : WriteStatus::APPLIED;
}

std::optional<Auditorium> PostgresBookingStore::findAuditorium(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kAuditoriumColumns + " FROM auditoriums WHERE id = $1",
      Params{str(id)});
  if (!result.ok()) {
    throw storageError("findAuditorium", result);
  }
  if (result.rows() == 0) {
    return std::nullopt;
  }
  return auditoriumFromRow(result, 0);
}

std::vector<Auditorium> PostgresBookingStore::listAuditoriums() {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kAuditoriumColumns +
                              " FROM auditoriums ORDER BY id");
  if (!result.ok()) {
    throw storageError("listAuditoriums", result);
  }
  return collect<Auditorium>(result, &auditoriumFromRow);
}

// ---- Accounts ----

WriteResult<Account> PostgresBookingStore::insertAccount(const Account& account) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("INSERT INTO accounts (display_name, email, login_name, credential_hash, "
                  "phone, role, created_at, is_active) "
                  "VALUES ($1, $2, $3, $4, $5, $6, TO_TIMESTAMP($7::bigint), $8::boolean) "
                  "RETURNING ") + kAccountColumns,
      Params{account.display_name, account.email, account.login_name, account.credential_hash,
             account.phone, toString(account.role), str(account.created_at),
             std::string(account.active ? "true" : "false")});
  if (!result.ok()) {
    return WriteResult<Account>::failed(
        classify("insertAccount", result, WriteStatus::MISSING_REFERENCE));
  }
  Account stored = accountFromRow(result, 0);
  if (stored.active) {
    remember(EntityKind::ACCOUNT, stored.id);
  }
  return WriteResult<Account>::applied(stored);
}

WriteResult<Account> PostgresBookingStore::setAccountActive(Id id, bool active) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("UPDATE accounts SET is_active = $2::boolean WHERE id = $1 RETURNING ") +
          kAccountColumns,
      Params{str(id), std::string(active ? "true" : "false")});
  if (!result.ok()) {
    throw storageError("setAccountActive", result);
  }
  forget(EntityKind::ACCOUNT, id);
  if (result.rows() == 0) {
    return WriteResult<Account>::failed(WriteStatus::NOT_FOUND);
  }
  return WriteResult<Account>::applied(accountFromRow(result, 0));
}

std::optional<Account> PostgresBookingStore::findAccount(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE id = $1",
      Params{str(id)});
  if (!result.ok()) {
    throw storageError("findAccount", result);
  }
  if (result.rows() == 0) {
    return std::nullopt;
  }
  return accountFromRow(result, 0);
}

std::vector<Account> PostgresBookingStore::listAccounts() {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kAccountColumns +
                              " FROM accounts ORDER BY id");
  if (!result.ok()) {
    throw storageError("listAccounts", result);
  }
  return collect<Account>(result, &accountFromRow);
}

bool PostgresBookingStore::exists(EntityKind kind, Id id) {
  if (cachedExists(kind, id)) {
    return true;
  }

  const char* query = nullptr;
  switch (kind) {
    case EntityKind::FILM: query = "SELECT 1 FROM films WHERE id = $1"; break;
    case EntityKind::AUDITORIUM: query = "SELECT 1 FROM auditoriums WHERE id = $1"; break;
    case EntityKind::ACCOUNT:
      query = "SELECT 1 FROM accounts WHERE id = $1 AND is_active = TRUE";
      break;
    case EntityKind::SCHEDULE: query = "SELECT 1 FROM schedules WHERE id = $1"; break;
    case EntityKind::BOOKING: query = "SELECT 1 FROM bookings WHERE id = $1"; break;
    case EntityKind::PAYMENT: query = "SELECT 1 FROM payments WHERE id = $1"; break;
  }

  auto conn = pool_->acquire();
  auto result = conn->execute(query, Params{str(id)});
  if (!result.ok()) {
    throw storageError("exists", result);
  }
  bool found = result.rows() > 0;
  if (found) {
    remember(kind, id);
  }
  return found;
}

// ---- Schedules ----

WriteResult<Schedule> PostgresBookingStore::insertSchedule(const Schedule& schedule) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("INSERT INTO schedules (auditorium_id, film_id, show_time, unit_price) "
                  "VALUES ($1, $2, TO_TIMESTAMP($3::bigint), $4) RETURNING ") + kScheduleColumns,
      Params{str(schedule.auditorium_id), str(schedule.film_id), str(schedule.show_time),
             str(schedule.unit_price)});
  if (!result.ok()) {
    return WriteResult<Schedule>::failed(
        classify("insertSchedule", result, WriteStatus::MISSING_REFERENCE));
  }
  return WriteResult<Schedule>::applied(scheduleFromRow(result, 0));
}

WriteResult<Schedule> PostgresBookingStore::updateSchedule(const Schedule& schedule) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("UPDATE schedules SET auditorium_id = $2, film_id = $3, "
                  "show_time = TO_TIMESTAMP($4::bigint), unit_price = $5 "
                  "WHERE id = $1 RETURNING ") + kScheduleColumns,
      Params{str(schedule.id), str(schedule.auditorium_id), str(schedule.film_id),
             str(schedule.show_time), str(schedule.unit_price)});
  if (!result.ok()) {
    return WriteResult<Schedule>::failed(
        classify("updateSchedule", result, WriteStatus::MISSING_REFERENCE));
  }
  if (result.rows() == 0) {
    return WriteResult<Schedule>::failed(WriteStatus::NOT_FOUND);
  }
  return WriteResult<Schedule>::applied(scheduleFromRow(result, 0));
}

WriteStatus PostgresBookingStore::deleteScheduleIfUnreferenced(Id id) {
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  // FOR UPDATE conflicts with the KEY SHARE lock a concurrent booking insert
  // or move takes through its foreign key, so no new booking can slip in.
  auto locked = conn->execute("SELECT id FROM schedules WHERE id = $1 FOR UPDATE",
                              Params{str(id)});
  if (!locked.ok()) {
    throw storageError("deleteSchedule", locked);
  }
  if (locked.rows() == 0) {
    return WriteStatus::NOT_FOUND;
  }

  auto dependents = conn->execute(
      "SELECT 1 FROM bookings b WHERE b.schedule_id = $1 AND (b.status <> 'CANCELLED' OR "
      "EXISTS (SELECT 1 FROM payments p WHERE p.booking_id = b.id AND p.status = 'SUCCESS')) "
      "LIMIT 1",
      Params{str(id)});
  if (!dependents.ok()) {
    throw storageError("deleteSchedule", dependents);
  }
  if (dependents.rows() > 0) {
    return WriteStatus::HAS_DEPENDENTS;
  }

  // Cancelled bookings and their payment attempts cascade.
  auto deleted = conn->execute("DELETE FROM schedules WHERE id = $1", Params{str(id)});
  if (!deleted.ok()) {
    throw storageError("deleteSchedule", deleted);
  }
  transaction.commit();
  return WriteStatus::APPLIED;
}

std::optional<Schedule> PostgresBookingStore::findSchedule(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kScheduleColumns + " FROM schedules WHERE id = $1",
      Params{str(id)});
  if (!result.ok()) {
    throw storageError("findSchedule", result);
  }
  if (result.rows() == 0) {
    return std::nullopt;
  }
  return scheduleFromRow(result, 0);
}

std::vector<Schedule> PostgresBookingStore::listSchedules() {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kScheduleColumns +
                              " FROM schedules ORDER BY id");
  if (!result.ok()) {
    throw storageError("listSchedules", result);
  }
  return collect<Schedule>(result, &scheduleFromRow);
}

// ---- Bookings ----

bool PostgresBookingStore::seatFree(Id schedule_id, const std::string& seat_code,
                                    std::optional<Id> exclude_booking_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      "SELECT 1 FROM bookings WHERE schedule_id = $1 AND seat_code = $2 AND status = 'ACTIVE' "
      "AND ($3::bigint IS NULL OR id <> $3::bigint) LIMIT 1",
      Params{str(schedule_id), seat_code, optionalId(exclude_booking_id)});
  if (!result.ok()) {
    throw storageError("seatFree", result);
  }
  return result.rows() == 0;
}

WriteResult<Booking> PostgresBookingStore::insertBookingIfSeatFree(const Booking& booking) {
  auto conn = pool_->acquire();
  // The partial unique index decides the race; the WHERE clause only keeps
  // deactivated accounts out.
  auto result = conn->execute(
      std::string("INSERT INTO bookings (schedule_id, account_id, seat_code, status, booked_at) "
                  "SELECT $1::bigint, $2::bigint, $3::varchar, 'ACTIVE', "
                  "TO_TIMESTAMP($4::bigint) "
                  "WHERE EXISTS (SELECT 1 FROM accounts WHERE id = $2::bigint AND is_active) "
                  "RETURNING ") + kBookingColumns,
      Params{str(booking.schedule_id), str(booking.account_id), booking.seat_code,
             str(booking.booked_at)});
  if (!result.ok()) {
    return WriteResult<Booking>::failed(
        classify("insertBooking", result, WriteStatus::MISSING_REFERENCE));
  }
  if (result.rows() == 0) {
    return WriteResult<Booking>::failed(WriteStatus::MISSING_REFERENCE);
  }
  return WriteResult<Booking>::applied(bookingFromRow(result, 0));
}

WriteResult<Booking> PostgresBookingStore::moveBookingIfSeatFree(Id booking_id, Id schedule_id,
                                                                 const std::string& seat_code) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("UPDATE bookings SET schedule_id = $2, seat_code = $3 "
                  "WHERE id = $1 AND status = 'ACTIVE' RETURNING ") + kBookingColumns,
      Params{str(booking_id), str(schedule_id), seat_code});
  if (!result.ok()) {
    return WriteResult<Booking>::failed(
        classify("moveBooking", result, WriteStatus::MISSING_REFERENCE));
  }
  if (result.rows() == 1) {
    return WriteResult<Booking>::applied(bookingFromRow(result, 0));
  }

  auto existing = conn->execute("SELECT 1 FROM bookings WHERE id = $1", Params{str(booking_id)});
  if (!existing.ok()) {
    throw storageError("moveBooking", existing);
  }
  return WriteResult<Booking>::failed(existing.rows() == 0 ? WriteStatus::NOT_FOUND
                                                           : WriteStatus::BOOKING_INACTIVE);
}

WriteResult<Booking> PostgresBookingStore::transitionBooking(Id booking_id, BookingEvent event) {
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  auto locked = conn->execute(
      std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE id = $1 FOR UPDATE",
      Params{str(booking_id)});
  if (!locked.ok()) {
    throw storageError("transitionBooking", locked);
  }
  if (locked.rows() == 0) {
    return WriteResult<Booking>::failed(WriteStatus::NOT_FOUND);
  }

  Booking booking = bookingFromRow(locked, 0);
  BookingStatus next = applyBookingEvent(booking.status, event);
  if (next == booking.status) {
    return WriteResult<Booking>::applied(booking, false);
  }

  auto updated = conn->execute("UPDATE bookings SET status = $2 WHERE id = $1",
                               Params{str(booking_id), toString(next)});
  if (!updated.ok()) {
    throw storageError("transitionBooking", updated);
  }
  transaction.commit();

  booking.status = next;
  return WriteResult<Booking>::applied(booking);
}

std::optional<Booking> PostgresBookingStore::findBooking(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE id = $1",
      Params{str(id)});
  if (!result.ok()) {
    throw storageError("findBooking", result);
  }
  if (result.rows() == 0) {
    return std::nullopt;
  }
  return bookingFromRow(result, 0);
}

std::vector<Booking> PostgresBookingStore::listBookings() {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kBookingColumns +
                              " FROM bookings ORDER BY id");
  if (!result.ok()) {
    throw storageError("listBookings", result);
  }
  return collect<Booking>(result, &bookingFromRow);
}

// ---- Payments ----

bool PostgresBookingStore::hasSuccessfulPayment(Id booking_id,
                                                std::optional<Id> exclude_payment_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      "SELECT 1 FROM payments WHERE booking_id = $1 AND status = 'SUCCESS' "
      "AND ($2::bigint IS NULL OR id <> $2::bigint) LIMIT 1",
      Params{str(booking_id), optionalId(exclude_payment_id)});
  if (!result.ok()) {
    throw storageError("hasSuccessfulPayment", result);
  }
  return result.rows() > 0;
}

WriteStatus PostgresBookingStore::checkPaymentTargets(PostgresConnection& conn,
                                                      const Payment& payment) {
  // FOR SHARE holds off a concurrent cancel/expire until this payment commits.
  auto booking = conn.execute("SELECT status FROM bookings WHERE id = $1 FOR SHARE",
                              Params{str(payment.booking_id)});
  if (!booking.ok()) {
    throw storageError("checkPaymentTargets", booking);
  }
  if (booking.rows() == 0) {
    return WriteStatus::MISSING_REFERENCE;
  }
  if (booking.getString(0, 0) != toString(BookingStatus::ACTIVE)) {
    return WriteStatus::BOOKING_INACTIVE;
  }

  auto payer = conn.execute("SELECT 1 FROM accounts WHERE id = $1 AND is_active = TRUE",
                            Params{str(payment.account_id)});
  if (!payer.ok()) {
    throw storageError("checkPaymentTargets", payer);
  }
  return payer.rows() == 0 ? WriteStatus::MISSING_REFERENCE : WriteStatus::APPLIED;
}

WriteResult<Payment> PostgresBookingStore::insertPaymentChecked(const Payment& payment) {
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  WriteStatus status = checkPaymentTargets(*conn, payment);
  if (status != WriteStatus::APPLIED) {
    return WriteResult<Payment>::failed(status);
  }

  auto result = conn->execute(
      std::string("INSERT INTO payments (booking_id, account_id, amount, method, status, "
                  "recorded_at, reference) "
                  "VALUES ($1, $2, $3, $4, $5, TO_TIMESTAMP($6::bigint), $7) RETURNING ") +
          kPaymentColumns,
      Params{str(payment.booking_id), str(payment.account_id), str(payment.amount),
             toString(payment.method), toString(payment.status), str(payment.recorded_at),
             payment.reference});
  if (!result.ok()) {
    return WriteResult<Payment>::failed(
        classify("insertPayment", result, WriteStatus::MISSING_REFERENCE));
  }
  Payment stored = paymentFromRow(result, 0);
  transaction.commit();
  return WriteResult<Payment>::applied(stored);
}

WriteResult<Payment> PostgresBookingStore::updatePaymentChecked(const Payment& payment) {
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  auto locked = conn->execute("SELECT id FROM payments WHERE id = $1 FOR UPDATE",
                              Params{str(payment.id)});
  if (!locked.ok()) {
    throw storageError("updatePayment", locked);
  }
  if (locked.rows() == 0) {
    return WriteResult<Payment>::failed(WriteStatus::NOT_FOUND);
  }

  WriteStatus status = checkPaymentTargets(*conn, payment);
  if (status != WriteStatus::APPLIED) {
    return WriteResult<Payment>::failed(status);
  }

  // recorded_at is left as first written.
  auto result = conn->execute(
      std::string("UPDATE payments SET booking_id = $2, account_id = $3, amount = $4, "
                  "method = $5, status = $6, reference = $7 WHERE id = $1 RETURNING ") +
          kPaymentColumns,
      Params{str(payment.id), str(payment.booking_id), str(payment.account_id),
             str(payment.amount), toString(payment.method), toString(payment.status),
             payment.reference});
  if (!result.ok()) {
    return WriteResult<Payment>::failed(
        classify("updatePayment", result, WriteStatus::MISSING_REFERENCE));
  }
  Payment stored = paymentFromRow(result, 0);
  transaction.commit();
  return WriteResult<Payment>::applied(stored);
}

std::optional<Payment> PostgresBookingStore::findPayment(Id id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kPaymentColumns + " FROM payments WHERE id = $1",
      Params{str(id)});
  if (!result.ok()) {
    throw storageError("findPayment", result);
  }
  if (result.rows() == 0) {
    return std::nullopt;
  }
  return paymentFromRow(result, 0);
}

std::vector<Payment> PostgresBookingStore::listPayments() {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kPaymentColumns +
                              " FROM payments ORDER BY recorded_at DESC, id DESC");
  if (!result.ok()) {
    throw storageError("listPayments", result);
  }
  return collect<Payment>(result, &paymentFromRow);
}

std::vector<Payment> PostgresBookingStore::paymentsByAccount(Id account_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kPaymentColumns +
                                  " FROM payments WHERE account_id = $1 "
                                  "ORDER BY recorded_at DESC, id DESC",
                              Params{str(account_id)});
  if (!result.ok()) {
    throw storageError("paymentsByAccount", result);
  }
  return collect<Payment>(result, &paymentFromRow);
}

std::vector<Payment> PostgresBookingStore::paymentsByBooking(Id booking_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(std::string("SELECT ") + kPaymentColumns +
                                  " FROM payments WHERE booking_id = $1 "
                                  "ORDER BY recorded_at DESC, id DESC",
                              Params{str(booking_id)});
  if (!result.ok()) {
    throw storageError("paymentsByBooking", result);
  }
  return collect<Payment>(result, &paymentFromRow);
}

}  // namespace database
}  // namespace cinema
