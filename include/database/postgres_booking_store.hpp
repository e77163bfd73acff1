#ifndef CINEMA_POSTGRES_BOOKING_STORE_HPP_
#define CINEMA_POSTGRES_BOOKING_STORE_HPP_

#include "booking_store.hpp"
#include "database/connection_pool.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace cinema {
namespace database {

/**
 * BookingStore on PostgreSQL.
 *
 * The two uniqueness invariants are partial unique indexes, so they hold for
 * every process sharing the database. Multi-statement primitives run inside
 * a transaction on one pooled connection with row locks on the rows they
 * check. Positive existence lookups of films, auditoriums and accounts are
 * cached; writes still rely on foreign keys.
 */
class PostgresBookingStore : public BookingStore {
 public:
  explicit PostgresBookingStore(std::shared_ptr<ConnectionPool> pool);
  ~PostgresBookingStore() override = default;

  // Non-copyable
  PostgresBookingStore(const PostgresBookingStore&) = delete;
  PostgresBookingStore& operator=(const PostgresBookingStore&) = delete;

  /**
   * Apply the schema file. Safe to repeat.
   */
  bool initializeSchema(const std::string& schema_path);

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
  // Booking must exist, be ACTIVE (row share-locked until commit) and the
  // payer must be an active account. Runs inside the caller's transaction.
  WriteStatus checkPaymentTargets(PostgresConnection& conn, const Payment& payment);

  bool cachedExists(EntityKind kind, Id id);
  void remember(EntityKind kind, Id id);
  void forget(EntityKind kind, Id id);

  std::shared_ptr<ConnectionPool> pool_;

  std::mutex cache_mutex_;
  std::unordered_set<Id> known_films_;
  std::unordered_set<Id> known_auditoriums_;
  std::unordered_set<Id> known_accounts_;
};

}  // namespace database
}  // namespace cinema

#endif  // CINEMA_POSTGRES_BOOKING_STORE_HPP_
