#ifndef CINEMA_CATALOG_STORE_HPP_
#define CINEMA_CATALOG_STORE_HPP_

#include "booking_store.hpp"
#include "cinema_types.hpp"
#include "clock.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cinema {

/**
 * Registration input for an account. `credential_hash` is produced outside
 * the engine and stored as-is.
 */
struct AccountRequest {
  std::string display_name;
  std::string email;
  std::string login_name;
  std::string credential_hash;
  std::optional<std::string> phone;
  AccountRole role = AccountRole::CUSTOMER;
};

/**
 * Film, auditorium and account reference data.
 */
class CatalogStore {
 public:
  CatalogStore(BookingStore& store, const Clock& clock);

  // Non-copyable
  CatalogStore(const CatalogStore&) = delete;
  CatalogStore& operator=(const CatalogStore&) = delete;

  /**
   * Stores a new film. `film.id` is ignored and assigned by the store.
   */
  Film CreateFilm(const Film& film);

  /**
   * Replaces every field of film `id`. NOT_FOUND for an unknown id.
   */
  Film UpdateFilm(Id id, const Film& film);
  Film GetFilm(Id id);
  std::vector<Film> ListFilms();

  /**
   * CONFLICT while any schedule still shows the film.
   */
  void DeleteFilm(Id id);

  Auditorium CreateAuditorium(const Auditorium& auditorium);
  Auditorium UpdateAuditorium(Id id, const Auditorium& auditorium);
  Auditorium GetAuditorium(Id id);
  std::vector<Auditorium> ListAuditoriums();
  void DeleteAuditorium(Id id);

  /**
   * Creates an active account stamped with the current time. A login name
   * already in use is a CONFLICT.
   */
  AccountView RegisterAccount(const AccountRequest& request);
  AccountView GetAccount(Id id);
  std::vector<AccountView> ListAccounts();

  // Deactivated accounts stop resolving as references for new bookings and
  // payments; existing rows are untouched.
  AccountView SetAccountActive(Id id, bool active);

 private:
  void validate(const Film& film) const;
  void validate(const Auditorium& auditorium) const;

  BookingStore& store_;
  const Clock& clock_;
};

}  // namespace cinema

#endif  // CINEMA_CATALOG_STORE_HPP_
