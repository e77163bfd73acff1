#include "catalog_store.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"
#include "validation.hpp"

namespace cinema {

using observability::LogLevel;

namespace {

BookingError notFound(const char* what, Id id) {
  return BookingError(ErrorKind::NOT_FOUND, std::string(what) + " " + std::to_string(id) +
                                                " not found");
}

}  // namespace

CatalogStore::CatalogStore(BookingStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

void CatalogStore::validate(const Film& film) const {
  requireText("title", film.title, limits::kFilmTitle);
  requireOptionalText("genre", film.genre, limits::kFilmGenre);
  requireOptionalText("description", film.description, limits::kFilmDescription);
  requireRange("duration_minutes", film.duration_minutes, limits::kMinDurationMinutes,
               limits::kMaxDurationMinutes);
}

void CatalogStore::validate(const Auditorium& auditorium) const {
  requireText("name", auditorium.name, limits::kAuditoriumName);
  requireOptionalText("facilities", auditorium.facilities, limits::kAuditoriumFacilities);
  requireRange("capacity", auditorium.capacity, limits::kMinCapacity, limits::kMaxCapacity);
}

Film CatalogStore::CreateFilm(const Film& film) {
  validate(film);
  Film stored = store_.insertFilm(film);
  LOG_BUILDER(LogLevel::INFO, "Film created")
      .field("film_id", stored.id)
      .field("title", stored.title);
  return stored;
}

Film CatalogStore::UpdateFilm(Id id, const Film& film) {
  validate(film);
  Film replacement = film;
  replacement.id = id;
  auto result = store_.updateFilm(replacement);
  if (!result.ok()) {
    throw notFound("film", id);
  }
  return *result.record;
}

Film CatalogStore::GetFilm(Id id) {
  auto film = store_.findFilm(id);
  if (!film) {
    throw notFound("film", id);
  }
  return *film;
}

std::vector<Film> CatalogStore::ListFilms() {
  return store_.listFilms();
}

void CatalogStore::DeleteFilm(Id id) {
  switch (store_.deleteFilm(id)) {
    case WriteStatus::APPLIED:
      LOG_BUILDER(LogLevel::INFO, "Film deleted").field("film_id", id);
      return;
    case WriteStatus::HAS_DEPENDENTS:
      throw BookingError(ErrorKind::CONFLICT,
                         "film " + std::to_string(id) + " is referenced by schedules");
    default:
      throw notFound("film", id);
  }
}

Auditorium CatalogStore::CreateAuditorium(const Auditorium& auditorium) {
  validate(auditorium);
  Auditorium stored = store_.insertAuditorium(auditorium);
  LOG_BUILDER(LogLevel::INFO, "Auditorium created")
      .field("auditorium_id", stored.id)
      .field("capacity", stored.capacity);
  return stored;
}

Auditorium CatalogStore::UpdateAuditorium(Id id, const Auditorium& auditorium) {
  validate(auditorium);
  Auditorium replacement = auditorium;
  replacement.id = id;
  auto result = store_.updateAuditorium(replacement);
  if (!result.ok()) {
    throw notFound("auditorium", id);
  }
  return *result.record;
}

Auditorium CatalogStore::GetAuditorium(Id id) {
  auto auditorium = store_.findAuditorium(id);
  if (!auditorium) {
    throw notFound("auditorium", id);
  }
  return *auditorium;
}

std::vector<Auditorium> CatalogStore::ListAuditoriums() {
  return store_.listAuditoriums();
}

void CatalogStore::DeleteAuditorium(Id id) {
  switch (store_.deleteAuditorium(id)) {
    case WriteStatus::APPLIED:
      LOG_BUILDER(LogLevel::INFO, "Auditorium deleted").field("auditorium_id", id);
      return;
    case WriteStatus::HAS_DEPENDENTS:
      throw BookingError(ErrorKind::CONFLICT,
                         "auditorium " + std::to_string(id) + " is referenced by schedules");
    default:
      throw notFound("auditorium", id);
  }
}

AccountView CatalogStore::RegisterAccount(const AccountRequest& request) {
  requireText("display_name", request.display_name, limits::kDisplayName);
  requireEmail(request.email);
  requireText("login_name", request.login_name, limits::kLoginName);
  requireText("credential", request.credential_hash, std::string::npos);
  requireOptionalText("phone", request.phone, limits::kPhone);

  Account account;
  account.display_name = request.display_name;
  account.email = request.email;
  account.login_name = request.login_name;
  account.credential_hash = request.credential_hash;
  account.phone = request.phone;
  account.role = request.role;
  account.created_at = clock_.now();
  account.active = true;

  auto result = store_.insertAccount(account);
  if (result.status == WriteStatus::DUPLICATE) {
    throw BookingError(ErrorKind::CONFLICT,
                       "login name '" + request.login_name + "' is already registered");
  }
  if (!result.ok()) {
    throw BookingError(ErrorKind::STORAGE_UNAVAILABLE, "account could not be stored");
  }

  LOG_BUILDER(LogLevel::INFO, "Account registered")
      .field("account_id", result.record->id)
      .field("role", toString(result.record->role));
  return AccountView::from(*result.record);
}

AccountView CatalogStore::GetAccount(Id id) {
  auto account = store_.findAccount(id);
  if (!account) {
    throw notFound("account", id);
  }
  return AccountView::from(*account);
}

std::vector<AccountView> CatalogStore::ListAccounts() {
  std::vector<AccountView> views;
  for (const auto& account : store_.listAccounts()) {
    views.push_back(AccountView::from(account));
  }
  return views;
}

AccountView CatalogStore::SetAccountActive(Id id, bool active) {
  auto result = store_.setAccountActive(id, active);
  if (!result.ok()) {
    throw notFound("account", id);
  }
  LOG_BUILDER(LogLevel::INFO, "Account activation changed")
      .field("account_id", id)
      .field("active", active);
  return AccountView::from(*result.record);
}

}  // namespace cinema
