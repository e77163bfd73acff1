#include "test_support.hpp"

#include <string>

using namespace cinema;
using namespace cinema::test;

using CatalogTest = LedgerTest;

TEST_F(CatalogTest, CreateAndGetFilm) {
  Film film = makeFilm("Avengers: Endgame", 181);
  EXPECT_GT(film.id, 0);

  Film loaded = catalog_.GetFilm(film.id);
  EXPECT_EQ(loaded.title, "Avengers: Endgame");
  EXPECT_EQ(loaded.duration_minutes, 181);
  ASSERT_TRUE(loaded.genre.has_value());
  EXPECT_EQ(*loaded.genre, "Thriller");

  expectError(ErrorKind::NOT_FOUND, [&] { catalog_.GetFilm(film.id + 100); });
}

TEST_F(CatalogTest, FilmFieldValidation) {
  Film film;
  film.title = "   ";
  film.duration_minutes = 100;
  expectError(ErrorKind::INVALID_INPUT, [&] { catalog_.CreateFilm(film); });

  film.title = std::string(201, 'x');
  expectError(ErrorKind::INVALID_INPUT, [&] { catalog_.CreateFilm(film); });

  film.title = "Long";
  film.duration_minutes = 601;
  expectError(ErrorKind::INVALID_QUANTITY, [&] { catalog_.CreateFilm(film); });

  film.duration_minutes = 0;
  expectError(ErrorKind::INVALID_QUANTITY, [&] { catalog_.CreateFilm(film); });

  film.duration_minutes = 600;
  film.description = std::string(1001, 'd');
  expectError(ErrorKind::INVALID_INPUT, [&] { catalog_.CreateFilm(film); });

  EXPECT_TRUE(catalog_.ListFilms().empty());
}

TEST_F(CatalogTest, UpdateFilmReplacesFields) {
  Film film = makeFilm();
  Film changed;
  changed.title = "Parasite (Director's Cut)";
  changed.duration_minutes = 140;

  Film updated = catalog_.UpdateFilm(film.id, changed);
  EXPECT_EQ(updated.id, film.id);
  EXPECT_EQ(updated.title, "Parasite (Director's Cut)");
  EXPECT_FALSE(updated.genre.has_value());

  expectError(ErrorKind::NOT_FOUND, [&] { catalog_.UpdateFilm(film.id + 1, changed); });
}

TEST_F(CatalogTest, AuditoriumCapacityBounds) {
  Auditorium auditorium;
  auditorium.name = "Hall";
  auditorium.capacity = 1001;
  expectError(ErrorKind::INVALID_QUANTITY, [&] { catalog_.CreateAuditorium(auditorium); });

  auditorium.capacity = 1000;
  Auditorium stored = catalog_.CreateAuditorium(auditorium);
  EXPECT_EQ(catalog_.GetAuditorium(stored.id).capacity, 1000);
  EXPECT_EQ(catalog_.ListAuditoriums().size(), 1u);
}

TEST_F(CatalogTest, DeleteReferencedCatalogRowsIsConflict) {
  ScheduleView schedule = makeSchedule();

  expectError(ErrorKind::CONFLICT, [&] { catalog_.DeleteFilm(schedule.film.id); });
  expectError(ErrorKind::CONFLICT, [&] { catalog_.DeleteAuditorium(schedule.auditorium.id); });

  schedules_.Delete(schedule.schedule.id);
  catalog_.DeleteFilm(schedule.film.id);
  catalog_.DeleteAuditorium(schedule.auditorium.id);

  expectError(ErrorKind::NOT_FOUND, [&] { catalog_.DeleteFilm(schedule.film.id); });
  expectError(ErrorKind::NOT_FOUND, [&] { catalog_.GetAuditorium(schedule.auditorium.id); });
}

TEST_F(CatalogTest, RegisterAccount) {
  clock_.set(1750000000);
  AccountView account = makeAccount("johndoe");

  EXPECT_EQ(account.login_name, "johndoe");
  EXPECT_EQ(account.role, AccountRole::CUSTOMER);
  EXPECT_EQ(account.created_at, 1750000000);
  EXPECT_TRUE(account.active);

  // The stored credential is kept but never projected.
  auto stored = store_.findAccount(account.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->credential_hash, "hash-johndoe");
}

TEST_F(CatalogTest, DuplicateLoginNameIsConflict) {
  makeAccount("janesmith");
  expectError(ErrorKind::CONFLICT, [&] { makeAccount("janesmith"); });
  EXPECT_EQ(catalog_.ListAccounts().size(), 1u);
}

TEST_F(CatalogTest, AccountFieldValidation) {
  AccountRequest request;
  request.display_name = "Bob";
  request.login_name = "bob";
  request.credential_hash = "h";

  request.email = "bob.example.com";
  expectError(ErrorKind::INVALID_INPUT, [&] { catalog_.RegisterAccount(request); });
  request.email = "@example.com";
  expectError(ErrorKind::INVALID_INPUT, [&] { catalog_.RegisterAccount(request); });

  request.email = "bob@example.com";
  request.phone = std::string(21, '1');
  expectError(ErrorKind::INVALID_INPUT, [&] { catalog_.RegisterAccount(request); });

  request.phone.reset();
  request.credential_hash = "";
  expectError(ErrorKind::INVALID_INPUT, [&] { catalog_.RegisterAccount(request); });
}

TEST_F(CatalogTest, InactiveAccountDoesNotResolve) {
  ScheduleView schedule = makeSchedule();
  AccountView account = makeAccount("bobwilson");

  AccountView inactive = catalog_.SetAccountActive(account.id, false);
  EXPECT_FALSE(inactive.active);
  EXPECT_FALSE(coordinator_.Exists(EntityKind::ACCOUNT, account.id));

  expectError(ErrorKind::REFERENCE_NOT_FOUND,
              [&] { reservations_.Reserve(schedule.schedule.id, account.id, "A1"); });

  // Still readable by id.
  EXPECT_FALSE(catalog_.GetAccount(account.id).active);

  catalog_.SetAccountActive(account.id, true);
  EXPECT_NO_THROW(reservations_.Reserve(schedule.schedule.id, account.id, "A1"));

  expectError(ErrorKind::NOT_FOUND, [&] { catalog_.SetAccountActive(9999, true); });
}
