#include "test_support.hpp"

#include "../include/cinema_engine.hpp"
#include "../include/engine_config.hpp"
#include "../include/observability/logger.hpp"
#include "../include/seed_data.hpp"
#include "../include/view_json.hpp"

#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace cinema;
using namespace cinema::test;

// End-to-end booking scenarios
TEST_F(LedgerTest, DoubleBookingAndDoublePaymentScenario) {
  Film film = makeFilm("Avengers: Endgame", 181);
  Auditorium auditorium = makeAuditorium("Studio IMAX", 200);
  ScheduleView schedule = schedules_.Create({auditorium.id, film.id, clock_.now() + kDay,
                                             7500000});
  AccountView a = makeAccount("accounta");
  AccountView b = makeAccount("accountb");

  BookingView booking = reservations_.Reserve(schedule.schedule.id, a.id, "A1");

  auto rival = std::async(std::launch::async, [&]() {
    return reservations_.Reserve(schedule.schedule.id, b.id, "A1");
  });
  expectError(ErrorKind::SEAT_TAKEN, [&] { rival.get(); });

  PaymentRequest first{booking.booking.id, a.id, 7500000, PaymentMethod::CARD,
                       PaymentStatus::SUCCESS, std::nullopt};
  EXPECT_NO_THROW(payments_.Record(first));

  PaymentRequest second{booking.booking.id, b.id, 7500000, PaymentMethod::CARD,
                        PaymentStatus::SUCCESS, std::nullopt};
  expectError(ErrorKind::ALREADY_PAID, [&] { payments_.Record(second); });
}

TEST_F(LedgerTest, CancellationFreesSlotScenario) {
  ScheduleView schedule = makeSchedule();
  AccountView a = makeAccount("accounta");
  AccountView b = makeAccount("accountb");

  BookingView booking = reservations_.Reserve(schedule.schedule.id, a.id, "A1");
  reservations_.Cancel(booking.booking.id);
  BookingView rebooked = reservations_.Reserve(schedule.schedule.id, b.id, "A1");
  EXPECT_EQ(rebooked.booking.status, BookingStatus::ACTIVE);
  EXPECT_EQ(rebooked.account.id, b.id);
}

// Engine facade and seeding
class CinemaEngineTest : public ::testing::Test {
 protected:
  CinemaEngineTest() : clock_(std::make_shared<ManualClock>(1760000000)) {}

  std::unique_ptr<CinemaEngine> makeEngine(bool seed) {
    CinemaEngine::Config config;
    config.worker_threads = 2;
    config.seed_demo_data = seed;
    config.log_level = "warn";
    return std::make_unique<CinemaEngine>(config, clock_, metrics_);
  }

  std::shared_ptr<ManualClock> clock_;
  observability::MetricsCollector metrics_;
};

TEST_F(CinemaEngineTest, AccessorsRequireInitialize) {
  auto engine = makeEngine(false);
  EXPECT_FALSE(engine->isInitialized());
  expectError(ErrorKind::STORAGE_UNAVAILABLE, [&] { engine->catalog(); });

  ASSERT_TRUE(engine->initialize());
  EXPECT_TRUE(engine->processor().isRunning());
  EXPECT_TRUE(engine->catalog().ListFilms().empty());
  engine->shutdown();
  EXPECT_FALSE(engine->processor().isRunning());
}

TEST_F(CinemaEngineTest, UnknownBackendFailsInitialize) {
  CinemaEngine::Config config;
  config.backend = "cassandra";
  CinemaEngine engine(config, clock_, metrics_);
  EXPECT_FALSE(engine.initialize());
  EXPECT_FALSE(engine.isInitialized());
}

namespace {

class UnreadableCatalogStore : public InMemoryBookingStore {
 public:
  std::vector<Film> listFilms() override {
    throw std::runtime_error("catalog read failed");
  }
};

}  // namespace

TEST_F(CinemaEngineTest, NonBookingErrorFailsInitialize) {
  CinemaEngine::Config config;
  config.seed_demo_data = true;
  CinemaEngine engine(config, std::make_unique<UnreadableCatalogStore>(), clock_, metrics_);

  EXPECT_FALSE(engine.initialize());
  EXPECT_FALSE(engine.isInitialized());
  expectError(ErrorKind::STORAGE_UNAVAILABLE, [&] { engine.processor(); });
}

TEST_F(CinemaEngineTest, SeedsDemoData) {
  auto engine = makeEngine(true);
  ASSERT_TRUE(engine->initialize());

  EXPECT_EQ(engine->catalog().ListFilms().size(), 3u);
  EXPECT_EQ(engine->catalog().ListAuditoriums().size(), 3u);
  EXPECT_EQ(engine->catalog().ListAccounts().size(), 4u);

  auto schedules = engine->schedules().List();
  ASSERT_EQ(schedules.size(), 3u);
  for (const auto& view : schedules) {
    EXPECT_GT(view.schedule.show_time, clock_->now());
  }

  auto bookings = engine->reservations().List();
  ASSERT_EQ(bookings.size(), 3u);
  int cancelled = 0;
  for (const auto& view : bookings) {
    if (view.booking.status == BookingStatus::CANCELLED) {
      ++cancelled;
      EXPECT_EQ(view.booking.seat_code, "C3");
    }
  }
  EXPECT_EQ(cancelled, 1);

  auto payments = engine->payments().List();
  ASSERT_EQ(payments.size(), 3u);
  int successes = 0;
  for (const auto& view : payments) {
    if (view.payment.status == PaymentStatus::SUCCESS) ++successes;
  }
  EXPECT_EQ(successes, 2);

  // A second run leaves the populated catalog alone.
  EXPECT_FALSE(seedDemoData(*engine));
  EXPECT_EQ(engine->catalog().ListFilms().size(), 3u);
}

TEST_F(CinemaEngineTest, InjectedStoreIsUsed) {
  CinemaEngine::Config config;
  config.backend = "postgres";  // ignored: a store is supplied
  CinemaEngine engine(config, std::make_unique<InMemoryBookingStore>(), clock_, metrics_);
  ASSERT_TRUE(engine.initialize());

  Film film;
  film.title = "Parasite";
  film.duration_minutes = 132;
  engine.catalog().CreateFilm(film);
  EXPECT_TRUE(engine.coordinator().Exists(EntityKind::FILM, 1));
}

TEST_F(CinemaEngineTest, OperationsRunOnWorkers) {
  auto engine = makeEngine(true);
  ASSERT_TRUE(engine->initialize());

  Id schedule_id = engine->schedules().List().front().schedule.id;
  Id account_id = engine->catalog().ListAccounts().back().id;

  auto free = engine->processor().submit([&]() {
    return engine->reservations().IsSeatFree(schedule_id, "D4");
  });
  EXPECT_TRUE(free.get());

  auto booked = engine->processor().submit([&]() {
    return engine->reservations().Reserve(schedule_id, account_id, "D4");
  });
  EXPECT_EQ(booked.get().booking.seat_code, "D4");
}

// Configuration
class EngineConfigTest : public ::testing::Test {
 protected:
  std::string writeFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
  }
};

TEST_F(EngineConfigTest, MissingKeysKeepDefaults) {
  CinemaEngine::Config config = parseEngineConfig(nlohmann::json::object());
  CinemaEngine::Config defaults;
  EXPECT_EQ(config.backend, defaults.backend);
  EXPECT_EQ(config.db_port, defaults.db_port);
  EXPECT_EQ(config.worker_threads, defaults.worker_threads);
  EXPECT_EQ(config.schema_path, defaults.schema_path);
  EXPECT_FALSE(config.seed_demo_data);
}

TEST_F(EngineConfigTest, LoadsFile) {
  std::string path = writeFile("cinema_config.json", R"({
    "backend": "postgres",
    "worker_threads": 8,
    "log_level": "debug",
    "seed_demo_data": true,
    "database": {"host": "db.internal", "port": 6543, "name": "box_office",
                 "username": "ticketing", "max_connections": 16}
  })");

  CinemaEngine::Config config = loadEngineConfig(path);
  EXPECT_EQ(config.backend, "postgres");
  EXPECT_EQ(config.worker_threads, 8u);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_TRUE(config.seed_demo_data);
  EXPECT_EQ(config.db_host, "db.internal");
  EXPECT_EQ(config.db_port, 6543);
  EXPECT_EQ(config.db_name, "box_office");
  EXPECT_EQ(config.db_username, "ticketing");
  EXPECT_EQ(config.max_connections, 16);
  EXPECT_EQ(config.connection_timeout, 10);
}

TEST_F(EngineConfigTest, RejectsBadInput) {
  expectError(ErrorKind::INVALID_INPUT,
              [&] { loadEngineConfig(writeFile("broken.json", "{\"backend\": ")); });
  expectError(ErrorKind::INVALID_INPUT,
              [&] { loadEngineConfig(::testing::TempDir() + "does_not_exist.json"); });
  expectError(ErrorKind::INVALID_INPUT,
              [&] { parseEngineConfig(nlohmann::json::parse(R"({"backend": "redis"})")); });
  expectError(ErrorKind::INVALID_INPUT,
              [&] { parseEngineConfig(nlohmann::json::parse(R"({"log_level": "loud"})")); });
  expectError(ErrorKind::INVALID_INPUT,
              [&] { parseEngineConfig(nlohmann::json::parse(R"({"worker_threads": "four"})")); });
  expectError(ErrorKind::INVALID_INPUT,
              [&] { parseEngineConfig(nlohmann::json::parse(R"({"worker_threads": 0})")); });
  expectError(ErrorKind::INVALID_INPUT, [&] {
    parseEngineConfig(nlohmann::json::parse(R"({"database": {"port": -1}})"));
  });
  expectError(ErrorKind::INVALID_INPUT, [&] { parseEngineConfig(nlohmann::json::array()); });
}

// JSON rendering
TEST_F(LedgerTest, ViewsRenderWithoutCredential) {
  ScheduleView schedule = makeSchedule();
  AccountView account = makeAccount("johndoe");
  BookingView booking = reservations_.Reserve(schedule.schedule.id, account.id, "A1");
  PaymentRequest request = paymentFor(booking, PaymentStatus::SUCCESS);
  request.reference = "TXN001";
  PaymentView payment = payments_.Record(request);

  nlohmann::json j = payment;
  EXPECT_EQ(j["status"], "SUCCESS");
  EXPECT_EQ(j["method"], "CARD");
  EXPECT_EQ(j["reference"], "TXN001");
  EXPECT_EQ(j["booking"]["seat_code"], "A1");
  EXPECT_EQ(j["booking"]["status"], "ACTIVE");
  EXPECT_EQ(j["booking"]["schedule"]["film"]["title"], schedule.film.title);
  EXPECT_EQ(j["account"]["login_name"], "johndoe");
  EXPECT_FALSE(j["account"].contains("credential_hash"));

  std::string text = j.dump();
  EXPECT_EQ(text.find("hash-johndoe"), std::string::npos);

  nlohmann::json film = schedule.film;
  EXPECT_TRUE(film["description"].is_null());
}

// Observability
TEST(LoggerTest, WritesEscapedJsonLines) {
  auto& logger = observability::Logger::getInstance();
  std::stringstream out;
  auto previous_level = logger.getLogLevel();
  logger.setOutputStream(out);
  logger.setLogLevel(observability::LogLevel::INFO);

  LOG_DEBUG("dropped");
  LOG_BUILDER(observability::LogLevel::WARN, "Seat \"A1\" taken")
      .field("seat_code", "A1")
      .field("schedule_id", static_cast<std::int64_t>(7))
      .field("retry", false);

  logger.setOutputStream(std::cout);
  logger.setLogLevel(previous_level);

  std::string line;
  ASSERT_TRUE(std::getline(out, line));
  auto entry = nlohmann::json::parse(line);
  EXPECT_EQ(entry["level"], "WARN");
  EXPECT_EQ(entry["message"], "Seat \"A1\" taken");
  EXPECT_EQ(entry["seat_code"], "A1");
  EXPECT_EQ(entry["schedule_id"], 7);
  EXPECT_EQ(entry["retry"], false);
  EXPECT_FALSE(std::getline(out, line));
}

TEST(LoggerTest, ParseLogLevel) {
  EXPECT_TRUE(observability::parseLogLevel("Debug") == observability::LogLevel::DEBUG);
  EXPECT_TRUE(observability::parseLogLevel("warning") == observability::LogLevel::WARN);
  EXPECT_FALSE(observability::parseLogLevel("verbose").has_value());
}

TEST(MetricsTest, CountersGaugesAndHistograms) {
  observability::MetricsCollector metrics;
  observability::describeEngineMetrics(metrics);

  metrics.incrementCounter(observability::metric::kBookingsReserved);
  metrics.incrementCounter(observability::metric::kBookingsReserved, 2.0);
  metrics.setGauge("cinema_open_screens", 5.0);
  metrics.decrementGauge("cinema_open_screens");
  metrics.observeHistogram(observability::metric::kReserveSeconds, 0.002);
  metrics.observeHistogram(observability::metric::kReserveSeconds, 100.0);

  EXPECT_EQ(metrics.counterValue(observability::metric::kBookingsReserved), 3.0);
  EXPECT_EQ(metrics.gaugeValue("cinema_open_screens"), 4.0);
  EXPECT_EQ(metrics.histogramCount(observability::metric::kReserveSeconds), 2u);
  EXPECT_EQ(metrics.counterValue("never_touched"), 0.0);

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# TYPE cinema_bookings_reserved_total counter"), std::string::npos);
  EXPECT_NE(text.find("cinema_bookings_reserved_total 3"), std::string::npos);
  EXPECT_NE(text.find("cinema_reserve_seconds_bucket{le=\"+Inf\"} 2"), std::string::npos);
  EXPECT_NE(text.find("cinema_reserve_seconds_count 2"), std::string::npos);

  metrics.reset();
  EXPECT_EQ(metrics.counterValue(observability::metric::kBookingsReserved), 0.0);
}

TEST(ErrorKindTest, StableNames) {
  EXPECT_STREQ(errorKindName(ErrorKind::SEAT_TAKEN), "SEAT_TAKEN");
  EXPECT_STREQ(errorKindName(ErrorKind::ALREADY_PAID), "ALREADY_PAID");
  EXPECT_STREQ(errorKindName(ErrorKind::REFERENCE_NOT_FOUND), "REFERENCE_NOT_FOUND");
  EXPECT_STREQ(errorKindName(ErrorKind::STORAGE_UNAVAILABLE), "STORAGE_UNAVAILABLE");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
