#include "cinema_engine.hpp"

#include "booking_error.hpp"
#include "database/connection_pool.hpp"
#include "database/postgres_booking_store.hpp"
#include "in_memory_booking_store.hpp"
#include "observability/logger.hpp"
#include "seed_data.hpp"

#include <exception>

namespace cinema {

using observability::LogLevel;

CinemaEngine::CinemaEngine(const Config& config, std::shared_ptr<const Clock> clock,
                           observability::MetricsCollector& metrics)
    : config_(config), clock_(std::move(clock)), metrics_(metrics) {
}

CinemaEngine::CinemaEngine(const Config& config, std::unique_ptr<BookingStore> store,
                           std::shared_ptr<const Clock> clock,
                           observability::MetricsCollector& metrics)
    : config_(config), clock_(std::move(clock)), metrics_(metrics), store_(std::move(store)) {
}

CinemaEngine::~CinemaEngine() {
  shutdown();
}

bool CinemaEngine::openStore() {
  if (store_) {
    return true;
  }

  if (config_.backend == "memory") {
    store_ = std::make_unique<InMemoryBookingStore>();
    return true;
  }

  if (config_.backend == "postgres") {
    database::PostgresConnection::Config db_config;
    db_config.host = config_.db_host;
    db_config.port = config_.db_port;
    db_config.database = config_.db_name;
    db_config.username = config_.db_username;
    db_config.password = config_.db_password;
    db_config.connection_timeout = config_.connection_timeout;
    db_config.max_connections = config_.max_connections;

    auto pool = std::make_shared<database::ConnectionPool>(db_config);
    if (!pool->initialize()) {
      LOG_ERROR("Failed to connect to database");
      return false;
    }

    auto store = std::make_unique<database::PostgresBookingStore>(pool);
    if (!store->initializeSchema(config_.schema_path)) {
      LOG_ERROR("Failed to initialize database schema");
      return false;
    }
    store_ = std::move(store);
    return true;
  }

  LOG_BUILDER(LogLevel::ERROR, "Unknown storage backend").field("backend", config_.backend);
  return false;
}

bool CinemaEngine::initialize() {
  if (initialized_) return true;

  try {
    if (auto level = observability::parseLogLevel(config_.log_level)) {
      observability::Logger::getInstance().setLogLevel(*level);
    }
    observability::describeEngineMetrics(metrics_);

    LOG_BUILDER(LogLevel::INFO, "Initializing cinema engine").field("backend", config_.backend);

    if (!openStore()) {
      return false;
    }

    coordinator_ = std::make_unique<ConsistencyCoordinator>(*store_);
    catalog_ = std::make_unique<CatalogStore>(*store_, *clock_);
    schedules_ = std::make_unique<ScheduleManager>(*coordinator_, *clock_);
    reservations_ = std::make_unique<ReservationLedger>(*coordinator_, *clock_, metrics_);
    payments_ = std::make_unique<PaymentLedger>(*coordinator_, *clock_, metrics_);
    processor_ = std::make_unique<concurrent::RequestProcessor>(config_.worker_threads, &metrics_);
    initialized_ = true;

    if (config_.seed_demo_data) {
      seedDemoData(*this);
    }

    processor_->start();
    LOG_INFO("Cinema engine initialized");
    return true;
  } catch (const BookingError& e) {
    LOG_BUILDER(LogLevel::ERROR, "Cinema engine initialization failed")
        .field("kind", errorKindName(e.kind()))
        .field("error", e.what());
    initialized_ = false;
    return false;
  } catch (const std::exception& e) {
    LOG_BUILDER(LogLevel::ERROR, "Cinema engine initialization failed")
        .field("error", e.what());
    initialized_ = false;
    return false;
  }
}

void CinemaEngine::shutdown() {
  if (processor_) {
    processor_->stop();
  }
}

void CinemaEngine::requireInitialized() const {
  if (!initialized_) {
    throw BookingError(ErrorKind::STORAGE_UNAVAILABLE, "cinema engine is not initialized");
  }
}

CatalogStore& CinemaEngine::catalog() {
  requireInitialized();
  return *catalog_;
}

ScheduleManager& CinemaEngine::schedules() {
  requireInitialized();
  return *schedules_;
}

ReservationLedger& CinemaEngine::reservations() {
  requireInitialized();
  return *reservations_;
}

PaymentLedger& CinemaEngine::payments() {
  requireInitialized();
  return *payments_;
}

ConsistencyCoordinator& CinemaEngine::coordinator() {
  requireInitialized();
  return *coordinator_;
}

concurrent::RequestProcessor& CinemaEngine::processor() {
  requireInitialized();
  return *processor_;
}

}  // namespace cinema
