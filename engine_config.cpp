#include "engine_config.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"

#include <fstream>

namespace cinema {

namespace {

template <typename T>
void read(const nlohmann::json& document, const char* key, T& target) {
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return;
  }
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw BookingError(ErrorKind::INVALID_INPUT,
                       std::string("config key '") + key + "': " + e.what());
  }
}

void requirePositive(long long value, const char* key) {
  if (value <= 0) {
    throw BookingError(ErrorKind::INVALID_INPUT,
                       std::string("config key '") + key + "' must be positive");
  }
}

}  // namespace

CinemaEngine::Config parseEngineConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw BookingError(ErrorKind::INVALID_INPUT, "config must be a JSON object");
  }

  CinemaEngine::Config config;
  read(document, "backend", config.backend);
  read(document, "seed_demo_data", config.seed_demo_data);
  read(document, "log_level", config.log_level);
  read(document, "worker_threads", config.worker_threads);

  auto db = document.find("database");
  if (db != document.end()) {
    if (!db->is_object()) {
      throw BookingError(ErrorKind::INVALID_INPUT, "config key 'database' must be an object");
    }
    read(*db, "host", config.db_host);
    read(*db, "port", config.db_port);
    read(*db, "name", config.db_name);
    read(*db, "username", config.db_username);
    read(*db, "password", config.db_password);
    read(*db, "max_connections", config.max_connections);
    read(*db, "connection_timeout", config.connection_timeout);
    read(*db, "schema_path", config.schema_path);
  }

  if (config.backend != "memory" && config.backend != "postgres") {
    throw BookingError(ErrorKind::INVALID_INPUT, "unknown backend '" + config.backend + "'");
  }
  if (!observability::parseLogLevel(config.log_level)) {
    throw BookingError(ErrorKind::INVALID_INPUT, "unknown log level '" + config.log_level + "'");
  }
  requirePositive(static_cast<long long>(config.worker_threads), "worker_threads");
  requirePositive(config.db_port, "database.port");
  requirePositive(config.max_connections, "database.max_connections");
  requirePositive(config.connection_timeout, "database.connection_timeout");

  return config;
}

CinemaEngine::Config loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw BookingError(ErrorKind::INVALID_INPUT, "cannot open config file " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw BookingError(ErrorKind::INVALID_INPUT, "malformed config " + path + ": " + e.what());
  }

  CinemaEngine::Config config = parseEngineConfig(document);
  LOG_BUILDER(observability::LogLevel::INFO, "Loaded engine config")
      .field("path", path)
      .field("backend", config.backend);
  return config;
}

}  // namespace cinema
