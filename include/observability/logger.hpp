#ifndef CINEMA_LOGGER_HPP_
#define CINEMA_LOGGER_HPP_

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace cinema {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

// Accepts "debug".."fatal" in any case.
std::optional<LogLevel> parseLogLevel(const std::string& text);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe and supports correlation IDs for request tracing.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cout)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void info(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void warn(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void error(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void fatal(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs, emitted on destruction.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder(const LogBuilder&) = delete;
    LogBuilder& operator=(const LogBuilder&) = delete;

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, std::int64_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    nlohmann::json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const nlohmann::json& fields = nlohmann::json::object());

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  std::atomic<LogLevel> min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) cinema::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) cinema::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) cinema::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) cinema::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) cinema::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  cinema::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace cinema

#endif  // CINEMA_LOGGER_HPP_
