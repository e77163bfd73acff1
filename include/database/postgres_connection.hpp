#ifndef CINEMA_POSTGRES_CONNECTION_HPP_
#define CINEMA_POSTGRES_CONNECTION_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <libpq-fe.h>

namespace cinema {
namespace database {

// SQLSTATE codes the store reacts to.
constexpr const char* kUniqueViolation = "23505";
constexpr const char* kForeignKeyViolation = "23503";

/**
 * Owning handle for a PGresult. A failed statement still yields a
 * QueryResult so callers can inspect the SQLSTATE and constraint name.
 */
class QueryResult {
 public:
  QueryResult() = default;
  QueryResult(PGresult* result, std::string error);
  ~QueryResult();

  QueryResult(QueryResult&& other) noexcept;
  QueryResult& operator=(QueryResult&& other) noexcept;
  QueryResult(const QueryResult&) = delete;
  QueryResult& operator=(const QueryResult&) = delete;

  bool ok() const;
  int rows() const;
  int affectedRows() const;

  bool isNull(int row, int col) const;
  std::string getString(int row, int col) const;
  std::optional<std::string> getOptionalString(int row, int col) const;
  std::int64_t getInt64(int row, int col) const;
  bool getBool(int row, int col) const;

  // Empty when the statement succeeded or the server did not report one.
  std::string sqlState() const;
  std::string constraintName() const;
  const std::string& errorMessage() const { return error_; }

 private:
  PGresult* result_ = nullptr;
  std::string error_;
};

// Single-quotes a conninfo value, backslash-escaping ' and \.
std::string quoteConninfoValue(const std::string& value);

/**
 * PostgreSQL database connection wrapper.
 * One connection serves one caller at a time; ConnectionPool hands them out.
 */
class PostgresConnection {
 public:
  using Param = std::optional<std::string>;  // std::nullopt binds SQL NULL

  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "cinema";
    std::string username = "cinema";
    std::string password = "";
    int connection_timeout = 10;  // seconds
    int max_connections = 8;
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database.
   */
  bool connect();

  /**
   * Disconnect from the database.
   */
  void disconnect();

  /**
   * Check if connected.
   */
  bool isConnected() const;

  /**
   * Re-establish a dropped connection in place.
   */
  bool reset();

  /**
   * Execute a statement that doesn't return results.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a parameterized statement with text parameters.
   */
  QueryResult execute(const std::string& query, const std::vector<Param>& params = {});

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();
  bool inTransaction() const;

  /**
   * Get last error message.
   */
  std::string getLastError() const;

  /**
   * Get connection info for logging (no password).
   */
  std::string getConnectionInfo() const;

 private:
  // Callers hold mutex_.
  bool executeLocked(const std::string& query);
  void disconnectLocked();

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back on destruction unless
 * committed.
 */
class TransactionGuard {
 public:
  // Throws BookingError(STORAGE_UNAVAILABLE) if BEGIN fails.
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Throws BookingError(STORAGE_UNAVAILABLE) if
   * COMMIT fails.
   */
  void commit();

  /**
   * Rollback the transaction.
   */
  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace cinema

#endif  // CINEMA_POSTGRES_CONNECTION_HPP_
