#include "database/postgres_connection.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"

#include <sstream>
#include <utility>

namespace cinema {
namespace database {

using observability::LogLevel;

// QueryResult

QueryResult::QueryResult(PGresult* result, std::string error)
    : result_(result), error_(std::move(error)) {}

QueryResult::~QueryResult() {
  if (result_) {
    PQclear(result_);
  }
}

QueryResult::QueryResult(QueryResult&& other) noexcept
    : result_(other.result_), error_(std::move(other.error_)) {
  other.result_ = nullptr;
}

QueryResult& QueryResult::operator=(QueryResult&& other) noexcept {
  if (this != &other) {
    if (result_) {
      PQclear(result_);
    }
    result_ = other.result_;
    error_ = std::move(other.error_);
    other.result_ = nullptr;
  }
  return *this;
}

bool QueryResult::ok() const {
  if (!result_) return false;
  ExecStatusType status = PQresultStatus(result_);
  return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

int QueryResult::rows() const {
  return result_ ? PQntuples(result_) : 0;
}

int QueryResult::affectedRows() const {
  if (!result_) return 0;
  const char* tuples = PQcmdTuples(result_);
  return (tuples && *tuples) ? std::stoi(tuples) : 0;
}

bool QueryResult::isNull(int row, int col) const {
  return PQgetisnull(result_, row, col) == 1;
}

std::string QueryResult::getString(int row, int col) const {
  return PQgetvalue(result_, row, col);
}

std::optional<std::string> QueryResult::getOptionalString(int row, int col) const {
  if (isNull(row, col)) {
    return std::nullopt;
  }
  return getString(row, col);
}

std::int64_t QueryResult::getInt64(int row, int col) const {
  return std::stoll(PQgetvalue(result_, row, col));
}

bool QueryResult::getBool(int row, int col) const {
  const char* value = PQgetvalue(result_, row, col);
  return value && value[0] == 't';
}

std::string QueryResult::sqlState() const {
  if (!result_) return "";
  const char* state = PQresultErrorField(result_, PG_DIAG_SQLSTATE);
  return state ? state : "";
}

std::string QueryResult::constraintName() const {
  if (!result_) return "";
  const char* name = PQresultErrorField(result_, PG_DIAG_CONSTRAINT_NAME);
  return name ? name : "";
}

std::string quoteConninfoValue(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '\'';
  return quoted;
}

// PostgresConnection

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  disconnectLocked();

  std::stringstream conn_str;
  conn_str << "host=" << quoteConninfoValue(config_.host)
           << " port=" << config_.port
           << " dbname=" << quoteConninfoValue(config_.database)
           << " user=" << quoteConninfoValue(config_.username)
           << " connect_timeout=" << config_.connection_timeout;
  if (!config_.password.empty()) {
    conn_str << " password=" << quoteConninfoValue(config_.password);
  }

  connection_ = PQconnectdb(conn_str.str().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    LOG_BUILDER(LogLevel::ERROR, "Database connection failed")
        .field("target", getConnectionInfo())
        .field("error", std::string(PQerrorMessage(connection_)));
    PQfinish(connection_);
    connection_ = nullptr;
    return false;
  }

  executeLocked("SET SESSION TIME ZONE 'UTC'");

  LOG_BUILDER(LogLevel::DEBUG, "Connected to PostgreSQL")
      .field("target", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    if (in_transaction_) {
      executeLocked("ROLLBACK");
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connection_) {
    return false;
  }
  PQreset(connection_);
  in_transaction_ = false;
  return PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeLocked(query);
}

bool PostgresConnection::executeLocked(const std::string& query) {
  if (!connection_) return false;

  PGresult* result = PQexec(connection_, query.c_str());
  if (!result) {
    LOG_ERROR("Query execution failed: connection lost");
    return false;
  }

  ExecStatusType status = PQresultStatus(result);
  bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);
  if (!success) {
    LOG_BUILDER(LogLevel::ERROR, "Query failed")
        .field("error", std::string(PQresultErrorMessage(result)));
  }

  PQclear(result);
  return success;
}

QueryResult PostgresConnection::execute(const std::string& query,
                                        const std::vector<Param>& params) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return QueryResult(nullptr, "not connected");
  }

  // Pointers into `params`, which outlives the call.
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  PGresult* result = PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                                  nullptr, values.empty() ? nullptr : values.data(),
                                  nullptr, nullptr, 0);
  if (!result) {
    return QueryResult(nullptr, PQerrorMessage(connection_));
  }

  ExecStatusType status = PQresultStatus(result);
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    return QueryResult(result, PQresultErrorMessage(result));
  }
  return QueryResult(result, "");
}

bool PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_transaction_ || !executeLocked("BEGIN")) {
    return false;
  }

  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("ROLLBACK");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return "Not connected";
  }

  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard

TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw BookingError(ErrorKind::STORAGE_UNAVAILABLE,
                       "failed to begin transaction: " + conn_.getLastError());
  }
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  if (!conn_.commitTransaction()) {
    throw BookingError(ErrorKind::STORAGE_UNAVAILABLE,
                       "failed to commit transaction: " + conn_.getLastError());
  }
}

void TransactionGuard::rollback() {
  if (!finished_) {
    conn_.rollbackTransaction();
    finished_ = true;
  }
}

}  // namespace database
}  // namespace cinema
