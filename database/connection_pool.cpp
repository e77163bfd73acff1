#include "database/connection_pool.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"

namespace cinema {
namespace database {

using observability::LogLevel;

ConnectionPool::Lease::Lease(ConnectionPool& pool, PostgresConnection* conn)
    : pool_(&pool), conn_(conn) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(other.conn_) {
  other.conn_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
  if (conn_) {
    pool_->release(conn_);
  }
}

ConnectionPool::ConnectionPool(const PostgresConnection::Config& config) : config_(config) {}

bool ConnectionPool::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);

  int count = config_.max_connections > 0 ? config_.max_connections : 1;
  for (int i = 0; i < count; ++i) {
    auto conn = std::make_unique<PostgresConnection>(config_);
    if (!conn->connect()) {
      connections_.clear();
      idle_.clear();
      return false;
    }
    idle_.push_back(conn.get());
    connections_.push_back(std::move(conn));
  }

  LOG_BUILDER(LogLevel::INFO, "Connection pool ready")
      .field("connections", count)
      .field("target", connections_.front()->getConnectionInfo());
  return true;
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);

  auto timeout = std::chrono::seconds(config_.connection_timeout > 0 ? config_.connection_timeout : 1);
  if (!available_cv_.wait_for(lock, timeout, [this] { return !idle_.empty(); })) {
    throw BookingError(ErrorKind::STORAGE_UNAVAILABLE,
                       "timed out waiting for a database connection");
  }

  PostgresConnection* conn = idle_.back();
  idle_.pop_back();
  lock.unlock();

  Lease lease(*this, conn);
  if (!conn->isConnected()) {
    LOG_WARN("Pooled connection dropped, reconnecting");
    if (!conn->reset()) {
      throw BookingError(ErrorKind::STORAGE_UNAVAILABLE,
                         "database connection lost: " + conn->getLastError());
    }
  }
  return lease;
}

std::size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::release(PostgresConnection* conn) {
  // A lease abandoned mid-transaction must not leak it to the next caller.
  if (conn->inTransaction()) {
    conn->rollbackTransaction();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(conn);
  }
  available_cv_.notify_one();
}

}  // namespace database
}  // namespace cinema
