#ifndef CINEMA_CONNECTION_POOL_HPP_
#define CINEMA_CONNECTION_POOL_HPP_

#include "database/postgres_connection.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace cinema {
namespace database {

/**
 * Fixed set of PostgresConnections shared by the worker threads. A caller
 * holds a Lease for the duration of one store operation (including its
 * transaction) and the connection returns to the pool when the lease ends.
 */
class ConnectionPool {
 public:
  class Lease {
   public:
    Lease(ConnectionPool& pool, PostgresConnection* conn);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&&) = delete;

    PostgresConnection& operator*() const { return *conn_; }
    PostgresConnection* operator->() const { return conn_; }

   private:
    ConnectionPool* pool_;
    PostgresConnection* conn_;
  };

  explicit ConnectionPool(const PostgresConnection::Config& config);
  ~ConnectionPool() = default;

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Open config.max_connections connections. False if any fails.
   */
  bool initialize();

  /**
   * Borrow a connection, waiting up to the configured connection timeout.
   * Throws BookingError(STORAGE_UNAVAILABLE) on timeout or when a dropped
   * connection cannot be re-established.
   */
  Lease acquire();

  std::size_t size() const { return connections_.size(); }
  std::size_t available() const;

 private:
  void release(PostgresConnection* conn);

  PostgresConnection::Config config_;
  std::vector<std::unique_ptr<PostgresConnection>> connections_;
  std::vector<PostgresConnection*> idle_;
  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
};

}  // namespace database
}  // namespace cinema

#endif  // CINEMA_CONNECTION_POOL_HPP_
