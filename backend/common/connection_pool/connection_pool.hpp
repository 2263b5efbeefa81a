#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "common/config/config.hpp"

namespace common {

// One open backend session. Closing happens in the subclass destructor.
class Connection {
public:
  Connection() = default;
  virtual ~Connection() = default;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Cheap liveness check run before a parked connection is handed out again.
  virtual bool isValid() const = 0;
};

/*
  Bounded pool of backend sessions.
    parked   idle sessions, most recently returned at the back
    leased   sessions currently held by a ConnectionGuard
    parked + leased <= max_connections
  A parked session older than idle_timeout is closed instead of reused.
*/
class ConnectionPool {
public:
  virtual ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Blocks up to the configured timeout. Throws std::runtime_error when the
  // pool is exhausted, shutting down, or the backend refuses a new session.
  std::unique_ptr<Connection> acquire();
  void release(std::unique_ptr<Connection> conn);

  size_t leased() const { return leased_.load(); }
  size_t parked() const;

protected:
  explicit ConnectionPool(const config::ConnectionPoolConfig& cfg) : cp_config_(cfg) {}

  // Opens a new session or throws std::runtime_error naming the cause.
  virtual std::unique_ptr<Connection> open() = 0;

  // Opens min_connections sessions up front. Called by subclass constructors
  // once open() is usable.
  void warmUp();

  config::ConnectionPoolConfig cp_config_;

private:
  struct Parked {
    std::unique_ptr<Connection> conn;
    std::chrono::steady_clock::time_point since;
  };

  void dropStaleLocked();

  std::deque<Parked> parked_;
  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::atomic<size_t> leased_{0};
  bool shutdown_{false};
};

// Scoped lease on one pooled session.
class ConnectionGuard {
public:
  explicit ConnectionGuard(ConnectionPool& pool) : pool_(pool), conn_(pool.acquire()) {}
  ~ConnectionGuard() { pool_.release(std::move(conn_)); }

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

protected:
  ConnectionPool& pool_;
  std::unique_ptr<Connection> conn_;
};

} // namespace common
