#include "connection_pool.hpp"
#include <stdexcept>

namespace common {

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdown_ = true;
  parked_.clear();
  released_.notify_all();
}

void ConnectionPool::warmUp() {
  for (size_t i = 0; i < cp_config_.min_connections; ++i) {
    auto conn = open();
    std::lock_guard<std::mutex> lock(mutex_);
    parked_.push_back(Parked{std::move(conn), std::chrono::steady_clock::now()});
  }
}

void ConnectionPool::dropStaleLocked() {
  const auto cutoff = std::chrono::steady_clock::now() - cp_config_.idle_timeout;
  // oldest first; keep at least min_connections parked
  while (parked_.size() > cp_config_.min_connections && parked_.front().since < cutoff) {
    parked_.pop_front();
  }
}

std::unique_ptr<Connection> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  const auto deadline = std::chrono::steady_clock::now() + cp_config_.timeout;

  while (true) {
    if (shutdown_) {
      throw std::runtime_error("Connection pool is shutting down");
    }
    dropStaleLocked();

    while (!parked_.empty()) {
      auto conn = std::move(parked_.back().conn);
      parked_.pop_back();
      if (conn && conn->isValid()) {
        leased_.fetch_add(1);
        return conn;
      }
    }

    if (leased_.load() < cp_config_.max_connections) {
      // reserve the slot before opening outside the lock
      leased_.fetch_add(1);
      lock.unlock();
      try {
        return open();
      } catch (...) {
        leased_.fetch_sub(1);
        released_.notify_one();
        throw;
      }
    }

    if (released_.wait_until(lock, deadline) == std::cv_status::timeout) {
      throw std::runtime_error("Timed out waiting for a database connection (" +
                               std::to_string(cp_config_.max_connections) + " in use)");
    }
  }
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
  if (!conn) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  leased_.fetch_sub(1);
  if (!shutdown_) {
    parked_.push_back(Parked{std::move(conn), std::chrono::steady_clock::now()});
  }
  released_.notify_one();
}

size_t ConnectionPool::parked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_.size();
}

} // namespace common
