#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <mysql/mysql.h>
#include <memory>

namespace common {

class MySQLConnection final : public Connection {
public:
  explicit MySQLConnection(MYSQL* handle) : handle_(handle) {}
  ~MySQLConnection() override;

  MYSQL* handle() const { return handle_; }
  bool isValid() const override { return handle_ && mysql_ping(handle_) == 0; }

private:
  MYSQL* handle_;
};

// Sessions to the jobs/renditions database. Construction opens
// min_connections sessions and throws std::runtime_error if the server is
// unreachable.
class MySQLConnectionPool final : public ConnectionPool {
public:
  MySQLConnectionPool(const config::DatabaseConfig& db_config,
                      const config::ConnectionPoolConfig& cp_config);

protected:
  std::unique_ptr<Connection> open() override;

private:
  config::DatabaseConfig db_config_;
};

class MySQLConnectionGuard final : public ConnectionGuard {
public:
  using ConnectionGuard::ConnectionGuard;

  MYSQL* get() const { return static_cast<MySQLConnection*>(conn_.get())->handle(); }
};

} // namespace common
