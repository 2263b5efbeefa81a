#include "mysql_connection_pool.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace common {

MySQLConnection::~MySQLConnection() {
  if (handle_) {
    mysql_close(handle_);
  }
}

MySQLConnectionPool::MySQLConnectionPool(const config::DatabaseConfig& db_config,
                                         const config::ConnectionPoolConfig& cp_config)
  : ConnectionPool(cp_config), db_config_(db_config) {
  warmUp();
}

std::unique_ptr<Connection> MySQLConnectionPool::open() {
  MYSQL* handle = mysql_init(nullptr);
  if (!handle) {
    throw std::runtime_error("mysql_init failed: out of memory");
  }

  // connect/read/write timeouts are whole seconds in the C API
  unsigned int seconds = static_cast<unsigned int>(
    std::max<long long>(1, std::chrono::duration_cast<std::chrono::seconds>(cp_config_.timeout).count()));
  mysql_options(handle, MYSQL_SET_CHARSET_NAME, db_config_.charset.c_str());
  mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &seconds);
  mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &seconds);
  mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &seconds);

  // affected row counts report matched rows, not only changed ones
  if (!mysql_real_connect(handle, db_config_.host.c_str(), db_config_.user.c_str(),
                          db_config_.password.c_str(), db_config_.db_name.c_str(),
                          db_config_.port, nullptr, CLIENT_FOUND_ROWS)) {
    std::string reason = mysql_error(handle);
    mysql_close(handle);
    throw std::runtime_error("Cannot connect to MySQL at " + db_config_.host + ":" +
                             std::to_string(db_config_.port) + ": " + reason);
  }
  return std::make_unique<MySQLConnection>(handle);
}

} // namespace common
