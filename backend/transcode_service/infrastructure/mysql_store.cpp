#include "mysql_store.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <format>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace transcode_service {

namespace {

// RAII wrapper for MySQL bind parameters
class MysqlBindHelper {
public:
  explicit MysqlBindHelper(size_t param_count)
    : binds_(param_count), string_storage_(param_count), int_storage_(param_count) {
    std::memset(binds_.data(), 0, sizeof(MYSQL_BIND) * param_count);
  }

  void bind_string(size_t pos, const std::string& str) {
    if (pos >= binds_.size()) return;
    string_storage_[pos] = str;
    binds_[pos].buffer_type = MYSQL_TYPE_STRING;
    binds_[pos].buffer = const_cast<char*>(string_storage_[pos].c_str());
    binds_[pos].buffer_length = string_storage_[pos].length();
  }

  void bind_int64(size_t pos, int64_t value) {
    if (pos >= binds_.size()) return;
    int_storage_[pos] = value;
    binds_[pos].buffer_type = MYSQL_TYPE_LONGLONG;
    binds_[pos].buffer = &int_storage_[pos];
  }

  MYSQL_BIND* data() { return binds_.data(); }

private:
  std::vector<MYSQL_BIND> binds_;
  std::vector<std::string> string_storage_;
  std::vector<long long> int_storage_;
};

struct ResultFree {
  void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};
using Result = std::unique_ptr<MYSQL_RES, ResultFree>;

std::string field(MYSQL_ROW row, int col) {
  return row[col] ? row[col] : "";
}

int64_t intField(MYSQL_ROW row, int col) {
  return row[col] ? std::stoll(row[col]) : 0;
}

// Prepared INSERT/UPDATE with bound parameters. Returns the matched row count.
std::expected<uint64_t, Error> executeCounted(MYSQL* conn, const char* query, MysqlBindHelper& binds) {
  MYSQL_STMT* stmt = mysql_stmt_init(conn);
  if (!stmt) {
    return std::unexpected(Error::storage(std::string("mysql_stmt_init: ") + mysql_error(conn)));
  }
  std::unique_ptr<MYSQL_STMT, decltype(&mysql_stmt_close)> guard(stmt, mysql_stmt_close);

  if (mysql_stmt_prepare(stmt, query, std::strlen(query)) ||
      mysql_stmt_bind_param(stmt, binds.data()) ||
      mysql_stmt_execute(stmt)) {
    return std::unexpected(Error::storage(std::string("mysql: ") + mysql_stmt_error(stmt)));
  }
  return static_cast<uint64_t>(mysql_stmt_affected_rows(stmt));
}

std::expected<void, Error> executeStatement(MYSQL* conn, const char* query, MysqlBindHelper& binds) {
  auto rows = executeCounted(conn, query, binds);
  if (!rows) {
    return std::unexpected(rows.error());
  }
  return {};
}

std::expected<Result, Error> runQuery(MYSQL* conn, const std::string& query) {
  if (mysql_query(conn, query.c_str())) {
    return std::unexpected(Error::storage(std::string("mysql: ") + mysql_error(conn)));
  }
  Result result(mysql_store_result(conn));
  if (!result) {
    return std::unexpected(Error::storage(std::string("mysql: no result set: ") + mysql_error(conn)));
  }
  return result;
}

const char* kCreateTables[] = {
  "CREATE TABLE IF NOT EXISTS videos ("
  "  id BIGINT PRIMARY KEY AUTO_INCREMENT,"
  "  source_path VARCHAR(1024) NOT NULL,"
  "  title VARCHAR(255) NOT NULL DEFAULT '')",
  "CREATE TABLE IF NOT EXISTS jobs ("
  "  id CHAR(36) PRIMARY KEY,"
  "  video_id BIGINT NOT NULL,"
  "  profile VARCHAR(32) NOT NULL,"
  "  overwrite TINYINT NOT NULL DEFAULT 0,"
  "  status VARCHAR(16) NOT NULL,"
  "  attempts INT NOT NULL DEFAULT 0,"
  "  last_error TEXT NOT NULL,"
  "  created_at BIGINT NOT NULL,"
  "  started_at BIGINT NOT NULL DEFAULT 0,"
  "  finished_at BIGINT NOT NULL DEFAULT 0,"
  "  not_before BIGINT NOT NULL DEFAULT 0,"
  "  seq BIGINT NOT NULL AUTO_INCREMENT UNIQUE,"
  "  INDEX jobs_key (video_id, profile),"
  "  INDEX jobs_status (status))",
  "CREATE TABLE IF NOT EXISTS renditions ("
  "  video_id BIGINT NOT NULL,"
  "  profile VARCHAR(32) NOT NULL,"
  "  directory VARCHAR(1024) NOT NULL,"
  "  playlist VARCHAR(255) NOT NULL,"
  "  segments MEDIUMTEXT NOT NULL,"
  "  ready TINYINT NOT NULL DEFAULT 0,"
  "  PRIMARY KEY (video_id, profile))",
};

std::expected<Rendition, Error> readRendition(MYSQL_ROW row) {
  Rendition r;
  r.video_id = intField(row, 0);
  r.profile = field(row, 1);
  r.directory = field(row, 2);
  r.playlist = field(row, 3);
  auto segments = nlohmann::json::parse(field(row, 4), nullptr, false);
  if (segments.is_discarded() || !segments.is_array()) {
    return std::unexpected(Error::storage("Corrupt segment list for rendition " + r.directory));
  }
  r.segments = segments.get<std::vector<std::string>>();
  r.ready = intField(row, 5) != 0;
  return r;
}

const char* kGuardedJobUpdate =
  "UPDATE jobs SET overwrite = ?, status = ?, attempts = ?, last_error = ?, started_at = ?, "
  "finished_at = ?, not_before = ? WHERE id = ? AND status = ? AND attempts = ?";

void bindGuardedUpdate(MysqlBindHelper& binds, const Job& job, JobStatus from, int from_attempts) {
  binds.bind_int64(0, job.overwrite ? 1 : 0);
  binds.bind_string(1, std::string(toString(job.status)));
  binds.bind_int64(2, job.attempts);
  binds.bind_string(3, job.last_error);
  binds.bind_int64(4, toEpochMillis(job.started_at));
  binds.bind_int64(5, toEpochMillis(job.finished_at));
  binds.bind_int64(6, toEpochMillis(job.not_before));
  binds.bind_string(7, job.id);
  binds.bind_string(8, std::string(toString(from)));
  binds.bind_int64(9, from_attempts);
}

} // namespace

MysqlStore::MysqlStore(std::shared_ptr<common::MySQLConnectionPool> pool) : pool_(std::move(pool)) {
  common::MySQLConnectionGuard conn_guard(*pool_);
  for (const char* ddl : kCreateTables) {
    if (mysql_query(conn_guard.get(), ddl)) {
      throw std::runtime_error(std::string("Failed to create schema: ") + mysql_error(conn_guard.get()));
    }
  }
}

std::string MysqlStore::escape(MYSQL* conn, const std::string& value) {
  std::string escaped(value.size() * 2 + 1, '\0');
  auto length = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(length);
  return escaped;
}

std::expected<void, Error> MysqlStore::save(const Job& job) {
  const char* query =
    "INSERT INTO jobs (id, video_id, profile, overwrite, status, attempts, last_error, "
    "created_at, started_at, finished_at, not_before) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON DUPLICATE KEY UPDATE overwrite=VALUES(overwrite), status=VALUES(status), "
    "attempts=VALUES(attempts), last_error=VALUES(last_error), started_at=VALUES(started_at), "
    "finished_at=VALUES(finished_at), not_before=VALUES(not_before)";

  MysqlBindHelper binds(11);
  binds.bind_string(0, job.id);
  binds.bind_int64(1, job.video_id);
  binds.bind_string(2, job.profile);
  binds.bind_int64(3, job.overwrite ? 1 : 0);
  binds.bind_string(4, std::string(toString(job.status)));
  binds.bind_int64(5, job.attempts);
  binds.bind_string(6, job.last_error);
  binds.bind_int64(7, toEpochMillis(job.created_at));
  binds.bind_int64(8, toEpochMillis(job.started_at));
  binds.bind_int64(9, toEpochMillis(job.finished_at));
  binds.bind_int64(10, toEpochMillis(job.not_before));

  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    return executeStatement(conn_guard.get(), query, binds);
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<bool, Error> MysqlStore::update(const Job& job, JobStatus from, int from_attempts) {
  MysqlBindHelper binds(10);
  bindGuardedUpdate(binds, job, from, from_attempts);
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    auto rows = executeCounted(conn_guard.get(), kGuardedJobUpdate, binds);
    if (!rows) {
      return std::unexpected(rows.error());
    }
    return *rows > 0;
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<bool, Error> MysqlStore::claim(const Job& job) {
  MysqlBindHelper binds(10);
  bindGuardedUpdate(binds, job, JobStatus::Queued, job.attempts - 1);
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    MYSQL* conn = conn_guard.get();
    auto rollback = [conn]() {
      if (mysql_query(conn, "ROLLBACK")) {
        std::cerr << "[MysqlStore] rollback failed: " << mysql_error(conn) << std::endl;
      }
    };

    if (mysql_query(conn, "START TRANSACTION")) {
      return std::unexpected(Error::storage(std::string("mysql: ") + mysql_error(conn)));
    }
    // every row of the key stays locked until commit, so two claimers of the
    // same key are serialized
    auto key_rows = runQuery(conn, std::format(
      "SELECT id, status FROM jobs WHERE video_id = {} AND profile = '{}' FOR UPDATE",
      job.video_id, escape(conn, job.profile)));
    if (!key_rows) {
      rollback();
      return std::unexpected(key_rows.error());
    }
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(key_rows->get()))) {
      if (field(row, 0) != job.id && field(row, 1) == toString(JobStatus::Running)) {
        rollback();
        return false;
      }
    }

    auto rows = executeCounted(conn, kGuardedJobUpdate, binds);
    if (!rows) {
      rollback();
      return std::unexpected(rows.error());
    }
    if (mysql_query(conn, "COMMIT")) {
      std::string reason = mysql_error(conn);
      rollback();
      return std::unexpected(Error::storage("mysql: " + reason));
    }
    return *rows > 0;
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<std::vector<Job>, Error> MysqlStore::queryJobs(const std::function<std::string(MYSQL*)>& where) {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    auto query = std::format(
      "SELECT id, video_id, profile, overwrite, status, attempts, last_error, "
      "created_at, started_at, finished_at, not_before FROM jobs WHERE {} ORDER BY created_at, seq",
      where(conn_guard.get()));
    auto result = runQuery(conn_guard.get(), query);
    if (!result) {
      return std::unexpected(result.error());
    }

    std::vector<Job> jobs;
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(result->get()))) {
      Job job;
      job.id = field(row, 0);
      job.video_id = intField(row, 1);
      job.profile = field(row, 2);
      job.overwrite = intField(row, 3) != 0;
      job.status = jobStatusFromString(field(row, 4)).value_or(JobStatus::Failed);
      job.attempts = static_cast<int>(intField(row, 5));
      job.last_error = field(row, 6);
      job.created_at = fromEpochMillis(intField(row, 7));
      job.started_at = fromEpochMillis(intField(row, 8));
      job.finished_at = fromEpochMillis(intField(row, 9));
      job.not_before = fromEpochMillis(intField(row, 10));
      jobs.push_back(std::move(job));
    }
    return jobs;
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<Job, Error> MysqlStore::findById(const std::string& id) {
  auto jobs = queryJobs([&id](MYSQL* conn) { return std::format("id = '{}'", escape(conn, id)); });
  if (!jobs) {
    return std::unexpected(jobs.error());
  }
  if (jobs->empty()) {
    return std::unexpected(Error::notFound("No such job: " + id));
  }
  return std::move(jobs->front());
}

std::expected<std::vector<Job>, Error> MysqlStore::findByStatus(JobStatus status) {
  return queryJobs([status](MYSQL*) { return std::format("status = '{}'", toString(status)); });
}

std::expected<std::vector<Job>, Error> MysqlStore::findByKey(int64_t video_id, const std::string& profile) {
  return queryJobs([video_id, &profile](MYSQL* conn) {
    return std::format("video_id = {} AND profile = '{}'", video_id, escape(conn, profile));
  });
}

std::expected<std::vector<Job>, Error> MysqlStore::findByVideo(int64_t video_id) {
  return queryJobs([video_id](MYSQL*) { return std::format("video_id = {}", video_id); });
}

std::expected<void, Error> MysqlStore::save(const Rendition& rendition) {
  const char* query =
    "INSERT INTO renditions (video_id, profile, directory, playlist, segments, ready) "
    "VALUES (?, ?, ?, ?, ?, ?) ON DUPLICATE KEY UPDATE directory=VALUES(directory), "
    "playlist=VALUES(playlist), segments=VALUES(segments), ready=VALUES(ready)";

  MysqlBindHelper binds(6);
  binds.bind_int64(0, rendition.video_id);
  binds.bind_string(1, rendition.profile);
  binds.bind_string(2, rendition.directory);
  binds.bind_string(3, rendition.playlist);
  binds.bind_string(4, nlohmann::json(rendition.segments).dump());
  binds.bind_int64(5, rendition.ready ? 1 : 0);

  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    return executeStatement(conn_guard.get(), query, binds);
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<void, Error> MysqlStore::remove(int64_t video_id, const std::string& profile) {
  const char* query = "DELETE FROM renditions WHERE video_id = ? AND profile = ?";
  MysqlBindHelper binds(2);
  binds.bind_int64(0, video_id);
  binds.bind_string(1, profile);
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    return executeStatement(conn_guard.get(), query, binds);
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<std::vector<Rendition>, Error> MysqlStore::findReady() {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    auto result = runQuery(conn_guard.get(),
      "SELECT video_id, profile, directory, playlist, segments, ready FROM renditions "
      "WHERE ready = 1 ORDER BY video_id, profile");
    if (!result) {
      return std::unexpected(result.error());
    }

    std::vector<Rendition> renditions;
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(result->get()))) {
      auto rendition = readRendition(row);
      if (!rendition) {
        return std::unexpected(rendition.error());
      }
      renditions.push_back(std::move(*rendition));
    }
    return renditions;
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<Rendition, Error> MysqlStore::find(int64_t video_id, const std::string& profile) {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    auto result = runQuery(conn_guard.get(), std::format(
      "SELECT video_id, profile, directory, playlist, segments, ready FROM renditions "
      "WHERE video_id = {} AND profile = '{}'", video_id, escape(conn_guard.get(), profile)));
    if (!result) {
      return std::unexpected(result.error());
    }
    MYSQL_ROW row = mysql_fetch_row(result->get());
    if (!row) {
      return std::unexpected(Error::notFound(std::format("No {} rendition recorded for video {}", profile, video_id)));
    }
    return readRendition(row);
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<Video, Error> MysqlStore::save(const Video& video) {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    if (video.id == 0) {
      MysqlBindHelper binds(2);
      binds.bind_string(0, video.source_path);
      binds.bind_string(1, video.title);
      if (auto ret = executeStatement(conn_guard.get(),
            "INSERT INTO videos (source_path, title) VALUES (?, ?)", binds); !ret) {
        return std::unexpected(ret.error());
      }
      Video saved = video;
      saved.id = static_cast<int64_t>(mysql_insert_id(conn_guard.get()));
      return saved;
    }

    MysqlBindHelper binds(3);
    binds.bind_int64(0, video.id);
    binds.bind_string(1, video.source_path);
    binds.bind_string(2, video.title);
    if (auto ret = executeStatement(conn_guard.get(),
          "INSERT INTO videos (id, source_path, title) VALUES (?, ?, ?) "
          "ON DUPLICATE KEY UPDATE source_path=VALUES(source_path), title=VALUES(title)", binds); !ret) {
      return std::unexpected(ret.error());
    }
    return video;
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

std::expected<Video, Error> MysqlStore::findById(int64_t id) {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    auto result = runQuery(conn_guard.get(),
      std::format("SELECT id, source_path, title FROM videos WHERE id = {}", id));
    if (!result) {
      return std::unexpected(result.error());
    }
    MYSQL_ROW row = mysql_fetch_row(result->get());
    if (!row) {
      return std::unexpected(Error::notFound(std::format("No such video: {}", id)));
    }
    return Video{
      .id = intField(row, 0),
      .source_path = field(row, 1),
      .title = field(row, 2)
    };
  } catch (const std::exception& e) {
    return std::unexpected(Error::storage(e.what()));
  }
}

} // namespace transcode_service
