#include "sqlite_store.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <memory>
#include <stdexcept>

namespace transcode_service {

namespace {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

void bindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void bindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string colText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t colI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

const char* kJobColumns =
  "id,video_id,profile,overwrite,status,attempts,last_error,"
  "created_at,started_at,finished_at,not_before";

Job readJob(sqlite3_stmt* st) {
  Job job;
  job.id = colText(st, 0);
  job.video_id = colI64(st, 1);
  job.profile = colText(st, 2);
  job.overwrite = sqlite3_column_int(st, 3) != 0;
  job.status = jobStatusFromString(colText(st, 4)).value_or(JobStatus::Failed);
  job.attempts = sqlite3_column_int(st, 5);
  job.last_error = colText(st, 6);
  job.created_at = fromEpochMillis(colI64(st, 7));
  job.started_at = fromEpochMillis(colI64(st, 8));
  job.finished_at = fromEpochMillis(colI64(st, 9));
  job.not_before = fromEpochMillis(colI64(st, 10));
  return job;
}

std::expected<Rendition, Error> readRendition(sqlite3_stmt* st) {
  Rendition r;
  r.video_id = colI64(st, 0);
  r.profile = colText(st, 1);
  r.directory = colText(st, 2);
  r.playlist = colText(st, 3);
  auto segments = nlohmann::json::parse(colText(st, 4), nullptr, false);
  if (segments.is_discarded() || !segments.is_array()) {
    return std::unexpected(Error::storage("Corrupt segment list for rendition " + r.directory));
  }
  r.segments = segments.get<std::vector<std::string>>();
  r.ready = sqlite3_column_int(st, 5) != 0;
  return r;
}

} // namespace

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open " + path_ + ": " + msg);
  }
  configure();
  createSchema();
}

SqliteStore::~SqliteStore() {
  if (db_) sqlite3_close(db_);
}

void SqliteStore::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteStore::configure() {
  // concurrent readers while a writer holds the lock
  exec("PRAGMA journal_mode=WAL;");
  // job transitions must survive a crash, not just a process exit
  exec("PRAGMA synchronous=FULL;");
  if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
    throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

void SqliteStore::createSchema() {
  exec(
    "CREATE TABLE IF NOT EXISTS videos ("
    "  id INTEGER PRIMARY KEY,"
    "  source_path TEXT NOT NULL,"
    "  title TEXT NOT NULL DEFAULT ''"
    ");"
    "CREATE TABLE IF NOT EXISTS jobs ("
    "  id TEXT PRIMARY KEY,"
    "  video_id INTEGER NOT NULL,"
    "  profile TEXT NOT NULL,"
    "  overwrite INTEGER NOT NULL DEFAULT 0,"
    "  status TEXT NOT NULL,"
    "  attempts INTEGER NOT NULL DEFAULT 0,"
    "  last_error TEXT NOT NULL DEFAULT '',"
    "  created_at INTEGER NOT NULL,"
    "  started_at INTEGER NOT NULL DEFAULT 0,"
    "  finished_at INTEGER NOT NULL DEFAULT 0,"
    "  not_before INTEGER NOT NULL DEFAULT 0"
    ");"
    "CREATE INDEX IF NOT EXISTS jobs_key ON jobs(video_id, profile);"
    "CREATE INDEX IF NOT EXISTS jobs_status ON jobs(status);"
    "CREATE TABLE IF NOT EXISTS renditions ("
    "  video_id INTEGER NOT NULL,"
    "  profile TEXT NOT NULL,"
    "  directory TEXT NOT NULL,"
    "  playlist TEXT NOT NULL,"
    "  segments TEXT NOT NULL,"
    "  ready INTEGER NOT NULL DEFAULT 0,"
    "  PRIMARY KEY (video_id, profile)"
    ");");
}

Error SqliteStore::translate(int rc, const char* what) const {
  return Error::storage(std::format("{}: {} ({})", what, sqlite3_errmsg(db_), sqlite3_errstr(rc)));
}

// --- jobs -------------------------------------------------------------------

std::expected<void, Error> SqliteStore::save(const Job& job) {
  static const std::string sql = std::format(
    "INSERT INTO jobs({}) VALUES(?,?,?,?,?,?,?,?,?,?,?) "
    "ON CONFLICT(id) DO UPDATE SET "
    "overwrite=excluded.overwrite, status=excluded.status, attempts=excluded.attempts, "
    "last_error=excluded.last_error, started_at=excluded.started_at, "
    "finished_at=excluded.finished_at, not_before=excluded.not_before;", kJobColumns);

  std::lock_guard lock(mutex_);
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr); rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare job upsert"));
  }
  Statement st(raw);
  bindText(st.get(), 1, job.id);
  bindI64(st.get(), 2, job.video_id);
  bindText(st.get(), 3, job.profile);
  sqlite3_bind_int(st.get(), 4, job.overwrite ? 1 : 0);
  bindText(st.get(), 5, std::string(toString(job.status)));
  sqlite3_bind_int(st.get(), 6, job.attempts);
  bindText(st.get(), 7, job.last_error);
  bindI64(st.get(), 8, toEpochMillis(job.created_at));
  bindI64(st.get(), 9, toEpochMillis(job.started_at));
  bindI64(st.get(), 10, toEpochMillis(job.finished_at));
  bindI64(st.get(), 11, toEpochMillis(job.not_before));

  if (int rc = sqlite3_step(st.get()); rc != SQLITE_DONE) {
    return std::unexpected(translate(rc, "save job"));
  }
  return {};
}

std::expected<bool, Error> SqliteStore::updateJob(const Job& job, JobStatus from, int from_attempts,
                                                  bool key_must_be_idle) {
  static const std::string guarded =
    "UPDATE jobs SET overwrite=?, status=?, attempts=?, last_error=?, started_at=?, "
    "finished_at=?, not_before=? WHERE id=? AND status=? AND attempts=?";
  static const std::string update_sql = guarded + ";";
  static const std::string claim_sql = guarded +
    " AND NOT EXISTS (SELECT 1 FROM jobs AS other WHERE other.video_id=jobs.video_id "
    "AND other.profile=jobs.profile AND other.status='running' AND other.id<>jobs.id);";

  std::lock_guard lock(mutex_);
  const auto& sql = key_must_be_idle ? claim_sql : update_sql;
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr); rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare job update"));
  }
  Statement st(raw);
  sqlite3_bind_int(st.get(), 1, job.overwrite ? 1 : 0);
  bindText(st.get(), 2, std::string(toString(job.status)));
  sqlite3_bind_int(st.get(), 3, job.attempts);
  bindText(st.get(), 4, job.last_error);
  bindI64(st.get(), 5, toEpochMillis(job.started_at));
  bindI64(st.get(), 6, toEpochMillis(job.finished_at));
  bindI64(st.get(), 7, toEpochMillis(job.not_before));
  bindText(st.get(), 8, job.id);
  bindText(st.get(), 9, std::string(toString(from)));
  sqlite3_bind_int(st.get(), 10, from_attempts);

  if (int rc = sqlite3_step(st.get()); rc != SQLITE_DONE) {
    return std::unexpected(translate(rc, "update job"));
  }
  return sqlite3_changes(db_) > 0;
}

std::expected<bool, Error> SqliteStore::update(const Job& job, JobStatus from, int from_attempts) {
  return updateJob(job, from, from_attempts, false);
}

std::expected<bool, Error> SqliteStore::claim(const Job& job) {
  return updateJob(job, JobStatus::Queued, job.attempts - 1, true);
}

std::expected<std::vector<Job>, Error> SqliteStore::queryJobs(const char* sql,
                                                              const std::function<void(sqlite3_stmt*)>& bind) {
  std::lock_guard lock(mutex_);
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr); rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare job query"));
  }
  Statement st(raw);
  bind(st.get());

  std::vector<Job> jobs;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    jobs.push_back(readJob(st.get()));
  }
  if (rc != SQLITE_DONE) {
    return std::unexpected(translate(rc, "query jobs"));
  }
  return jobs;
}

std::expected<Job, Error> SqliteStore::findById(const std::string& id) {
  static const std::string sql = std::format("SELECT {} FROM jobs WHERE id=?;", kJobColumns);
  auto jobs = queryJobs(sql.c_str(), [&id](sqlite3_stmt* st) { bindText(st, 1, id); });
  if (!jobs) {
    return std::unexpected(jobs.error());
  }
  if (jobs->empty()) {
    return std::unexpected(Error::notFound("No such job: " + id));
  }
  return std::move(jobs->front());
}

std::expected<std::vector<Job>, Error> SqliteStore::findByStatus(JobStatus status) {
  static const std::string sql = std::format(
    "SELECT {} FROM jobs WHERE status=? ORDER BY created_at, rowid;", kJobColumns);
  const std::string text(toString(status));
  return queryJobs(sql.c_str(), [&text](sqlite3_stmt* st) { bindText(st, 1, text); });
}

std::expected<std::vector<Job>, Error> SqliteStore::findByKey(int64_t video_id, const std::string& profile) {
  static const std::string sql = std::format(
    "SELECT {} FROM jobs WHERE video_id=? AND profile=? ORDER BY created_at, rowid;", kJobColumns);
  return queryJobs(sql.c_str(), [video_id, &profile](sqlite3_stmt* st) {
    bindI64(st, 1, video_id);
    bindText(st, 2, profile);
  });
}

std::expected<std::vector<Job>, Error> SqliteStore::findByVideo(int64_t video_id) {
  static const std::string sql = std::format(
    "SELECT {} FROM jobs WHERE video_id=? ORDER BY created_at, rowid;", kJobColumns);
  return queryJobs(sql.c_str(), [video_id](sqlite3_stmt* st) { bindI64(st, 1, video_id); });
}

// --- renditions -------------------------------------------------------------

std::expected<void, Error> SqliteStore::save(const Rendition& rendition) {
  const char* sql =
    "INSERT INTO renditions(video_id,profile,directory,playlist,segments,ready) VALUES(?,?,?,?,?,?) "
    "ON CONFLICT(video_id, profile) DO UPDATE SET "
    "directory=excluded.directory, playlist=excluded.playlist, "
    "segments=excluded.segments, ready=excluded.ready;";

  std::lock_guard lock(mutex_);
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr); rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare rendition upsert"));
  }
  Statement st(raw);
  bindI64(st.get(), 1, rendition.video_id);
  bindText(st.get(), 2, rendition.profile);
  bindText(st.get(), 3, rendition.directory);
  bindText(st.get(), 4, rendition.playlist);
  bindText(st.get(), 5, nlohmann::json(rendition.segments).dump());
  sqlite3_bind_int(st.get(), 6, rendition.ready ? 1 : 0);

  if (int rc = sqlite3_step(st.get()); rc != SQLITE_DONE) {
    return std::unexpected(translate(rc, "save rendition"));
  }
  return {};
}

std::expected<void, Error> SqliteStore::remove(int64_t video_id, const std::string& profile) {
  std::lock_guard lock(mutex_);
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_, "DELETE FROM renditions WHERE video_id=? AND profile=?;", -1, &raw, nullptr);
      rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare rendition delete"));
  }
  Statement st(raw);
  bindI64(st.get(), 1, video_id);
  bindText(st.get(), 2, profile);
  if (int rc = sqlite3_step(st.get()); rc != SQLITE_DONE) {
    return std::unexpected(translate(rc, "remove rendition"));
  }
  return {};
}

std::expected<std::vector<Rendition>, Error> SqliteStore::findReady() {
  std::lock_guard lock(mutex_);
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_,
        "SELECT video_id,profile,directory,playlist,segments,ready FROM renditions WHERE ready=1 "
        "ORDER BY video_id, profile;", -1, &raw, nullptr); rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare rendition query"));
  }
  Statement st(raw);

  std::vector<Rendition> renditions;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto rendition = readRendition(st.get());
    if (!rendition) {
      return std::unexpected(rendition.error());
    }
    renditions.push_back(std::move(*rendition));
  }
  if (rc != SQLITE_DONE) {
    return std::unexpected(translate(rc, "query renditions"));
  }
  return renditions;
}

std::expected<Rendition, Error> SqliteStore::find(int64_t video_id, const std::string& profile) {
  std::lock_guard lock(mutex_);
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_,
        "SELECT video_id,profile,directory,playlist,segments,ready FROM renditions "
        "WHERE video_id=? AND profile=?;", -1, &raw, nullptr); rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare rendition lookup"));
  }
  Statement st(raw);
  bindI64(st.get(), 1, video_id);
  bindText(st.get(), 2, profile);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    return std::unexpected(Error::notFound(std::format("No {} rendition recorded for video {}", profile, video_id)));
  }
  if (rc != SQLITE_ROW) {
    return std::unexpected(translate(rc, "find rendition"));
  }
  return readRendition(st.get());
}

// --- videos -----------------------------------------------------------------

std::expected<Video, Error> SqliteStore::save(const Video& video) {
  std::lock_guard lock(mutex_);
  const bool assign_id = video.id == 0;
  const char* sql = assign_id
    ? "INSERT INTO videos(source_path,title) VALUES(?,?);"
    : "INSERT INTO videos(source_path,title,id) VALUES(?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET source_path=excluded.source_path, title=excluded.title;";

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr); rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare video upsert"));
  }
  Statement st(raw);
  bindText(st.get(), 1, video.source_path);
  bindText(st.get(), 2, video.title);
  if (!assign_id) {
    bindI64(st.get(), 3, video.id);
  }
  if (int rc = sqlite3_step(st.get()); rc != SQLITE_DONE) {
    return std::unexpected(translate(rc, "save video"));
  }

  Video saved = video;
  if (assign_id) {
    saved.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
  }
  return saved;
}

std::expected<Video, Error> SqliteStore::findById(int64_t id) {
  std::lock_guard lock(mutex_);
  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db_, "SELECT id,source_path,title FROM videos WHERE id=?;", -1, &raw, nullptr);
      rc != SQLITE_OK) {
    return std::unexpected(translate(rc, "prepare video query"));
  }
  Statement st(raw);
  bindI64(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    return std::unexpected(Error::notFound(std::format("No such video: {}", id)));
  }
  if (rc != SQLITE_ROW) {
    return std::unexpected(translate(rc, "find video"));
  }
  return Video{
    .id = colI64(st.get(), 0),
    .source_path = colText(st.get(), 1),
    .title = colText(st.get(), 2)
  };
}

} // namespace transcode_service
