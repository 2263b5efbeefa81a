#pragma once
#include "domain/repositories.hpp"

#include <sqlite3.h>

#include <functional>
#include <mutex>
#include <string>

namespace transcode_service {

// Embedded store for jobs, renditions and the video source lookup. One
// connection in WAL mode; statements are serialized by the store.
class SqliteStore final : public JobRepository,
                          public RenditionRepository,
                          public VideoRepository {
public:
  // Opens or creates the database and its schema. Throws std::runtime_error.
  explicit SqliteStore(const std::string& path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  // JobRepository
  std::expected<void, Error> save(const Job& job) override;
  std::expected<bool, Error> update(const Job& job, JobStatus from, int from_attempts) override;
  std::expected<bool, Error> claim(const Job& job) override;
  std::expected<Job, Error> findById(const std::string& id) override;
  std::expected<std::vector<Job>, Error> findByStatus(JobStatus status) override;
  std::expected<std::vector<Job>, Error> findByKey(int64_t video_id, const std::string& profile) override;
  std::expected<std::vector<Job>, Error> findByVideo(int64_t video_id) override;

  // RenditionRepository
  std::expected<void, Error> save(const Rendition& rendition) override;
  std::expected<void, Error> remove(int64_t video_id, const std::string& profile) override;
  std::expected<std::vector<Rendition>, Error> findReady() override;
  std::expected<Rendition, Error> find(int64_t video_id, const std::string& profile) override;

  // VideoRepository. A video with id 0 gets the next free id.
  std::expected<Video, Error> save(const Video& video) override;
  std::expected<Video, Error> findById(int64_t id) override;

private:
  void exec(const std::string& sql);
  void configure();
  void createSchema();
  Error translate(int rc, const char* what) const;
  std::expected<bool, Error> updateJob(const Job& job, JobStatus from, int from_attempts, bool key_must_be_idle);
  std::expected<std::vector<Job>, Error> queryJobs(const char* sql,
                                                   const std::function<void(sqlite3_stmt*)>& bind);

  std::string path_;
  sqlite3* db_{nullptr};
  std::mutex mutex_;
};

} // namespace transcode_service
