#pragma once
#include "domain/repositories.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"

#include <functional>
#include <memory>
#include <string>

namespace transcode_service {

// Same tables as SqliteStore, on a MySQL server reached through the
// connection pool. Selected with database.backend = "mysql".
class MysqlStore final : public JobRepository,
                         public RenditionRepository,
                         public VideoRepository {
public:
  // Creates missing tables. Throws std::runtime_error if the server is unreachable.
  explicit MysqlStore(std::shared_ptr<common::MySQLConnectionPool> pool);

  std::expected<void, Error> save(const Job& job) override;
  std::expected<bool, Error> update(const Job& job, JobStatus from, int from_attempts) override;
  std::expected<bool, Error> claim(const Job& job) override;
  std::expected<Job, Error> findById(const std::string& id) override;
  std::expected<std::vector<Job>, Error> findByStatus(JobStatus status) override;
  std::expected<std::vector<Job>, Error> findByKey(int64_t video_id, const std::string& profile) override;
  std::expected<std::vector<Job>, Error> findByVideo(int64_t video_id) override;

  std::expected<void, Error> save(const Rendition& rendition) override;
  std::expected<void, Error> remove(int64_t video_id, const std::string& profile) override;
  std::expected<std::vector<Rendition>, Error> findReady() override;
  std::expected<Rendition, Error> find(int64_t video_id, const std::string& profile) override;

  std::expected<Video, Error> save(const Video& video) override;
  std::expected<Video, Error> findById(int64_t id) override;

private:
  // `where` builds the WHERE clause; values must go through escape()
  std::expected<std::vector<Job>, Error> queryJobs(const std::function<std::string(MYSQL*)>& where);
  static std::string escape(MYSQL* conn, const std::string& value);

  std::shared_ptr<common::MySQLConnectionPool> pool_;
};

} // namespace transcode_service
