#pragma once

// project
#include "domain/error.hpp"
#include "domain/job.hpp"
#include "domain/video.hpp"

// std
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace transcode_service {

// Durable job records. Every method is a single atomic write or read.
class JobRepository {
public:
  virtual ~JobRepository() = default;
  virtual std::expected<void, Error> save(const Job& job) = 0;
  // Writes `job` only while the stored row still has status `from` and
  // `from_attempts` attempts. False means another writer changed it first.
  virtual std::expected<bool, Error> update(const Job& job, JobStatus from, int from_attempts) = 0;
  // Queued -> running for a job that carries its new lease. Refused while
  // any other job of the same (video, profile) is running, in any process.
  virtual std::expected<bool, Error> claim(const Job& job) = 0;
  virtual std::expected<Job, Error> findById(const std::string& id) = 0;
  // ordered by created_at, oldest first
  virtual std::expected<std::vector<Job>, Error> findByStatus(JobStatus status) = 0;
  virtual std::expected<std::vector<Job>, Error> findByKey(int64_t video_id, const std::string& profile) = 0;
  virtual std::expected<std::vector<Job>, Error> findByVideo(int64_t video_id) = 0;
};

class RenditionRepository {
public:
  virtual ~RenditionRepository() = default;
  // upsert keyed by (video_id, profile), ready flag included in the same row
  virtual std::expected<void, Error> save(const Rendition& rendition) = 0;
  virtual std::expected<void, Error> remove(int64_t video_id, const std::string& profile) = 0;
  virtual std::expected<std::vector<Rendition>, Error> findReady() = 0;
  // Ready or not; NotFound if no row exists.
  virtual std::expected<Rendition, Error> find(int64_t video_id, const std::string& profile) = 0;
};

class VideoRepository {
public:
  virtual ~VideoRepository() = default;
  virtual std::expected<Video, Error> save(const Video& video) = 0;
  virtual std::expected<Video, Error> findById(int64_t id) = 0;
};

} // namespace transcode_service
