#pragma once

#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include "application/rendition_catalog.hpp"
#include "application/transcode_engine.hpp"
#include "domain/job.hpp"
#include "domain/profile.hpp"
#include "domain/repositories.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

namespace transcode_service {

struct EnqueueResult {
  std::string job_id;
  bool coalesced{false};  // true if an already queued or running job was returned
};

struct ProfileEnqueueOutcome {
  std::string profile;
  std::expected<EnqueueResult, Error> result;
};

// Durable FIFO of transcode jobs consumed by a fixed worker pool. At most one
// job per (video, profile) is active; every transition reaches the
// JobRepository before it can be observed through status(). Several
// processes may share one store: a job only runs after JobRepository::claim
// succeeded, and later transitions are conditional on the claimed row.
class JobQueue {
public:
  JobQueue(std::shared_ptr<JobRepository> jobs,
           std::shared_ptr<VideoRepository> videos,
           std::shared_ptr<TranscodeEngine> engine,
           std::shared_ptr<RenditionCatalog> catalog,
           const ProfileSet& profiles,
           const config::TranscodeConfig& transcode_cfg,
           const config::StorageConfig& storage_cfg);
  ~JobQueue();

  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  // Reloads queued jobs, recovers expired leases and starts dispatching.
  // With adopt_stored false only jobs enqueued through this instance run,
  // and lease recovery is left to the serving process.
  std::expected<void, Error> start(bool adopt_stored = true);
  // Stops dispatching and waits for running jobs to finish. Queued jobs stay
  // queued in the store.
  void stop();

  std::expected<EnqueueResult, Error> enqueue(int64_t video_id, const std::string& profile, bool overwrite = false);
  // One enqueue per configured profile, lowest quality first.
  std::vector<ProfileEnqueueOutcome> enqueueAll(int64_t video_id, bool overwrite = false);

  std::expected<Job, Error> status(const std::string& job_id) const;
  std::expected<Job, Error> cancel(const std::string& job_id);
  std::expected<std::vector<Job>, Error> jobsForVideo(int64_t video_id) const;

  // Cancels the video's queued jobs and deletes every rendition of it. The
  // video row stays. Conflict while one of its jobs is running.
  std::expected<size_t, Error> removeVideo(int64_t video_id);

  // Blocks until the job is terminal or the timeout elapses (then Timeout).
  std::expected<Job, Error> waitFor(const std::string& job_id, std::chrono::milliseconds timeout);

  // Requeues running jobs whose lease expired and that do not run here.
  // Returns the number of jobs touched.
  size_t recoverExpiredLeases();

  std::chrono::milliseconds backoffFor(int attempts) const;

private:
  using Key = std::pair<int64_t, std::string>;

  void dispatchLocked();
  void runJob(Job job);
  std::expected<Rendition, Error> execute(const Job& job);
  void finish(Job job, const std::expected<Rendition, Error>& result);
  void schedulerLoop(std::stop_token stoken);
  std::optional<Clock::time_point> nextDueLocked() const;
  // Reconciles pending_ with the queued jobs in the store.
  void syncPendingLocked();
  size_t recoverExpiredLeasesLocked();

  static std::string generateJobId();

  std::shared_ptr<JobRepository> jobs_;
  std::shared_ptr<VideoRepository> videos_;
  std::shared_ptr<TranscodeEngine> engine_;
  std::shared_ptr<RenditionCatalog> catalog_;
  ProfileSet profiles_;
  config::TranscodeConfig cfg_;
  std::filesystem::path media_root_;

  mutable std::mutex mutex_;
  std::condition_variable_any wake_cv_;
  std::condition_variable done_cv_;
  bool wake_{false};
  bool running_{false};
  bool adopt_stored_{true};

  std::deque<Job> pending_;                  // queued jobs, FIFO
  std::set<Key> busy_keys_;                  // keys with a job executing here
  std::unordered_set<std::string> in_flight_;
  Clock::time_point next_sweep_{};

  std::unique_ptr<common::ThreadPool> pool_;
  std::jthread scheduler_;
};

} // namespace transcode_service
