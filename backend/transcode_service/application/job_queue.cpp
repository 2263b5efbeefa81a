#include "job_queue.hpp"

#include <uuid/uuid.h>

#include <algorithm>
#include <format>
#include <iostream>
#include <stdexcept>

namespace transcode_service {

JobQueue::JobQueue(std::shared_ptr<JobRepository> jobs,
                   std::shared_ptr<VideoRepository> videos,
                   std::shared_ptr<TranscodeEngine> engine,
                   std::shared_ptr<RenditionCatalog> catalog,
                   const ProfileSet& profiles,
                   const config::TranscodeConfig& transcode_cfg,
                   const config::StorageConfig& storage_cfg)
  : jobs_(std::move(jobs)),
    videos_(std::move(videos)),
    engine_(std::move(engine)),
    catalog_(std::move(catalog)),
    profiles_(profiles),
    cfg_(transcode_cfg),
    media_root_(storage_cfg.media_root) {
  if (cfg_.max_attempts < 1) {
    throw std::runtime_error("transcode.max_attempts must be at least 1");
  }
  if (cfg_.job_timeout >= cfg_.lease_timeout) {
    throw std::runtime_error("transcode.job_timeout_s must be shorter than transcode.lease_timeout_s");
  }
}

JobQueue::~JobQueue() {
  stop();
}

std::string JobQueue::generateJobId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse(uuid, uuid_str);
  return uuid_str;
}

std::chrono::milliseconds JobQueue::backoffFor(int attempts) const {
  auto delay = cfg_.backoff_base;
  for (int i = 1; i < attempts && delay < cfg_.backoff_max; ++i) {
    delay *= 2;
  }
  return std::min(delay, cfg_.backoff_max);
}

std::expected<void, Error> JobQueue::start(bool adopt_stored) {
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return {};
    }
    adopt_stored_ = adopt_stored;
    if (adopt_stored_) {
      auto queued = jobs_->findByStatus(JobStatus::Queued);
      if (!queued) {
        return std::unexpected(queued.error());
      }
      pending_.assign(queued->begin(), queued->end());
    }

    pool_ = std::make_unique<common::ThreadPool>(static_cast<unsigned int>(cfg_.worker_count));
    running_ = true;

    auto recovered = adopt_stored_ ? recoverExpiredLeasesLocked() : 0;
    next_sweep_ = Clock::now() + cfg_.sweep_interval;
    std::cout << "[JobQueue] started with " << pool_->size() << " workers, "
              << pending_.size() << " queued jobs (" << recovered << " recovered)" << std::endl;
    dispatchLocked();
  }
  scheduler_ = std::jthread([this](std::stop_token stoken) { schedulerLoop(stoken); });
  return {};
}

void JobQueue::stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  if (scheduler_.joinable()) {
    scheduler_.request_stop();
    scheduler_.join();
  }
  // running encodes are not interrupted
  pool_->shutdown();

  std::lock_guard lock(mutex_);
  pending_.clear();
  pool_.reset();
  done_cv_.notify_all();
  std::cout << "[JobQueue] stopped" << std::endl;
}

std::expected<EnqueueResult, Error> JobQueue::enqueue(int64_t video_id, const std::string& profile_name, bool overwrite) {
  auto profile = profiles_.parse(profile_name);
  if (!profile) {
    return std::unexpected(profile.error());
  }
  auto video = videos_->findById(video_id);
  if (!video) {
    return std::unexpected(video.error());
  }

  std::lock_guard lock(mutex_);
  auto history = jobs_->findByKey(video_id, profile->name);
  if (!history) {
    return std::unexpected(history.error());
  }

  for (auto& existing : *history) {
    if (!existing.active()) {
      continue;
    }
    if (existing.status == JobStatus::Running) {
      if (overwrite && !existing.overwrite) {
        return std::unexpected(Error::conflict(std::format(
          "job {} for video {} @ {} is already running without overwrite", existing.id, video_id, profile->name)));
      }
      return EnqueueResult{existing.id, true};
    }
    if (overwrite && !existing.overwrite) {
      Job upgraded = existing;
      upgraded.overwrite = true;
      auto updated = jobs_->update(upgraded, JobStatus::Queued, existing.attempts);
      if (!updated) {
        return std::unexpected(updated.error());
      }
      if (!*updated) {
        return std::unexpected(Error::conflict(std::format(
          "job {} for video {} @ {} started meanwhile", existing.id, video_id, profile->name)));
      }
      existing = upgraded;
      for (auto& queued : pending_) {
        if (queued.id == existing.id) {
          queued.overwrite = true;
        }
      }
    }
    // a job queued by another process runs here if nobody else takes it
    const bool known = in_flight_.contains(existing.id) ||
      std::any_of(pending_.begin(), pending_.end(), [&existing](const Job& queued) { return queued.id == existing.id; });
    if (!known) {
      pending_.push_back(existing);
      dispatchLocked();
    }
    return EnqueueResult{existing.id, true};
  }

  if (!overwrite && !history->empty() && history->back().status == JobStatus::Succeeded) {
    return std::unexpected(Error::conflict(std::format(
      "video {} @ {} was already transcoded by job {}", video_id, profile->name, history->back().id)));
  }

  Job job;
  job.id = generateJobId();
  job.video_id = video_id;
  job.profile = profile->name;
  job.overwrite = overwrite;
  job.status = JobStatus::Queued;
  job.created_at = Clock::now();
  if (auto ret = jobs_->save(job); !ret) {
    return std::unexpected(ret.error());
  }
  std::cout << "[JobQueue] job " << job.id << " queued for video " << video_id << " @ " << job.profile
            << (overwrite ? " (overwrite)" : "") << std::endl;

  pending_.push_back(job);
  dispatchLocked();
  return EnqueueResult{job.id, false};
}

std::vector<ProfileEnqueueOutcome> JobQueue::enqueueAll(int64_t video_id, bool overwrite) {
  std::vector<ProfileEnqueueOutcome> outcomes;
  outcomes.reserve(profiles_.size());
  for (const auto& profile : profiles_.all()) {
    outcomes.push_back(ProfileEnqueueOutcome{profile.name, enqueue(video_id, profile.name, overwrite)});
  }
  return outcomes;
}

std::expected<Job, Error> JobQueue::status(const std::string& job_id) const {
  return jobs_->findById(job_id);
}

std::expected<std::vector<Job>, Error> JobQueue::jobsForVideo(int64_t video_id) const {
  return jobs_->findByVideo(video_id);
}

std::expected<Job, Error> JobQueue::cancel(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  auto job = jobs_->findById(job_id);
  if (!job) {
    return std::unexpected(job.error());
  }
  if (job->status != JobStatus::Queued) {
    return std::unexpected(Error::conflict(std::format(
      "job {} is {}, only queued jobs can be cancelled", job_id, toString(job->status))));
  }

  Job cancelled = *job;
  cancelled.status = JobStatus::Failed;
  cancelled.last_error = "cancelled";
  cancelled.finished_at = Clock::now();
  auto updated = jobs_->update(cancelled, JobStatus::Queued, job->attempts);
  if (!updated) {
    return std::unexpected(updated.error());
  }
  if (!*updated) {
    return std::unexpected(Error::conflict(std::format("job {} is no longer queued", job_id)));
  }
  job = std::move(cancelled);
  std::erase_if(pending_, [&job_id](const Job& queued) { return queued.id == job_id; });
  done_cv_.notify_all();
  std::cout << "[JobQueue] job " << job_id << " cancelled" << std::endl;
  return *job;
}

std::expected<size_t, Error> JobQueue::removeVideo(int64_t video_id) {
  if (auto video = videos_->findById(video_id); !video) {
    return std::unexpected(video.error());
  }

  std::lock_guard lock(mutex_);
  auto jobs = jobs_->findByVideo(video_id);
  if (!jobs) {
    return std::unexpected(jobs.error());
  }
  for (const auto& job : *jobs) {
    if (job.status == JobStatus::Running) {
      return std::unexpected(Error::conflict(std::format(
        "video {} has running job {} ({})", video_id, job.id, job.profile)));
    }
  }

  size_t cancelled = 0;
  for (const auto& job : *jobs) {
    if (job.status != JobStatus::Queued) {
      continue;
    }
    Job removed = job;
    removed.status = JobStatus::Failed;
    removed.last_error = "video removed";
    removed.finished_at = Clock::now();
    auto updated = jobs_->update(removed, JobStatus::Queued, job.attempts);
    if (!updated) {
      return std::unexpected(updated.error());
    }
    if (!*updated) {
      return std::unexpected(Error::conflict(std::format("job {} started while removing video {}", job.id, video_id)));
    }
    ++cancelled;
  }
  std::erase_if(pending_, [video_id](const Job& queued) { return queued.video_id == video_id; });
  done_cv_.notify_all();

  if (auto ret = catalog_->removeVideo(video_id); !ret) {
    return std::unexpected(ret.error());
  }
  std::cout << "[JobQueue] video " << video_id << " removed, " << cancelled << " queued jobs cancelled" << std::endl;
  return cancelled;
}

std::expected<Job, Error> JobQueue::waitFor(const std::string& job_id, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lock(mutex_);
  while (true) {
    // the store is read without holding the queue lock
    lock.unlock();
    auto job = jobs_->findById(job_id);
    lock.lock();
    if (!job || job->terminal()) {
      return job;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::unexpected(Error::timeout(std::format("job {} still {}", job_id, toString(job->status))));
    }
    // the job may be driven by another process, so poll as well
    done_cv_.wait_until(lock, std::min(deadline, now + std::chrono::milliseconds(250)));
  }
}

size_t JobQueue::recoverExpiredLeases() {
  std::lock_guard lock(mutex_);
  auto count = recoverExpiredLeasesLocked();
  dispatchLocked();
  return count;
}

size_t JobQueue::recoverExpiredLeasesLocked() {
  auto running = jobs_->findByStatus(JobStatus::Running);
  if (!running) {
    std::cerr << "[JobQueue] lease sweep failed: " << running.error().describe() << std::endl;
    return 0;
  }

  const auto now = Clock::now();
  size_t count = 0;
  for (auto& job : *running) {
    if (in_flight_.contains(job.id) || job.started_at + cfg_.lease_timeout > now) {
      continue;
    }
    job.last_error = Error::timeout(std::format("lease expired after attempt {}", job.attempts)).describe();
    if (job.attempts >= cfg_.max_attempts) {
      job.status = JobStatus::Failed;
      job.finished_at = now;
    } else {
      job.status = JobStatus::Queued;
      job.not_before = Clock::time_point{};
    }
    auto updated = jobs_->update(job, JobStatus::Running, job.attempts);
    if (!updated) {
      std::cerr << "[JobQueue] failed to recover job " << job.id << ": " << updated.error().describe() << std::endl;
      continue;
    }
    if (!*updated) {
      // finished or recovered by another process since the read
      continue;
    }
    std::cout << "[JobQueue] job " << job.id << " lease expired, now " << toString(job.status) << std::endl;
    if (job.status == JobStatus::Queued) {
      pending_.push_back(job);
    }
    ++count;
  }
  return count;
}

void JobQueue::dispatchLocked() {
  if (!running_ || !pool_) {
    return;
  }
  const auto now = Clock::now();
  for (auto it = pending_.begin(); it != pending_.end() && in_flight_.size() < pool_->size();) {
    Key key{it->video_id, it->profile};
    if (it->not_before > now || busy_keys_.contains(key)) {
      ++it;
      continue;
    }

    Job job = *it;
    job.status = JobStatus::Running;
    job.attempts += 1;
    job.started_at = now;
    job.not_before = Clock::time_point{};
    auto claimed = jobs_->claim(job);
    if (!claimed) {
      std::cerr << "[JobQueue] failed to start job " << job.id << ": " << claimed.error().describe() << std::endl;
      ++it;
      continue;
    }
    if (!*claimed) {
      // cancelled, taken or blocked by another process; the sweep drops it
      // unless it is still queued
      std::cout << "[JobQueue] job " << job.id << " not claimable, retry after next sweep" << std::endl;
      it->not_before = now + cfg_.sweep_interval;
      ++it;
      continue;
    }
    it = pending_.erase(it);
    busy_keys_.insert(key);
    in_flight_.insert(job.id);
    std::cout << "[JobQueue] job " << job.id << " running, attempt " << job.attempts << "/" << cfg_.max_attempts << std::endl;
    pool_->commit([this, job]() mutable { runJob(std::move(job)); });
  }
}

void JobQueue::runJob(Job job) {
  std::expected<Rendition, Error> result = std::unexpected(Error::internal("job did not run"));
  try {
    result = execute(job);
  } catch (const std::exception& e) {
    result = std::unexpected(Error::internal(e.what()));
  }
  finish(std::move(job), result);
}

std::expected<Rendition, Error> JobQueue::execute(const Job& job) {
  auto video = videos_->findById(job.video_id);
  if (!video) {
    if (video.error().code == ErrorCode::NotFound) {
      return std::unexpected(Error::encodeFatal(std::format("video {} no longer exists", job.video_id)));
    }
    return std::unexpected(video.error());
  }
  auto profile = profiles_.parse(job.profile);
  if (!profile) {
    return std::unexpected(profile.error());
  }

  std::filesystem::path source = video->source_path;
  if (!source.empty() && source.is_relative()) {
    source = media_root_ / source;
  }

  // an overwrite must not leave the old segments reachable while re-encoding
  if (job.overwrite || !catalog_->lookup(job.video_id, profile->name)) {
    if (auto ret = catalog_->retract(job.video_id, profile->name); !ret) {
      return std::unexpected(ret.error());
    }
  }

  TranscodeRequest request{
    .video_id = job.video_id,
    .source_path = source.string(),
    .profile = *profile,
    .output_dir = TranscodeEngine::outputDirFor(job.video_id, *profile),
    .overwrite = job.overwrite,
    .deadline = std::chrono::steady_clock::now() + cfg_.job_timeout
  };
  auto rendition = engine_->transcode(request);
  if (!rendition) {
    return rendition;
  }
  if (auto ret = catalog_->registerRendition(*rendition); !ret) {
    return std::unexpected(ret.error());
  }
  rendition->ready = true;
  return rendition;
}

void JobQueue::finish(Job job, const std::expected<Rendition, Error>& result) {
  std::lock_guard lock(mutex_);
  busy_keys_.erase(Key{job.video_id, job.profile});
  in_flight_.erase(job.id);

  const auto now = Clock::now();
  if (result) {
    job.status = JobStatus::Succeeded;
    job.last_error.clear();
    job.finished_at = now;
  } else {
    job.last_error = result.error().describe();
    if (result.error().transient && job.attempts < cfg_.max_attempts) {
      job.status = JobStatus::Queued;
      job.not_before = now + backoffFor(job.attempts);
    } else {
      job.status = JobStatus::Failed;
      job.finished_at = now;
    }
  }

  auto recorded = jobs_->update(job, JobStatus::Running, job.attempts);
  if (!recorded) {
    // stays running in the store; the lease sweep picks it up again
    std::cerr << "[JobQueue] failed to record outcome of job " << job.id << ": " << recorded.error().describe() << std::endl;
  } else if (!*recorded) {
    std::cerr << "[JobQueue] job " << job.id << " lost its lease before finishing, outcome dropped" << std::endl;
  } else {
    if (job.status == JobStatus::Queued) {
      std::cout << "[JobQueue] job " << job.id << " will retry in " << backoffFor(job.attempts).count()
                << "ms: " << job.last_error << std::endl;
      pending_.push_back(job);
    } else if (job.status == JobStatus::Succeeded) {
      std::cout << "[JobQueue] job " << job.id << " succeeded" << std::endl;
    } else {
      std::cerr << "[JobQueue] job " << job.id << " failed: " << job.last_error << std::endl;
    }
  }

  wake_ = true;
  wake_cv_.notify_all();
  done_cv_.notify_all();
  dispatchLocked();
}

void JobQueue::syncPendingLocked() {
  auto queued = jobs_->findByStatus(JobStatus::Queued);
  if (!queued) {
    std::cerr << "[JobQueue] failed to reload queued jobs: " << queued.error().describe() << std::endl;
    return;
  }

  // the store wins: jobs cancelled elsewhere drop out, jobs enqueued elsewhere join
  std::deque<Job> synced;
  std::unordered_set<std::string> seen;
  for (const auto& mine : pending_) {
    auto it = std::find_if(queued->begin(), queued->end(),
                           [&mine](const Job& stored) { return stored.id == mine.id; });
    if (it != queued->end()) {
      Job job = *it;
      job.not_before = std::max(job.not_before, mine.not_before);
      synced.push_back(std::move(job));
      seen.insert(mine.id);
    }
  }
  for (auto& stored : *queued) {
    if (adopt_stored_ && !seen.contains(stored.id) && !in_flight_.contains(stored.id)) {
      synced.push_back(std::move(stored));
    }
  }
  pending_ = std::move(synced);
}

std::optional<Clock::time_point> JobQueue::nextDueLocked() const {
  const auto now = Clock::now();
  std::optional<Clock::time_point> next;
  for (const auto& job : pending_) {
    if (job.not_before > now && (!next || job.not_before < *next)) {
      next = job.not_before;
    }
  }
  return next;
}

void JobQueue::schedulerLoop(std::stop_token stoken) {
  std::unique_lock lock(mutex_);
  while (!stoken.stop_requested()) {
    auto now = Clock::now();
    if (now >= next_sweep_) {
      syncPendingLocked();
      if (adopt_stored_) {
        recoverExpiredLeasesLocked();
      }
      // renditions registered or retracted by other processes
      if (auto refreshed = catalog_->refresh(); !refreshed) {
        std::cerr << "[JobQueue] rendition refresh failed: " << refreshed.error().describe() << std::endl;
      }
      next_sweep_ = now + cfg_.sweep_interval;
    }
    dispatchLocked();

    auto wake_at = next_sweep_;
    if (auto due = nextDueLocked(); due && *due < wake_at) {
      wake_at = *due;
    }
    wake_cv_.wait_until(lock, stoken, wake_at, [this] { return wake_; });
    wake_ = false;
  }
}

} // namespace transcode_service
