#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace transcode_service {

using Clock = std::chrono::system_clock;

enum class JobStatus {
  Queued,
  Running,
  Succeeded,
  Failed,
};

std::string_view toString(JobStatus status);
std::optional<JobStatus> jobStatusFromString(std::string_view text);

// One transcode attempt series for a (video, profile) key. A time point equal
// to Clock::time_point{} means "not set".
struct Job {
  std::string id;
  int64_t video_id{0};
  std::string profile;
  bool overwrite{false};
  JobStatus status{JobStatus::Queued};
  int attempts{0};
  std::string last_error;
  Clock::time_point created_at{};
  Clock::time_point started_at{};   // lease start of the current attempt
  Clock::time_point finished_at{};
  Clock::time_point not_before{};   // retry backoff

  bool terminal() const { return status == JobStatus::Succeeded || status == JobStatus::Failed; }
  bool active() const { return status == JobStatus::Queued || status == JobStatus::Running; }
};

int64_t toEpochMillis(Clock::time_point tp);
Clock::time_point fromEpochMillis(int64_t ms);

} // namespace transcode_service
