#include "job.hpp"

namespace transcode_service {

std::string_view toString(JobStatus status) {
  switch (status) {
    case JobStatus::Queued: return "queued";
    case JobStatus::Running: return "running";
    case JobStatus::Succeeded: return "succeeded";
    case JobStatus::Failed: return "failed";
  }
  return "failed";
}

std::optional<JobStatus> jobStatusFromString(std::string_view text) {
  if (text == "queued") return JobStatus::Queued;
  if (text == "running") return JobStatus::Running;
  if (text == "succeeded") return JobStatus::Succeeded;
  if (text == "failed") return JobStatus::Failed;
  return std::nullopt;
}

int64_t toEpochMillis(Clock::time_point tp) {
  if (tp == Clock::time_point{}) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point fromEpochMillis(int64_t ms) {
  if (ms == 0) {
    return Clock::time_point{};
  }
  return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms))};
}

} // namespace transcode_service
