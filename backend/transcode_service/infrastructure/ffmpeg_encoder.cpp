// ffmpeg_encoder.cpp
#include "ffmpeg_encoder.hpp"
#include "domain/video.hpp"

#include <boost/process.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <sys/wait.h>

#include <format>
#include <fstream>
#include <iostream>
#include <system_error>

namespace transcode_service {
namespace bp = boost::process;
namespace fs = std::filesystem;

namespace {

// stderr fragments after which a retry cannot help
const char* const kFatalPatterns[] = {
  "No such file or directory",
  "Invalid data found when processing input",
  "moov atom not found",
  "does not contain any stream",
  "Invalid argument",
  "Unknown encoder",
};

// stderr fragments of conditions that tend to clear up on their own
const char* const kTransientPatterns[] = {
  "Cannot allocate memory",
  "Resource temporarily unavailable",
  "Connection timed out",
  "Input/output error",
  "Too many open files",
};

}  // namespace

FfmpegEncoder::FfmpegEncoder(const std::string& ffmpeg_path) : ffmpeg_(ffmpeg_path), ffmpeg_available_(false) {
  if (ffmpeg_.is_absolute()) {
    ffmpeg_available_ = fs::exists(ffmpeg_);
  } else {
    auto found = bp::search_path(ffmpeg_path);
    ffmpeg_available_ = !found.empty();
    if (ffmpeg_available_) {
      ffmpeg_ = found.string();
    }
  }
  if (!ffmpeg_available_) {
    std::cerr << "[FfmpegEncoder] ffmpeg not found: " << ffmpeg_path << std::endl;
  }
}

std::vector<std::string> FfmpegEncoder::buildArguments(const EncodeRequest& request) const {
  const auto& profile = request.profile;
  const auto seconds = request.segment_duration.count();
  const auto segment_pattern = request.output_dir / std::format("%0{}d.ts", request.segment_index_width);
  const auto playlist = request.output_dir / PLAYLIST_FILE_NAME;

  return {
    "-y", "-nostdin", "-hide_banner", "-loglevel", "error",
    "-i", request.source.string(),
    "-vf", std::format("scale=-2:{}", profile.height),
    "-c:v", "libx264", "-preset", "veryfast",
    "-b:v", std::to_string(profile.video_bitrate),
    "-maxrate", std::to_string(profile.video_bitrate * 107 / 100),
    "-bufsize", std::to_string(profile.video_bitrate * 3 / 2),
    "-force_key_frames", std::format("expr:gte(t,n_forced*{})", seconds),
    "-c:a", "aac", "-ac", "2",
    "-b:a", std::to_string(profile.audio_bitrate),
    "-f", "hls",
    "-hls_time", std::to_string(seconds),
    "-hls_playlist_type", "vod",
    "-hls_flags", "independent_segments",
    "-hls_segment_filename", segment_pattern.string(),
    playlist.string()
  };
}

std::expected<void, Error> FfmpegEncoder::encode(const EncodeRequest& request) {
  if (!ffmpeg_available_) {
    return std::unexpected(Error::encodeFatal("FFmpeg is not installed or not found in PATH"));
  }

  // diagnostics go next to, not into, the output directory
  const auto log_path = request.output_dir.parent_path() /
                        (request.output_dir.filename().string() + ".ffmpeg.log");
  auto cleanup_log = [&log_path]() {
    std::error_code ec;
    fs::remove(log_path, ec);
  };

  bp::child child;
  try {
    child = bp::child(boost::filesystem::path(ffmpeg_.string()),
                      bp::args(buildArguments(request)),
                      bp::std_in < bp::null,
                      bp::std_out > bp::null,
                      bp::std_err > boost::filesystem::path(log_path.string()));
  } catch (const bp::process_error& e) {
    cleanup_log();
    return std::unexpected(Error::encodeTransient(std::string("Failed to start ffmpeg: ") + e.what()));
  }

  std::error_code ec;
  if (!child.wait_until(request.deadline, ec)) {
    std::error_code kill_ec;
    child.terminate(kill_ec);
    cleanup_log();
    if (ec) {
      return std::unexpected(Error::encodeTransient("Failed to wait for ffmpeg: " + ec.message()));
    }
    return std::unexpected(Error::timeout(std::format(
      "ffmpeg exceeded the job deadline while encoding {}", request.profile.name)));
  }

  const int status = child.native_exit_code();
  const bool signaled = WIFSIGNALED(status);
  const int exit_code = signaled ? WTERMSIG(status) : WEXITSTATUS(status);
  if (!signaled && exit_code == 0) {
    cleanup_log();
    return {};
  }

  auto tail = readTail(log_path, 4096);
  cleanup_log();
  std::cerr << "[FfmpegEncoder] ffmpeg failed (" << (signaled ? "signal " : "exit ") << exit_code
            << ") for " << request.source << " @ " << request.profile.name << ": " << tail << std::endl;
  return std::unexpected(classifyFailure(exit_code, signaled, tail));
}

Error FfmpegEncoder::classifyFailure(int exit_code, bool killed_by_signal, const std::string& stderr_tail) {
  const auto what = killed_by_signal
    ? std::format("ffmpeg killed by signal {}", exit_code)
    : std::format("ffmpeg exited with code {}", exit_code);
  const auto detail = stderr_tail.empty() ? what : what + ": " + stderr_tail;

  // out of disk is a storage failure for the job, never retried
  if (boost::algorithm::contains(stderr_tail, "No space left on device")) {
    return Error::storage(detail);
  }
  for (const char* pattern : kTransientPatterns) {
    if (boost::algorithm::contains(stderr_tail, pattern)) {
      return Error::encodeTransient(detail);
    }
  }
  if (killed_by_signal) {
    return Error::encodeTransient(detail);
  }
  for (const char* pattern : kFatalPatterns) {
    if (boost::algorithm::contains(stderr_tail, pattern)) {
      return Error::encodeFatal(detail);
    }
  }
  return Error::encodeTransient(detail);
}

std::string FfmpegEncoder::readTail(const fs::path& path, size_t max_bytes) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return {};
  }
  const auto size = static_cast<size_t>(file.tellg());
  const auto start = size > max_bytes ? size - max_bytes : 0;
  file.seekg(static_cast<std::streamoff>(start));
  std::string tail(size - start, '\0');
  file.read(tail.data(), static_cast<std::streamsize>(tail.size()));
  while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) {
    tail.pop_back();
  }
  return tail;
}

} // namespace transcode_service
