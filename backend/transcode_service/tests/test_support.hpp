#pragma once

#include "application/job_queue.hpp"
#include "application/rendition_catalog.hpp"
#include "application/streaming_service.hpp"
#include "application/transcode_engine.hpp"
#include "common/config/config.hpp"
#include "domain/transcoding_service.hpp"
#include "infrastructure/hls_playlist.hpp"
#include "infrastructure/local_content_store.hpp"
#include "infrastructure/sqlite_store.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

namespace transcode_service::test {

namespace fs = std::filesystem;

// Scratch directory removed with everything below it on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = fs::temp_directory_path() / ("streamforge-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  fs::path operator/(const std::string& name) const { return path_ / name; }

private:
  fs::path path_;
};

inline void writeFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline config::TranscodeConfig testTranscodeConfig() {
  auto tc = config::Config::defaults().getTranscode();
  tc.ffmpeg_path = "/nonexistent/ffmpeg";
  tc.worker_count = 4;
  tc.max_attempts = 3;
  tc.segment_duration = std::chrono::seconds(10);
  tc.segment_index_width = 3;
  tc.backoff_base = std::chrono::milliseconds(10);
  tc.backoff_max = std::chrono::milliseconds(40);
  tc.sweep_interval = std::chrono::seconds(3600);
  return tc;
}

inline ProfileSet testProfiles() {
  return ProfileSet::fromConfig(testTranscodeConfig().profiles);
}

// Reports a fixed geometry for any existing file.
class FakeMediaInspector final : public MediaInspector {
public:
  explicit FakeMediaInspector(int height = 1080) : height_(height) {}

  std::expected<SourceInfo, Error> inspect(const fs::path& source) override {
    if (!fs::exists(source)) {
      return std::unexpected(Error::encodeFatal("cannot open " + source.string()));
    }
    return SourceInfo{.width = height_ * 16 / 9, .height = height_, .duration = 30.0, .codec = "h264"};
  }

  void setHeight(int height) { height_ = height; }

private:
  std::atomic<int> height_;
};

// Writes a synthetic HLS tree instead of running ffmpeg. Scripted failures
// are consumed one per call, before anything is written.
class FakeEncoder final : public Encoder {
public:
  std::expected<void, Error> encode(const EncodeRequest& request) override {
    const auto key = request.output_dir.string();
    std::optional<Error> failure;
    {
      std::lock_guard lock(mutex_);
      ++calls_;
      auto& active = active_[key];
      ++active;
      max_active_per_key_ = std::max(max_active_per_key_, active);
      if (!failures_.empty()) {
        failure = failures_.front();
        failures_.pop_front();
      } else if (always_fail_) {
        failure = *always_fail_;
      }
    }

    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }

    if (!failure) {
      std::vector<std::string> names;
      for (size_t i = 0; i < segment_count_; ++i) {
        names.push_back(hls::segmentFileName(i, request.segment_index_width));
        writeFile(request.output_dir / names.back(),
                  std::format("{}:{}:segment-{}", request.source.filename().string(), request.profile.name, i));
      }
      if (write_playlist_) {
        writeFile(request.output_dir / PLAYLIST_FILE_NAME, hls::buildVodPlaylist(names, request.segment_duration));
      }
    }

    std::lock_guard lock(mutex_);
    --active_[key];
    if (failure) {
      return std::unexpected(*failure);
    }
    return {};
  }

  void failNext(Error error) {
    std::lock_guard lock(mutex_);
    failures_.push_back(std::move(error));
  }
  void failAlways(Error error) {
    std::lock_guard lock(mutex_);
    always_fail_ = std::move(error);
  }

  void setSegmentCount(size_t count) { segment_count_ = count; }
  void setWritePlaylist(bool write) { write_playlist_ = write; }
  void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

  int calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }
  int maxActivePerKey() const {
    std::lock_guard lock(mutex_);
    return max_active_per_key_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<Error> failures_;
  std::optional<Error> always_fail_;
  std::map<std::string, int> active_;
  int max_active_per_key_{0};
  int calls_{0};
  size_t segment_count_{3};
  bool write_playlist_{true};
  std::chrono::milliseconds delay_{0};
};

// The full job pipeline over a scratch directory and a SQLite file.
struct Pipeline {
  explicit Pipeline(const TempDir& dir, config::TranscodeConfig tc = testTranscodeConfig())
    : transcode_cfg(std::move(tc)),
      profiles(ProfileSet::fromConfig(transcode_cfg.profiles)) {
    storage_cfg.media_root = (dir.path() / "media").string();
    storage_cfg.hls_root = (dir.path() / "media" / "hls").string();
    fs::create_directories(storage_cfg.media_root);

    db = std::make_shared<SqliteStore>((dir.path() / "streamforge.db").string());
    hls_store = std::make_shared<LocalContentStore>(storage_cfg.hls_root);
    inspector = std::make_shared<FakeMediaInspector>();
    encoder = std::make_shared<FakeEncoder>();
    catalog = std::make_shared<RenditionCatalog>(hls_store, db, profiles);
    engine = std::make_shared<TranscodeEngine>(hls_store, inspector, encoder, transcode_cfg);
    queue = std::make_shared<JobQueue>(db, db, engine, catalog, profiles, transcode_cfg, storage_cfg);
    streaming = std::make_shared<StreamingService>(catalog, hls_store, profiles);
  }

  // Registers a video whose source lives under the media root.
  void addVideo(int64_t id, const std::string& source_name = "") {
    const auto name = source_name.empty() ? std::format("video{}.mp4", id) : source_name;
    writeFile(fs::path(storage_cfg.media_root) / name, "not really an mp4");
    auto saved = db->save(Video{.id = id, .source_path = name, .title = name});
    if (!saved) {
      throw std::runtime_error(saved.error().describe());
    }
  }

  fs::path hlsPath(const std::string& relative) const {
    return fs::path(storage_cfg.hls_root) / relative;
  }

  config::TranscodeConfig transcode_cfg;
  config::StorageConfig storage_cfg;
  ProfileSet profiles;
  std::shared_ptr<SqliteStore> db;
  std::shared_ptr<LocalContentStore> hls_store;
  std::shared_ptr<FakeMediaInspector> inspector;
  std::shared_ptr<FakeEncoder> encoder;
  std::shared_ptr<RenditionCatalog> catalog;
  std::shared_ptr<TranscodeEngine> engine;
  std::shared_ptr<JobQueue> queue;
  std::shared_ptr<StreamingService> streaming;
};

} // namespace transcode_service::test
