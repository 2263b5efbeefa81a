#include "config.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>

namespace config {

namespace {

template <typename Duration>
Duration durationOr(const nlohmann::json& j, const char* key, Duration fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  return Duration(j.at(key).get<typename Duration::rep>());
}

void readDatabase(const nlohmann::json& j, DatabaseConfig& db) {
  db.backend = j.value("backend", db.backend);
  db.sqlite_path = j.value("sqlite_path", db.sqlite_path);
  db.host = j.value("host", db.host);
  db.port = j.value("port", db.port);
  db.user = j.value("user", db.user);
  db.password = j.value("password", db.password);
  db.db_name = j.value("db_name", db.db_name);
  db.charset = j.value("charset", db.charset);
  if (db.backend != "sqlite" && db.backend != "mysql") {
    throw std::runtime_error("database.backend must be \"sqlite\" or \"mysql\", got: " + db.backend);
  }
}

void readTranscode(const nlohmann::json& j, TranscodeConfig& tc) {
  tc.ffmpeg_path = j.value("ffmpeg_path", tc.ffmpeg_path);
  tc.worker_count = j.value("worker_count", tc.worker_count);
  tc.segment_duration = durationOr(j, "segment_duration_s", tc.segment_duration);
  tc.segment_index_width = j.value("segment_index_width", tc.segment_index_width);
  tc.max_attempts = j.value("max_attempts", tc.max_attempts);
  tc.lease_timeout = durationOr(j, "lease_timeout_s", tc.lease_timeout);
  tc.job_timeout = durationOr(j, "job_timeout_s", tc.job_timeout);
  tc.backoff_base = durationOr(j, "backoff_base_ms", tc.backoff_base);
  tc.backoff_max = durationOr(j, "backoff_max_ms", tc.backoff_max);
  tc.sweep_interval = durationOr(j, "sweep_interval_s", tc.sweep_interval);

  if (j.contains("profiles")) {
    tc.profiles.clear();
    for (const auto& p : j.at("profiles")) {
      tc.profiles.push_back(ProfileConfig{
        .name = p.at("name").get<std::string>(),
        .height = p.at("height").get<int>(),
        .video_bitrate = p.at("video_bitrate").get<long>(),
        .audio_bitrate = p.value("audio_bitrate", 128000L)
      });
    }
  }

  if (tc.worker_count < 1) {
    throw std::runtime_error("transcode.worker_count must be at least 1");
  }
  if (tc.max_attempts < 1) {
    throw std::runtime_error("transcode.max_attempts must be at least 1");
  }
  if (tc.segment_duration.count() < 1) {
    throw std::runtime_error("transcode.segment_duration_s must be positive");
  }
  if (tc.segment_index_width < 1 || tc.segment_index_width > 9) {
    throw std::runtime_error("transcode.segment_index_width must be in [1, 9]");
  }
  if (tc.job_timeout >= tc.lease_timeout) {
    throw std::runtime_error("transcode.job_timeout_s must be shorter than transcode.lease_timeout_s");
  }
  if (tc.profiles.empty()) {
    throw std::runtime_error("transcode.profiles must not be empty");
  }
}

} // namespace

Config Config::defaults() {
  Config cfg;
  cfg.database_ = {
    .backend = "sqlite",
    .sqlite_path = "streamforge.db",
    .host = "localhost",
    .port = 3306,
    .user = "streamforge",
    .password = "",
    .db_name = "streamforge_db",
    .charset = "utf8mb4",
  };

  cfg.db_cp_ = {
    .min_connections = 4,
    .max_connections = 16,
    .timeout = std::chrono::milliseconds(5000),
    .idle_timeout = std::chrono::seconds(600)
  };

  cfg.http_ = {
    .host = "0.0.0.0",
    .port = 8080,
    .threads = 4,
    .idle_timeout = std::chrono::seconds(30),
    .max_body_bytes = 64 * 1024
  };

  cfg.grpc_ = {
    .host = "0.0.0.0",
    .port = 50053
  };

  cfg.auth_ = {
    .mode = "grpc",
    .user_service = "127.0.0.1:50051",
    .timeout = std::chrono::milliseconds(2000)
  };

  cfg.storage_ = {
    .media_root = "media",
    .hls_root = "media/hls"
  };

  unsigned int cores = std::thread::hardware_concurrency();
  cfg.transcode_ = {
    .ffmpeg_path = "ffmpeg",
    .worker_count = cores > 0 ? cores : 2,
    .segment_duration = std::chrono::seconds(10),
    .segment_index_width = 3,
    .max_attempts = 3,
    .lease_timeout = std::chrono::seconds(3 * 3600),
    .job_timeout = std::chrono::seconds(2 * 3600),
    .backoff_base = std::chrono::milliseconds(2000),
    .backoff_max = std::chrono::milliseconds(60000),
    .sweep_interval = std::chrono::seconds(60),
    .profiles = {
      {.name = "480p", .height = 480, .video_bitrate = 1400000, .audio_bitrate = 128000},
      {.name = "720p", .height = 720, .video_bitrate = 2800000, .audio_bitrate = 128000},
      {.name = "1080p", .height = 1080, .video_bitrate = 5000000, .audio_bitrate = 192000},
    }
  };
  return cfg;
}

Config Config::fromJson(const std::string& text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Invalid configuration JSON: " + std::string(e.what()));
  }

  Config cfg = defaults();
  try {
    if (root.contains("database")) {
      readDatabase(root.at("database"), cfg.database_);
    }
    if (root.contains("connection_pool")) {
      const auto& cp = root.at("connection_pool");
      cfg.db_cp_.min_connections = cp.value("min_connections", cfg.db_cp_.min_connections);
      cfg.db_cp_.max_connections = cp.value("max_connections", cfg.db_cp_.max_connections);
      cfg.db_cp_.timeout = durationOr(cp, "timeout_ms", cfg.db_cp_.timeout);
      cfg.db_cp_.idle_timeout = durationOr(cp, "idle_timeout_s", cfg.db_cp_.idle_timeout);
    }
    if (root.contains("http")) {
      const auto& h = root.at("http");
      cfg.http_.host = h.value("host", cfg.http_.host);
      cfg.http_.port = h.value("port", cfg.http_.port);
      cfg.http_.threads = h.value("threads", cfg.http_.threads);
      cfg.http_.idle_timeout = durationOr(h, "idle_timeout_s", cfg.http_.idle_timeout);
      cfg.http_.max_body_bytes = h.value("max_body_bytes", cfg.http_.max_body_bytes);
    }
    if (root.contains("grpc")) {
      const auto& g = root.at("grpc");
      cfg.grpc_.host = g.value("host", cfg.grpc_.host);
      cfg.grpc_.port = g.value("port", cfg.grpc_.port);
    }
    if (root.contains("auth")) {
      const auto& a = root.at("auth");
      cfg.auth_.mode = a.value("mode", cfg.auth_.mode);
      cfg.auth_.user_service = a.value("user_service", cfg.auth_.user_service);
      cfg.auth_.timeout = durationOr(a, "timeout_ms", cfg.auth_.timeout);
      if (cfg.auth_.mode != "grpc" && cfg.auth_.mode != "disabled") {
        throw std::runtime_error("auth.mode must be \"grpc\" or \"disabled\", got: " + cfg.auth_.mode);
      }
    }
    if (root.contains("storage")) {
      const auto& s = root.at("storage");
      cfg.storage_.media_root = s.value("media_root", cfg.storage_.media_root);
      cfg.storage_.hls_root = s.value("hls_root", cfg.storage_.media_root + "/hls");
    }
    readTranscode(root.value("transcode", nlohmann::json::object()), cfg.transcode_);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Invalid configuration value: " + std::string(e.what()));
  }
  return cfg;
}

Config Config::fromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return defaults();
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return fromJson(buffer.str());
}

} // namespace config
