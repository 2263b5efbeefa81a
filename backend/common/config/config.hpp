#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <chrono>
#include <vector>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
  std::chrono::seconds idle_timeout;
};

struct DatabaseConfig {
  std::string backend;      // "sqlite" or "mysql"
  std::string sqlite_path;
  std::string host;
  unsigned int port;
  std::string user;
  std::string password;
  std::string db_name;
  std::string charset;
};

struct HttpConfig {
  std::string host;
  int port;
  int threads;
  std::chrono::seconds idle_timeout;  // per read and per write
  std::uint64_t max_body_bytes;
};

struct GrpcServiceConfig {
  std::string host;
  int port;
};

struct AuthConfig {
  std::string mode;          // "grpc" or "disabled"
  std::string user_service;  // host:port of the auth collaborator
  std::chrono::milliseconds timeout;
};

struct StorageConfig {
  std::string media_root;
  std::string hls_root;
};

struct ProfileConfig {
  std::string name;
  int height;
  long video_bitrate;  // in bits per second
  long audio_bitrate;  // in bits per second
};

struct TranscodeConfig {
  std::string ffmpeg_path;
  size_t worker_count;
  std::chrono::seconds segment_duration;
  int segment_index_width;
  int max_attempts;
  std::chrono::seconds lease_timeout;
  std::chrono::seconds job_timeout;
  std::chrono::milliseconds backoff_base;
  std::chrono::milliseconds backoff_max;
  std::chrono::seconds sweep_interval;
  std::vector<ProfileConfig> profiles;  // ascending quality
};

// Immutable process configuration. Built once in main and handed to
// constructors by const reference.
class Config {
public:
  static Config defaults();
  // Missing file yields defaults, a malformed one throws std::runtime_error.
  static Config fromFile(const std::string& path);
  static Config fromJson(const std::string& text);

  const DatabaseConfig& getDatabase() const { return database_; }
  const ConnectionPoolConfig& getDBCntPool() const { return db_cp_; }
  const HttpConfig& getHttp() const { return http_; }
  const GrpcServiceConfig& getGrpc() const { return grpc_; }
  const AuthConfig& getAuth() const { return auth_; }
  const StorageConfig& getStorage() const { return storage_; }
  const TranscodeConfig& getTranscode() const { return transcode_; }
  std::string getGrpcIpPort() const { return grpc_.host+":"+std::to_string(grpc_.port);}

private:
  Config() = default;

  DatabaseConfig database_;
  ConnectionPoolConfig db_cp_;
  HttpConfig http_;
  GrpcServiceConfig grpc_;
  AuthConfig auth_;
  StorageConfig storage_;
  TranscodeConfig transcode_;
};

} // namespace config
