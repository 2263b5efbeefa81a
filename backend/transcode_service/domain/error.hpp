#pragma once
#include <string>
#include <string_view>

namespace transcode_service {

enum class ErrorCode {
  Conflict,              // duplicate in-flight job, or already transcoded
  NotFound,              // unknown video / job / rendition / segment
  InvalidArgument,       // malformed profile name, bad request
  EncodeError,           // encoder failure, see Error::transient
  StorageError,          // I/O on artifacts, always fatal for the job
  Timeout,               // job exceeded its wall-clock budget, transient
  ProfileExceedsSource,  // no-upscale policy refused the profile
  RangeNotSatisfiable,
  DeliveryError,         // registered-ready artifact unreadable
  Unauthorized,
  Internal,
};

struct Error {
  ErrorCode code{ErrorCode::Internal};
  std::string message;
  bool transient{false};

  static Error conflict(std::string msg) { return {ErrorCode::Conflict, std::move(msg), false}; }
  static Error notFound(std::string msg) { return {ErrorCode::NotFound, std::move(msg), false}; }
  static Error invalidArgument(std::string msg) { return {ErrorCode::InvalidArgument, std::move(msg), false}; }
  static Error encodeTransient(std::string msg) { return {ErrorCode::EncodeError, std::move(msg), true}; }
  static Error encodeFatal(std::string msg) { return {ErrorCode::EncodeError, std::move(msg), false}; }
  static Error storage(std::string msg) { return {ErrorCode::StorageError, std::move(msg), false}; }
  static Error timeout(std::string msg) { return {ErrorCode::Timeout, std::move(msg), true}; }
  static Error profileExceedsSource(std::string msg) { return {ErrorCode::ProfileExceedsSource, std::move(msg), false}; }
  static Error rangeNotSatisfiable(std::string msg) { return {ErrorCode::RangeNotSatisfiable, std::move(msg), false}; }
  static Error delivery(std::string msg) { return {ErrorCode::DeliveryError, std::move(msg), false}; }
  static Error unauthorized(std::string msg) { return {ErrorCode::Unauthorized, std::move(msg), false}; }
  static Error internal(std::string msg) { return {ErrorCode::Internal, std::move(msg), false}; }

  // "encode_error: ffmpeg exited with 1", as stored in Job::last_error
  std::string describe() const;
};

std::string_view toString(ErrorCode code);

} // namespace transcode_service
