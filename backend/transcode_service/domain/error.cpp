#include "error.hpp"

namespace transcode_service {

std::string_view toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::InvalidArgument: return "invalid_argument";
    case ErrorCode::EncodeError: return "encode_error";
    case ErrorCode::StorageError: return "storage_error";
    case ErrorCode::Timeout: return "timeout";
    case ErrorCode::ProfileExceedsSource: return "profile_exceeds_source";
    case ErrorCode::RangeNotSatisfiable: return "range_not_satisfiable";
    case ErrorCode::DeliveryError: return "delivery_error";
    case ErrorCode::Unauthorized: return "unauthorized";
    case ErrorCode::Internal: return "internal";
  }
  return "internal";
}

std::string Error::describe() const {
  return std::string(toString(code)) + ": " + message;
}

} // namespace transcode_service
