#pragma once
#include "domain/error.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace transcode_service {

// Byte-level access to source files and rendition trees. Relative paths are
// resolved against the store root, absolute paths are used as given.
class ContentStore {
public:
  virtual ~ContentStore() = default;

  virtual std::filesystem::path resolve(const std::filesystem::path& path) const = 0;
  virtual bool exists(const std::filesystem::path& path) const = 0;
  virtual std::expected<uint64_t, Error> size(const std::filesystem::path& path) const = 0;
  virtual std::expected<std::string, Error> read(const std::filesystem::path& path) const = 0;
  virtual std::expected<std::string, Error> readRange(const std::filesystem::path& path,
                                                      uint64_t offset, uint64_t length) const = 0;
  virtual std::expected<void, Error> makeDirectory(const std::filesystem::path& dir) = 0;
  virtual std::expected<void, Error> removeAll(const std::filesystem::path& path) = 0;
  // Replaces `to` with `from`: any previous `to` tree is removed first.
  virtual std::expected<void, Error> replaceDirectory(const std::filesystem::path& from,
                                                      const std::filesystem::path& to) = 0;
};

} // namespace transcode_service
