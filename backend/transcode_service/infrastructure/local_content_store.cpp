#include "local_content_store.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace transcode_service {
namespace fs = std::filesystem;

LocalContentStore::LocalContentStore(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw std::runtime_error("Failed to create content root " + root_.string() + ": " + ec.message());
  }
}

fs::path LocalContentStore::resolve(const fs::path& path) const {
  return path.is_absolute() ? path : root_ / path;
}

bool LocalContentStore::exists(const fs::path& path) const {
  std::error_code ec;
  return fs::exists(resolve(path), ec);
}

std::expected<uint64_t, Error> LocalContentStore::size(const fs::path& path) const {
  std::error_code ec;
  auto full = resolve(path);
  auto bytes = fs::file_size(full, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return std::unexpected(Error::notFound("No such file: " + full.string()));
    }
    return std::unexpected(Error::storage("Failed to stat " + full.string() + ": " + ec.message()));
  }
  return bytes;
}

std::expected<std::string, Error> LocalContentStore::read(const fs::path& path) const {
  auto full = resolve(path);
  std::ifstream file(full, std::ios::binary);
  if (!file.is_open()) {
    if (!exists(full)) {
      return std::unexpected(Error::notFound("No such file: " + full.string()));
    }
    return std::unexpected(Error::storage("Failed to open " + full.string()));
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::unexpected(Error::storage("Failed to read " + full.string()));
  }
  return content;
}

std::expected<std::string, Error> LocalContentStore::readRange(const fs::path& path,
                                                               uint64_t offset, uint64_t length) const {
  auto full = resolve(path);
  std::ifstream file(full, std::ios::binary);
  if (!file.is_open()) {
    if (!exists(full)) {
      return std::unexpected(Error::notFound("No such file: " + full.string()));
    }
    return std::unexpected(Error::storage("Failed to open " + full.string()));
  }
  file.seekg(static_cast<std::streamoff>(offset));
  if (!file) {
    return std::unexpected(Error::storage("Failed to seek " + full.string()));
  }
  std::string content(length, '\0');
  file.read(content.data(), static_cast<std::streamsize>(length));
  if (file.bad()) {
    return std::unexpected(Error::storage("Failed to read " + full.string()));
  }
  content.resize(static_cast<size_t>(file.gcount()));
  if (content.size() != length) {
    return std::unexpected(Error::storage("Short read on " + full.string()));
  }
  return content;
}

std::expected<void, Error> LocalContentStore::makeDirectory(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(resolve(dir), ec);
  if (ec) {
    return std::unexpected(Error::storage("Failed to create " + resolve(dir).string() + ": " + ec.message()));
  }
  return {};
}

std::expected<void, Error> LocalContentStore::removeAll(const fs::path& path) {
  std::error_code ec;
  fs::remove_all(resolve(path), ec);
  if (ec) {
    return std::unexpected(Error::storage("Failed to remove " + resolve(path).string() + ": " + ec.message()));
  }
  return {};
}

std::expected<void, Error> LocalContentStore::replaceDirectory(const fs::path& from, const fs::path& to) {
  auto src = resolve(from);
  auto dst = resolve(to);
  std::error_code ec;
  fs::remove_all(dst, ec);
  if (ec) {
    return std::unexpected(Error::storage("Failed to clear " + dst.string() + ": " + ec.message()));
  }
  fs::create_directories(dst.parent_path(), ec);
  if (ec) {
    return std::unexpected(Error::storage("Failed to create " + dst.parent_path().string() + ": " + ec.message()));
  }
  fs::rename(src, dst, ec);
  if (ec) {
    return std::unexpected(Error::storage("Failed to move " + src.string() + " to " + dst.string() + ": " + ec.message()));
  }
  return {};
}

} // namespace transcode_service
