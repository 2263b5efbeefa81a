#pragma once
#include "domain/content_store.hpp"
#include <filesystem>

namespace transcode_service {

// ContentStore on a local (or mounted) filesystem.
class LocalContentStore final : public ContentStore {
public:
  explicit LocalContentStore(std::filesystem::path root);

  std::filesystem::path resolve(const std::filesystem::path& path) const override;
  bool exists(const std::filesystem::path& path) const override;
  std::expected<uint64_t, Error> size(const std::filesystem::path& path) const override;
  std::expected<std::string, Error> read(const std::filesystem::path& path) const override;
  std::expected<std::string, Error> readRange(const std::filesystem::path& path,
                                              uint64_t offset, uint64_t length) const override;
  std::expected<void, Error> makeDirectory(const std::filesystem::path& dir) override;
  std::expected<void, Error> removeAll(const std::filesystem::path& path) override;
  std::expected<void, Error> replaceDirectory(const std::filesystem::path& from,
                                              const std::filesystem::path& to) override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace transcode_service
