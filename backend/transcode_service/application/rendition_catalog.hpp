#pragma once

#include "domain/content_store.hpp"
#include "domain/profile.hpp"
#include "domain/repositories.hpp"
#include "domain/video.hpp"

#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace transcode_service {

// (video, profile) -> ready Rendition. Only fully written renditions are ever
// visible: registration checks the files, persists, and only then publishes.
// The map caches the RenditionRepository, which other processes write too:
// misses read through to it and refresh() reconciles the whole map.
class RenditionCatalog {
public:
  RenditionCatalog(std::shared_ptr<ContentStore> store,
                   std::shared_ptr<RenditionRepository> repository,
                   const ProfileSet& profiles);

  // Restores ready renditions persisted by a previous run.
  std::expected<size_t, Error> load();
  // Reconciles the map with the store. Skipped (returns nullopt) when a local
  // write raced the read.
  std::expected<std::optional<size_t>, Error> refresh();

  std::expected<void, Error> registerRendition(const Rendition& rendition);
  // Hides the rendition and persists it as not ready.
  std::expected<void, Error> retract(int64_t video_id, const std::string& profile);
  std::expected<Rendition, Error> lookup(int64_t video_id, const std::string& profile);
  // Rereads one entry from the store, bypassing the map.
  std::expected<Rendition, Error> reload(int64_t video_id, const std::string& profile);
  // ready profile names, in configured quality order
  std::vector<std::string> list(int64_t video_id) const;

  // Forgets every rendition of the video and deletes its directory tree.
  std::expected<void, Error> removeVideo(int64_t video_id);

private:
  using Key = std::pair<int64_t, std::string>;

  std::expected<void, Error> verifyFiles(const Rendition& rendition) const;
  // Caller holds mutex_ exclusively.
  size_t replaceAllLocked(std::vector<Rendition> ready);
  void eraseLocked(int64_t video_id, const std::string& profile);
  std::mutex& writerLock(int64_t video_id, const std::string& profile);

  std::shared_ptr<ContentStore> store_;
  std::shared_ptr<RenditionRepository> repository_;
  ProfileSet profiles_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<int64_t, std::unordered_map<std::string, Rendition>> renditions_;
  uint64_t version_{0};  // bumped by every local change of renditions_

  std::mutex writers_mutex_;
  std::map<Key, std::unique_ptr<std::mutex>> writers_;
};

} // namespace transcode_service
