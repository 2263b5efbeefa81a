#include "rendition_catalog.hpp"

#include <format>
#include <iostream>

namespace transcode_service {

RenditionCatalog::RenditionCatalog(std::shared_ptr<ContentStore> store,
                                   std::shared_ptr<RenditionRepository> repository,
                                   const ProfileSet& profiles)
  : store_(std::move(store)),
    repository_(std::move(repository)),
    profiles_(profiles) {}

std::expected<size_t, Error> RenditionCatalog::load() {
  auto ready = repository_->findReady();
  if (!ready) {
    return std::unexpected(ready.error());
  }

  std::unique_lock lock(mutex_);
  auto count = replaceAllLocked(std::move(*ready));
  std::cout << "[RenditionCatalog] loaded " << count << " ready renditions" << std::endl;
  return count;
}

std::expected<std::optional<size_t>, Error> RenditionCatalog::refresh() {
  uint64_t seen;
  size_t before = 0;
  {
    std::shared_lock lock(mutex_);
    seen = version_;
    for (const auto& [video_id, profiles] : renditions_) {
      before += profiles.size();
    }
  }
  auto ready = repository_->findReady();
  if (!ready) {
    return std::unexpected(ready.error());
  }

  std::unique_lock lock(mutex_);
  if (version_ != seen) {
    return std::nullopt;
  }
  auto count = replaceAllLocked(std::move(*ready));
  if (count != before) {
    std::cout << "[RenditionCatalog] refreshed, " << count << " ready renditions (was " << before << ")" << std::endl;
  }
  return count;
}

size_t RenditionCatalog::replaceAllLocked(std::vector<Rendition> ready) {
  renditions_.clear();
  ++version_;
  size_t count = 0;
  for (auto& rendition : ready) {
    if (!profiles_.parse(rendition.profile)) {
      std::cerr << "[RenditionCatalog] ignoring rendition " << rendition.directory
                << " of unconfigured profile " << rendition.profile << std::endl;
      continue;
    }
    auto video_id = rendition.video_id;
    auto profile = rendition.profile;
    renditions_[video_id][profile] = std::move(rendition);
    ++count;
  }
  return count;
}

void RenditionCatalog::eraseLocked(int64_t video_id, const std::string& profile) {
  ++version_;
  auto it = renditions_.find(video_id);
  if (it == renditions_.end()) {
    return;
  }
  it->second.erase(profile);
  if (it->second.empty()) {
    renditions_.erase(it);
  }
}

std::expected<void, Error> RenditionCatalog::verifyFiles(const Rendition& rendition) const {
  if (rendition.segments.empty()) {
    return std::unexpected(Error::storage("Rendition " + rendition.directory + " has no segments"));
  }

  auto check = [this](const std::filesystem::path& path) -> std::expected<void, Error> {
    auto bytes = store_->size(path);
    if (!bytes) {
      return std::unexpected(Error::storage("Cannot register, " + bytes.error().message));
    }
    if (*bytes == 0) {
      return std::unexpected(Error::storage("Cannot register, empty file: " + path.string()));
    }
    return {};
  };

  if (auto ret = check(rendition.playlistPath()); !ret) {
    return ret;
  }
  for (size_t i = 0; i < rendition.segments.size(); ++i) {
    if (auto ret = check(rendition.segmentPath(i)); !ret) {
      return ret;
    }
  }
  return {};
}

std::mutex& RenditionCatalog::writerLock(int64_t video_id, const std::string& profile) {
  std::lock_guard lock(writers_mutex_);
  auto& slot = writers_[Key{video_id, profile}];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

std::expected<void, Error> RenditionCatalog::registerRendition(const Rendition& rendition) {
  if (!profiles_.parse(rendition.profile)) {
    return std::unexpected(Error::invalidArgument("Unknown profile: " + rendition.profile));
  }

  std::lock_guard writer(writerLock(rendition.video_id, rendition.profile));

  if (auto ret = verifyFiles(rendition); !ret) {
    return ret;
  }

  Rendition ready = rendition;
  ready.ready = true;
  if (auto ret = repository_->save(ready); !ret) {
    return std::unexpected(Error::storage("Failed to persist rendition " + ready.directory + ": " + ret.error().message));
  }

  {
    std::unique_lock lock(mutex_);
    renditions_[ready.video_id][ready.profile] = ready;
    ++version_;
  }
  std::cout << "[RenditionCatalog] " << ready.directory << " ready with "
            << ready.segments.size() << " segments" << std::endl;
  return {};
}

std::expected<void, Error> RenditionCatalog::retract(int64_t video_id, const std::string& profile) {
  std::lock_guard writer(writerLock(video_id, profile));

  Rendition pending{
    .video_id = video_id,
    .profile = profile,
    .directory = std::format("{}/{}", video_id, profile),
    .playlist = PLAYLIST_FILE_NAME,
    .segments = {},
    .ready = false
  };
  {
    std::unique_lock lock(mutex_);
    auto it = renditions_.find(video_id);
    if (it != renditions_.end()) {
      auto entry = it->second.find(profile);
      if (entry != it->second.end()) {
        pending = entry->second;
        pending.ready = false;
      }
    }
    eraseLocked(video_id, profile);
  }
  // hidden from lookups first, then recorded as not ready
  if (auto ret = repository_->save(pending); !ret) {
    return std::unexpected(Error::storage("Failed to persist retraction of " + pending.directory + ": " + ret.error().message));
  }
  return {};
}

std::expected<Rendition, Error> RenditionCatalog::lookup(int64_t video_id, const std::string& profile) {
  {
    std::shared_lock lock(mutex_);
    auto video = renditions_.find(video_id);
    if (video != renditions_.end()) {
      auto rendition = video->second.find(profile);
      if (rendition != video->second.end() && rendition->second.ready) {
        return rendition->second;
      }
    }
  }
  // registered by another process since the last refresh?
  return reload(video_id, profile);
}

std::expected<Rendition, Error> RenditionCatalog::reload(int64_t video_id, const std::string& profile) {
  std::lock_guard writer(writerLock(video_id, profile));
  auto stored = repository_->find(video_id, profile);
  if (!stored && stored.error().code != ErrorCode::NotFound) {
    return std::unexpected(stored.error());
  }

  std::unique_lock lock(mutex_);
  if (!stored || !stored->ready || !profiles_.parse(profile)) {
    eraseLocked(video_id, profile);
    return std::unexpected(Error::notFound(std::format("No ready {} rendition for video {}", profile, video_id)));
  }
  renditions_[video_id][profile] = *stored;
  ++version_;
  return *stored;
}

std::vector<std::string> RenditionCatalog::list(int64_t video_id) const {
  std::vector<std::string> names;
  std::shared_lock lock(mutex_);
  auto video = renditions_.find(video_id);
  if (video == renditions_.end()) {
    return names;
  }
  for (const auto& profile : profiles_.all()) {
    auto it = video->second.find(profile.name);
    if (it != video->second.end() && it->second.ready) {
      names.push_back(profile.name);
    }
  }
  return names;
}

std::expected<void, Error> RenditionCatalog::removeVideo(int64_t video_id) {
  for (const auto& profile : profiles_.all()) {
    std::lock_guard writer(writerLock(video_id, profile.name));
    {
      std::unique_lock lock(mutex_);
      eraseLocked(video_id, profile.name);
    }
    if (auto ret = repository_->remove(video_id, profile.name); !ret) {
      return ret;
    }
  }
  std::cout << "[RenditionCatalog] removing renditions of video " << video_id << std::endl;
  return store_->removeAll(std::to_string(video_id));
}

} // namespace transcode_service
