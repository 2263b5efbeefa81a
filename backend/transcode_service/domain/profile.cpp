#include "profile.hpp"
#include <format>
#include <stdexcept>

namespace transcode_service {

ProfileSet ProfileSet::fromConfig(const std::vector<config::ProfileConfig>& profiles) {
  if (profiles.empty()) {
    throw std::runtime_error("at least one transcode profile is required");
  }

  ProfileSet set;
  for (const auto& p : profiles) {
    if (p.name.empty() || p.name.find('/') != std::string::npos || p.name.find("..") != std::string::npos) {
      throw std::runtime_error("invalid profile name: '" + p.name + "'");
    }
    if (p.height <= 0 || p.video_bitrate <= 0 || p.audio_bitrate <= 0) {
      throw std::runtime_error("profile " + p.name + " needs a positive height and bitrates");
    }
    for (const auto& existing : set.profiles_) {
      if (existing.name == p.name) {
        throw std::runtime_error("duplicate profile name: " + p.name);
      }
      if (existing.height >= p.height) {
        throw std::runtime_error(std::format(
          "profiles must be listed by ascending height: {} ({}) after {} ({})",
          p.name, p.height, existing.name, existing.height));
      }
    }
    set.profiles_.push_back(Profile{
      .name = p.name,
      .height = p.height,
      .video_bitrate = p.video_bitrate,
      .audio_bitrate = p.audio_bitrate,
      .rank = set.profiles_.size()
    });
  }
  return set;
}

std::expected<Profile, Error> ProfileSet::parse(std::string_view name) const {
  for (const auto& p : profiles_) {
    if (p.name == name) {
      return p;
    }
  }
  std::string known;
  for (const auto& p : profiles_) {
    known += known.empty() ? p.name : ", " + p.name;
  }
  return std::unexpected(Error::invalidArgument(
    std::format("unknown profile '{}' (configured: {})", name, known)));
}

} // namespace transcode_service
