#pragma once
#include "domain/error.hpp"
#include "common/config/config.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace transcode_service {

struct Profile {
  std::string name;     // "480p"
  int height{0};
  long video_bitrate{0};  // in bits per second
  long audio_bitrate{0};  // in bits per second
  size_t rank{0};         // position in the configured ladder, 0 = lowest

  bool operator==(const Profile& other) const { return name == other.name; }
};

// The closed set of profiles a deployment knows about. Ordered by ascending
// quality; that order is the client fallback order.
class ProfileSet {
public:
  // Throws std::runtime_error on duplicate names, non-positive heights or
  // bitrates, or heights that are not strictly ascending.
  static ProfileSet fromConfig(const std::vector<config::ProfileConfig>& profiles);

  std::expected<Profile, Error> parse(std::string_view name) const;
  const std::vector<Profile>& all() const { return profiles_; }
  size_t size() const { return profiles_.size(); }

private:
  std::vector<Profile> profiles_;
};

} // namespace transcode_service
