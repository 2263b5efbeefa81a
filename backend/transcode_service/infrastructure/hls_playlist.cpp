#include "hls_playlist.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <charconv>
#include <format>
#include <sstream>

namespace transcode_service::hls {

std::vector<std::string> parseSegmentList(std::string_view playlist) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start < playlist.size()) {
    auto end = playlist.find('\n', start);
    if (end == std::string_view::npos) {
      end = playlist.size();
    }
    std::string line{playlist.substr(start, end - start)};
    boost::algorithm::trim(line);
    if (!line.empty() && line.front() != '#') {
      segments.push_back(std::move(line));
    }
    start = end + 1;
  }
  return segments;
}

std::optional<size_t> segmentIndexFromName(std::string_view name) {
  if (boost::algorithm::ends_with(name, ".ts")) {
    name.remove_suffix(3);
  }
  if (name.empty() || name.size() > 9) {
    return std::nullopt;
  }
  size_t index = 0;
  auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
  if (ec != std::errc{} || ptr != name.data() + name.size()) {
    return std::nullopt;
  }
  return index;
}

std::string segmentFileName(size_t index, int width) {
  return std::format("{:0{}}.ts", index, width);
}

std::string buildVodPlaylist(const std::vector<std::string>& segments,
                             std::chrono::seconds segment_duration) {
  std::ostringstream playlist;
  playlist << "#EXTM3U\n"
           << "#EXT-X-VERSION:3\n"
           << "#EXT-X-TARGETDURATION:" << segment_duration.count() << "\n"
           << "#EXT-X-MEDIA-SEQUENCE:0\n"
           << "#EXT-X-PLAYLIST-TYPE:VOD\n";
  for (const auto& segment : segments) {
    playlist << "#EXTINF:" << segment_duration.count() << ".0,\n"
             << segment << "\n";
  }
  playlist << "#EXT-X-ENDLIST\n";
  return playlist.str();
}

} // namespace transcode_service::hls
