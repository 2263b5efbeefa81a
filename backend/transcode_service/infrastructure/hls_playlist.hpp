#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transcode_service::hls {

// URIs of the media segments of a media playlist, in playlist order.
std::vector<std::string> parseSegmentList(std::string_view playlist);

// "007.ts" -> 7, "7" -> 7; anything else -> nullopt
std::optional<size_t> segmentIndexFromName(std::string_view name);

// 7, width 3 -> "007.ts"
std::string segmentFileName(size_t index, int width);

// VOD media playlist over equally long segments, closed by #EXT-X-ENDLIST
std::string buildVodPlaylist(const std::vector<std::string>& segments,
                             std::chrono::seconds segment_duration);

} // namespace transcode_service::hls
