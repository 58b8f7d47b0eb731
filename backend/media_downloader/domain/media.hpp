#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace media_downloader {

enum class MediaKind {
  Photo,
  Video,
  Document
};

struct PhotoMedia {};

struct VideoMedia {
  int width{0};
  int height{0};
  int duration_seconds{0};
};

struct DocumentMedia {};

// alternatives are ordered like MediaKind
using MediaPayload = std::variant<PhotoMedia, VideoMedia, DocumentMedia>;

struct MediaDescriptor {
  std::string id;
  std::string collection_id;
  std::optional<std::string> name;
  std::uint64_t size_bytes{0};
  MediaPayload payload;

  MediaKind kind() const { return static_cast<MediaKind>(payload.index()); }

  // only valid when kind() == MediaKind::Video
  const VideoMedia& video() const { return std::get<VideoMedia>(payload); }
};

std::string kindName(MediaKind kind);

// File name under the download directory: photos become "<id>.jpg", other
// kinds keep their name (path separators replaced) or "Unknown-<id>".
std::string fileName(const MediaDescriptor& media);

// "HD", "HD Ready" or "SD" for videos, "N/A" for everything else.
std::string quality(const MediaDescriptor& media);

// "<name> (<size> MB) - <Kind> - <quality>", suffixed with " [DOWNLOADED]"
std::string displayName(const MediaDescriptor& media, bool downloaded = false);

// "@name" and positive ids pass through; a negative or zero id "-N" becomes
// "-100N" unless it is already a full channel id ("-100" plus 10 digits).
std::string normalizeCollectionId(const std::string& input);

} // namespace media_downloader
