#include "media.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace media_downloader {

namespace {

constexpr size_t CHANNEL_ID_DIGITS = 13;

} // namespace

std::string kindName(MediaKind kind) {
  switch (kind) {
    case MediaKind::Photo: return "Photo";
    case MediaKind::Video: return "Video";
    case MediaKind::Document: return "Document";
  }
  return "Unknown";
}

std::string fileName(const MediaDescriptor& media) {
  if (media.kind() == MediaKind::Photo) {
    return media.id + ".jpg";
  }
  if (!media.name || media.name->empty()) {
    return "Unknown-" + media.id;
  }
  std::string name = *media.name;
  std::replace(name.begin(), name.end(), '/', '_');
  std::replace(name.begin(), name.end(), '\\', '_');
  if (name == "." || name == "..") {
    return "Unknown-" + media.id;
  }
  return name;
}

std::string quality(const MediaDescriptor& media) {
  if (media.kind() != MediaKind::Video) {
    return "N/A";
  }
  const auto& v = media.video();
  if (v.width >= 1920 || v.height >= 1080) {
    return "HD";
  }
  if (v.width >= 1280 || v.height >= 720) {
    return "HD Ready";
  }
  return "SD";
}

std::string displayName(const MediaDescriptor& media, bool downloaded) {
  std::string name;
  if (media.kind() == MediaKind::Photo) {
    name = "Photo-" + media.id;
  } else {
    name = media.name.value_or("Unknown-" + media.id);
  }

  auto line = std::format("{} ({:.2f} MB) - {} - {}",
    name, static_cast<double>(media.size_bytes) / 1024 / 1024, kindName(media.kind()), quality(media));
  if (downloaded) {
    line += " [DOWNLOADED]";
  }
  return line;
}

std::string normalizeCollectionId(const std::string& input) {
  if (input.empty() || input.front() == '@') {
    return input;
  }

  bool negative = input.front() == '-';
  std::string digits = negative ? input.substr(1) : input;
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
    return input;
  }

  auto first = digits.find_first_not_of('0');
  digits = first == std::string::npos ? "0" : digits.substr(first);

  if (!negative && digits != "0") {
    return digits;
  }
  // already a full channel id: "-100" followed by a 10 digit channel number
  if (negative && digits.size() >= CHANNEL_ID_DIGITS && digits.starts_with("100")) {
    return "-" + digits;
  }
  return "-100" + digits;
}

} // namespace media_downloader
