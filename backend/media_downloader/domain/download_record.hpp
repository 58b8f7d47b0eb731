#pragma once
#include <cstdint>
#include <string>

namespace media_downloader {

struct DownloadRecord {
  std::string filename;
  std::uint64_t size_bytes{0};
  std::string completed_at;  // ISO-8601, UTC

  bool operator==(const DownloadRecord&) const = default;
};

} // namespace media_downloader
