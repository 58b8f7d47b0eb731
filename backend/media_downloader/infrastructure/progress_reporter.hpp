#pragma once
#include "domain/media.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace media_downloader {

// Logs per-item progress whenever an item crosses another `step_percent`.
class ProgressReporter {
public:
  explicit ProgressReporter(int step_percent = 10);

  void report(const MediaDescriptor& media, std::uint64_t so_far, std::uint64_t total);

private:
  int step_percent_;
  std::mutex mutex_;
  std::unordered_map<std::string, int> last_step_;  // "<collection>/<id>" -> last logged percent, never reset
};

} // namespace media_downloader
