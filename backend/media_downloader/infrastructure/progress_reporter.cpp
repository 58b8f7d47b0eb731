#include "progress_reporter.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace media_downloader {

ProgressReporter::ProgressReporter(int step_percent)
  : step_percent_(std::clamp(step_percent, 1, 100)) {}

void ProgressReporter::report(const MediaDescriptor& media, std::uint64_t so_far, std::uint64_t total) {
  if (total == 0) {
    return;
  }
  int percent = static_cast<int>(std::min<std::uint64_t>(so_far, total) * 100 / total);
  int step = percent / step_percent_ * step_percent_;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = media.collection_id + "/" + media.id;
    auto [it, inserted] = last_step_.try_emplace(key, -1);
    if (step <= it->second) {
      return;
    }
    // kept after 100%: curl keeps calling back with (total, total) once the body is in
    it->second = step;
  }

  spdlog::info("{}: {}% ({:.2f}/{:.2f} MB)", fileName(media), step,
               static_cast<double>(so_far) / 1024 / 1024, static_cast<double>(total) / 1024 / 1024);
}

} // namespace media_downloader
