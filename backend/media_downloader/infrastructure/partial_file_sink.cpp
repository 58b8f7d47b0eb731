#include "partial_file_sink.hpp"

namespace media_downloader {

PartialFileSink::PartialFileSink(std::filesystem::path path, std::uint64_t resume_offset)
  : path_(std::move(path)), offset_(resume_offset) {}

size_t PartialFileSink::write(const char* data, size_t bytes, long http_code) {
  if (!started_) {
    started_ = true;
    if (http_code >= 400) {
      // error bodies never go into the partial file
      return http_code == 416 ? bytes : 0;
    }

    auto mode = std::ios::binary | std::ios::app;
    if (offset_ > 0 && http_code == 200) {
      mode = std::ios::binary | std::ios::trunc;
      offset_ = 0;
    }
    file_.open(path_, mode);
    if (!file_) {
      failed_ = true;
      error_ = "Failed to open output file " + path_.string();
      return 0;
    }
  }

  if (!file_.is_open()) {
    return bytes;  // rest of a discarded 416 body
  }

  if (!file_.write(data, static_cast<std::streamsize>(bytes))) {
    failed_ = true;
    error_ = "Failed to write " + path_.string();
    return 0;
  }
  written_ += bytes;
  return bytes;
}

void PartialFileSink::close() {
  if (!file_.is_open()) {
    return;
  }
  file_.close();
  if (file_.fail() && !failed_) {
    failed_ = true;
    error_ = "Failed to flush " + path_.string();
  }
}

} // namespace media_downloader
