#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace media_downloader {

// Receives one HTTP response body for a partial file.
//   206          -> appended after the bytes already on disk
//   200          -> the server ignored the range, the file is truncated and restarted
//   416          -> body discarded, the partial file is left as it is
//   other >= 400 -> nothing written, the write is refused so the transfer aborts
// The file is opened on the first body chunk, so an error reply never creates it.
class PartialFileSink {
public:
  PartialFileSink(std::filesystem::path path, std::uint64_t resume_offset);

  PartialFileSink(const PartialFileSink&) = delete;
  PartialFileSink& operator=(const PartialFileSink&) = delete;

  // Returns the number of bytes consumed; anything other than `bytes` tells
  // curl to abort the transfer.
  size_t write(const char* data, size_t bytes, long http_code);
  void close();

  // bytes that were on disk before this response (0 after a restart)
  std::uint64_t offset() const { return offset_; }
  std::uint64_t written() const { return written_; }
  bool failed() const { return failed_; }
  const std::string& error() const { return error_; }

private:
  std::filesystem::path path_;
  std::ofstream file_;
  std::uint64_t offset_;
  std::uint64_t written_{0};
  bool started_{false};
  bool failed_{false};
  std::string error_;
};

} // namespace media_downloader
