#pragma once

// project
#include "media.hpp"

// std
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace media_downloader {

struct TransferError {
  enum class Kind {
    Timeout,  // transient, the caller may retry
    Failure
  };

  Kind kind{Kind::Failure};
  std::string message;

  bool isTimeout() const { return kind == Kind::Timeout; }

  static TransferError timeout(std::string msg) { return {Kind::Timeout, std::move(msg)}; }
  static TransferError failure(std::string msg) { return {Kind::Failure, std::move(msg)}; }
};

// Source of media bytes. Implementations must be safe to call from several
// worker threads at once.
class MediaProvider {
public:
  // (bytes so far including the resume offset, total bytes)
  using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

  virtual ~MediaProvider() = default;

  virtual std::expected<MediaDescriptor, TransferError> resolve(
    const std::string& collection_id,
    const std::string& id
  ) = 0;

  // Appends the bytes of `media` from `resume_offset` on to `destination`,
  // creating it on first write. Returns the number of bytes written by this call.
  virtual std::expected<std::uint64_t, TransferError> streamInto(
    const MediaDescriptor& media,
    const std::filesystem::path& destination,
    std::uint64_t resume_offset,
    ProgressCallback progress_callback = nullptr
  ) = 0;
};

} // namespace media_downloader
