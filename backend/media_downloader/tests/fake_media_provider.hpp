#pragma once
#include "domain/media_provider.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

namespace media_downloader::test_support {

inline char patternByte(std::uint64_t offset) {
  return static_cast<char>(offset % 251);
}

// One scripted outcome for the next streamInto() call of an item. The attempt
// writes `bytes_before_error` bytes (or everything when unset) and then fails
// with `error` if one is given.
struct ScriptedAttempt {
  std::optional<std::uint64_t> bytes_before_error;
  std::optional<TransferError> error;
};

// In-memory provider: item bytes follow patternByte(), attempts can be scripted
// per item, and the number of concurrently running streams is recorded.
class FakeMediaProvider : public MediaProvider {
public:
  void add(const MediaDescriptor& media) {
    std::lock_guard<std::mutex> lock(mutex_);
    media_[media.id] = media;
  }

  void script(const std::string& id, ScriptedAttempt attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_[id].push_back(std::move(attempt));
  }

  void failResolve(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    unresolvable_.push_back(id);
  }

  void setStreamDelay(std::chrono::milliseconds delay) { delay_ = delay; }

  std::expected<MediaDescriptor, TransferError> resolve(
    const std::string& collection_id,
    const std::string& id
  ) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(unresolvable_.begin(), unresolvable_.end(), id) != unresolvable_.end()) {
      return std::unexpected(TransferError::failure("message " + id + " not found"));
    }
    auto it = media_.find(id);
    if (it == media_.end()) {
      return std::unexpected(TransferError::failure("message " + id + " not found"));
    }
    auto media = it->second;
    media.collection_id = collection_id;
    return media;
  }

  std::expected<std::uint64_t, TransferError> streamInto(
    const MediaDescriptor& media,
    const std::filesystem::path& destination,
    std::uint64_t resume_offset,
    ProgressCallback progress_callback
  ) override {
    auto running = active_.fetch_add(1) + 1;
    auto seen = max_active_.load();
    while (running > seen && !max_active_.compare_exchange_weak(seen, running)) {
    }

    ScriptedAttempt attempt;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      attempts_[media.id].push_back(resume_offset);
      auto& queue = scripts_[media.id];
      if (!queue.empty()) {
        attempt = std::move(queue.front());
        queue.pop_front();
      }
    }

    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }

    auto result = write(media, destination, resume_offset, attempt, progress_callback);
    active_.fetch_sub(1);
    return result;
  }

  std::vector<std::uint64_t> attemptOffsets(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(id);
    return it == attempts_.end() ? std::vector<std::uint64_t>{} : it->second;
  }

  size_t totalAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [id, offsets] : attempts_) {
      total += offsets.size();
    }
    return total;
  }

  std::uint64_t bytesWritten() const { return bytes_written_.load(); }
  int maxActive() const { return max_active_.load(); }

private:
  std::expected<std::uint64_t, TransferError> write(
    const MediaDescriptor& media,
    const std::filesystem::path& destination,
    std::uint64_t resume_offset,
    const ScriptedAttempt& attempt,
    const ProgressCallback& progress_callback
  ) {
    std::uint64_t end = media.size_bytes;
    if (attempt.bytes_before_error) {
      end = std::min(end, resume_offset + *attempt.bytes_before_error);
    }

    std::uint64_t written = 0;
    if (end > resume_offset) {
      std::ofstream out(destination, std::ios::binary | std::ios::app);
      if (!out) {
        return std::unexpected(TransferError::failure("cannot open " + destination.string()));
      }
      constexpr std::uint64_t CHUNK = 64 * 1024;
      std::string buffer;
      for (std::uint64_t pos = resume_offset; pos < end; pos += buffer.size()) {
        auto n = std::min(CHUNK, end - pos);
        buffer.resize(n);
        for (std::uint64_t i = 0; i < n; ++i) {
          buffer[i] = patternByte(pos + i);
        }
        out.write(buffer.data(), static_cast<std::streamsize>(n));
        written += n;
        if (progress_callback) {
          progress_callback(pos + n, media.size_bytes);
        }
      }
    }
    bytes_written_.fetch_add(written);

    if (attempt.error) {
      return std::unexpected(*attempt.error);
    }
    return written;
  }

  mutable std::mutex mutex_;
  std::map<std::string, MediaDescriptor> media_;
  std::map<std::string, std::deque<ScriptedAttempt>> scripts_;
  std::map<std::string, std::vector<std::uint64_t>> attempts_;
  std::vector<std::string> unresolvable_;
  std::chrono::milliseconds delay_{0};
  std::atomic<int> active_{0};
  std::atomic<int> max_active_{0};
  std::atomic<std::uint64_t> bytes_written_{0};
};

inline MediaDescriptor document(const std::string& id, std::uint64_t size, const std::string& collection = "chan") {
  MediaDescriptor media;
  media.id = id;
  media.collection_id = collection;
  media.name = "doc-" + id + ".bin";
  media.size_bytes = size;
  media.payload = DocumentMedia{};
  return media;
}

// Fresh empty directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& tag) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
      ("media_downloader_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool matchesPattern(const std::string& content) {
  for (std::uint64_t i = 0; i < content.size(); ++i) {
    if (content[i] != patternByte(i)) {
      return false;
    }
  }
  return true;
}

} // namespace media_downloader::test_support
