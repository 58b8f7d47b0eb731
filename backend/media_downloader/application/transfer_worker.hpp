#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>
#include "common/rate_limiter.hpp"
#include "domain/media.hpp"
#include "domain/media_provider.hpp"
#include "infrastructure/download_ledger.hpp"

namespace media_downloader {

enum class TransferOutcome {
  Downloaded,
  Skipped,
  Failed,
  Cancelled
};

struct RetryPolicy {
  size_t max_timeout_retries{0};  // 0 = unlimited
  std::chrono::milliseconds backoff{0};
};

// (item, bytes so far, total bytes)
using ItemProgressCallback = std::function<void(const MediaDescriptor&, std::uint64_t, std::uint64_t)>;

inline constexpr const char* PARTIAL_FILE_SUFFIX = ".part";

std::filesystem::path partialPath(const std::filesystem::path& final_path);

// Runs one item to completion: dedup check, resume offset, rate-limited
// transfer attempts, rename of the partial file, ledger update.
// Shared by all worker threads of a batch; run() is reentrant.
class TransferWorker {
public:
  TransferWorker(std::shared_ptr<MediaProvider> provider,
                 DownloadLedger& ledger,
                 common::RateLimiter& rate_limiter,
                 RetryPolicy retry_policy,
                 ItemProgressCallback progress_callback = nullptr);

  TransferOutcome run(const MediaDescriptor& item,
                      const std::filesystem::path& download_dir,
                      std::stop_token stop = {});

private:
  TransferOutcome transfer(const MediaDescriptor& item,
                           const std::filesystem::path& final_path,
                           std::stop_token stop);

  std::shared_ptr<MediaProvider> provider_;
  DownloadLedger& ledger_;
  common::RateLimiter& rate_limiter_;
  RetryPolicy retry_policy_;
  ItemProgressCallback progress_callback_;
};

} // namespace media_downloader
