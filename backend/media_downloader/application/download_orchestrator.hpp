#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>
#include "common/concurrency_gate.hpp"
#include "common/config/config.hpp"
#include "common/rate_limiter.hpp"
#include "common/thread_pool.hpp"
#include "application/transfer_worker.hpp"
#include "infrastructure/download_ledger.hpp"

namespace media_downloader {

struct BatchSummary {
  size_t downloaded{0};  // the batch's success count
  size_t skipped{0};
  size_t failed{0};
  size_t cancelled{0};
};

class DownloadOrchestrator {
public:
  DownloadOrchestrator(std::shared_ptr<MediaProvider> provider,
                       const config::DownloadConfig& cfg,
                       ItemProgressCallback progress_callback = nullptr);

  DownloadOrchestrator(const DownloadOrchestrator&) = delete;
  DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

  // Downloads every item into download_dir with at most max_concurrent_downloads
  // transfers in flight. Item failures are logged and counted, never returned;
  // an error is returned only when the batch cannot start (directory, ledger).
  // Batches on one orchestrator must not overlap.
  std::expected<BatchSummary, std::string> downloadBatch(
    const std::string& collection_id,
    const std::vector<MediaDescriptor>& items,
    const std::filesystem::path& download_dir
  );

  // Stops the running batch at its next wait point. Attempts already streaming
  // finish first. The next downloadBatch() starts uncancelled.
  void cancel();

  std::expected<void, std::string> loadLedger() { return ledger_.load(); }
  const DownloadLedger& ledger() const { return ledger_; }

private:
  std::stop_token beginBatch();

  std::shared_ptr<MediaProvider> provider_;
  DownloadLedger ledger_;
  common::ConcurrencyGate gate_;
  common::RateLimiter rate_limiter_;
  TransferWorker worker_;

  std::mutex stop_mutex_;
  std::stop_source stop_source_;

  // declared last: workers are joined before anything they use goes away
  common::ThreadPool pool_;
};

} // namespace media_downloader
