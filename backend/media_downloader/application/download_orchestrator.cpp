#include "download_orchestrator.hpp"
#include <future>
#include <numeric>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace media_downloader {

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<MediaProvider> provider,
                                           const config::DownloadConfig& cfg,
                                           ItemProgressCallback progress_callback)
  : provider_(provider),
    ledger_(cfg.history_file),
    gate_(cfg.max_concurrent_downloads),
    rate_limiter_(cfg.rate_limit.max_rate, cfg.rate_limit.period),
    worker_(provider, ledger_, rate_limiter_,
            RetryPolicy{cfg.retry.max_timeout_retries, cfg.retry.backoff},
            std::move(progress_callback)),
    pool_(static_cast<unsigned int>(cfg.max_concurrent_downloads)) {}

void DownloadOrchestrator::cancel() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  stop_source_.request_stop();
}

std::stop_token DownloadOrchestrator::beginBatch() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (stop_source_.stop_requested()) {
    stop_source_ = std::stop_source{};
  }
  return stop_source_.get_token();
}

std::expected<BatchSummary, std::string> DownloadOrchestrator::downloadBatch(
  const std::string& collection_id,
  const std::vector<MediaDescriptor>& items,
  const std::filesystem::path& download_dir
) {
  std::error_code ec;
  std::filesystem::create_directories(download_dir, ec);
  if (ec) {
    return std::unexpected("Failed to create download directory " + download_dir.string() + ": " + ec.message());
  }

  if (auto loaded = ledger_.load(); !loaded) {
    return std::unexpected(loaded.error());
  }

  auto total_bytes = std::accumulate(items.begin(), items.end(), std::uint64_t{0},
    [](std::uint64_t sum, const MediaDescriptor& m) { return sum + m.size_bytes; });
  spdlog::info("Downloading {} selected media ({:.2f} MB) to {}",
               items.size(), static_cast<double>(total_bytes) / 1024 / 1024, download_dir.string());

  auto stop = beginBatch();
  BatchSummary summary;
  std::vector<std::future<TransferOutcome>> results;
  results.reserve(items.size());

  std::unordered_set<std::string> seen_ids;
  std::unordered_map<std::string, std::string> claimed_files;  // file name -> item id

  for (const auto& selected : items) {
    // the batch collection is authoritative; the caller's descriptor stays untouched
    MediaDescriptor item = selected;
    if (item.collection_id != collection_id) {
      if (!item.collection_id.empty()) {
        spdlog::warn("Item {} belongs to collection {}, recording it under {}",
                     item.id, item.collection_id, collection_id);
      }
      item.collection_id = collection_id;
    }

    if (!seen_ids.insert(item.id).second) {
      spdlog::warn("Item {} is listed twice in the batch, ignoring the duplicate", item.id);
      ++summary.skipped;
      continue;
    }

    // two items sharing a name would write the same partial file
    auto name = fileName(item);
    if (auto [it, inserted] = claimed_files.emplace(name, item.id); !inserted) {
      spdlog::error("Error downloading {}: item {} targets the same file as item {}", name, item.id, it->second);
      ++summary.failed;
      continue;
    }

    if (!gate_.acquire(stop)) {
      ++summary.cancelled;
      continue;
    }
    common::PermitGuard permit(gate_, std::adopt_lock);

    results.push_back(pool_.commit(
      [this, item = std::move(item), download_dir, stop, permit = std::move(permit)]() mutable {
        common::PermitGuard held = std::move(permit);
        return worker_.run(item, download_dir, stop);
      }));
  }

  for (auto& result : results) {
    switch (result.get()) {
      case TransferOutcome::Downloaded: ++summary.downloaded; break;
      case TransferOutcome::Skipped: ++summary.skipped; break;
      case TransferOutcome::Failed: ++summary.failed; break;
      case TransferOutcome::Cancelled: ++summary.cancelled; break;
    }
  }

  spdlog::info("Download complete. Total media downloaded: {}", summary.downloaded);
  if (summary.skipped || summary.failed || summary.cancelled) {
    spdlog::info("Skipped: {}, failed: {}, cancelled: {}", summary.skipped, summary.failed, summary.cancelled);
  }
  return summary;
}

} // namespace media_downloader
