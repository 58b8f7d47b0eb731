#include "transfer_worker.hpp"
#include <chrono>
#include <format>
#include <fstream>
#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

namespace media_downloader {

namespace {

std::string nowIso8601() {
  auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  return std::format("{:%FT%TZ}", now);
}

} // namespace

std::filesystem::path partialPath(const std::filesystem::path& final_path) {
  auto path = final_path;
  path += PARTIAL_FILE_SUFFIX;
  return path;
}

TransferWorker::TransferWorker(std::shared_ptr<MediaProvider> provider,
                               DownloadLedger& ledger,
                               common::RateLimiter& rate_limiter,
                               RetryPolicy retry_policy,
                               ItemProgressCallback progress_callback)
  : provider_(std::move(provider)),
    ledger_(ledger),
    rate_limiter_(rate_limiter),
    retry_policy_(retry_policy),
    progress_callback_(std::move(progress_callback)) {}

TransferOutcome TransferWorker::run(const MediaDescriptor& item,
                                    const std::filesystem::path& download_dir,
                                    std::stop_token stop) {
  const auto filename = fileName(item);
  const auto final_path = download_dir / filename;

  try {
    // 两个去重信号互相独立, 任一成立即跳过
    std::error_code ec;
    if (std::filesystem::exists(final_path, ec) || ledger_.contains(item.collection_id, item.id)) {
      spdlog::info("File {} already exists or was previously downloaded. Skipping.", filename);
      return TransferOutcome::Skipped;
    }
    return transfer(item, final_path, stop);
  } catch (const std::exception& e) {
    spdlog::error("Error downloading {}: {}", filename, e.what());
    return TransferOutcome::Failed;
  }
}

TransferOutcome TransferWorker::transfer(const MediaDescriptor& item,
                                         const std::filesystem::path& final_path,
                                         std::stop_token stop) {
  const auto filename = final_path.filename().string();
  const auto part_path = partialPath(final_path);

  auto resolved = provider_->resolve(item.collection_id, item.id);
  if (!resolved) {
    spdlog::error("Error resolving {}: {}", filename, resolved.error().message);
    return TransferOutcome::Failed;
  }
  const MediaDescriptor& media = resolved.value();

  MediaProvider::ProgressCallback on_progress = nullptr;
  if (progress_callback_) {
    on_progress = [this, &item](std::uint64_t so_far, std::uint64_t total) {
      progress_callback_(item, so_far, total);
    };
  }

  size_t timeouts = 0;
  while (true) {
    if (stop.stop_requested()) {
      spdlog::info("Download of {} cancelled", filename);
      return TransferOutcome::Cancelled;
    }

    // the partial file may have grown during a failed attempt, so re-read it every time
    std::error_code ec;
    std::uint64_t offset = 0;
    if (std::filesystem::exists(part_path, ec)) {
      offset = std::filesystem::file_size(part_path, ec);
      if (ec) {
        spdlog::error("Error downloading {}: cannot read partial file size: {}", filename, ec.message());
        return TransferOutcome::Failed;
      }
      if (media.size_bytes > 0 && offset > media.size_bytes) {
        spdlog::warn("Partial file for {} is larger than the media ({} > {} bytes), restarting",
                     filename, offset, media.size_bytes);
        std::filesystem::remove(part_path, ec);
        if (ec) {
          spdlog::error("Error downloading {}: cannot remove partial file: {}", filename, ec.message());
          return TransferOutcome::Failed;
        }
        offset = 0;
      }
    }

    if (!rate_limiter_.acquire(stop)) {
      spdlog::info("Download of {} cancelled", filename);
      return TransferOutcome::Cancelled;
    }

    if (offset > 0) {
      spdlog::info("Resuming {} at byte {} of {}", filename, offset, media.size_bytes);
    } else {
      spdlog::info("Downloading {} ({} bytes)", filename, media.size_bytes);
    }

    auto written = provider_->streamInto(media, part_path, offset, on_progress);
    if (written) {
      spdlog::debug("Wrote {} bytes of {}", written.value(), filename);
      break;
    }

    if (!written.error().isTimeout()) {
      spdlog::error("Error downloading {}: {}", filename, written.error().message);
      return TransferOutcome::Failed;
    }

    ++timeouts;
    if (retry_policy_.max_timeout_retries > 0 && timeouts > retry_policy_.max_timeout_retries) {
      spdlog::error("Timeout while downloading {}. Giving up after {} retries", filename, timeouts - 1);
      return TransferOutcome::Failed;
    }
    spdlog::error("Timeout while downloading {}. Retrying...", filename);
    if (retry_policy_.backoff.count() > 0) {
      std::this_thread::sleep_for(retry_policy_.backoff);
    }
  }

  std::error_code ec;
  if (!std::filesystem::exists(part_path, ec)) {
    // an empty media never triggers a write
    std::ofstream touch(part_path, std::ios::binary);
    if (!touch) {
      spdlog::error("Error downloading {}: cannot create {}", filename, part_path.string());
      return TransferOutcome::Failed;
    }
  }

  auto final_size = std::filesystem::file_size(part_path, ec);
  if (ec) {
    spdlog::error("Error downloading {}: {}", filename, ec.message());
    return TransferOutcome::Failed;
  }
  if (final_size < media.size_bytes) {
    spdlog::error("Error downloading {}: transfer ended at {} of {} bytes", filename, final_size, media.size_bytes);
    return TransferOutcome::Failed;
  }

  std::filesystem::rename(part_path, final_path, ec);
  if (ec) {
    spdlog::error("Error downloading {}: rename failed: {}", filename, ec.message());
    return TransferOutcome::Failed;
  }
  spdlog::info("Downloaded: {}", filename);

  auto persisted = ledger_.recordAndPersist(item.collection_id, item.id, DownloadRecord{
    .filename = filename,
    .size_bytes = final_size,
    .completed_at = nowIso8601()
  });
  if (!persisted) {
    // the file is in place, so the item still counts as downloaded
    spdlog::error("Failed to record {} in download history: {}", filename, persisted.error());
  }
  return TransferOutcome::Downloaded;
}

} // namespace media_downloader
