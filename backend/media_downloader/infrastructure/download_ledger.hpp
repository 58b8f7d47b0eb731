#pragma once
#include "domain/download_record.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace media_downloader {

/*
  账本文件格式 (JSON):
  { "<collection>": { "<id>": { "filename": ..., "size": ..., "timestamp": ... } } }
  每次持久化都整体重写, 先写临时文件再 rename 覆盖
*/
class DownloadLedger {
public:
  explicit DownloadLedger(std::filesystem::path file);

  DownloadLedger(const DownloadLedger&) = delete;
  DownloadLedger& operator=(const DownloadLedger&) = delete;

  // Replaces the in-memory entries with the file content. A missing file gives
  // an empty ledger; unreadable or malformed content is reported as corrupt
  // and leaves the in-memory entries untouched.
  std::expected<void, std::string> load();

  bool contains(const std::string& collection_id, const std::string& id) const;
  std::optional<DownloadRecord> find(const std::string& collection_id, const std::string& id) const;

  void record(const std::string& collection_id, const std::string& id, DownloadRecord entry);
  std::expected<void, std::string> persist();

  // record + persist as one critical section, so concurrent workers cannot
  // overwrite each other's snapshot
  std::expected<void, std::string> recordAndPersist(
    const std::string& collection_id,
    const std::string& id,
    DownloadRecord entry
  );

  size_t size() const;
  size_t size(const std::string& collection_id) const;

  const std::filesystem::path& file() const { return file_; }

private:
  using CollectionEntries = std::unordered_map<std::string, DownloadRecord>;

  std::expected<void, std::string> persistLocked() const;

  std::filesystem::path file_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CollectionEntries> entries_;
};

} // namespace media_downloader
