#include "download_ledger.hpp"
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace media_downloader {

namespace {

// Older histories store null for media without a name; that reads as "".
// Any other non-string value is a corrupt entry.
std::string optionalString(const nlohmann::json& value, const char* key) {
  auto it = value.find(key);
  if (it == value.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

} // namespace

DownloadLedger::DownloadLedger(std::filesystem::path file) : file_(std::move(file)) {}

std::expected<void, std::string> DownloadLedger::load() {
  std::error_code ec;
  if (!std::filesystem::exists(file_, ec)) {
    if (ec) {
      return std::unexpected("Failed to stat ledger " + file_.string() + ": " + ec.message());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    return {};
  }

  std::ifstream in(file_);
  if (!in) {
    return std::unexpected("Failed to open ledger " + file_.string());
  }

  std::unordered_map<std::string, CollectionEntries> loaded;
  try {
    auto root = nlohmann::json::parse(in);
    if (!root.is_object()) {
      return std::unexpected("Corrupt ledger " + file_.string() + ": top level is not an object");
    }
    for (const auto& [collection_id, items] : root.items()) {
      if (!items.is_object()) {
        return std::unexpected("Corrupt ledger " + file_.string() + ": collection " + collection_id + " is not an object");
      }
      auto& collection = loaded[collection_id];
      for (const auto& [id, value] : items.items()) {
        if (!value.is_object()) {
          return std::unexpected("Corrupt ledger " + file_.string() + ": entry " + collection_id + "/" + id + " is not an object");
        }
        DownloadRecord entry;
        entry.filename = optionalString(value, "filename");
        entry.size_bytes = value.at("size").get<std::uint64_t>();
        // the timestamp is informational only
        auto timestamp = value.find("timestamp");
        if (timestamp != value.end() && timestamp->is_string()) {
          entry.completed_at = timestamp->get<std::string>();
        }
        collection.emplace(id, std::move(entry));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected("Corrupt ledger " + file_.string() + ": " + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  entries_ = std::move(loaded);
  return {};
}

bool DownloadLedger::contains(const std::string& collection_id, const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(collection_id);
  return it != entries_.end() && it->second.contains(id);
}

std::optional<DownloadRecord> DownloadLedger::find(const std::string& collection_id, const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(collection_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  auto entry = it->second.find(id);
  if (entry == it->second.end()) {
    return std::nullopt;
  }
  return entry->second;
}

void DownloadLedger::record(const std::string& collection_id, const std::string& id, DownloadRecord entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[collection_id][id] = std::move(entry);
}

std::expected<void, std::string> DownloadLedger::persist() {
  std::lock_guard<std::mutex> lock(mutex_);
  return persistLocked();
}

std::expected<void, std::string> DownloadLedger::recordAndPersist(
  const std::string& collection_id,
  const std::string& id,
  DownloadRecord entry
) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[collection_id][id] = std::move(entry);
  return persistLocked();
}

size_t DownloadLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t total = 0;
  for (const auto& [collection_id, items] : entries_) {
    total += items.size();
  }
  return total;
}

size_t DownloadLedger::size(const std::string& collection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(collection_id);
  return it == entries_.end() ? 0 : it->second.size();
}

std::expected<void, std::string> DownloadLedger::persistLocked() const {
  nlohmann::json root = nlohmann::json::object();
  for (const auto& [collection_id, items] : entries_) {
    auto& collection = root[collection_id];
    collection = nlohmann::json::object();
    for (const auto& [id, entry] : items) {
      collection[id] = {
        {"filename", entry.filename},
        {"size", entry.size_bytes},
        {"timestamp", entry.completed_at}
      };
    }
  }

  std::error_code ec;
  if (file_.has_parent_path()) {
    std::filesystem::create_directories(file_.parent_path(), ec);
    if (ec) {
      return std::unexpected("Failed to create ledger directory: " + ec.message());
    }
  }

  auto temp_path = file_;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return std::unexpected("Failed to open " + temp_path.string() + " for writing");
    }
    out << root.dump();
    out.flush();
    if (!out) {
      return std::unexpected("Failed to write " + temp_path.string());
    }
  }

  std::filesystem::rename(temp_path, file_, ec);
  if (ec) {
    return std::unexpected("Failed to replace ledger " + file_.string() + ": " + ec.message());
  }
  return {};
}

} // namespace media_downloader
