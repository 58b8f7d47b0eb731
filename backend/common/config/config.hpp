#pragma once

#include <cstddef>
#include <string>
#include <chrono>
#include <expected>

namespace config {

struct RateLimitConfig {
  size_t max_rate;
  std::chrono::milliseconds period;
};

struct RetryConfig {
  size_t max_timeout_retries;  // 0 = retry timeouts forever
  std::chrono::milliseconds backoff;
};

struct DownloadConfig {
  size_t max_concurrent_downloads;
  RateLimitConfig rate_limit;
  RetryConfig retry;
  std::string default_download_dir;
  std::string history_file;
};

struct ProviderConfig {
  std::string base_url;
  std::string auth_token;
  std::chrono::seconds connect_timeout;
  std::chrono::seconds stall_timeout;
};

struct LogConfig {
  std::string file;
  std::string level;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overlay values from a JSON file on top of the defaults.
// Call once at startup, before any getter is shared with worker threads.
std::expected<void, std::string> load(const std::string& path);

// Getters
const DownloadConfig& getDownload() const { return download_; }
const ProviderConfig& getProvider() const { return provider_; }
const LogConfig& getLog() const { return log_; }

private:
  Config();

  DownloadConfig download_;
  ProviderConfig provider_;
  LogConfig log_;
};

} // namespace config
