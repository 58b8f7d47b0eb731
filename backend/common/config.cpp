#include "config/config.hpp"
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>

namespace config {

  Config::Config() {
    download_ = {
      .max_concurrent_downloads = 4,
      .rate_limit = {
        .max_rate = 5,
        .period = std::chrono::seconds(60)
      },
      .retry = {
        .max_timeout_retries = 0,
        .backoff = std::chrono::milliseconds(0)
      },
      .default_download_dir = "downloads",
      .history_file = "download_history.json"
    };

    provider_ = {
      .base_url = "http://127.0.0.1:8080/media",
      .auth_token = "",
      .connect_timeout = std::chrono::seconds(30),
      .stall_timeout = std::chrono::seconds(60)
    };

    log_ = {
      .file = "media_downloader.log",
      .level = "info"
    };
  }

  std::expected<void, std::string> Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      return std::unexpected("Failed to open config file: " + path);
    }

    nlohmann::json root;
    try {
      root = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      return std::unexpected("Invalid config file " + path + ": " + e.what());
    }
    if (!root.is_object()) {
      return std::unexpected("Invalid config file " + path + ": top level must be an object");
    }

    // work on a copy so a bad file leaves the defaults untouched
    DownloadConfig download = download_;
    ProviderConfig provider = provider_;
    LogConfig log = log_;

    try {
      if (root.contains("max_concurrent_downloads")) {
        auto value = root.at("max_concurrent_downloads").get<long long>();
        if (value < 1) {
          return std::unexpected("max_concurrent_downloads must be at least 1");
        }
        download.max_concurrent_downloads = static_cast<size_t>(value);
      }
      if (root.contains("rate_limit")) {
        const auto& rate = root.at("rate_limit");
        if (rate.contains("max_rate")) {
          auto value = rate.at("max_rate").get<long long>();
          if (value < 1) {
            return std::unexpected("rate_limit.max_rate must be at least 1");
          }
          download.rate_limit.max_rate = static_cast<size_t>(value);
        }
        if (rate.contains("time_period")) {
          auto seconds = rate.at("time_period").get<double>();
          if (seconds <= 0) {
            return std::unexpected("rate_limit.time_period must be positive");
          }
          // sub-millisecond periods round up to 1ms
          download.rate_limit.period = std::chrono::ceil<std::chrono::milliseconds>(
            std::chrono::duration<double>(seconds));
        }
      }
      if (root.contains("retry")) {
        const auto& retry = root.at("retry");
        if (retry.contains("max_timeout_retries")) {
          download.retry.max_timeout_retries = retry.at("max_timeout_retries").get<size_t>();
        }
        if (retry.contains("backoff_ms")) {
          download.retry.backoff = std::chrono::milliseconds(retry.at("backoff_ms").get<long long>());
        }
      }
      if (root.contains("default_download_dir")) {
        download.default_download_dir = root.at("default_download_dir").get<std::string>();
      }
      if (root.contains("history_file")) {
        download.history_file = root.at("history_file").get<std::string>();
      }

      if (root.contains("provider")) {
        const auto& p = root.at("provider");
        provider.base_url = p.value("base_url", provider.base_url);
        provider.auth_token = p.value("auth_token", provider.auth_token);
        if (p.contains("connect_timeout")) {
          provider.connect_timeout = std::chrono::seconds(p.at("connect_timeout").get<long long>());
        }
        if (p.contains("stall_timeout")) {
          provider.stall_timeout = std::chrono::seconds(p.at("stall_timeout").get<long long>());
        }
      }

      if (root.contains("log")) {
        const auto& l = root.at("log");
        log.file = l.value("file", log.file);
        log.level = l.value("level", log.level);
      }
    } catch (const nlohmann::json::exception& e) {
      return std::unexpected("Invalid config file " + path + ": " + e.what());
    }

    download_ = std::move(download);
    provider_ = std::move(provider);
    log_ = std::move(log);
    return {};
  }
}
