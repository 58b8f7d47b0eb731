#include "application/download_orchestrator.hpp"
#include "infrastructure/http_media_provider.hpp"
#include "infrastructure/media_json.hpp"
#include "infrastructure/progress_reporter.hpp"
#include "common/config/config.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <expected>
#include <pthread.h>
#include <thread>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

struct Options {
  std::string manifest;
  std::optional<std::string> download_dir;
  std::optional<std::string> config_file;
  bool list_only{false};
};

void printUsage(const char* argv0) {
  std::println(std::cerr, "usage: {} <manifest.json> [download_dir] [--config <file>] [--list]", argv0);
}

std::optional<Options> parseArgs(int argc, char** argv) {
  Options options;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        return std::nullopt;
      }
      options.config_file = argv[++i];
    } else if (arg == "--list") {
      options.list_only = true;
    } else if (arg == "-h" || arg == "--help" || arg.starts_with("--")) {
      return std::nullopt;
    } else {
      positional.push_back(std::move(arg));
    }
  }
  if (positional.empty() || positional.size() > 2) {
    return std::nullopt;
  }
  options.manifest = positional[0];
  if (positional.size() == 2) {
    options.download_dir = positional[1];
  }
  return options;
}

// Waits for SIGINT/SIGTERM on its own thread and cancels the running batch.
// The signals must already be blocked in every thread.
class SignalWatcher {
public:
  SignalWatcher(media_downloader::DownloadOrchestrator& orchestrator, sigset_t signals)
    : thread_([this, &orchestrator, signals]() {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0 && !done_.load()) {
          spdlog::warn("Received signal {}, cancelling downloads", sig);
          orchestrator.cancel();
        }
      }) {}

  ~SignalWatcher() {
    done_.store(true);
    // wakes the sigwait; the signal is blocked, so it stays pending until taken there
    pthread_kill(thread_.native_handle(), SIGTERM);
  }

private:
  std::atomic_bool done_{false};
  std::jthread thread_;
};

} // namespace

int main(int argc, char** argv) {
  auto options = parseArgs(argc, argv);
  if (!options) {
    printUsage(argv[0]);
    return 1;
  }

  // SIGINT/SIGTERM are taken by a watcher thread via sigwait; block them before
  // any worker thread exists so every thread inherits the mask
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
    std::println(std::cerr, "Error: cannot block signals: {}", std::strerror(rc));
    return 1;
  }

  try {
    auto& cfg = config::Config::getInstance();
    std::optional<std::string> config_file = options->config_file;
    if (!config_file && std::filesystem::exists("config.json")) {
      config_file = "config.json";
    }
    if (config_file) {
      if (auto loaded = cfg.load(*config_file); !loaded) {
        std::println(std::cerr, "Error: {}", loaded.error());
        return 1;
      }
    }

    if (auto logging = common::initLogging(cfg.getLog()); !logging) {
      std::println(std::cerr, "Error: {}", logging.error());
      return 1;
    }

    auto manifest = media_downloader::loadManifest(options->manifest);
    if (!manifest) {
      spdlog::error("{}", manifest.error());
      return 1;
    }
    spdlog::info("Processed channel identifier: {}", manifest->collection_id);

    auto provider = std::make_shared<media_downloader::HttpMediaProvider>(cfg.getProvider());
    auto reporter = std::make_shared<media_downloader::ProgressReporter>();
    media_downloader::DownloadOrchestrator orchestrator(
      provider, cfg.getDownload(),
      [reporter](const media_downloader::MediaDescriptor& media, std::uint64_t so_far, std::uint64_t total) {
        reporter->report(media, so_far, total);
      });

    if (options->list_only) {
      if (auto loaded = orchestrator.loadLedger(); !loaded) {
        spdlog::error("{}", loaded.error());
        return 1;
      }
      for (const auto& item : manifest->items) {
        bool downloaded = orchestrator.ledger().contains(manifest->collection_id, item.id);
        std::println("{}", media_downloader::displayName(item, downloaded));
      }
      return 0;
    }

    if (manifest->items.empty()) {
      spdlog::warn("No media selected for download.");
      return 0;
    }

    auto download_dir = options->download_dir.value_or(cfg.getDownload().default_download_dir);
    std::expected<media_downloader::BatchSummary, std::string> summary;
    {
      SignalWatcher watcher(orchestrator, signals);
      summary = orchestrator.downloadBatch(manifest->collection_id, manifest->items, download_dir);
    }

    if (!summary) {
      spdlog::error("{}", summary.error());
      return 1;
    }
    std::println("Total media downloaded: {}", summary->downloaded);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
