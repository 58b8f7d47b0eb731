#include "logger.hpp"
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace common {

std::expected<void, std::string> initLogging(const config::LogConfig& cfg) {
  auto level = spdlog::level::from_str(cfg.level);
  // from_str falls back to "off" for unknown names
  if (level == spdlog::level::off && cfg.level != "off") {
    return std::unexpected("Unknown log level: " + cfg.level);
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!cfg.file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));
    } catch (const spdlog::spdlog_ex& e) {
      return std::unexpected("Failed to open log file " + cfg.file + ": " + e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("media_downloader", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e - %n - %^%l%$ - %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return {};
}

} // namespace common
