#pragma once

#include "common/config/config.hpp"
#include <expected>
#include <string>

namespace common {

// Installs the process-wide spdlog default logger: colored console output plus
// an append-only log file.
std::expected<void, std::string> initLogging(const config::LogConfig& cfg);

} // namespace common
