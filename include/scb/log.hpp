#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string>

namespace scb {

// trace, debug, info, warn|warning, error|err, critical|crit, off|none.
// Case-insensitive.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * Route spdlog to stderr and pick the level: SCB_LOG_LEVEL when set and
 * valid, otherwise debug with --verbose and warn without.
 */
void init_logging(bool verbose);

} // namespace scb
