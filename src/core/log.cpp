#include "scb/log.hpp"
#include "scb/platform.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <memory>

namespace scb {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string v;
    for (char c : name) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (v == "trace") return spdlog::level::trace;
    if (v == "debug") return spdlog::level::debug;
    if (v == "info") return spdlog::level::info;
    if (v == "warn" || v == "warning") return spdlog::level::warn;
    if (v == "error" || v == "err") return spdlog::level::err;
    if (v == "critical" || v == "crit") return spdlog::level::critical;
    if (v == "off" || v == "none") return spdlog::level::off;
    return std::nullopt;
}

void init_logging(bool verbose) {
    // stdout carries command output and --json documents
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("scb", sink);
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);

    auto level = verbose ? spdlog::level::debug : spdlog::level::warn;
    if (auto env = get_env("SCB_LOG_LEVEL"); env && !env->empty()) {
        if (auto parsed = parse_log_level(*env)) {
            level = *parsed;
        }
    }
    spdlog::set_level(level);
}

} // namespace scb
