#pragma once

#include "scb/error.hpp"

#include <optional>
#include <string>

namespace scb {

// ============================================================================
// Ignore-file Policy
// ============================================================================

enum class IgnoreMode {
    Track,    // leave ignore files alone
    All,      // ignore the whole framework directory
    NonUser,  // ignore framework-owned directories, keep user directories tracked
};

const char* ignore_mode_name(IgnoreMode mode);
std::optional<IgnoreMode> parse_ignore_mode(const std::string& name);

// ============================================================================
// Install Configuration
// ============================================================================

/**
 * @brief Immutable inputs of one install run
 *
 * Built once from command-line options and passed by value into the
 * installer.
 */
struct InstallConfig {
    std::string target_dir;
    std::string template_id = "main";
    bool force = false;
    bool force_core = false;
    bool skip_confirm = false;
    bool no_backup = false;
    bool dry_run = false;
    bool verbose = false;
    std::string backup_dir;            // parent of the backup; empty: target_dir
    int git_timeout_seconds = 30;
    IgnoreMode ignore_mode = IgnoreMode::Track;

    VoidResult validate() const;

    // Copy with target_dir and backup_dir made absolute.
    InstallConfig with_absolute_paths() const;
};

struct CleanConfig {
    std::string target_dir;
    bool force = false;
    bool dry_run = false;
    bool verbose = false;

    VoidResult validate() const;
};

} // namespace scb
