#pragma once

#include "scb/error.hpp"
#include "scb/symlink_manager.hpp"
#include "scb/template_info.hpp"

#include <optional>
#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Installation State
// ============================================================================

/**
 * @brief Snapshot of a target directory, rebuilt on every query
 *
 * Symlink statuses are listed only for integration directories that exist.
 * "Not installed" with no issues is the normal state of an untouched
 * directory and is not an error.
 */
struct InstallationState {
    std::string target_dir;
    bool framework_dir = false;
    bool claude_dir = false;
    bool codex_dir = false;
    std::vector<SymlinkStatus> symlinks;
    std::vector<std::string> issues;
    std::optional<TemplateInfo> template_info;

    bool has_integration_dir() const { return claude_dir || codex_dir; }
    size_t valid_symlinks() const;
    size_t existing_symlinks() const;

    // framework dir && an integration dir && at least one valid symlink
    bool is_installed() const;

    std::string summary() const;
};

// ============================================================================
// Status Detector
// ============================================================================

class StatusDetector {
public:
    // Fails only when target_dir is missing, not a directory, or unreadable.
    Result<InstallationState> check_installation(const std::string& target_dir) const;
};

} // namespace scb
