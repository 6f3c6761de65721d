#pragma once

#include "scb/error.hpp"
#include "scb/layout.hpp"

#include <optional>
#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Symlink Status
// ============================================================================

struct SymlinkStatus {
    std::string integration;   // ".claude"
    std::string name;          // "agents/strategic"
    std::string path;          // absolute path of the link
    bool exists = false;
    bool valid = false;
    std::string target;        // literal readlink value
    std::optional<std::string> error;
};

// ============================================================================
// Ownership-checked removal
// ============================================================================

enum class OwnedRemovalAction {
    Absent,
    Removed,
    PreservedNotSymlink,
    PreservedForeign,
    Failed,
};

struct OwnedRemovalOutcome {
    std::string name;
    std::string path;
    OwnedRemovalAction action = OwnedRemovalAction::Absent;
    std::string detail;
};

struct RepairResult {
    std::vector<std::string> repaired;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
};

// ============================================================================
// Symlink Manager
// ============================================================================

/**
 * @brief Manages the relative symlinks of one integration directory
 *
 * Links are written with the literal target string from the layout and
 * validated against it byte for byte. remove_all() deletes by name without
 * looking at the link; remove_owned() deletes only links whose target is
 * one of the known framework targets.
 */
class SymlinkManager {
public:
    explicit SymlinkManager(IntegrationLayout layout);

    const IntegrationLayout& layout() const { return layout_; }

    std::string integration_dir(const std::string& target_dir) const;

    // mkdir -p the integration dir and its required subdirectories
    VoidResult ensure_structure(const std::string& target_dir) const;

    VoidResult create_all(const std::string& target_dir) const;
    VoidResult remove_all(const std::string& target_dir) const;
    VoidResult update_all(const std::string& target_dir) const;
    std::vector<SymlinkStatus> validate_all(const std::string& target_dir) const;
    RepairResult repair_broken(const std::string& target_dir) const;

    std::vector<OwnedRemovalOutcome> remove_owned(const std::string& target_dir,
                                                  const std::vector<std::string>& known_targets) const;

    SymlinkStatus validate(const std::string& target_dir, const SymlinkSpec& spec) const;

private:
    VoidResult create_one(const std::string& target_dir, const SymlinkSpec& spec) const;

    IntegrationLayout layout_;
};

// One manager per integration layout, .claude first.
std::vector<SymlinkManager> all_symlink_managers();

} // namespace scb
