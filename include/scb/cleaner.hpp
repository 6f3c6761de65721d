#pragma once

#include "scb/error.hpp"
#include "scb/settings.hpp"

#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Cleanup Result
// ============================================================================

struct CleanupResult {
    bool removed_directory = false;
    std::vector<std::string> removed_symlinks;    // "<integration>/<name>"
    bool cleaned_settings = false;

    std::vector<std::string> preserved_files;
    std::vector<std::string> cleaned_directories;

    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    bool success = false;
};

// ============================================================================
// Cleaner
// ============================================================================

/**
 * @brief Removes an installation while keeping everything the user owns
 *
 * Only symlinks whose literal target is a known framework target are
 * removed. Integration directories are pruned only when empty. Failures on
 * individual entries are collected in the result; failing to remove the
 * framework directory aborts with an error.
 */
class Cleaner {
public:
    explicit Cleaner(SettingsEngine settings = SettingsEngine());

    Result<CleanupResult> remove_installation(const std::string& target_dir) const;

    // Removes broken or foreign symlinks at the managed names and the
    // framework directory, then prunes empty integration directories.
    Result<CleanupResult> handle_partial_installation(const std::string& target_dir) const;

    // Re-check the target and add a warning for every framework link or
    // directory still present. Never adds errors.
    void validate_cleanup(const std::string& target_dir, CleanupResult& result) const;

private:
    void remove_symlinks(const std::string& target_dir, CleanupResult& result) const;
    VoidResult remove_framework(const std::string& target_dir, CleanupResult& result) const;
    void clean_settings(const std::string& target_dir, CleanupResult& result) const;
    void prune_empty_directories(const std::string& target_dir, CleanupResult& result) const;

    SettingsEngine settings_;
};

} // namespace scb
