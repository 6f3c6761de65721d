#pragma once

#include "scb/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Directory Primitives
// ============================================================================

// mkdir -p. Fails with ALREADY_EXISTS if a non-directory occupies the path
// and PERMISSION_DENIED when the parent is not writable.
VoidResult ensure_directory(const std::string& path);

// Recursive copy. Symlinks are recreated with their literal target, regular
// files and directories keep their permission bits.
VoidResult copy_tree(const std::string& src, const std::string& dst);

// Copy a single file, keeping its permission bits.
VoidResult copy_file_preserving(const std::string& src, const std::string& dst);

// Remove a directory tree, refusing any path whose final component is not
// exactly expected_name.
VoidResult remove_directory_named(const std::string& path, const std::string& expected_name);

// Remove <target_dir>/.strategic-claude-basic through remove_directory_named.
VoidResult remove_framework_directory(const std::string& target_dir);

// stem + ext when free, otherwise stem + "-N" + ext for the first free N.
// Keeps second-resolution backup names from overwriting each other.
std::string unique_path(const std::string& stem, const std::string& ext);

// Path of `to` relative to directory `from_dir` (lexical, no symlink resolution).
std::string relative_path(const std::string& from_dir, const std::string& to);

// ============================================================================
// Queries
// ============================================================================

std::string join_path(const std::string& base, const std::string& rel);
std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);

// Absolute, lexically normalized form of path.
std::string absolute_path(const std::string& path);

// lstat-based existence: true for dangling symlinks.
bool path_exists_no_follow(const std::string& path);
bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);
bool is_symlink(const std::string& path);
bool is_writable(const std::string& path);

std::optional<std::string> read_symlink(const std::string& path);
std::optional<std::string> read_file(const std::string& path);

// Sorted entry names; empty when the path is not a readable directory.
std::vector<std::string> list_directory(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Current time as RFC3339 UTC string
std::string get_current_timestamp();

// Local time as YYYYMMDD-HHMMSS, used in backup names
std::string get_backup_timestamp();

// Generate a UUID string
std::string generate_uuid();

// Create a fresh directory under the system temp directory whose name
// starts with prefix.
Result<std::string> make_scratch_directory(const std::string& prefix);

} // namespace scb
