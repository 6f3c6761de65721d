#pragma once

/**
 * @file layout.hpp
 * @brief Fixed on-disk layout of a framework installation
 *
 * A target directory holds one framework directory and up to two
 * integration directories. Each integration directory has its own set of
 * relative symlinks pointing back into the framework's core.
 */

#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Directory and File Names
// ============================================================================

inline constexpr const char* kFrameworkDir = ".strategic-claude-basic";
inline constexpr const char* kClaudeDir = ".claude";
inline constexpr const char* kCodexDir = ".codex";

inline constexpr const char* kTemplateInfoFile = ".template-info";
inline constexpr const char* kSettingsFile = "settings.json";
inline constexpr const char* kSettingsTemplateFile = "templates/hooks/dot_claude.settings.template.json";
inline constexpr const char* kSettingsBackupPrefix = "settings-backup-";
inline constexpr const char* kCodexConfigFile = "config.toml";
inline constexpr const char* kCodexConfigTemplateFile = "templates/hooks/dot_codex.config.template.toml";
inline constexpr const char* kCodexConfigBackupPrefix = "config-backup-";
inline constexpr const char* kIgnoreTemplateDir = "templates/ignore";

inline constexpr const char* kBackupDirPrefix = "strategic-claude-basic-backup-";
inline constexpr const char* kScratchDirPrefix = "strategic-claude-base-";

inline constexpr const char* kPreInstallScript = "pre-install.sh";
inline constexpr const char* kPostInstallScript = "post-install.sh";

// Top-level framework children replaced by a core update.
const std::vector<std::string>& framework_directories();

// Top-level framework children that belong to the user.
const std::vector<std::string>& user_preserved_directories();

// Subdirectories that must exist under core/.
const std::vector<std::string>& required_core_subdirectories();

// ============================================================================
// Integration Directories and Symlink Specs
// ============================================================================

struct SymlinkSpec {
    std::string name;    // "agents/strategic", relative to the integration dir
    std::string target;  // literal relative target string
};

struct IntegrationLayout {
    std::string dir;                          // ".claude"
    std::vector<std::string> required_subdirs;
    std::vector<SymlinkSpec> symlinks;
};

const IntegrationLayout& claude_layout();
const IntegrationLayout& codex_layout();

// Both integration layouts, .claude first.
const std::vector<IntegrationLayout>& integration_layouts();

// Union of every symlink target across all integration layouts.
std::vector<std::string> known_symlink_targets();

} // namespace scb
