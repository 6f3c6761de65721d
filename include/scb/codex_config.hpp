#pragma once

#include "scb/error.hpp"

#include <optional>
#include <string>

namespace scb {

struct CodexConfigOutcome {
    bool written = false;
    std::optional<std::string> backup_path;
};

/**
 * Copy the framework's Codex config template to <target>/.codex/config.toml.
 *
 * Plain overwrite: an existing config.toml is saved as
 * config-backup-<timestamp>.toml first. Nothing happens when the template is
 * absent or the live file already matches it.
 */
Result<CodexConfigOutcome> process_codex_config(const std::string& target_dir);

} // namespace scb
