#pragma once

#include "scb/config.hpp"
#include "scb/error.hpp"

#include <string>
#include <vector>

namespace scb {

inline constexpr const char* kIgnoreHeader = "# Strategic Claude Basic entries";

/**
 * Merge ignore-file lines: header first, then existing lines, then
 * template lines. Blank lines, previous headers and lines whose trimmed
 * text was already emitted are dropped.
 */
std::vector<std::string> merge_ignore_lines(const std::vector<std::string>& existing,
                                            const std::vector<std::string>& tmpl);

struct IgnorePolicyResult {
    std::vector<std::string> applied;   // relative paths written
    std::vector<std::string> warnings;
};

/**
 * Write the ignore files selected by mode, reading templates from
 * <source_root>/.strategic-claude-basic/templates/ignore. An existing
 * ignore file is saved as <file>.backup before it changes. A missing
 * template is a warning.
 */
Result<IgnorePolicyResult> apply_ignore_policy(const std::string& source_root,
                                               const std::string& target_dir, IgnoreMode mode);

} // namespace scb
