#pragma once

#include "scb/error.hpp"
#include "scb/template_registry.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Provenance Record (.template-info)
// ============================================================================

/**
 * @brief Which template and revision is installed in a framework directory
 *
 * Written after every successful install and read back by the status
 * detector. Stored as JSON:
 *
 * ```json
 * {
 *   "template": { "id": "main", "name": "...", "commit": "...", ... },
 *   "installed_at": "2025-01-01T00:00:00Z",
 *   "installed_commit": "9080f529...",
 *   "metadata": { "cli_version": "0.1.0", "installation_type": "cli" }
 * }
 * ```
 */
struct TemplateInfo {
    Template source;
    std::string installed_at;
    std::string installed_commit;
    std::map<std::string, std::string> metadata;
};

struct TemplateInfoParseResult {
    bool ok = false;
    std::string error;
    TemplateInfo record;
    std::vector<std::string> warnings;
};

TemplateInfoParseResult parse_template_info(const std::string& json_str);

// Pretty-printed JSON, 2-space indent
std::string serialize_template_info(const TemplateInfo& info);

// Build a record for a template installed now.
TemplateInfo make_template_info(const Template& tmpl, const std::string& install_mode);

// Path of the record inside target_dir's framework directory.
std::string template_info_path(const std::string& target_dir);

// nullopt when the record file does not exist.
Result<std::optional<TemplateInfo>> read_template_info(const std::string& target_dir);

VoidResult write_template_info(const std::string& target_dir, const TemplateInfo& info);

} // namespace scb
