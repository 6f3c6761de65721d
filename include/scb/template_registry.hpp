#pragma once

#include "scb/error.hpp"

#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Template
// ============================================================================

/**
 * @brief A named, pinned-revision source of framework content
 */
struct Template {
    std::string id;
    std::string name;
    std::string description;
    std::string repo_url;
    std::string branch;
    std::string commit;          // 40-char hex SHA-1
    std::string language;        // optional
    std::vector<std::string> tags;
    bool deprecated = false;

    // id, name, url, branch non-empty and commit is 40 hex chars
    bool is_valid() const;

    // name, with " (deprecated)" appended for deprecated entries
    std::string display_name() const;

    // Case-insensitive tag match
    bool has_tag(const std::string& tag) const;
};

bool is_valid_commit_hash(const std::string& commit);

// ============================================================================
// Registry
// ============================================================================

inline constexpr const char* kDefaultTemplateId = "main";
inline constexpr const char* kTemplateRepoUrl =
    "https://github.com/Fomo-Driven-Development/strategic-claude-base.git";

namespace registry {

Result<Template> lookup(const std::string& id);

bool exists(const std::string& id);

// All templates sorted by id
std::vector<Template> list_all();

// Non-deprecated templates sorted by id
std::vector<Template> list_active();

std::vector<Template> filter_by_language(const std::string& language);
std::vector<Template> filter_by_tag(const std::string& tag);

std::vector<std::string> template_ids();

} // namespace registry

} // namespace scb
