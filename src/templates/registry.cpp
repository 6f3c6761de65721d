#include "scb/template_registry.hpp"

#include <algorithm>
#include <cctype>

namespace scb {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::vector<Template>& builtin_templates() {
    static const std::vector<Template> templates = [] {
        std::vector<Template> t;

        Template main;
        main.id = "main";
        main.name = "Strategic Claude Basic";
        main.description = "Core framework with agents, commands, hooks and guides";
        main.repo_url = kTemplateRepoUrl;
        main.branch = "main";
        main.commit = "9080f5291629718f1aa01824750479a263bc2360";
        main.tags = {"general", "default"};
        t.push_back(main);

        Template ccr;
        ccr.id = "ccr";
        ccr.name = "CCR Template";
        ccr.description = "Framework variant with the CCR workflow commands";
        ccr.repo_url = kTemplateRepoUrl;
        ccr.branch = "ccr-template";
        ccr.commit = "2c9fa88312f7ae68747dd69bbc0075ab47b0225f";
        ccr.tags = {"ccr", "workflow", "specialized"};
        t.push_back(ccr);

        std::sort(t.begin(), t.end(),
                  [](const Template& a, const Template& b) { return a.id < b.id; });
        return t;
    }();
    return templates;
}

} // namespace

bool is_valid_commit_hash(const std::string& commit) {
    if (commit.size() != 40) return false;
    return std::all_of(commit.begin(), commit.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool Template::is_valid() const {
    return !id.empty() && !name.empty() && !repo_url.empty() && !branch.empty() &&
           is_valid_commit_hash(commit);
}

std::string Template::display_name() const {
    if (deprecated) return name + " (deprecated)";
    return name;
}

bool Template::has_tag(const std::string& tag) const {
    std::string wanted = to_lower(tag);
    for (const auto& t : tags) {
        if (to_lower(t) == wanted) return true;
    }
    return false;
}

namespace registry {

Result<Template> lookup(const std::string& id) {
    for (const auto& t : builtin_templates()) {
        if (t.id == id) return Result<Template>::ok(t);
    }

    std::string available;
    for (const auto& known : template_ids()) {
        if (!available.empty()) available += ", ";
        available += known;
    }
    return Result<Template>::err(Error(ErrorCode::VALIDATION_FAILED,
        "unknown template '" + id + "' (available: " + available + ")"));
}

bool exists(const std::string& id) {
    return lookup(id).isOk();
}

std::vector<Template> list_all() {
    return builtin_templates();
}

std::vector<Template> list_active() {
    std::vector<Template> active;
    for (const auto& t : builtin_templates()) {
        if (!t.deprecated) active.push_back(t);
    }
    return active;
}

std::vector<Template> filter_by_language(const std::string& language) {
    std::vector<Template> out;
    std::string wanted = to_lower(language);
    for (const auto& t : builtin_templates()) {
        if (to_lower(t.language) == wanted) out.push_back(t);
    }
    return out;
}

std::vector<Template> filter_by_tag(const std::string& tag) {
    std::vector<Template> out;
    for (const auto& t : builtin_templates()) {
        if (t.has_tag(tag)) out.push_back(t);
    }
    return out;
}

std::vector<std::string> template_ids() {
    std::vector<std::string> ids;
    for (const auto& t : builtin_templates()) ids.push_back(t.id);
    return ids;
}

} // namespace registry

} // namespace scb
