/**
 * scb CLI - Common utilities and types
 */

#pragma once

#include <scb/error.hpp>
#include <scb/installer.hpp>
#include <scb/log.hpp>
#include <scb/platform.hpp>
#include <scb/status.hpp>
#include <scb/template_registry.hpp>

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace scb::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string target;            // -t, --target
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
};

/**
 * Resolve the target directory.
 * Priority: positional argument > --target > SCB_TARGET env > "."
 */
inline std::string resolve_target(const std::string& positional, const GlobalOptions& opts) {
    if (!positional.empty()) return absolute_path(positional);
    if (!opts.target.empty()) return absolute_path(opts.target);
    if (auto env = get_env("SCB_TARGET"); env && !env->empty()) return absolute_path(*env);
    return absolute_path(".");
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const { return nlohmann::json(warnings); }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
}

// Called first by every command, once the global flags are parsed.
inline void begin_command(const GlobalOptions& opts) {
    init_logging(opts.verbose);
    init_warning_collector(opts.json);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode, const std::string& code = "") {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!code.empty()) j["code"] = code;
        auto& collector = get_warning_collector();
        if (!collector.empty()) j["warnings"] = collector.to_json();
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

// Prints an Error with its operator guidance and returns its exit code.
inline int report_error(const Error& error, bool json_mode) {
    print_error(json_mode ? error.message() : user_message(error), json_mode, error_code_name(error.code()));
    return exit_code_for(error);
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Ask a yes/no question on stdin.
 * Returns nullopt when stdin is not a terminal.
 */
inline std::optional<bool> confirm(const std::string& question) {
    if (!isatty(STDIN_FILENO)) return std::nullopt;

    std::cout << question << " [y/N]: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "Yes";
}

// ============================================================================
// JSON views
// ============================================================================

inline nlohmann::json template_to_json(const Template& t) {
    nlohmann::json j;
    j["id"] = t.id;
    j["name"] = t.name;
    j["description"] = t.description;
    j["repo_url"] = t.repo_url;
    j["branch"] = t.branch;
    j["commit"] = t.commit;
    if (!t.language.empty()) j["language"] = t.language;
    if (!t.tags.empty()) j["tags"] = t.tags;
    j["deprecated"] = t.deprecated;
    return j;
}

inline nlohmann::json plan_to_json(const InstallationPlan& plan) {
    nlohmann::json j;
    j["target_dir"] = plan.target_dir;
    j["installation_type"] = installation_type_name(plan.type);
    j["template"] = template_to_json(plan.tmpl);
    j["will_create"] = plan.will_create;
    j["will_replace"] = plan.will_replace;
    j["will_preserve"] = plan.will_preserve;
    j["symlinks_to_create"] = plan.symlinks_to_create;
    j["symlinks_to_update"] = plan.symlinks_to_update;
    j["directories_to_create"] = plan.directories_to_create;
    j["backup_required"] = plan.backup_required;
    if (plan.backup_required) j["backup_path"] = plan.backup_path;
    j["already_installed"] = plan.already_installed;
    j["warnings"] = plan.warnings;
    j["errors"] = plan.errors;
    return j;
}

inline nlohmann::json state_to_json(const InstallationState& state) {
    nlohmann::json j;
    j["target_dir"] = state.target_dir;
    j["installed"] = state.is_installed();
    j["summary"] = state.summary();
    j["framework_dir"] = state.framework_dir;
    j["claude_dir"] = state.claude_dir;
    j["codex_dir"] = state.codex_dir;

    j["symlinks"] = nlohmann::json::array();
    for (const auto& s : state.symlinks) {
        nlohmann::json link;
        link["name"] = s.integration + "/" + s.name;
        link["path"] = s.path;
        link["exists"] = s.exists;
        link["valid"] = s.valid;
        if (!s.target.empty()) link["target"] = s.target;
        if (s.error) link["error"] = *s.error;
        j["symlinks"].push_back(link);
    }

    if (state.template_info) {
        nlohmann::json t = template_to_json(state.template_info->source);
        t["installed_at"] = state.template_info->installed_at;
        t["installed_commit"] = state.template_info->installed_commit;
        j["template"] = t;
    }
    j["issues"] = state.issues;
    return j;
}

inline void print_list(const std::string& title, const std::vector<std::string>& items,
                       const std::string& marker) {
    if (items.empty()) return;
    std::cout << title << std::endl;
    for (const auto& item : items) {
        std::cout << "  " << marker << " " << item << std::endl;
    }
    std::cout << std::endl;
}

} // namespace scb::cli
