#include "scb/layout.hpp"

#include <algorithm>

namespace scb {

namespace {

std::string core_target(const std::string& sub) {
    return std::string("../../") + kFrameworkDir + "/core/" + sub;
}

} // namespace

const std::vector<std::string>& framework_directories() {
    static const std::vector<std::string> dirs = {"core", "guides", "templates"};
    return dirs;
}

const std::vector<std::string>& user_preserved_directories() {
    static const std::vector<std::string> dirs = {
        "archives", "decisions", "issues", "plan", "product",
        "research", "summary", "tools", "validation",
    };
    return dirs;
}

const std::vector<std::string>& required_core_subdirectories() {
    static const std::vector<std::string> dirs = {"agents", "commands", "hooks"};
    return dirs;
}

const IntegrationLayout& claude_layout() {
    static const IntegrationLayout layout = {
        kClaudeDir,
        {"agents", "commands", "hooks"},
        {
            {"agents/strategic", core_target("agents")},
            {"commands/strategic", core_target("commands")},
            {"hooks/strategic", core_target("hooks")},
        },
    };
    return layout;
}

const IntegrationLayout& codex_layout() {
    static const IntegrationLayout layout = {
        kCodexDir,
        {"prompts", "hooks"},
        {
            {"prompts/strategic", core_target("commands")},
            {"hooks/strategic", core_target("hooks")},
        },
    };
    return layout;
}

const std::vector<IntegrationLayout>& integration_layouts() {
    static const std::vector<IntegrationLayout> layouts = {claude_layout(), codex_layout()};
    return layouts;
}

std::vector<std::string> known_symlink_targets() {
    std::vector<std::string> targets;
    for (const auto& layout : integration_layouts()) {
        for (const auto& spec : layout.symlinks) {
            if (std::find(targets.begin(), targets.end(), spec.target) == targets.end()) {
                targets.push_back(spec.target);
            }
        }
    }
    return targets;
}

} // namespace scb
