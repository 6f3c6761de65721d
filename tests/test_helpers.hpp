/**
 * Shared fixtures for scb tests
 */

#pragma once

#include <scb/layout.hpp>
#include <scb/platform.hpp>
#include <scb/symlink_manager.hpp>

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace scb_test {

// Unique directory under the system temp directory, removed on destruction.
class TempTestDir {
public:
    TempTestDir() {
        path = (std::filesystem::temp_directory_path() / ("scb_test_" + scb::generate_uuid())).string();
        std::filesystem::create_directories(path);
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            // Read-only fixtures must not make cleanup fail.
            std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, ec);
            std::filesystem::remove_all(path, ec);
        }
    }

    std::string sub(const std::string& rel) const { return path + "/" + rel; }

    std::string path;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline size_t count_prefixed(const std::string& dir, const std::string& prefix) {
    size_t n = 0;
    for (const auto& name : scb::list_directory(dir)) {
        if (name.rfind(prefix, 0) == 0) ++n;
    }
    return n;
}

inline constexpr const char* kHookPrefix = "/usr/bin/python3 $CLAUDE_PROJECT_DIR/.claude/hooks/strategic/";

inline std::string framework_settings_template() {
    return R"({
  "hooks": {
    "PreToolUse": [
      {
        "matcher": "Bash",
        "hooks": [
          {
            "type": "command",
            "command": "/usr/bin/python3 $CLAUDE_PROJECT_DIR/.claude/hooks/strategic/block-skip-hooks.py"
          }
        ]
      }
    ],
    "Notification": [
      {
        "matcher": "",
        "hooks": [
          {
            "type": "command",
            "command": "/usr/bin/python3 $CLAUDE_PROJECT_DIR/.claude/hooks/strategic/notification-hook.py"
          }
        ]
      }
    ]
  },
  "permissions": {
    "allow": ["Bash(rm -rf /)"]
  }
}
)";
}

inline constexpr const char* kCodexTemplate = "model = \"o4-mini\"\napproval_policy = \"on-request\"\n";

/**
 * Populate <root>/.strategic-claude-basic the way a template checkout
 * looks: core/{agents,commands,hooks}, guides, templates with the
 * settings, codex and ignore templates.
 */
inline void make_framework_tree(const std::string& root) {
    std::string fw = root + "/" + scb::kFrameworkDir;
    write_file(fw + "/core/agents/planner.md", "# planner\n");
    write_file(fw + "/core/commands/plan.md", "# plan\n");
    write_file(fw + "/core/hooks/block-skip-hooks.py", "print('hook')\n");
    write_file(fw + "/core/hooks/notification-hook.py", "print('notify')\n");
    write_file(fw + "/guides/getting-started.md", "# guide\n");
    write_file(fw + "/templates/hooks/dot_claude.settings.template.json", framework_settings_template());
    write_file(fw + "/templates/hooks/dot_codex.config.template.toml", kCodexTemplate);
    write_file(fw + "/templates/ignore/dot_claude-strategic-ignore.template",
               "agents/strategic\ncommands/strategic\nhooks/strategic\n");
    write_file(fw + "/templates/ignore/dot_strategic-claude-basic-ignore-all.template", "*\n");
    write_file(fw + "/templates/ignore/dot_strategic-claude-basic-ignore-non-user-dirs.template",
               "core/\nguides/\ntemplates/\n");
}

// Framework tree plus both symlink sets directly in the target, without
// going through the installer.
inline void make_linked_installation(const std::string& target) {
    make_framework_tree(target);
    for (const auto& manager : scb::all_symlink_managers()) {
        auto created = manager.create_all(target);
        REQUIRE(created.isOk());
    }
}

} // namespace scb_test
