#include "scb/settings.hpp"

#include <algorithm>
#include <cctype>

namespace scb {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

HookPolicy::HookPolicy(std::vector<std::string> script_names, std::string canonical_prefix)
    : script_names_(std::move(script_names)), canonical_prefix_(std::move(canonical_prefix)) {}

HookPolicy HookPolicy::framework_default() {
    return HookPolicy(
        {
            "block-skip-hooks.py",
            "block-config-writes.py",
            "stop-session-notify.py",
            "precompact-notify.py",
            "notification-hook.py",
        },
        "/usr/bin/python3 $CLAUDE_PROJECT_DIR/.claude/hooks/strategic/");
}

std::optional<std::string> HookPolicy::framework_script(const std::string& command) const {
    std::string trimmed = trim(command);
    if (trimmed.empty()) return std::nullopt;

    // Last whitespace-separated token, then its last path segment.
    size_t ws = trimmed.find_last_of(" \t");
    std::string token = ws == std::string::npos ? trimmed : trimmed.substr(ws + 1);
    size_t slash = token.rfind('/');
    std::string base = slash == std::string::npos ? token : token.substr(slash + 1);

    if (std::find(script_names_.begin(), script_names_.end(), base) != script_names_.end()) {
        return base;
    }
    return std::nullopt;
}

bool HookPolicy::is_framework_hook(const std::string& command) const {
    return framework_script(command).has_value();
}

std::string HookPolicy::normalize(const std::string& command) const {
    if (auto script = framework_script(command)) return *script;
    return trim(command);
}

std::string HookPolicy::canonical_command(const std::string& command) const {
    if (auto script = framework_script(command)) return canonical_prefix_ + *script;
    return command;
}

} // namespace scb
