#pragma once

/**
 * @file settings.hpp
 * @brief Typed model and merge engine for .claude/settings.json
 *
 * The document has a fixed schema: five hook-type lists and a permissions
 * section. Keys outside that schema (top-level settings such as "model",
 * unknown hook types, extra fields on a hook entry, extra permission
 * lists) are carried through verbatim so that merging and cleaning never
 * drop user configuration.
 *
 * Which hook entries belong to the framework is decided by a HookPolicy
 * that is passed in, not hardcoded in the merge logic.
 */

#include "scb/error.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace scb {

using ordered_json = nlohmann::ordered_json;

// ============================================================================
// Document Model
// ============================================================================

enum class HookType {
    PreToolUse,
    PostToolUse,
    Stop,
    PreCompact,
    Notification,
};

inline constexpr std::array<HookType, 5> kHookTypes = {
    HookType::PreToolUse,
    HookType::PostToolUse,
    HookType::Stop,
    HookType::PreCompact,
    HookType::Notification,
};

const char* hook_type_name(HookType type);

struct HookEntry {
    std::string type;
    std::string command;
    ordered_json extra = ordered_json::object();  // e.g. "timeout"
    bool has_type = true;                         // false when "type" was absent
};

struct HookMatcher {
    std::string matcher;
    std::vector<HookEntry> hooks;
    bool has_matcher = true;  // false when "matcher" was absent
};

struct HooksSection {
    std::vector<HookMatcher> pre_tool_use;
    std::vector<HookMatcher> post_tool_use;
    std::vector<HookMatcher> stop;
    std::vector<HookMatcher> pre_compact;
    std::vector<HookMatcher> notification;
    ordered_json extra = ordered_json::object();  // hook types outside the five
    std::vector<std::string> key_order;            // hook type names as read

    std::vector<HookMatcher>& list(HookType type);
    const std::vector<HookMatcher>& list(HookType type) const;

    size_t entry_count() const;
};

struct Permissions {
    std::vector<std::string> allow;
    std::vector<std::string> additional_directories;
    ordered_json extra = ordered_json::object();  // e.g. "deny", "defaultMode"

    bool has_content() const;
};

struct SettingsDocument {
    std::optional<HooksSection> hooks;
    std::optional<Permissions> permissions;
    ordered_json extra = ordered_json::object();

    // Top-level keys in file order. Serialization writes known keys in this
    // order and appends keys that were not read from a file.
    std::vector<std::string> key_order;

    // No hook entries, no permission content and no other keys.
    bool is_empty() const;
};

Result<SettingsDocument> parse_settings(const std::string& json_str);

// Pretty-printed, 2-space indent, trailing newline
std::string serialize_settings(const SettingsDocument& doc);

// ============================================================================
// Hook Identity Policy
// ============================================================================

/**
 * @brief Classifies hook commands as framework-owned or user-owned
 *
 * A command is a framework hook when the basename of its last
 * whitespace-separated token is one of the policy's script names. Framework
 * hooks are identified by that basename alone, so the same script installed
 * under different paths is one hook. Any other command is identified by its
 * trimmed text.
 */
class HookPolicy {
public:
    HookPolicy(std::vector<std::string> script_names, std::string canonical_prefix);

    // The framework's own hook scripts, invoked through .claude/hooks/strategic.
    static HookPolicy framework_default();

    std::optional<std::string> framework_script(const std::string& command) const;
    bool is_framework_hook(const std::string& command) const;

    // Identity key used to detect duplicates during merge
    std::string normalize(const std::string& command) const;

    // Canonical invocation for a framework hook; other commands unchanged
    std::string canonical_command(const std::string& command) const;

    const std::vector<std::string>& script_names() const { return script_names_; }

private:
    std::vector<std::string> script_names_;
    std::string canonical_prefix_;
};

// ============================================================================
// Pure Merge / Clean
// ============================================================================

/**
 * Merge a template document into an optional existing one.
 *
 * Permissions and unknown keys come from the existing document only. For
 * each hook type, existing matchers keep their order and entries; template
 * entries are appended under their matcher unless an entry with the same
 * identity is already there. Framework hooks are then rewritten to their
 * canonical command.
 */
SettingsDocument merge_settings(const SettingsDocument& tmpl,
                                const std::optional<SettingsDocument>& existing,
                                const HookPolicy& policy);

// Drop every framework hook and every matcher left without hooks.
SettingsDocument strip_framework_hooks(const SettingsDocument& doc, const HookPolicy& policy);

// ============================================================================
// Settings Engine
// ============================================================================

enum class SettingsAction {
    Skipped,     // nothing to do (no template, or no settings file)
    Unchanged,   // result identical to the file on disk
    Created,
    Updated,
    Removed,
};

struct SettingsOutcome {
    SettingsAction action = SettingsAction::Skipped;
    std::optional<std::string> backup_path;
};

class SettingsEngine {
public:
    explicit SettingsEngine(HookPolicy policy = HookPolicy::framework_default());

    /**
     * Merge the installed framework's settings template into
     * <target>/.claude/settings.json. The existing file is backed up as
     * settings-backup-<timestamp>.json before it is rewritten.
     */
    Result<SettingsOutcome> process_settings(const std::string& target_dir) const;

    /**
     * Remove framework hooks from <target>/.claude/settings.json. The file
     * is deleted when nothing else is left in it.
     */
    Result<SettingsOutcome> clean_settings(const std::string& target_dir) const;

    const HookPolicy& policy() const { return policy_; }

private:
    HookPolicy policy_;
};

std::string settings_path(const std::string& target_dir);
std::string settings_template_path(const std::string& target_dir);

} // namespace scb
