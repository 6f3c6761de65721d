#include "scb/settings.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <utility>

namespace scb {

namespace {

bool has_identity(const HookMatcher& matcher, const std::string& identity, const HookPolicy& policy) {
    for (const auto& h : matcher.hooks) {
        if (policy.normalize(h.command) == identity) return true;
    }
    return false;
}

size_t matcher_slot(std::vector<HookMatcher>& matchers, const HookMatcher& like) {
    for (size_t i = 0; i < matchers.size(); ++i) {
        if (matchers[i].matcher == like.matcher) return i;
    }
    HookMatcher empty = like;
    empty.hooks.clear();
    matchers.push_back(std::move(empty));
    return matchers.size() - 1;
}

// User entries are kept as written, duplicates included. Matchers with the
// same name are joined in order of appearance.
void add_existing(std::vector<HookMatcher>& out, const std::vector<HookMatcher>& existing) {
    for (const auto& m : existing) {
        size_t slot = matcher_slot(out, m);
        out[slot].hooks.insert(out[slot].hooks.end(), m.hooks.begin(), m.hooks.end());
    }
}

// Template entries are added only when no entry with their identity is
// already under the matcher.
void add_template(std::vector<HookMatcher>& out, const std::vector<HookMatcher>& tmpl,
                  const HookPolicy& policy) {
    for (const auto& m : tmpl) {
        size_t slot = matcher_slot(out, m);
        for (const auto& h : m.hooks) {
            if (!has_identity(out[slot], policy.normalize(h.command), policy)) {
                out[slot].hooks.push_back(h);
            }
        }
    }
}

std::vector<HookMatcher> merge_hook_type(const std::vector<HookMatcher>& tmpl,
                                         const std::vector<HookMatcher>& existing,
                                         const HookPolicy& policy) {
    std::vector<HookMatcher> out;
    add_existing(out, existing);
    add_template(out, tmpl, policy);

    out.erase(std::remove_if(out.begin(), out.end(),
                             [](const HookMatcher& m) { return m.hooks.empty(); }),
              out.end());
    return out;
}

// Backup name beside the live file: <prefix><timestamp>.json
std::string settings_backup_path(const std::string& live_path) {
    std::string stem = join_path(get_parent_directory(live_path),
                                 std::string(kSettingsBackupPrefix) + get_backup_timestamp());
    return unique_path(stem, ".json");
}

Result<std::string> backup_settings(const std::string& live_path, const std::string& raw) {
    std::string backup = settings_backup_path(live_path);
    auto written = atomic_write_file(backup, raw);
    if (!written.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::BACKUP_FAILED, backup + ": " + written.error));
    }
    spdlog::info("backed up {} to {}", live_path, backup);
    return Result<std::string>::ok(backup);
}

Result<SettingsDocument> load_document(const std::string& path, std::string& raw) {
    auto content = read_file(path);
    if (!content) {
        return Result<SettingsDocument>::err(Error(ErrorCode::IO_ERROR, path + ": cannot read file"));
    }
    raw = *content;
    auto doc = parse_settings(raw);
    if (doc.isErr()) doc.error().withContext(path);
    return doc;
}

} // namespace

// ============================================================================
// Pure Merge / Clean
// ============================================================================

SettingsDocument merge_settings(const SettingsDocument& tmpl,
                                const std::optional<SettingsDocument>& existing,
                                const HookPolicy& policy) {
    SettingsDocument result;

    // Template permissions and other template keys are never applied.
    if (existing) {
        result.permissions = existing->permissions;
        result.extra = existing->extra;
        result.key_order = existing->key_order;
    }

    const bool existing_has_hooks = existing && existing->hooks;
    if (!tmpl.hooks && !existing_has_hooks) return result;

    static const HooksSection kEmpty;
    const HooksSection& t = tmpl.hooks ? *tmpl.hooks : kEmpty;
    const HooksSection& e = existing_has_hooks ? *existing->hooks : kEmpty;

    HooksSection merged;
    for (HookType type : kHookTypes) {
        auto& list = merged.list(type);
        list = merge_hook_type(t.list(type), e.list(type), policy);
        for (auto& m : list) {
            for (auto& h : m.hooks) h.command = policy.canonical_command(h.command);
        }
    }
    merged.extra = e.extra;
    merged.key_order = e.key_order;
    result.hooks = std::move(merged);
    return result;
}

SettingsDocument strip_framework_hooks(const SettingsDocument& doc, const HookPolicy& policy) {
    SettingsDocument result = doc;
    if (!result.hooks) return result;

    for (HookType type : kHookTypes) {
        auto& list = result.hooks->list(type);
        for (auto& m : list) {
            m.hooks.erase(std::remove_if(m.hooks.begin(), m.hooks.end(),
                                         [&](const HookEntry& h) {
                                             return policy.is_framework_hook(h.command);
                                         }),
                          m.hooks.end());
        }
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [](const HookMatcher& m) { return m.hooks.empty(); }),
                   list.end());
    }
    return result;
}

// ============================================================================
// Settings Engine
// ============================================================================

std::string settings_path(const std::string& target_dir) {
    return join_path(join_path(target_dir, kClaudeDir), kSettingsFile);
}

std::string settings_template_path(const std::string& target_dir) {
    return join_path(join_path(target_dir, kFrameworkDir), kSettingsTemplateFile);
}

SettingsEngine::SettingsEngine(HookPolicy policy)
    : policy_(std::move(policy)) {}

Result<SettingsOutcome> SettingsEngine::process_settings(const std::string& target_dir) const {
    using R = Result<SettingsOutcome>;
    SettingsOutcome outcome;

    std::string tmpl_path = settings_template_path(target_dir);
    if (!is_regular_file(tmpl_path)) {
        spdlog::debug("no settings template at {}", tmpl_path);
        return R::ok(outcome);
    }

    std::string tmpl_raw;
    auto tmpl = load_document(tmpl_path, tmpl_raw);
    if (tmpl.isErr()) return R::err(tmpl.error().withContext("load settings template"));

    std::string live = settings_path(target_dir);
    std::optional<SettingsDocument> existing;
    std::optional<std::string> existing_raw;
    if (path_exists(live)) {
        std::string raw;
        auto doc = load_document(live, raw);
        if (doc.isErr()) return R::err(doc.error().withContext("load existing settings"));
        existing = std::move(doc.value());
        existing_raw = std::move(raw);
    }

    SettingsDocument merged = merge_settings(tmpl.value(), existing, policy_);
    std::string out = serialize_settings(merged);

    if (existing_raw && *existing_raw == out) {
        outcome.action = SettingsAction::Unchanged;
        spdlog::debug("{} already up to date", live);
        return R::ok(outcome);
    }

    auto dir = ensure_directory(get_parent_directory(live));
    if (dir.isErr()) return R::err(dir.error().withContext("write settings"));

    if (existing_raw) {
        auto backup = backup_settings(live, *existing_raw);
        if (backup.isErr()) return R::err(backup.error());
        outcome.backup_path = backup.value();
    }

    auto written = atomic_write_file(live, out);
    if (!written.ok) {
        return R::err(Error(ErrorCode::IO_ERROR, live + ": " + written.error).withContext("write settings"));
    }

    outcome.action = existing_raw ? SettingsAction::Updated : SettingsAction::Created;
    spdlog::info("{} {}", existing_raw ? "updated" : "created", live);
    return R::ok(outcome);
}

Result<SettingsOutcome> SettingsEngine::clean_settings(const std::string& target_dir) const {
    using R = Result<SettingsOutcome>;
    SettingsOutcome outcome;

    std::string live = settings_path(target_dir);
    if (!path_exists(live)) return R::ok(outcome);

    std::string raw;
    auto doc = load_document(live, raw);
    if (doc.isErr()) return R::err(doc.error().withContext("clean settings"));

    SettingsDocument cleaned = strip_framework_hooks(doc.value(), policy_);

    if (cleaned.is_empty()) {
        auto backup = backup_settings(live, raw);
        if (backup.isErr()) return R::err(backup.error());
        outcome.backup_path = backup.value();

        std::error_code ec;
        std::filesystem::remove(live, ec);
        if (ec) return R::err(error_from_errc(ec, live).withContext("clean settings"));
        outcome.action = SettingsAction::Removed;
        spdlog::info("removed {} (no user content left)", live);
        return R::ok(outcome);
    }

    std::string out = serialize_settings(cleaned);
    if (out == raw) {
        outcome.action = SettingsAction::Unchanged;
        return R::ok(outcome);
    }

    auto backup = backup_settings(live, raw);
    if (backup.isErr()) return R::err(backup.error());
    outcome.backup_path = backup.value();

    auto written = atomic_write_file(live, out);
    if (!written.ok) {
        return R::err(Error(ErrorCode::IO_ERROR, live + ": " + written.error).withContext("clean settings"));
    }
    outcome.action = SettingsAction::Updated;
    spdlog::info("removed framework hooks from {}", live);
    return R::ok(outcome);
}

} // namespace scb
