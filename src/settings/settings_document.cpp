#include "scb/settings.hpp"

#include <cctype>

namespace scb {

namespace {

bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

// Reads an optional string member. Absent or null yields "".
bool read_string(const ordered_json& j, const char* key, std::string& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_string_list(const ordered_json& j, const char* key, std::vector<std::string>& out,
                      std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_array()) {
        error = std::string("'") + key + "' must be an array";
        return false;
    }
    for (const auto& elem : *it) {
        if (!elem.is_string()) {
            error = std::string("'") + key + "' must contain only strings";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

bool parse_matchers(const ordered_json& j, const std::string& type_name,
                    std::vector<HookMatcher>& out, std::string& error) {
    if (j.is_null()) return true;
    if (!j.is_array()) {
        error = "hooks." + type_name + " must be an array";
        return false;
    }

    for (const auto& m : j) {
        if (!m.is_object()) {
            error = "hooks." + type_name + " entries must be objects";
            return false;
        }
        HookMatcher matcher;
        matcher.has_matcher = m.contains("matcher");
        if (!read_string(m, "matcher", matcher.matcher, error)) return false;

        auto hooks = m.find("hooks");
        if (hooks != m.end() && !hooks->is_null()) {
            if (!hooks->is_array()) {
                error = "hooks." + type_name + "[].hooks must be an array";
                return false;
            }
            for (const auto& h : *hooks) {
                if (!h.is_object()) {
                    error = "hooks." + type_name + "[].hooks entries must be objects";
                    return false;
                }
                HookEntry entry;
                entry.has_type = h.contains("type");
                if (!read_string(h, "type", entry.type, error)) return false;
                if (!read_string(h, "command", entry.command, error)) return false;
                for (auto it = h.begin(); it != h.end(); ++it) {
                    if (it.key() != "type" && it.key() != "command") {
                        entry.extra[it.key()] = it.value();
                    }
                }
                matcher.hooks.push_back(std::move(entry));
            }
        }
        out.push_back(std::move(matcher));
    }
    return true;
}

bool parse_hooks(const ordered_json& j, HooksSection& hooks, std::string& error) {
    if (!j.is_object()) {
        error = "'hooks' must be an object";
        return false;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        hooks.key_order.push_back(it.key());
        bool known = false;
        for (HookType type : kHookTypes) {
            if (it.key() == hook_type_name(type)) {
                if (!parse_matchers(it.value(), it.key(), hooks.list(type), error)) return false;
                known = true;
                break;
            }
        }
        if (!known) hooks.extra[it.key()] = it.value();
    }
    return true;
}

bool parse_permissions(const ordered_json& j, Permissions& perms, std::string& error) {
    if (!j.is_object()) {
        error = "'permissions' must be an object";
        return false;
    }
    if (!read_string_list(j, "allow", perms.allow, error)) return false;
    if (!read_string_list(j, "additionalDirectories", perms.additional_directories, error)) return false;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "allow" && it.key() != "additionalDirectories") {
            perms.extra[it.key()] = it.value();
        }
    }
    return true;
}

ordered_json matchers_to_json(const std::vector<HookMatcher>& matchers) {
    ordered_json arr = ordered_json::array();
    for (const auto& m : matchers) {
        ordered_json jm;
        if (m.has_matcher || !m.matcher.empty()) jm["matcher"] = m.matcher;
        jm["hooks"] = ordered_json::array();
        for (const auto& h : m.hooks) {
            ordered_json jh;
            if (h.has_type || !h.type.empty()) jh["type"] = h.type;
            jh["command"] = h.command;
            for (auto it = h.extra.begin(); it != h.extra.end(); ++it) {
                jh[it.key()] = it.value();
            }
            jm["hooks"].push_back(std::move(jh));
        }
        arr.push_back(std::move(jm));
    }
    return arr;
}

ordered_json hooks_to_json(const HooksSection& hooks) {
    ordered_json out = ordered_json::object();
    auto emit = [&](const std::string& key) {
        if (out.contains(key)) return;
        for (HookType type : kHookTypes) {
            if (key == hook_type_name(type)) {
                const auto& matchers = hooks.list(type);
                if (!matchers.empty()) out[key] = matchers_to_json(matchers);
                return;
            }
        }
        if (hooks.extra.contains(key)) out[key] = hooks.extra.at(key);
    };

    for (const auto& key : hooks.key_order) emit(key);
    for (HookType type : kHookTypes) emit(hook_type_name(type));
    for (auto it = hooks.extra.begin(); it != hooks.extra.end(); ++it) emit(it.key());
    return out;
}

ordered_json permissions_to_json(const Permissions& perms) {
    ordered_json out = ordered_json::object();
    if (!perms.allow.empty()) out["allow"] = perms.allow;
    if (!perms.additional_directories.empty()) {
        out["additionalDirectories"] = perms.additional_directories;
    }
    for (auto it = perms.extra.begin(); it != perms.extra.end(); ++it) {
        out[it.key()] = it.value();
    }
    return out;
}

} // namespace

const char* hook_type_name(HookType type) {
    switch (type) {
        case HookType::PreToolUse: return "PreToolUse";
        case HookType::PostToolUse: return "PostToolUse";
        case HookType::Stop: return "Stop";
        case HookType::PreCompact: return "PreCompact";
        case HookType::Notification: return "Notification";
    }
    return "";
}

std::vector<HookMatcher>& HooksSection::list(HookType type) {
    switch (type) {
        case HookType::PreToolUse: return pre_tool_use;
        case HookType::PostToolUse: return post_tool_use;
        case HookType::Stop: return stop;
        case HookType::PreCompact: return pre_compact;
        case HookType::Notification: return notification;
    }
    return pre_tool_use;
}

const std::vector<HookMatcher>& HooksSection::list(HookType type) const {
    switch (type) {
        case HookType::PreToolUse: return pre_tool_use;
        case HookType::PostToolUse: return post_tool_use;
        case HookType::Stop: return stop;
        case HookType::PreCompact: return pre_compact;
        case HookType::Notification: return notification;
    }
    return pre_tool_use;
}

size_t HooksSection::entry_count() const {
    size_t count = 0;
    for (HookType type : kHookTypes) {
        for (const auto& m : list(type)) count += m.hooks.size();
    }
    return count;
}

bool Permissions::has_content() const {
    return !allow.empty() || !additional_directories.empty() || !extra.empty();
}

bool SettingsDocument::is_empty() const {
    if (!extra.empty()) return false;
    if (hooks && (hooks->entry_count() > 0 || !hooks->extra.empty())) return false;
    if (permissions && permissions->has_content()) return false;
    return true;
}

Result<SettingsDocument> parse_settings(const std::string& json_str) {
    using R = Result<SettingsDocument>;
    SettingsDocument doc;

    if (is_blank(json_str)) return R::ok(doc);

    try {
        auto j = ordered_json::parse(json_str);
        if (!j.is_object()) {
            return R::err(Error(ErrorCode::PARSE_ERROR, "settings must be a JSON object"));
        }

        std::string error;
        for (auto it = j.begin(); it != j.end(); ++it) {
            doc.key_order.push_back(it.key());
            if (it.key() == "hooks") {
                if (it.value().is_null()) continue;
                HooksSection hooks;
                if (!parse_hooks(it.value(), hooks, error)) {
                    return R::err(Error(ErrorCode::PARSE_ERROR, error));
                }
                doc.hooks = std::move(hooks);
            } else if (it.key() == "permissions") {
                if (it.value().is_null()) continue;
                Permissions perms;
                if (!parse_permissions(it.value(), perms, error)) {
                    return R::err(Error(ErrorCode::PARSE_ERROR, error));
                }
                doc.permissions = std::move(perms);
            } else {
                doc.extra[it.key()] = it.value();
            }
        }
    } catch (const nlohmann::json::parse_error& e) {
        return R::err(Error(ErrorCode::PARSE_ERROR, std::string("JSON parse error: ") + e.what()));
    } catch (const nlohmann::json::exception& e) {
        return R::err(Error(ErrorCode::PARSE_ERROR, std::string("JSON error: ") + e.what()));
    }

    return R::ok(std::move(doc));
}

std::string serialize_settings(const SettingsDocument& doc) {
    ordered_json j = ordered_json::object();

    // Keys keep the position they had in the file; new keys go last.
    auto emit = [&](const std::string& key) {
        if (j.contains(key)) return;
        if (key == "hooks") {
            if (doc.hooks) j["hooks"] = hooks_to_json(*doc.hooks);
        } else if (key == "permissions") {
            if (doc.permissions) j["permissions"] = permissions_to_json(*doc.permissions);
        } else if (doc.extra.contains(key)) {
            j[key] = doc.extra.at(key);
        }
    };

    for (const auto& key : doc.key_order) emit(key);
    emit("hooks");
    emit("permissions");
    for (auto it = doc.extra.begin(); it != doc.extra.end(); ++it) emit(it.key());

    return j.dump(2) + "\n";
}

} // namespace scb
