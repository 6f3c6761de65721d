#include "scb/template_info.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"
#include "scb/version.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scb {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

nlohmann::json template_to_json(const Template& t) {
    nlohmann::json j;
    j["id"] = t.id;
    j["name"] = t.name;
    j["description"] = t.description;
    j["repo_url"] = t.repo_url;
    j["branch"] = t.branch;
    j["commit"] = t.commit;
    if (!t.language.empty()) j["language"] = t.language;
    if (!t.tags.empty()) j["tags"] = t.tags;
    if (t.deprecated) j["deprecated"] = true;
    return j;
}

} // namespace

TemplateInfoParseResult parse_template_info(const std::string& json_str) {
    TemplateInfoParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (!j.contains("template") || !j["template"].is_object()) {
            result.error = "template section missing";
            return result;
        }

        const auto& t = j["template"];
        auto& src = result.record.source;
        if (auto id = get_string(t, "id"); id && !id->empty()) {
            src.id = *id;
        } else {
            result.error = "template.id missing";
            return result;
        }
        src.name = get_string(t, "name").value_or("");
        src.description = get_string(t, "description").value_or("");
        src.repo_url = get_string(t, "repo_url").value_or("");
        src.branch = get_string(t, "branch").value_or("");
        src.commit = get_string(t, "commit").value_or("");
        src.language = get_string(t, "language").value_or("");
        src.tags = get_string_array(t, "tags");
        if (t.contains("deprecated") && t["deprecated"].is_boolean()) {
            src.deprecated = t["deprecated"].get<bool>();
        }

        if (auto commit = get_string(j, "installed_commit"); commit && !commit->empty()) {
            result.record.installed_commit = *commit;
        } else {
            result.error = "installed_commit missing";
            return result;
        }
        if (!is_valid_commit_hash(result.record.installed_commit)) {
            result.warnings.push_back("installed_commit is not a 40-character hash");
        }

        if (auto at = get_string(j, "installed_at")) {
            result.record.installed_at = *at;
        } else {
            result.warnings.push_back("installed_at missing");
        }

        if (j.contains("metadata") && j["metadata"].is_object()) {
            for (auto it = j["metadata"].begin(); it != j["metadata"].end(); ++it) {
                if (it.value().is_string()) {
                    result.record.metadata[it.key()] = it.value().get<std::string>();
                }
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
    }

    return result;
}

std::string serialize_template_info(const TemplateInfo& info) {
    nlohmann::json j;
    j["template"] = template_to_json(info.source);
    j["installed_at"] = info.installed_at;
    j["installed_commit"] = info.installed_commit;
    j["metadata"] = nlohmann::json::object();
    for (const auto& [key, value] : info.metadata) {
        j["metadata"][key] = value;
    }
    return j.dump(2) + "\n";
}

TemplateInfo make_template_info(const Template& tmpl, const std::string& install_mode) {
    TemplateInfo info;
    info.source = tmpl;
    info.installed_at = get_current_timestamp();
    info.installed_commit = tmpl.commit;
    info.metadata["cli_version"] = SCB_VERSION;
    info.metadata["installation_type"] = "cli";
    info.metadata["install_mode"] = install_mode;
    return info;
}

std::string template_info_path(const std::string& target_dir) {
    return join_path(join_path(target_dir, kFrameworkDir), kTemplateInfoFile);
}

Result<std::optional<TemplateInfo>> read_template_info(const std::string& target_dir) {
    using R = Result<std::optional<TemplateInfo>>;
    std::string path = template_info_path(target_dir);

    if (!path_exists(path)) return R::ok(std::nullopt);

    auto content = read_file(path);
    if (!content) {
        return R::err(Error(ErrorCode::IO_ERROR, path + ": cannot read file"));
    }

    auto parsed = parse_template_info(*content);
    if (!parsed.ok) {
        return R::err(Error(ErrorCode::PARSE_ERROR, path + ": " + parsed.error));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}: {}", path, w);
    }
    return R::ok(parsed.record);
}

VoidResult write_template_info(const std::string& target_dir, const TemplateInfo& info) {
    std::string path = template_info_path(target_dir);
    auto dir = ensure_directory(get_parent_directory(path));
    if (dir.isErr()) return dir;

    auto written = atomic_write_file(path, serialize_template_info(info));
    if (!written.ok) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR, path + ": " + written.error));
    }
    spdlog::debug("wrote provenance record {}", path);
    return VoidResult::ok();
}

} // namespace scb
