#include "scb/config.hpp"
#include "scb/platform.hpp"
#include "scb/template_registry.hpp"

namespace scb {

const char* ignore_mode_name(IgnoreMode mode) {
    switch (mode) {
        case IgnoreMode::Track: return "track";
        case IgnoreMode::All: return "all";
        case IgnoreMode::NonUser: return "non-user";
    }
    return "track";
}

std::optional<IgnoreMode> parse_ignore_mode(const std::string& name) {
    if (name == "track") return IgnoreMode::Track;
    if (name == "all") return IgnoreMode::All;
    if (name == "non-user") return IgnoreMode::NonUser;
    return std::nullopt;
}

VoidResult InstallConfig::validate() const {
    auto invalid = [](const std::string& msg) {
        return VoidResult::err(Error(ErrorCode::VALIDATION_FAILED, msg));
    };

    if (target_dir.empty()) return invalid("target directory cannot be empty");
    if (force && force_core) return invalid("cannot specify both --force and --force-core");
    if (no_backup && !backup_dir.empty()) {
        return invalid("cannot specify both --no-backup and --backup-dir");
    }
    if (git_timeout_seconds <= 0) return invalid("git timeout must be positive");

    auto tmpl = registry::lookup(template_id);
    if (tmpl.isErr()) return VoidResult::err(tmpl.error());
    if (!tmpl.value().is_valid()) {
        return invalid("template '" + template_id + "' has an invalid definition");
    }
    return VoidResult::ok();
}

InstallConfig InstallConfig::with_absolute_paths() const {
    InstallConfig copy = *this;
    if (!copy.target_dir.empty()) copy.target_dir = absolute_path(copy.target_dir);
    if (!copy.backup_dir.empty()) copy.backup_dir = absolute_path(copy.backup_dir);
    return copy;
}

VoidResult CleanConfig::validate() const {
    if (target_dir.empty()) {
        return VoidResult::err(Error(ErrorCode::VALIDATION_FAILED, "target directory cannot be empty"));
    }
    return VoidResult::ok();
}

} // namespace scb
