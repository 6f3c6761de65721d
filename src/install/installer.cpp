#include "scb/installer.hpp"
#include "scb/codex_config.hpp"
#include "scb/ignore_policy.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"
#include "scb/symlink_manager.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace scb {

const char* installation_type_name(InstallationType type) {
    switch (type) {
        case InstallationType::New:
            return "New Installation";
        case InstallationType::Update:
            return "Update Core Only";
        case InstallationType::Overwrite:
            return "Full Overwrite";
    }
    return "Unknown";
}

InstallationType classify_installation(bool force, bool force_core, bool installed) {
    if (force) return InstallationType::Overwrite;
    if (force_core) return InstallationType::Update;
    if (!installed) return InstallationType::New;
    return InstallationType::Overwrite;
}

Installer::Installer(SourceProvider& source, ScriptRunner& scripts, SettingsEngine settings)
    : source_(source), scripts_(scripts), settings_(std::move(settings)) {}

// ============================================================================
// Planning
// ============================================================================

Result<InstallationPlan> Installer::analyze(const InstallConfig& raw) const {
    using R = Result<InstallationPlan>;

    auto valid = raw.validate();
    if (valid.isErr()) return R::err(valid.error());

    InstallConfig config = raw.with_absolute_paths();
    if (!path_exists(config.target_dir)) {
        return R::err(Error(ErrorCode::NOT_FOUND, "target directory does not exist: " + config.target_dir));
    }

    auto state = StatusDetector().check_installation(config.target_dir);
    if (state.isErr()) return R::err(state.error().withContext("analyze installation"));

    auto tmpl = registry::lookup(config.template_id);
    if (tmpl.isErr()) return R::err(tmpl.error());

    InstallationPlan plan;
    plan.target_dir = config.target_dir;
    plan.tmpl = tmpl.value();
    plan.already_installed = state.value().is_installed();
    plan.installed_template = state.value().template_info;
    plan.type = classify_installation(config.force, config.force_core, plan.already_installed);

    std::string framework = join_path(config.target_dir, kFrameworkDir);
    bool framework_present = is_directory(framework);

    if (path_exists_no_follow(framework) && !framework_present) {
        plan.add_error(std::string(kFrameworkDir) + " exists but is not a directory");
    }

    switch (plan.type) {
        case InstallationType::New:
            plan.will_create.push_back(kFrameworkDir);
            break;
        case InstallationType::Update:
            for (const auto& dir : framework_directories()) {
                std::string rel = std::string(kFrameworkDir) + "/" + dir;
                if (path_exists(join_path(config.target_dir, rel))) {
                    plan.will_replace.push_back(rel);
                } else {
                    plan.will_create.push_back(rel);
                }
            }
            for (const auto& dir : user_preserved_directories()) {
                plan.will_preserve.push_back(std::string(kFrameworkDir) + "/" + dir);
            }
            break;
        case InstallationType::Overwrite:
            if (framework_present) {
                plan.will_replace.push_back(kFrameworkDir);
            } else {
                plan.will_create.push_back(kFrameworkDir);
            }
            break;
    }

    plan.backup_required = !config.no_backup && !plan.will_replace.empty();
    if (plan.backup_required) {
        std::string parent = config.backup_dir.empty() ? config.target_dir : config.backup_dir;
        if (!is_directory(parent)) {
            plan.add_error("backup directory does not exist: " + parent);
        }
        plan.backup_path = unique_path(
            join_path(parent, std::string(kBackupDirPrefix) + get_backup_timestamp()), "");
    } else if (config.no_backup && !plan.will_replace.empty()) {
        plan.add_warning("Backups are disabled; replaced files cannot be restored");
    }

    for (const auto& manager : all_symlink_managers()) {
        const auto& layout = manager.layout();
        std::string integration = join_path(config.target_dir, layout.dir);

        if (path_exists_no_follow(integration) && !is_directory(integration)) {
            plan.add_error(layout.dir + " exists but is not a directory");
            continue;
        }
        if (!is_directory(integration)) plan.directories_to_create.push_back(layout.dir);
        for (const auto& sub : layout.required_subdirs) {
            std::string rel = layout.dir + "/" + sub;
            if (!is_directory(join_path(config.target_dir, rel))) plan.directories_to_create.push_back(rel);
        }

        for (const auto& spec : layout.symlinks) {
            std::string rel = layout.dir + "/" + spec.name;
            if (path_exists_no_follow(join_path(config.target_dir, rel))) {
                plan.symlinks_to_update.push_back(rel);
            } else {
                plan.symlinks_to_create.push_back(rel);
            }
        }
    }

    if (plan.installed_template && plan.installed_template->source.id != plan.tmpl.id) {
        plan.add_warning("Switching template from '" + plan.installed_template->source.id + "' to '" +
                         plan.tmpl.id + "'");
    }
    if (plan.tmpl.deprecated) {
        plan.add_warning("Template '" + plan.tmpl.id + "' is deprecated");
    }

    spdlog::debug("planned {} for {}: {} create, {} replace, {} preserve",
                  installation_type_name(plan.type), plan.target_dir, plan.will_create.size(),
                  plan.will_replace.size(), plan.will_preserve.size());
    return R::ok(plan);
}

// ============================================================================
// Execution
// ============================================================================

VoidResult Installer::create_backup(const InstallationPlan& plan) const {
    std::string framework = join_path(plan.target_dir, kFrameworkDir);
    if (!is_directory(framework)) return VoidResult::ok();

    auto copied = copy_tree(framework, plan.backup_path);
    if (copied.isErr()) {
        return VoidResult::err(Error(ErrorCode::BACKUP_FAILED, copied.error().message())
                                   .withContext("backup to " + plan.backup_path));
    }
    spdlog::info("backed up {} to {}", framework, plan.backup_path);
    return VoidResult::ok();
}

VoidResult Installer::install_core(const std::string& source_framework,
                                   const std::string& target_framework) const {
    auto dir = ensure_directory(target_framework);
    if (dir.isErr()) return dir;

    for (const auto& name : framework_directories()) {
        std::string src = join_path(source_framework, name);
        if (!is_directory(src)) {
            spdlog::debug("template has no {} directory", name);
            continue;
        }
        std::string dst = join_path(target_framework, name);
        if (path_exists_no_follow(dst)) {
            auto removed = remove_directory_named(dst, name);
            if (removed.isErr()) return removed;
        }
        auto copied = copy_tree(src, dst);
        if (copied.isErr()) return copied;
    }

    for (const auto& name : user_preserved_directories()) {
        auto ensured = ensure_directory(join_path(target_framework, name));
        if (ensured.isErr()) return ensured;
    }
    return VoidResult::ok();
}

VoidResult Installer::install_framework(const InstallationPlan& plan, const FetchedSource& source) const {
    std::string src = source.framework_root();
    std::string dst = join_path(plan.target_dir, kFrameworkDir);

    switch (plan.type) {
        case InstallationType::Update:
            return install_core(src, dst);
        case InstallationType::Overwrite:
            if (path_exists_no_follow(dst)) {
                auto removed = remove_framework_directory(plan.target_dir);
                if (removed.isErr()) return removed;
            }
            return copy_tree(src, dst);
        case InstallationType::New:
            return copy_tree(src, dst);
    }
    return VoidResult::ok();
}

VoidResult Installer::validate_installation(const std::string& target_dir, InstallOutcome& outcome) const {
    auto state = StatusDetector().check_installation(target_dir);
    if (state.isErr()) return VoidResult::err(state.error().withContext("post-install validation"));

    outcome.final_state = state.value();
    const auto& s = state.value();
    if (!s.is_installed()) {
        return VoidResult::err(Error(ErrorCode::INSTALLATION_FAILED,
                                     "installation validation failed: installation not detected"));
    }
    if (!s.issues.empty()) {
        std::string msg = "installation validation failed:";
        for (const auto& issue : s.issues) msg += "\n  - " + issue;
        return VoidResult::err(Error(ErrorCode::INSTALLATION_FAILED, msg));
    }
    return VoidResult::ok();
}

Result<InstallOutcome> Installer::execute(const InstallationPlan& plan, const InstallConfig& config) {
    using R = Result<InstallOutcome>;

    if (!plan.is_valid()) {
        std::string msg = "installation plan has errors:";
        for (const auto& e : plan.errors) msg += "\n  - " + e;
        return R::err(Error(ErrorCode::INSTALLATION_FAILED, msg));
    }

    InstallOutcome outcome;
    outcome.plan = plan;
    outcome.warnings = plan.warnings;

    spdlog::info("{} of template '{}' into {}", installation_type_name(plan.type), plan.tmpl.id,
                 plan.target_dir);

    if (plan.backup_required) {
        auto backup = create_backup(plan);
        if (backup.isErr()) return R::err(backup.error());
        if (is_directory(plan.backup_path)) outcome.backup_path = plan.backup_path;
    }

    auto fetched = source_.fetch(plan.tmpl);
    if (fetched.isErr()) return R::err(fetched.error().withContext("fetch template " + plan.tmpl.id));
    FetchedSource source = std::move(fetched.value());

    if (!is_directory(source.framework_root())) {
        return R::err(Error(ErrorCode::INSTALLATION_FAILED,
                            "template does not contain " + std::string(kFrameworkDir)));
    }

    if (scripts_.exists(source.root(), kPreInstallScript)) {
        auto pre = scripts_.run(source.root(), kPreInstallScript, plan.target_dir);
        if (pre.isErr()) return R::err(pre.error().withContext("pre-install script failed"));
        outcome.ran_pre_install = true;
    }

    auto copied = install_framework(plan, source);
    if (copied.isErr()) {
        return R::err(Error(ErrorCode::INSTALLATION_FAILED, copied.error().message())
                          .withContext("install framework files"));
    }

    for (const auto& manager : all_symlink_managers()) {
        auto structure = manager.ensure_structure(plan.target_dir);
        if (structure.isErr()) return R::err(structure.error().withContext("create integration directories"));
        auto links = manager.update_all(plan.target_dir);
        if (links.isErr()) return R::err(links.error().withContext("create symlinks"));
    }

    auto settings = settings_.process_settings(plan.target_dir);
    if (settings.isErr()) return R::err(settings.error().withContext("process settings"));
    outcome.settings_action = settings.value().action;
    outcome.settings_backup = settings.value().backup_path;

    auto codex = process_codex_config(plan.target_dir);
    if (codex.isErr()) return R::err(codex.error().withContext("process codex config"));
    outcome.codex_config_written = codex.value().written;

    if (scripts_.exists(source.root(), kPostInstallScript)) {
        auto post = scripts_.run(source.root(), kPostInstallScript, plan.target_dir);
        if (post.isErr()) {
            spdlog::warn("post-install script failed: {}", post.error().message());
            outcome.warnings.push_back("Post-install script failed: " + post.error().message());
        } else {
            outcome.ran_post_install = true;
        }
    }

    auto ignore = apply_ignore_policy(source.root(), plan.target_dir, config.ignore_mode);
    if (ignore.isErr()) return R::err(ignore.error().withContext("apply ignore policy"));
    outcome.ignore_files = ignore.value().applied;
    for (const auto& w : ignore.value().warnings) outcome.warnings.push_back(w);

    source.release();

    auto info = write_template_info(plan.target_dir,
                                    make_template_info(plan.tmpl, installation_type_name(plan.type)));
    if (info.isErr()) return R::err(info.error().withContext("save template info"));

    auto validated = validate_installation(plan.target_dir, outcome);
    if (validated.isErr()) return R::err(validated.error());

    spdlog::info("installation of '{}' complete", plan.tmpl.id);
    return R::ok(std::move(outcome));
}

Result<InstallOutcome> Installer::install(const InstallConfig& config) {
    using R = Result<InstallOutcome>;

    auto plan = analyze(config);
    if (plan.isErr()) return R::err(plan.error());

    if (config.dry_run) {
        InstallOutcome outcome;
        outcome.plan = plan.value();
        outcome.dry_run = true;
        outcome.warnings = plan.value().warnings;
        return R::ok(std::move(outcome));
    }
    return execute(plan.value(), config.with_absolute_paths());
}

} // namespace scb
