#pragma once

/**
 * @file installer.hpp
 * @brief Reconciliation planner and executor
 *
 * analyze() inspects the target and produces an InstallationPlan without
 * touching the disk. execute() carries a valid plan out: backup, fetch,
 * pre-install script, framework copy, symlinks, settings merge, Codex
 * config, post-install script, ignore files, provenance record and a final
 * status check.
 *
 * @example
 * ```cpp
 * scb::GitSourceProvider source;
 * scb::BashScriptRunner scripts;
 * scb::Installer installer(source, scripts);
 *
 * scb::InstallConfig config;
 * config.target_dir = "/work/project";
 * auto plan = installer.analyze(config);
 * if (plan.isOk() && plan.value().is_valid()) {
 *     auto outcome = installer.execute(plan.value(), config);
 * }
 * ```
 */

#include "scb/config.hpp"
#include "scb/error.hpp"
#include "scb/script_runner.hpp"
#include "scb/settings.hpp"
#include "scb/source_provider.hpp"
#include "scb/status.hpp"
#include "scb/template_info.hpp"
#include "scb/template_registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Installation Plan
// ============================================================================

enum class InstallationType {
    New,
    Update,     // replace framework directories, keep user directories
    Overwrite,  // replace the whole framework directory
};

// "New Installation", "Update Core Only", "Full Overwrite"
const char* installation_type_name(InstallationType type);

// force -> Overwrite, force_core -> Update, not installed -> New, else Overwrite
InstallationType classify_installation(bool force, bool force_core, bool installed);

struct InstallationPlan {
    std::string target_dir;
    InstallationType type = InstallationType::New;
    Template tmpl;

    // Paths relative to target_dir
    std::vector<std::string> will_create;
    std::vector<std::string> will_replace;
    std::vector<std::string> will_preserve;
    std::vector<std::string> symlinks_to_create;
    std::vector<std::string> symlinks_to_update;
    std::vector<std::string> directories_to_create;

    bool backup_required = false;
    std::string backup_path;

    bool already_installed = false;
    std::optional<TemplateInfo> installed_template;

    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    bool has_conflicts = false;

    void add_warning(const std::string& msg) { warnings.push_back(msg); }

    void add_error(const std::string& msg) {
        errors.push_back(msg);
        has_conflicts = true;
    }

    bool is_valid() const { return errors.empty(); }
};

// ============================================================================
// Install Outcome
// ============================================================================

struct InstallOutcome {
    InstallationPlan plan;
    bool dry_run = false;
    std::optional<std::string> backup_path;
    bool ran_pre_install = false;
    bool ran_post_install = false;
    SettingsAction settings_action = SettingsAction::Skipped;
    std::optional<std::string> settings_backup;
    bool codex_config_written = false;
    std::vector<std::string> ignore_files;
    std::vector<std::string> warnings;
    std::optional<InstallationState> final_state;
};

// ============================================================================
// Installer
// ============================================================================

class Installer {
public:
    Installer(SourceProvider& source, ScriptRunner& scripts,
              SettingsEngine settings = SettingsEngine());

    // Validates the config and builds a plan. Does not modify the disk.
    Result<InstallationPlan> analyze(const InstallConfig& config) const;

    // Runs a plan. Plans with errors are refused.
    Result<InstallOutcome> execute(const InstallationPlan& plan, const InstallConfig& config);

    // analyze() then execute(), stopping after analyze() for dry runs.
    Result<InstallOutcome> install(const InstallConfig& config);

private:
    VoidResult create_backup(const InstallationPlan& plan) const;
    VoidResult install_framework(const InstallationPlan& plan, const FetchedSource& source) const;
    VoidResult install_core(const std::string& source_framework, const std::string& target_framework) const;
    VoidResult validate_installation(const std::string& target_dir, InstallOutcome& outcome) const;

    SourceProvider& source_;
    ScriptRunner& scripts_;
    SettingsEngine settings_;
};

} // namespace scb
