/**
 * scb CLI - init command
 *
 * Install, update or overwrite the framework in a target directory.
 */

#include "../common.hpp"
#include <scb/config.hpp>
#include <scb/installer.hpp>
#include <scb/script_runner.hpp>
#include <scb/source_provider.hpp>
#include <CLI/CLI.hpp>
#include <memory>

namespace scb::cli::commands {

namespace {

struct InitOptions {
    std::string directory;
    bool force = false;
    bool force_core = false;
    bool yes = false;
    bool no_backup = false;
    std::string backup_dir;
    bool dry_run = false;
    std::string template_id;
    std::string ignore = "track";
    std::string source;
    int timeout = 30;
};

void print_plan(const InstallationPlan& plan) {
    std::cout << std::endl;
    std::cout << "Target directory: " << plan.target_dir << std::endl;
    std::cout << "Installation type: " << installation_type_name(plan.type) << std::endl;
    std::cout << "Template: " << plan.tmpl.display_name() << " (" << plan.tmpl.id << ")" << std::endl;
    if (!plan.tmpl.description.empty()) {
        std::cout << "Description: " << plan.tmpl.description << std::endl;
    }
    std::cout << "Branch: " << plan.tmpl.branch << std::endl;
    std::cout << "Commit: " << plan.tmpl.commit << std::endl;
    std::cout << std::endl;

    print_list("Files/directories to be created:", plan.will_create, "+");
    print_list("Directories to be created:", plan.directories_to_create, "+");
    print_list("Symlinks to be created:", plan.symlinks_to_create, "->");
    print_list("Symlinks to be updated:", plan.symlinks_to_update, "->");
    print_list("Files/directories to be replaced:", plan.will_replace, "~");
    print_list("User content to be preserved:", plan.will_preserve, "=");

    if (plan.backup_required) {
        std::cout << "Backup will be created at: " << plan.backup_path << std::endl << std::endl;
    }
    print_list("Warnings:", plan.warnings, "-");
    print_list("Errors:", plan.errors, "!");
}

InstallConfig make_config(const GlobalOptions& opts, const InitOptions& init_opts, IgnoreMode mode) {
    InstallConfig config;
    config.target_dir = resolve_target(init_opts.directory, opts);
    config.template_id = init_opts.template_id.empty() ? kDefaultTemplateId : init_opts.template_id;
    config.force = init_opts.force;
    config.force_core = init_opts.force_core;
    config.skip_confirm = init_opts.yes;
    config.no_backup = init_opts.no_backup;
    config.dry_run = init_opts.dry_run;
    config.verbose = opts.verbose;
    config.backup_dir = init_opts.backup_dir;
    config.git_timeout_seconds = init_opts.timeout;
    config.ignore_mode = mode;
    return config;
}

int cmd_init(const GlobalOptions& opts, const InitOptions& init_opts) {
    begin_command(opts);

    auto mode = parse_ignore_mode(init_opts.ignore);
    if (!mode) {
        return report_error(Error(ErrorCode::VALIDATION_FAILED,
                                  "invalid ignore mode '" + init_opts.ignore +
                                      "' (expected track, all or non-user)"),
                            opts.json);
    }

    InstallConfig config = make_config(opts, init_opts, *mode);
    auto valid = config.validate();
    if (valid.isErr()) return report_error(valid.error(), opts.json);

    std::unique_ptr<SourceProvider> source;
    if (!init_opts.source.empty()) {
        source = std::make_unique<LocalSourceProvider>(absolute_path(init_opts.source));
    } else {
        source = std::make_unique<GitSourceProvider>(config.git_timeout_seconds);
    }
    BashScriptRunner scripts;
    Installer installer(*source, scripts);

    auto analyzed = installer.analyze(config);
    if (analyzed.isErr()) return report_error(analyzed.error(), opts.json);
    const InstallationPlan& plan = analyzed.value();

    if (!opts.json) print_plan(plan);

    if (!plan.is_valid()) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = "installation plan has conflicts";
            j["plan"] = plan_to_json(plan);
            output_json(j);
        } else {
            std::cerr << "Error: installation plan has conflicts" << std::endl;
        }
        return 2;
    }

    if (config.dry_run) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["dry_run"] = true;
            j["plan"] = plan_to_json(plan);
            output_json(j);
        } else {
            std::cout << "Dry run: no changes were made." << std::endl;
        }
        return 0;
    }

    if (plan.already_installed && !config.force && !config.force_core && !config.skip_confirm) {
        std::optional<bool> answer;
        if (!opts.json) answer = confirm("Strategic Claude Basic is already installed. Overwrite it?");
        if (!answer) {
            print_error("Strategic Claude Basic is already installed in " + plan.target_dir +
                            "; use --force, --force-core or --yes",
                        opts.json, "ALREADY_INSTALLED");
            return 7;
        }
        if (!*answer) {
            print_success("Installation cancelled by user", opts.json);
            return exit_code_for(Error(ErrorCode::USER_CANCELLED, "cancelled"));
        }
    }

    print_success("Installing Strategic Claude Basic in " + plan.target_dir + "...", opts.json);

    auto executed = installer.execute(plan, config.with_absolute_paths());
    if (executed.isErr()) return report_error(executed.error(), opts.json);
    const InstallOutcome& outcome = executed.value();

    for (const auto& w : outcome.warnings) print_warning(w);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["plan"] = plan_to_json(plan);
        if (outcome.backup_path) j["backup_path"] = *outcome.backup_path;
        if (outcome.settings_backup) j["settings_backup"] = *outcome.settings_backup;
        j["ran_pre_install"] = outcome.ran_pre_install;
        j["ran_post_install"] = outcome.ran_post_install;
        j["codex_config_written"] = outcome.codex_config_written;
        j["ignore_files"] = outcome.ignore_files;
        if (outcome.final_state) j["status"] = state_to_json(*outcome.final_state);
        output_json(j);
    } else {
        if (outcome.backup_path) std::cout << "Backup created at " << *outcome.backup_path << std::endl;
        std::cout << "Strategic Claude Basic installation completed successfully!" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_init(CLI::App* app, GlobalOptions& opts) {
    static InitOptions init_opts;

    app->add_option("directory", init_opts.directory, "Target directory");
    app->add_flag("-f,--force", init_opts.force, "Overwrite the whole framework directory");
    app->add_flag("--force-core", init_opts.force_core, "Replace framework files, keep user directories");
    app->add_flag("-y,--yes", init_opts.yes, "Skip confirmation prompts");
    app->add_flag("--no-backup", init_opts.no_backup, "Do not back up replaced content");
    app->add_option("--backup-dir", init_opts.backup_dir, "Parent directory for the backup");
    app->add_flag("--dry-run", init_opts.dry_run, "Show the plan without changing anything");
    app->add_option("--template", init_opts.template_id, "Template id (default: main)");
    app->add_option("--ignore", init_opts.ignore, "Ignore-file mode: track, all or non-user");
    app->add_option("--source", init_opts.source, "Use a local template checkout instead of git");
    app->add_option("--timeout", init_opts.timeout, "Git timeout in seconds");

    app->callback([&opts]() {
        std::exit(cmd_init(opts, init_opts));
    });
}

} // namespace scb::cli::commands
