/**
 * scb CLI - clean command
 *
 * Remove the framework while keeping user content.
 */

#include "../common.hpp"
#include <scb/cleaner.hpp>
#include <scb/layout.hpp>
#include <scb/settings.hpp>
#include <scb/status.hpp>
#include <CLI/CLI.hpp>
#include <algorithm>

namespace scb::cli::commands {

namespace {

struct CleanOptions {
    std::string directory;
    bool force = false;
    bool dry_run = false;
};

bool has_framework_content(const InstallationState& state) {
    if (state.framework_dir || state.is_installed()) return true;
    return std::any_of(state.symlinks.begin(), state.symlinks.end(),
                       [](const SymlinkStatus& s) { return s.exists; });
}

nlohmann::json result_to_json(const CleanupResult& result) {
    nlohmann::json j;
    j["ok"] = result.success;
    j["removed_directory"] = result.removed_directory;
    j["removed_symlinks"] = result.removed_symlinks;
    j["cleaned_settings"] = result.cleaned_settings;
    j["preserved_files"] = result.preserved_files;
    j["cleaned_directories"] = result.cleaned_directories;
    j["warnings"] = result.warnings;
    j["errors"] = result.errors;
    return j;
}

int show_dry_run(const GlobalOptions& opts, const InstallationState& state) {
    auto known = known_symlink_targets();
    std::vector<std::string> remove_links;
    std::vector<std::string> keep_links;
    for (const auto& link : state.symlinks) {
        if (!link.exists) continue;
        bool owned = std::find(known.begin(), known.end(), link.target) != known.end();
        (owned ? remove_links : keep_links).push_back(link.integration + "/" + link.name);
    }
    bool settings = is_regular_file(settings_path(state.target_dir));

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["dry_run"] = true;
        j["remove_directory"] = state.framework_dir;
        j["remove_symlinks"] = remove_links;
        j["preserve_symlinks"] = keep_links;
        j["clean_settings"] = settings;
        output_json(j);
        return 0;
    }

    std::cout << "=== DRY RUN MODE ===" << std::endl << std::endl;
    if (state.framework_dir) {
        std::cout << "Directory to be removed:" << std::endl;
        std::cout << "  - " << kFrameworkDir << std::endl << std::endl;
    }
    print_list("Symlinks to be removed:", remove_links, "-");
    print_list("Paths to be preserved:", keep_links, "=");
    if (settings) {
        std::cout << "settings.json will be cleaned of strategic hooks" << std::endl << std::endl;
    }
    std::cout << "Dry run: no changes were made." << std::endl;
    return 0;
}

void print_result(const CleanupResult& result, bool verbose) {
    std::cout << std::endl;
    if (result.success) {
        if (result.removed_directory) {
            std::cout << "Removed " << kFrameworkDir << " directory" << std::endl;
        }
        if (!result.removed_symlinks.empty()) {
            std::cout << "Removed " << result.removed_symlinks.size() << " Strategic Claude symlink(s)" << std::endl;
            if (verbose) {
                for (const auto& s : result.removed_symlinks) std::cout << "  - " << s << std::endl;
            }
        }
        if (!result.cleaned_directories.empty()) {
            std::cout << "Cleaned up " << result.cleaned_directories.size() << " empty director(ies)" << std::endl;
            if (verbose) {
                for (const auto& d : result.cleaned_directories) std::cout << "  - " << d << std::endl;
            }
        }
        if (!result.preserved_files.empty()) {
            std::cout << "Preserved " << result.preserved_files.size() << " user file(s)" << std::endl;
            if (verbose) {
                for (const auto& f : result.preserved_files) std::cout << "  = " << f << std::endl;
            }
        }
        std::cout << "Strategic Claude Basic cleanup completed successfully" << std::endl;
    }

    for (const auto& w : result.warnings) print_warning(w);
    for (const auto& e : result.errors) std::cerr << "Error: " << e << std::endl;
}

int cmd_clean(const GlobalOptions& opts, const CleanOptions& clean_opts) {
    begin_command(opts);

    CleanConfig config;
    config.target_dir = resolve_target(clean_opts.directory, opts);
    config.force = clean_opts.force;
    config.dry_run = clean_opts.dry_run;
    config.verbose = opts.verbose;

    auto valid = config.validate();
    if (valid.isErr()) return report_error(valid.error(), opts.json);

    auto checked = StatusDetector().check_installation(config.target_dir);
    if (checked.isErr()) return report_error(checked.error(), opts.json);
    const InstallationState& state = checked.value();

    if (!has_framework_content(state)) {
        print_warning("No Strategic Claude Basic installation found");
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["installed"] = false;
            output_json(j);
        }
        return 0;
    }

    if (config.dry_run) return show_dry_run(opts, state);

    if (!config.force) {
        std::optional<bool> answer;
        if (!opts.json) {
            answer = confirm("Remove Strategic Claude Basic from " + config.target_dir + "?");
        }
        if (!answer) {
            return report_error(Error(ErrorCode::USER_CANCELLED,
                                      "refusing to clean without confirmation; use --force"),
                                opts.json);
        }
        if (!*answer) {
            print_success("Cleanup cancelled by user", opts.json);
            return exit_code_for(Error(ErrorCode::USER_CANCELLED, "cancelled"));
        }
    }

    Cleaner cleaner;
    bool partial = !state.is_installed() && !state.issues.empty();
    auto cleaned = partial ? cleaner.handle_partial_installation(config.target_dir)
                           : cleaner.remove_installation(config.target_dir);
    if (cleaned.isErr()) return report_error(cleaned.error().withContext("cleanup failed"), opts.json);
    const CleanupResult& result = cleaned.value();

    if (opts.json) {
        output_json(result_to_json(result));
    } else {
        print_result(result, opts.verbose);
    }

    if (!result.success) {
        if (!opts.json) std::cerr << "Error: cleanup completed with errors" << std::endl;
        return 1;
    }
    return 0;
}

} // anonymous namespace

void setup_clean(CLI::App* app, GlobalOptions& opts) {
    static CleanOptions clean_opts;

    app->add_option("directory", clean_opts.directory, "Target directory");
    app->add_flag("-f,--force", clean_opts.force, "Clean without confirmation");
    app->add_flag("--dry-run", clean_opts.dry_run, "Show what would be removed");

    app->callback([&opts]() {
        std::exit(cmd_clean(opts, clean_opts));
    });
}

} // namespace scb::cli::commands
