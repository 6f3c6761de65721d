/**
 * scb CLI - status command
 */

#include "../common.hpp"
#include <scb/status.hpp>
#include <CLI/CLI.hpp>

namespace scb::cli::commands {

namespace {

struct StatusOptions {
    std::string directory;
};

const char* yes_no(bool v) { return v ? "yes" : "no"; }

int cmd_status(const GlobalOptions& opts, const StatusOptions& status_opts) {
    begin_command(opts);

    std::string target = resolve_target(status_opts.directory, opts);
    auto checked = StatusDetector().check_installation(target);
    if (checked.isErr()) return report_error(checked.error(), opts.json);
    const InstallationState& state = checked.value();

    if (opts.json) {
        nlohmann::json j = state_to_json(state);
        j["ok"] = true;
        output_json(j);
        return 0;
    }

    std::cout << state.summary() << std::endl << std::endl;
    std::cout << "Target directory: " << state.target_dir << std::endl;
    std::cout << "  .strategic-claude-basic: " << yes_no(state.framework_dir) << std::endl;
    std::cout << "  .claude: " << yes_no(state.claude_dir) << std::endl;
    std::cout << "  .codex: " << yes_no(state.codex_dir) << std::endl;

    if (!state.symlinks.empty()) {
        std::cout << std::endl << "Symlinks (" << state.valid_symlinks() << "/" << state.symlinks.size()
                  << " valid):" << std::endl;
        for (const auto& link : state.symlinks) {
            std::string mark = link.valid ? "ok" : (link.exists ? "broken" : "missing");
            std::cout << "  [" << mark << "] " << link.integration << "/" << link.name;
            if (link.error) std::cout << " (" << *link.error << ")";
            std::cout << std::endl;
        }
    }

    if (state.template_info) {
        const auto& info = *state.template_info;
        std::cout << std::endl << "Template: " << info.source.display_name() << " (" << info.source.id << ")"
                  << std::endl;
        std::cout << "  Commit: " << info.installed_commit << std::endl;
        std::cout << "  Installed at: " << info.installed_at << std::endl;
        auto mode = info.metadata.find("install_mode");
        if (mode != info.metadata.end()) std::cout << "  Mode: " << mode->second << std::endl;
    }

    if (!state.issues.empty()) {
        std::cout << std::endl;
        print_list("Issues:", state.issues, "-");
    }
    return 0;
}

} // anonymous namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    static StatusOptions status_opts;

    app->add_option("directory", status_opts.directory, "Target directory");

    app->callback([&opts]() {
        std::exit(cmd_status(opts, status_opts));
    });
}

} // namespace scb::cli::commands
