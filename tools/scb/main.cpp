/**
 * scb CLI - Entry Point
 *
 * Installs, inspects and removes the Strategic Claude Basic framework in a
 * project directory.
 */

#include <CLI/CLI.hpp>
#include <scb/version.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace scb::cli::commands {
    void setup_init(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_clean(CLI::App* app, GlobalOptions& opts);
    void setup_templates(CLI::App* app, GlobalOptions& opts);
    void setup_version(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace scb::cli;

    CLI::App app{"scb - Strategic Claude Basic installer"};
    app.set_version_flag("-V,--version", SCB_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-t,--target", opts.target, "Target directory (default: SCB_TARGET or .)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");

    auto* init_cmd = app.add_subcommand("init", "Install or update the framework");
    commands::setup_init(init_cmd, opts);

    auto* status_cmd = app.add_subcommand("status", "Show installation status");
    commands::setup_status(status_cmd, opts);

    auto* clean_cmd = app.add_subcommand("clean", "Remove the framework, keeping user content");
    commands::setup_clean(clean_cmd, opts);

    auto* templates_cmd = app.add_subcommand("templates", "List available templates");
    commands::setup_templates(templates_cmd, opts);

    auto* version_cmd = app.add_subcommand("version", "Print version information");
    commands::setup_version(version_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
