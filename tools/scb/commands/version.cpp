/**
 * scb CLI - version command
 */

#include "../common.hpp"
#include <scb/version.hpp>
#include <CLI/CLI.hpp>

namespace scb::cli::commands {

namespace {

int cmd_version(const GlobalOptions& opts) {
    begin_command(opts);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["version"] = SCB_VERSION;
        j["default_template"] = kDefaultTemplateId;
        output_json(j);
    } else {
        std::cout << "scb " << SCB_VERSION << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_version(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_version(opts));
    });
}

} // namespace scb::cli::commands
