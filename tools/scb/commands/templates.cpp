/**
 * scb CLI - templates command
 */

#include "../common.hpp"
#include <scb/template_registry.hpp>
#include <CLI/CLI.hpp>

namespace scb::cli::commands {

namespace {

struct TemplatesOptions {
    bool all = false;
    std::string tag;
};

int cmd_templates(const GlobalOptions& opts, const TemplatesOptions& tmpl_opts) {
    begin_command(opts);

    auto templates = tmpl_opts.all ? registry::list_all() : registry::list_active();
    if (!tmpl_opts.tag.empty()) {
        std::vector<Template> tagged;
        for (const auto& t : templates) {
            if (t.has_tag(tmpl_opts.tag)) tagged.push_back(t);
        }
        templates = tagged;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["templates"] = nlohmann::json::array();
        for (const auto& t : templates) j["templates"].push_back(template_to_json(t));
        output_json(j);
        return 0;
    }

    if (templates.empty()) {
        std::cout << "No templates found." << std::endl;
        return 0;
    }

    std::cout << "Available templates:" << std::endl;
    for (const auto& t : templates) {
        std::cout << "  " << t.id;
        if (t.id == kDefaultTemplateId) std::cout << " (default)";
        std::cout << std::endl;
        std::cout << "    " << t.display_name() << std::endl;
        if (!t.description.empty()) std::cout << "    " << t.description << std::endl;
        if (opts.verbose) {
            std::cout << "    branch: " << t.branch << ", commit: " << t.commit << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_templates(CLI::App* app, GlobalOptions& opts) {
    static TemplatesOptions tmpl_opts;

    app->add_flag("--all", tmpl_opts.all, "Include deprecated templates");
    app->add_option("--tag", tmpl_opts.tag, "Only templates with this tag");

    app->callback([&opts]() {
        std::exit(cmd_templates(opts, tmpl_opts));
    });
}

} // namespace scb::cli::commands
