#include "scb/status.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace scb {

namespace {

void check_framework(const std::string& framework, std::vector<std::string>& issues) {
    for (const auto& dir : framework_directories()) {
        if (!is_directory(join_path(framework, dir))) {
            issues.push_back("Missing framework directory: " + dir);
        }
    }

    std::string core = join_path(framework, "core");
    if (is_directory(core)) {
        for (const auto& sub : required_core_subdirectories()) {
            if (!is_directory(join_path(core, sub))) {
                issues.push_back("Missing core subdirectory: core/" + sub);
            }
        }
    }

    if (!is_writable(framework)) {
        issues.push_back("Framework directory is not writable: " + framework);
    }
}

} // namespace

size_t InstallationState::valid_symlinks() const {
    size_t n = 0;
    for (const auto& s : symlinks) {
        if (s.valid) ++n;
    }
    return n;
}

size_t InstallationState::existing_symlinks() const {
    size_t n = 0;
    for (const auto& s : symlinks) {
        if (s.exists) ++n;
    }
    return n;
}

bool InstallationState::is_installed() const {
    return framework_dir && has_integration_dir() && valid_symlinks() > 0;
}

std::string InstallationState::summary() const {
    if (!is_installed()) {
        return "Strategic Claude Basic is not installed";
    }
    if (!issues.empty()) {
        return "Strategic Claude Basic is installed but has " + std::to_string(issues.size()) +
               (issues.size() == 1 ? " issue" : " issues");
    }
    return "Strategic Claude Basic is installed and configured correctly";
}

Result<InstallationState> StatusDetector::check_installation(const std::string& target_dir) const {
    using R = Result<InstallationState>;

    if (target_dir.empty()) {
        return R::err(Error(ErrorCode::VALIDATION_FAILED, "target directory cannot be empty"));
    }
    if (!path_exists(target_dir)) {
        return R::err(Error(ErrorCode::NOT_FOUND, target_dir + ": directory does not exist"));
    }
    if (!is_directory(target_dir)) {
        return R::err(Error(ErrorCode::INVALID_PATH, target_dir + ": not a directory"));
    }
    if (access(target_dir.c_str(), R_OK | X_OK) != 0) {
        return R::err(Error(ErrorCode::PERMISSION_DENIED, target_dir + ": directory is not readable"));
    }

    InstallationState state;
    state.target_dir = target_dir;

    std::string framework = join_path(target_dir, kFrameworkDir);
    state.framework_dir = is_directory(framework);
    if (state.framework_dir) {
        check_framework(framework, state.issues);
    }

    for (const auto& manager : all_symlink_managers()) {
        const auto& layout = manager.layout();
        std::string dir = manager.integration_dir(target_dir);
        bool present = is_directory(dir);

        if (layout.dir == kClaudeDir) state.claude_dir = present;
        if (layout.dir == kCodexDir) state.codex_dir = present;

        if (!present) {
            if (state.framework_dir) {
                state.issues.push_back("Missing integration directory: " + layout.dir);
            }
            continue;
        }

        for (const auto& sub : layout.required_subdirs) {
            if (!is_directory(join_path(dir, sub))) {
                state.issues.push_back("Missing " + layout.dir + " subdirectory: " + sub);
            }
        }

        auto statuses = manager.validate_all(target_dir);
        state.symlinks.insert(state.symlinks.end(), statuses.begin(), statuses.end());
    }

    // Cross-checks
    if (state.framework_dir && !state.has_integration_dir()) {
        state.issues.push_back(
            "Partial installation: framework directory exists but no integration directory found");
    }
    if (!state.framework_dir && state.has_integration_dir()) {
        state.issues.push_back(
            "Partial installation: integration directory exists but framework directory is missing");
    }

    size_t total = state.symlinks.size();
    size_t valid = state.valid_symlinks();
    size_t existing = state.existing_symlinks();
    if (existing > 0 && valid < total) {
        state.issues.push_back("Some symlinks are broken or invalid (" + std::to_string(valid) + "/" +
                               std::to_string(total) + " valid)");
    }
    if (state.framework_dir && state.has_integration_dir() && existing == 0) {
        state.issues.push_back("Installation directories exist but no strategic symlinks were found");
    }

    if (state.framework_dir) {
        auto info = read_template_info(target_dir);
        if (info.isErr()) {
            state.issues.push_back("Failed to read template info: " + info.error().message());
        } else {
            state.template_info = info.value();
        }
    }

    spdlog::debug("status of {}: installed={} issues={}", target_dir, state.is_installed(),
                  state.issues.size());
    return R::ok(std::move(state));
}

} // namespace scb
