#include "scb/cleaner.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"
#include "scb/status.hpp"
#include "scb/symlink_manager.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

namespace scb {

namespace fs = std::filesystem;

namespace {

// rmdir when empty, otherwise report every remaining entry as preserved.
VoidResult prune_if_empty(const std::string& dir, CleanupResult& result) {
    if (!is_directory(dir)) return VoidResult::ok();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return VoidResult::err(error_from_errc(ec, dir));

    if (it == fs::directory_iterator()) {
        fs::remove(dir, ec);
        if (ec) return VoidResult::err(error_from_errc(ec, dir));
        result.cleaned_directories.push_back(dir);
        spdlog::debug("removed empty directory {}", dir);
        return VoidResult::ok();
    }

    for (const auto& name : list_directory(dir)) {
        result.preserved_files.push_back(join_path(dir, name));
    }
    return VoidResult::ok();
}

} // namespace

Cleaner::Cleaner(SettingsEngine settings) : settings_(std::move(settings)) {}

void Cleaner::remove_symlinks(const std::string& target_dir, CleanupResult& result) const {
    auto known = known_symlink_targets();

    for (const auto& manager : all_symlink_managers()) {
        for (const auto& out : manager.remove_owned(target_dir, known)) {
            switch (out.action) {
                case OwnedRemovalAction::Absent:
                    break;
                case OwnedRemovalAction::Removed:
                    result.removed_symlinks.push_back(out.name);
                    break;
                case OwnedRemovalAction::PreservedNotSymlink:
                case OwnedRemovalAction::PreservedForeign:
                    result.preserved_files.push_back(out.path);
                    result.warnings.push_back(out.detail);
                    break;
                case OwnedRemovalAction::Failed:
                    result.errors.push_back("Failed to remove symlink " + out.path + ": " + out.detail);
                    break;
            }
        }
    }
}

VoidResult Cleaner::remove_framework(const std::string& target_dir, CleanupResult& result) const {
    if (!path_exists_no_follow(join_path(target_dir, kFrameworkDir))) return VoidResult::ok();

    auto removed = remove_framework_directory(target_dir);
    if (removed.isErr()) return removed;
    result.removed_directory = true;
    return VoidResult::ok();
}

void Cleaner::clean_settings(const std::string& target_dir, CleanupResult& result) const {
    if (!path_exists(settings_path(target_dir))) return;

    auto cleaned = settings_.clean_settings(target_dir);
    if (cleaned.isErr()) {
        result.warnings.push_back("Warning during settings cleanup: " + cleaned.error().message());
        return;
    }

    result.cleaned_settings = true;
    if (cleaned.value().action == SettingsAction::Removed) {
        result.preserved_files.push_back("settings.json removed (was empty after cleanup)");
    } else {
        result.preserved_files.push_back("settings.json (cleaned of strategic hooks)");
    }
}

void Cleaner::prune_empty_directories(const std::string& target_dir, CleanupResult& result) const {
    for (const auto& layout : integration_layouts()) {
        std::string root = join_path(target_dir, layout.dir);
        if (!is_directory(root)) continue;

        std::vector<std::string> order;
        for (const auto& sub : layout.required_subdirs) order.push_back(join_path(root, sub));
        order.push_back(root);

        for (const auto& dir : order) {
            auto pruned = prune_if_empty(dir, result);
            if (pruned.isErr()) {
                result.warnings.push_back("Warning during directory cleanup: " + pruned.error().message());
                break;
            }
        }
    }
}

void Cleaner::validate_cleanup(const std::string& target_dir, CleanupResult& result) const {
    auto state = StatusDetector().check_installation(target_dir);
    if (state.isErr()) {
        result.warnings.push_back("Cleanup validation warning: " + state.error().message());
        return;
    }

    if (state.value().framework_dir) {
        result.warnings.push_back("Strategic Claude directory still exists after cleanup");
    }
    for (const auto& link : state.value().symlinks) {
        if (link.exists && link.valid) {
            result.warnings.push_back("Strategic Claude symlink still exists: " + link.path);
        }
    }
}

Result<CleanupResult> Cleaner::remove_installation(const std::string& target_dir) const {
    using R = Result<CleanupResult>;

    if (target_dir.empty()) {
        return R::err(Error(ErrorCode::VALIDATION_FAILED, "target directory cannot be empty"));
    }

    auto state = StatusDetector().check_installation(target_dir);
    if (state.isErr()) return R::err(state.error().withContext("get installation status"));

    CleanupResult result;
    const auto& s = state.value();
    if (!s.is_installed() && !s.framework_dir && !s.has_integration_dir()) {
        result.success = true;
        result.warnings.push_back("No Strategic Claude Basic installation found");
        return R::ok(result);
    }

    spdlog::info("removing installation from {}", target_dir);

    remove_symlinks(target_dir, result);

    auto removed = remove_framework(target_dir, result);
    if (removed.isErr()) {
        return R::err(removed.error().withContext("remove Strategic Claude directory"));
    }

    if (!result.removed_symlinks.empty() || result.removed_directory) {
        clean_settings(target_dir, result);
    }

    prune_empty_directories(target_dir, result);
    validate_cleanup(target_dir, result);

    result.success = result.errors.empty();
    return R::ok(result);
}

Result<CleanupResult> Cleaner::handle_partial_installation(const std::string& target_dir) const {
    using R = Result<CleanupResult>;

    auto state = StatusDetector().check_installation(target_dir);
    if (state.isErr()) return R::err(state.error().withContext("get installation status"));

    CleanupResult result;
    result.warnings.push_back("Handling partial installation cleanup");

    for (const auto& link : state.value().symlinks) {
        if (!link.exists || link.valid) continue;
        if (!is_symlink(link.path)) {
            result.preserved_files.push_back(link.path);
            continue;
        }
        std::error_code ec;
        fs::remove(link.path, ec);
        if (ec) {
            result.warnings.push_back("Could not remove broken symlink " + link.path + ": " + ec.message());
        } else {
            result.removed_symlinks.push_back(link.integration + "/" + link.name);
        }
    }

    if (state.value().framework_dir) {
        auto removed = remove_framework(target_dir, result);
        if (removed.isErr()) {
            return R::err(removed.error().withContext("remove Strategic Claude directory"));
        }
    }

    prune_empty_directories(target_dir, result);

    result.success = result.errors.empty();
    return R::ok(result);
}

} // namespace scb
