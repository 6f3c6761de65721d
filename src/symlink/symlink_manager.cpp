#include "scb/symlink_manager.hpp"
#include "scb/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace scb {

namespace fs = std::filesystem;

namespace {

// Removal that reports permission problems distinctly.
VoidResult remove_path(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) return VoidResult::err(error_from_errc(ec, path));
    return VoidResult::ok();
}

} // namespace

SymlinkManager::SymlinkManager(IntegrationLayout layout)
    : layout_(std::move(layout)) {}

std::string SymlinkManager::integration_dir(const std::string& target_dir) const {
    return join_path(target_dir, layout_.dir);
}

VoidResult SymlinkManager::ensure_structure(const std::string& target_dir) const {
    std::string dir = integration_dir(target_dir);
    auto root = ensure_directory(dir);
    if (root.isErr()) return root;

    for (const auto& sub : layout_.required_subdirs) {
        auto made = ensure_directory(join_path(dir, sub));
        if (made.isErr()) return made;
    }
    return VoidResult::ok();
}

VoidResult SymlinkManager::create_one(const std::string& target_dir, const SymlinkSpec& spec) const {
    std::string link = join_path(integration_dir(target_dir), spec.name);

    auto parent = ensure_directory(get_parent_directory(link));
    if (parent.isErr()) return parent;

    if (path_exists_no_follow(link)) {
        auto removed = remove_path(link);
        if (removed.isErr()) return removed;
    }

    std::error_code ec;
    fs::create_symlink(spec.target, link, ec);
    if (ec) {
        Error e = error_from_errc(ec, link);
        if (e.code() != ErrorCode::PERMISSION_DENIED) {
            e = Error(ErrorCode::SYMLINK_CREATION_FAILED, e.message());
        }
        return VoidResult::err(e);
    }
    spdlog::debug("linked {} -> {}", link, spec.target);
    return VoidResult::ok();
}

VoidResult SymlinkManager::create_all(const std::string& target_dir) const {
    auto structure = ensure_structure(target_dir);
    if (structure.isErr()) {
        structure.error().withContext("prepare " + layout_.dir);
        return structure;
    }

    for (const auto& spec : layout_.symlinks) {
        auto made = create_one(target_dir, spec);
        if (made.isErr()) {
            made.error().withContext("create symlink " + layout_.dir + "/" + spec.name);
            return made;
        }
    }
    return VoidResult::ok();
}

VoidResult SymlinkManager::remove_all(const std::string& target_dir) const {
    for (const auto& spec : layout_.symlinks) {
        std::string link = join_path(integration_dir(target_dir), spec.name);
        if (!path_exists_no_follow(link)) continue;

        auto removed = remove_path(link);
        if (removed.isErr()) {
            removed.error().withContext("remove symlink " + layout_.dir + "/" + spec.name);
            return removed;
        }
        spdlog::debug("removed {}", link);
    }
    return VoidResult::ok();
}

VoidResult SymlinkManager::update_all(const std::string& target_dir) const {
    auto removed = remove_all(target_dir);
    if (removed.isErr()) return removed;
    return create_all(target_dir);
}

SymlinkStatus SymlinkManager::validate(const std::string& target_dir, const SymlinkSpec& spec) const {
    SymlinkStatus status;
    status.integration = layout_.dir;
    status.name = spec.name;
    status.path = join_path(integration_dir(target_dir), spec.name);

    std::error_code ec;
    auto st = fs::symlink_status(status.path, ec);
    if (!fs::exists(st)) {
        return status;
    }
    status.exists = true;

    if (!fs::is_symlink(st)) {
        status.error = "path exists but is not a symlink";
        return status;
    }

    auto target = read_symlink(status.path);
    if (!target) {
        status.error = "failed to read symlink target";
        return status;
    }
    status.target = *target;

    if (status.target != spec.target) {
        status.error = "symlink points to '" + status.target + "', expected '" + spec.target + "'";
        return status;
    }

    std::string resolved = join_path(get_parent_directory(status.path), status.target);
    if (!path_exists(resolved)) {
        status.error = "symlink target '" + status.target + "' does not exist";
        return status;
    }

    status.valid = true;
    return status;
}

std::vector<SymlinkStatus> SymlinkManager::validate_all(const std::string& target_dir) const {
    std::vector<SymlinkStatus> statuses;
    for (const auto& spec : layout_.symlinks) {
        statuses.push_back(validate(target_dir, spec));
    }
    return statuses;
}

RepairResult SymlinkManager::repair_broken(const std::string& target_dir) const {
    RepairResult result;

    for (const auto& spec : layout_.symlinks) {
        auto status = validate(target_dir, spec);
        if (status.valid) continue;

        if (status.exists) {
            auto removed = remove_path(status.path);
            if (removed.isErr()) {
                result.error = removed.error().withContext("repair " + layout_.dir + "/" + spec.name);
                return result;
            }
        }

        auto made = create_one(target_dir, spec);
        if (made.isErr()) {
            result.error = made.error().withContext("repair " + layout_.dir + "/" + spec.name);
            return result;
        }
        spdlog::info("repaired {}/{}", layout_.dir, spec.name);
        result.repaired.push_back(spec.name);
    }
    return result;
}

std::vector<OwnedRemovalOutcome> SymlinkManager::remove_owned(
    const std::string& target_dir, const std::vector<std::string>& known_targets) const {
    std::vector<OwnedRemovalOutcome> outcomes;

    for (const auto& spec : layout_.symlinks) {
        OwnedRemovalOutcome out;
        out.name = layout_.dir + "/" + spec.name;
        out.path = join_path(integration_dir(target_dir), spec.name);

        std::error_code ec;
        auto st = fs::symlink_status(out.path, ec);
        if (!fs::exists(st)) {
            out.action = OwnedRemovalAction::Absent;
        } else if (!fs::is_symlink(st)) {
            out.action = OwnedRemovalAction::PreservedNotSymlink;
            out.detail = "Preserving non-symlink file: " + out.path;
        } else {
            auto target = read_symlink(out.path).value_or("");
            bool owned = std::find(known_targets.begin(), known_targets.end(), target) != known_targets.end();
            if (!owned) {
                out.action = OwnedRemovalAction::PreservedForeign;
                out.detail = "Preserving non-Strategic Claude symlink: " + out.path + " -> " + target;
            } else {
                auto removed = remove_path(out.path);
                if (removed.isErr()) {
                    out.action = OwnedRemovalAction::Failed;
                    out.detail = removed.error().message();
                } else {
                    out.action = OwnedRemovalAction::Removed;
                    spdlog::debug("removed {}", out.path);
                }
            }
        }
        outcomes.push_back(out);
    }
    return outcomes;
}

std::vector<SymlinkManager> all_symlink_managers() {
    std::vector<SymlinkManager> managers;
    for (const auto& layout : integration_layouts()) {
        managers.emplace_back(layout);
    }
    return managers;
}

} // namespace scb
