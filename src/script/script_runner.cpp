#include "scb/script_runner.hpp"
#include "scb/platform.hpp"
#include "scb/process.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace scb {

namespace fs = std::filesystem;

bool BashScriptRunner::exists(const std::string& dir, const std::string& name) const {
    return is_regular_file(join_path(dir, name));
}

VoidResult BashScriptRunner::run(const std::string& dir, const std::string& name,
                                 const std::string& target_dir) {
    std::string script = join_path(dir, name);
    if (!is_regular_file(script)) {
        spdlog::debug("no {} in {}", name, dir);
        return VoidResult::ok();
    }

    // Never clobber a file of the same name that belongs to the project.
    fs::path named(name);
    std::string copy = unique_path(join_path(target_dir, named.stem().string()),
                                   named.extension().string());

    auto copied = copy_file_preserving(script, copy);
    if (copied.isErr()) return VoidResult::err(copied.error().withContext("stage " + name));

    std::error_code ec;
    fs::permissions(copy, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec, ec);
    if (ec) spdlog::warn("could not mark {} executable: {}", copy, ec.message());

    spdlog::info("running {} in {}", name, target_dir);
    ProcessOptions opts;
    opts.cwd = target_dir;
    auto result = run_process({"bash", get_filename(copy)}, opts);

    fs::remove(copy, ec);
    if (ec) spdlog::warn("failed to remove {}: {}", copy, ec.message());

    if (!result.ok) {
        return VoidResult::err(Error(ErrorCode::SCRIPT_FAILED, name + ": " + result.error));
    }
    if (result.exit_code != 0) {
        return VoidResult::err(Error(ErrorCode::SCRIPT_FAILED,
                                     name + " exited with status " + std::to_string(result.exit_code)));
    }
    return VoidResult::ok();
}

} // namespace scb
