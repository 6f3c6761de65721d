#include "scb/codex_config.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"

#include <spdlog/spdlog.h>

namespace scb {

Result<CodexConfigOutcome> process_codex_config(const std::string& target_dir) {
    using R = Result<CodexConfigOutcome>;
    CodexConfigOutcome outcome;

    std::string tmpl = join_path(join_path(target_dir, kFrameworkDir), kCodexConfigTemplateFile);
    if (!is_regular_file(tmpl)) {
        spdlog::debug("no codex config template at {}", tmpl);
        return R::ok(outcome);
    }

    auto content = read_file(tmpl);
    if (!content) return R::err(Error(ErrorCode::IO_ERROR, tmpl + ": cannot read file"));

    std::string codex_dir = join_path(target_dir, kCodexDir);
    auto dir = ensure_directory(codex_dir);
    if (dir.isErr()) return R::err(dir.error().withContext("codex config"));

    std::string live = join_path(codex_dir, kCodexConfigFile);
    if (path_exists(live)) {
        auto existing = read_file(live);
        if (!existing) return R::err(Error(ErrorCode::IO_ERROR, live + ": cannot read file"));
        if (*existing == *content) return R::ok(outcome);

        std::string backup = unique_path(
            join_path(codex_dir, std::string(kCodexConfigBackupPrefix) + get_backup_timestamp()), ".toml");
        auto saved = atomic_write_file(backup, *existing);
        if (!saved.ok) return R::err(Error(ErrorCode::BACKUP_FAILED, backup + ": " + saved.error));
        outcome.backup_path = backup;
        spdlog::info("backed up {} to {}", live, backup);
    }

    auto written = atomic_write_file(live, *content);
    if (!written.ok) return R::err(Error(ErrorCode::IO_ERROR, live + ": " + written.error));
    outcome.written = true;
    spdlog::info("wrote {}", live);
    return R::ok(outcome);
}

} // namespace scb
