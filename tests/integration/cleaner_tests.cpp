/**
 * Cleaner integration tests
 */

#include <doctest/doctest.h>
#include <scb/cleaner.hpp>
#include <scb/installer.hpp>
#include <scb/layout.hpp>
#include <scb/platform.hpp>
#include <scb/settings.hpp>
#include "test_helpers.hpp"

#include <unistd.h>

#include <algorithm>
#include <filesystem>

using namespace scb;
using scb_test::TempTestDir;
using scb_test::make_linked_installation;
using scb_test::read_text;
using scb_test::write_file;

namespace fs = std::filesystem;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// Never reports a script, so installs run without bash.
class NoScripts : public ScriptRunner {
public:
    bool exists(const std::string&, const std::string&) const override { return false; }
    VoidResult run(const std::string&, const std::string&, const std::string&) override {
        return VoidResult::ok();
    }
};

void install_into(const std::string& source, const std::string& target) {
    scb_test::make_framework_tree(source);
    fs::create_directories(target);
    LocalSourceProvider provider(source);
    NoScripts scripts;
    InstallConfig config;
    config.target_dir = target;
    auto outcome = Installer(provider, scripts).install(config);
    REQUIRE(outcome.isOk());
}

} // namespace

TEST_CASE("cleanup of an empty target is a successful no-op") {
    TempTestDir temp;
    auto r = Cleaner().remove_installation(temp.path);
    REQUIRE(r.isOk());
    CHECK(r.value().success);
    CHECK_FALSE(r.value().removed_directory);
    CHECK(contains(r.value().warnings, "No Strategic Claude Basic installation found"));
}

TEST_CASE("cleanup rejects an empty target path") {
    auto r = Cleaner().remove_installation("");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::VALIDATION_FAILED);
}

TEST_CASE("cleanup removes a linked installation completely") {
    TempTestDir temp;
    make_linked_installation(temp.path);

    auto r = Cleaner().remove_installation(temp.path);
    REQUIRE(r.isOk());
    const auto& result = r.value();
    CHECK(result.success);
    CHECK(result.removed_directory);
    CHECK(result.removed_symlinks.size() == 5);
    CHECK(contains(result.removed_symlinks, ".codex/prompts/strategic"));
    CHECK(result.warnings.empty());

    CHECK_FALSE(path_exists(temp.sub(".strategic-claude-basic")));
    CHECK_FALSE(path_exists(temp.sub(".claude")));
    CHECK_FALSE(path_exists(temp.sub(".codex")));
    CHECK(contains(result.cleaned_directories, temp.sub(".claude")));
}

TEST_CASE("cleanup after a real install") {
    TempTestDir temp;
    std::string target = temp.sub("target");
    install_into(temp.sub("source"), target);

    auto r = Cleaner().remove_installation(target);
    REQUIRE(r.isOk());
    const auto& result = r.value();
    CHECK(result.success);

    // Settings held only framework hooks: removed, with a backup left behind
    CHECK(result.cleaned_settings);
    CHECK(contains(result.preserved_files, "settings.json removed (was empty after cleanup)"));
    CHECK_FALSE(path_exists(settings_path(target)));
    CHECK(scb_test::count_prefixed(target + "/.claude", kSettingsBackupPrefix) == 1);

    // The Codex config belongs to the user once written
    CHECK(is_regular_file(target + "/.codex/config.toml"));
    CHECK(contains(result.preserved_files, target + "/.codex/config.toml"));

    CHECK_FALSE(path_exists(target + "/.strategic-claude-basic"));
}

TEST_CASE("cleanup keeps user hooks in settings") {
    TempTestDir temp;
    std::string target = temp.sub("target");
    write_file(target + "/.claude/settings.json", R"({
  "hooks": {"Stop": [{"matcher": "", "hooks": [{"type": "command", "command": "echo bye"}]}]}
})");
    install_into(temp.sub("source"), target);

    auto r = Cleaner().remove_installation(target);
    REQUIRE(r.isOk());
    CHECK(contains(r.value().preserved_files, "settings.json (cleaned of strategic hooks)"));

    std::string content = read_text(settings_path(target));
    CHECK(content.find("echo bye") != std::string::npos);
    CHECK(content.find("strategic/") == std::string::npos);
}

TEST_CASE("cleanup preserves foreign symlinks and user files") {
    TempTestDir temp;
    make_linked_installation(temp.path);

    fs::remove(temp.sub(".claude/agents/strategic"));
    fs::create_symlink("/opt/team-agents", temp.sub(".claude/agents/strategic"));
    fs::remove(temp.sub(".codex/hooks/strategic"));
    write_file(temp.sub(".codex/hooks/strategic"), "my own hook list");
    write_file(temp.sub(".claude/commands/review.md"), "# review\n");

    auto r = Cleaner().remove_installation(temp.path);
    REQUIRE(r.isOk());
    const auto& result = r.value();
    CHECK(result.success);
    CHECK(result.removed_symlinks.size() == 3);

    CHECK(is_symlink(temp.sub(".claude/agents/strategic")));
    CHECK(read_symlink(temp.sub(".claude/agents/strategic")).value() == "/opt/team-agents");
    CHECK(is_regular_file(temp.sub(".codex/hooks/strategic")));
    CHECK(is_regular_file(temp.sub(".claude/commands/review.md")));

    CHECK(contains(result.warnings, "Preserving non-Strategic Claude symlink: " +
                                        temp.sub(".claude/agents/strategic") + " -> /opt/team-agents"));
    CHECK(contains(result.warnings, "Preserving non-symlink file: " + temp.sub(".codex/hooks/strategic")));
    CHECK(contains(result.preserved_files, temp.sub(".claude/commands/review.md")));

    // Only the empty subdirectory was pruned
    CHECK(contains(result.cleaned_directories, temp.sub(".claude/hooks")));
    CHECK(is_directory(temp.sub(".claude")));
}

TEST_CASE("partial installation cleanup removes broken links only") {
    TempTestDir temp;
    make_linked_installation(temp.path);
    fs::remove_all(temp.sub(".strategic-claude-basic/core/agents"));
    fs::remove(temp.sub(".claude/hooks/strategic"));
    write_file(temp.sub(".claude/hooks/strategic"), "user file");

    auto r = Cleaner().handle_partial_installation(temp.path);
    REQUIRE(r.isOk());
    const auto& result = r.value();
    CHECK(result.success);
    CHECK(contains(result.warnings, "Handling partial installation cleanup"));

    CHECK(contains(result.removed_symlinks, ".claude/agents/strategic"));
    CHECK_FALSE(path_exists_no_follow(temp.sub(".claude/agents/strategic")));
    CHECK(contains(result.preserved_files, temp.sub(".claude/hooks/strategic")));
    CHECK(is_regular_file(temp.sub(".claude/hooks/strategic")));

    CHECK(result.removed_directory);
    CHECK_FALSE(path_exists(temp.sub(".strategic-claude-basic")));
}

TEST_CASE("leftover framework state is reported as warnings") {
    TempTestDir temp;
    make_linked_installation(temp.path);

    CleanupResult result;
    Cleaner().validate_cleanup(temp.path, result);

    CHECK(result.errors.empty());
    CHECK(contains(result.warnings, "Strategic Claude directory still exists after cleanup"));
    CHECK(contains(result.warnings,
                   "Strategic Claude symlink still exists: " + temp.sub(".claude/agents/strategic")));
    CHECK(contains(result.warnings,
                   "Strategic Claude symlink still exists: " + temp.sub(".codex/prompts/strategic")));
    CHECK(result.warnings.size() == 6);

    SUBCASE("a clean target adds nothing") {
        CleanupResult after;
        REQUIRE(Cleaner().remove_installation(temp.path).isOk());
        Cleaner().validate_cleanup(temp.path, after);
        CHECK(after.warnings.empty());
        CHECK(after.errors.empty());
    }
}

// Root ignores directory permissions, so the failure cannot be provoked there.
TEST_CASE("cleanup fails when the framework directory cannot be removed" * doctest::skip(::geteuid() == 0)) {
    TempTestDir temp;
    make_linked_installation(temp.path);

    std::string locked = temp.sub(".strategic-claude-basic/core");
    fs::permissions(locked, fs::perms::owner_write, fs::perm_options::remove);
    auto r = Cleaner().remove_installation(temp.path);
    fs::permissions(locked, fs::perms::owner_write, fs::perm_options::add);

    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::PERMISSION_DENIED);
    CHECK(r.error().message().rfind("remove Strategic Claude directory: ", 0) == 0);
    CHECK(is_directory(temp.sub(".strategic-claude-basic")));
}
