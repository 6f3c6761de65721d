#include <doctest/doctest.h>
#include <scb/ignore_policy.hpp>
#include <scb/platform.hpp>
#include "test_helpers.hpp"

using namespace scb;
using scb_test::TempTestDir;
using scb_test::make_framework_tree;
using scb_test::read_text;
using scb_test::write_file;

TEST_CASE("merge ignore lines") {
    auto merged = merge_ignore_lines({"node_modules/", "", "agents/strategic", "# Strategic Claude Basic entries"},
                                     {"agents/strategic", "  ", "hooks/strategic"});
    REQUIRE(merged.size() == 4);
    CHECK(merged[0] == kIgnoreHeader);
    CHECK(merged[1] == "node_modules/");
    CHECK(merged[2] == "agents/strategic");
    CHECK(merged[3] == "hooks/strategic");

    // Merging the result again changes nothing
    CHECK(merge_ignore_lines(merged, {"hooks/strategic"}) == merged);
}

TEST_CASE("track mode writes nothing") {
    TempTestDir temp;
    make_framework_tree(temp.path);

    auto r = apply_ignore_policy(temp.path, temp.path, IgnoreMode::Track);
    REQUIRE(r.isOk());
    CHECK(r.value().applied.empty());
    CHECK_FALSE(path_exists(temp.sub(".claude/.gitignore")));
}

TEST_CASE("all mode ignores the whole framework directory") {
    TempTestDir temp;
    make_framework_tree(temp.path);

    auto r = apply_ignore_policy(temp.path, temp.path, IgnoreMode::All);
    REQUIRE(r.isOk());
    REQUIRE(r.value().applied.size() == 2);
    CHECK(r.value().applied[0] == ".claude/.gitignore");
    CHECK(read_text(temp.sub(".strategic-claude-basic/.gitignore")) ==
          std::string(kIgnoreHeader) + "\n*\n");
}

TEST_CASE("non-user mode keeps existing entries and backs them up") {
    TempTestDir temp;
    make_framework_tree(temp.path);
    write_file(temp.sub(".claude/.gitignore"), "local.json\n");

    auto r = apply_ignore_policy(temp.path, temp.path, IgnoreMode::NonUser);
    REQUIRE(r.isOk());
    CHECK(r.value().warnings.empty());

    CHECK(read_text(temp.sub(".claude/.gitignore.backup")) == "local.json\n");
    CHECK(read_text(temp.sub(".claude/.gitignore")) ==
          std::string(kIgnoreHeader) + "\nlocal.json\nagents/strategic\ncommands/strategic\nhooks/strategic\n");
    CHECK(read_text(temp.sub(".strategic-claude-basic/.gitignore")) ==
          std::string(kIgnoreHeader) + "\ncore/\nguides/\ntemplates/\n");

    // Second run is a no-op
    auto again = apply_ignore_policy(temp.path, temp.path, IgnoreMode::NonUser);
    REQUIRE(again.isOk());
    CHECK(again.value().applied.empty());
}

TEST_CASE("missing ignore template is a warning") {
    TempTestDir temp;
    auto r = apply_ignore_policy(temp.path, temp.path, IgnoreMode::All);
    REQUIRE(r.isOk());
    CHECK(r.value().applied.empty());
    REQUIRE(r.value().warnings.size() == 2);
    CHECK(r.value().warnings[0] ==
          "Ignore template dot_claude-strategic-ignore.template not found, skipping");
}
