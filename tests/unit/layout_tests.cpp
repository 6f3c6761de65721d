/**
 * Unit tests for the fixed installation layout
 */

#include <scb/layout.hpp>
#include <doctest/doctest.h>

#include <algorithm>

using namespace scb;

TEST_CASE("framework and user directory sets are disjoint") {
    for (const auto& dir : framework_directories()) {
        const auto& user = user_preserved_directories();
        CHECK(std::find(user.begin(), user.end(), dir) == user.end());
    }
    CHECK(user_preserved_directories().size() == 9);
}

TEST_CASE("integration layouts") {
    const auto& layouts = integration_layouts();
    REQUIRE(layouts.size() == 2);
    CHECK(layouts[0].dir == ".claude");
    CHECK(layouts[1].dir == ".codex");

    SUBCASE("claude symlinks point into core") {
        const auto& claude = claude_layout();
        REQUIRE(claude.symlinks.size() == 3);
        CHECK(claude.symlinks[0].name == "agents/strategic");
        CHECK(claude.symlinks[0].target == "../../.strategic-claude-basic/core/agents");
        CHECK(claude.symlinks[2].target == "../../.strategic-claude-basic/core/hooks");
    }

    SUBCASE("codex prompts reuse the command set") {
        const auto& codex = codex_layout();
        REQUIRE(codex.symlinks.size() == 2);
        CHECK(codex.symlinks[0].name == "prompts/strategic");
        CHECK(codex.symlinks[0].target == "../../.strategic-claude-basic/core/commands");
    }
}

TEST_CASE("known symlink targets are unique") {
    auto targets = known_symlink_targets();
    CHECK(targets.size() == 3);
    auto sorted = targets;
    std::sort(sorted.begin(), sorted.end());
    CHECK(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end());
}
