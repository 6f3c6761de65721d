#include <doctest/doctest.h>
#include <scb/settings.hpp>
#include "test_helpers.hpp"

using namespace scb;
using scb_test::kHookPrefix;

namespace {

SettingsDocument parse_ok(const std::string& json) {
    auto r = parse_settings(json);
    REQUIRE(r.isOk());
    return r.value();
}

SettingsDocument framework_template() {
    return parse_ok(scb_test::framework_settings_template());
}

} // namespace

TEST_CASE("merge into nothing takes template hooks only") {
    auto policy = HookPolicy::framework_default();
    auto merged = merge_settings(framework_template(), std::nullopt, policy);

    REQUIRE(merged.hooks.has_value());
    REQUIRE(merged.hooks->pre_tool_use.size() == 1);
    CHECK(merged.hooks->pre_tool_use[0].hooks[0].command ==
          std::string(kHookPrefix) + "block-skip-hooks.py");
    CHECK(merged.hooks->notification.size() == 1);

    // Template permissions are never applied
    CHECK_FALSE(merged.permissions.has_value());
}

TEST_CASE("merge keeps user permissions and keys") {
    auto policy = HookPolicy::framework_default();
    auto existing = parse_ok(R"({
        "permissions": {"allow": ["Read(*)"]},
        "model": "opus"
    })");

    auto merged = merge_settings(framework_template(), existing, policy);
    REQUIRE(merged.permissions.has_value());
    CHECK(merged.permissions->allow == std::vector<std::string>{"Read(*)"});
    CHECK(merged.extra["model"] == "opus");

    auto out = serialize_settings(merged);
    CHECK(out.find("rm -rf") == std::string::npos);
}

TEST_CASE("merge appends user hooks before template hooks") {
    auto policy = HookPolicy::framework_default();
    auto existing = parse_ok(R"({
        "hooks": {
            "PreToolUse": [
                {"matcher": "Bash", "hooks": [{"type": "command", "command": "echo mine"}]},
                {"matcher": "Edit", "hooks": [{"type": "command", "command": "echo edit"}]}
            ]
        }
    })");

    auto merged = merge_settings(framework_template(), existing, policy);
    const auto& pre = merged.hooks->pre_tool_use;
    REQUIRE(pre.size() == 2);
    CHECK(pre[0].matcher == "Bash");
    REQUIRE(pre[0].hooks.size() == 2);
    CHECK(pre[0].hooks[0].command == "echo mine");
    CHECK(pre[0].hooks[1].command == std::string(kHookPrefix) + "block-skip-hooks.py");
    CHECK(pre[1].matcher == "Edit");
}

TEST_CASE("merge collapses framework hooks installed under another path") {
    auto policy = HookPolicy::framework_default();
    auto existing = parse_ok(R"({
        "hooks": {
            "PreToolUse": [
                {"matcher": "Bash", "hooks": [
                    {"type": "command", "command": "python3 /old/place/block-skip-hooks.py", "timeout": 10}
                ]}
            ]
        }
    })");

    auto merged = merge_settings(framework_template(), existing, policy);
    const auto& hooks = merged.hooks->pre_tool_use[0].hooks;
    REQUIRE(hooks.size() == 1);
    CHECK(hooks[0].command == std::string(kHookPrefix) + "block-skip-hooks.py");
    CHECK(hooks[0].extra["timeout"] == 10);
}

TEST_CASE("merge is idempotent") {
    auto policy = HookPolicy::framework_default();
    auto once = merge_settings(framework_template(), std::nullopt, policy);
    auto twice = merge_settings(framework_template(), once, policy);
    CHECK(serialize_settings(once) == serialize_settings(twice));
    CHECK(twice.hooks->entry_count() == 2);
}

TEST_CASE("merge keeps duplicate user commands under different matchers") {
    auto policy = HookPolicy::framework_default();
    auto existing = parse_ok(R"({
        "hooks": {
            "Stop": [
                {"matcher": "", "hooks": [{"type": "command", "command": "echo done"}]},
                {"matcher": "x", "hooks": [{"type": "command", "command": "echo done"}]}
            ]
        }
    })");

    auto merged = merge_settings(framework_template(), existing, policy);
    CHECK(merged.hooks->stop.size() == 2);
}

TEST_CASE("strip framework hooks") {
    auto policy = HookPolicy::framework_default();

    SUBCASE("framework only document becomes empty") {
        auto stripped = strip_framework_hooks(framework_template(), policy);
        CHECK(stripped.hooks->entry_count() == 0);
        CHECK(stripped.hooks->pre_tool_use.empty());
    }

    SUBCASE("user hooks remain") {
        auto doc = parse_ok(R"({
            "hooks": {
                "PreToolUse": [
                    {"matcher": "Bash", "hooks": [
                        {"type": "command", "command": "echo mine"},
                        {"type": "command", "command": "python3 x/block-skip-hooks.py"}
                    ]}
                ]
            }
        })");
        auto stripped = strip_framework_hooks(doc, policy);
        REQUIRE(stripped.hooks->pre_tool_use.size() == 1);
        REQUIRE(stripped.hooks->pre_tool_use[0].hooks.size() == 1);
        CHECK(stripped.hooks->pre_tool_use[0].hooks[0].command == "echo mine");
        CHECK_FALSE(stripped.is_empty());
    }
}

TEST_CASE("merge keeps custom hooks of other types next to framework hooks") {
    auto policy = HookPolicy::framework_default();
    auto existing = parse_ok(R"({
        "permissions": {"allow": ["X"]},
        "hooks": {
            "PostToolUse": [
                {"matcher": "Write", "hooks": [{"type": "command", "command": "make lint"}]}
            ]
        }
    })");

    auto merged = merge_settings(framework_template(), existing, policy);
    CHECK(merged.permissions->allow == std::vector<std::string>{"X"});

    REQUIRE(merged.hooks->post_tool_use.size() == 1);
    CHECK(merged.hooks->post_tool_use[0].hooks[0].command == "make lint");

    REQUIRE(merged.hooks->pre_tool_use.size() == 1);
    CHECK(merged.hooks->pre_tool_use[0].hooks[0].command ==
          std::string(kHookPrefix) + "block-skip-hooks.py");
}

TEST_CASE("merge keeps every user entry that shares a command") {
    auto policy = HookPolicy::framework_default();
    auto existing = parse_ok(R"({
        "hooks": {
            "PostToolUse": [
                {"matcher": "Bash", "hooks": [
                    {"type": "command", "command": "npm test", "timeout": 30},
                    {"type": "command", "command": "npm test", "timeout": 600}
                ]},
                {"matcher": "Bash", "hooks": [
                    {"type": "command", "command": "npm test"}
                ]}
            ]
        }
    })");

    auto merged = merge_settings(framework_template(), existing, policy);
    const auto& post = merged.hooks->post_tool_use;
    REQUIRE(post.size() == 1);
    REQUIRE(post[0].hooks.size() == 3);
    CHECK(post[0].hooks[0].extra["timeout"] == 30);
    CHECK(post[0].hooks[1].extra["timeout"] == 600);
    CHECK(post[0].hooks[2].extra.empty());

    auto out = serialize_settings(merged);
    CHECK(out.find("600") != std::string::npos);

    // Merging again changes nothing
    auto again = merge_settings(framework_template(), merged, policy);
    CHECK(serialize_settings(again) == out);
}
