#include <doctest/doctest.h>
#include <scb/template_registry.hpp>

using namespace scb;

TEST_CASE("registry lookup") {
    auto main = registry::lookup("main");
    REQUIRE(main.isOk());
    CHECK(main.value().branch == "main");
    CHECK(main.value().is_valid());
    CHECK(main.value().repo_url == kTemplateRepoUrl);

    auto ccr = registry::lookup("ccr");
    REQUIRE(ccr.isOk());
    CHECK(ccr.value().branch == "ccr-template");

    auto missing = registry::lookup("nope");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::VALIDATION_FAILED);
    CHECK(missing.error().message().find("available: ccr, main") != std::string::npos);
}

TEST_CASE("default template is registered") {
    CHECK(registry::exists(kDefaultTemplateId));
}

TEST_CASE("registry listing is sorted by id") {
    auto ids = registry::template_ids();
    REQUIRE(ids.size() == 2);
    CHECK(ids[0] == "ccr");
    CHECK(ids[1] == "main");

    auto all = registry::list_all();
    for (const auto& t : all) {
        CHECK(t.is_valid());
    }
    CHECK(registry::list_active().size() == all.size());
}

TEST_CASE("tag filter is case-insensitive") {
    auto workflow = registry::filter_by_tag("WORKFLOW");
    REQUIRE(workflow.size() == 1);
    CHECK(workflow[0].id == "ccr");

    CHECK(registry::filter_by_tag("unknown").empty());
    CHECK(registry::filter_by_language("go").empty());
}

TEST_CASE("commit hash validation") {
    CHECK(is_valid_commit_hash("9080f5291629718f1aa01824750479a263bc2360"));
    CHECK_FALSE(is_valid_commit_hash("9080f52"));
    CHECK_FALSE(is_valid_commit_hash("zz80f5291629718f1aa01824750479a263bc2360"));

    Template t;
    t.id = "x";
    t.name = "X";
    t.repo_url = "https://example.invalid/x.git";
    t.branch = "main";
    t.commit = "abc";
    CHECK_FALSE(t.is_valid());

    t.deprecated = true;
    CHECK(t.display_name() == "X (deprecated)");
}
