#include <doctest/doctest.h>
#include <scb/layout.hpp>
#include <scb/platform.hpp>
#include <scb/source_provider.hpp>
#include "test_helpers.hpp"

#include <utility>

using namespace scb;
using scb_test::TempTestDir;
using scb_test::write_file;

TEST_CASE("owned fetched source is removed with its handle") {
    auto dir = make_scratch_directory(kScratchDirPrefix);
    REQUIRE(dir.isOk());
    write_file(dir.value() + "/.strategic-claude-basic/core/x", "x");

    {
        FetchedSource source(dir.value(), true);
        CHECK(source.owned());
        CHECK(source.framework_root() == dir.value() + "/.strategic-claude-basic");
    }
    CHECK_FALSE(path_exists(dir.value()));
}

TEST_CASE("moved-from fetched source does not remove the tree") {
    auto dir = make_scratch_directory(kScratchDirPrefix);
    REQUIRE(dir.isOk());

    FetchedSource first(dir.value(), true);
    {
        FetchedSource second(std::move(first));
        CHECK(second.root() == dir.value());
        second.release();
        CHECK_FALSE(path_exists(dir.value()));
        // Releasing twice is harmless
        second.release();
    }
}

TEST_CASE("borrowed fetched source is never touched") {
    TempTestDir temp;
    {
        FetchedSource source(temp.path, false);
        source.release();
    }
    CHECK(is_directory(temp.path));
}

TEST_CASE("local source provider") {
    TempTestDir temp;
    auto tmpl = registry::lookup(kDefaultTemplateId).value();

    LocalSourceProvider present(temp.path);
    auto ok = present.fetch(tmpl);
    REQUIRE(ok.isOk());
    CHECK_FALSE(ok.value().owned());
    CHECK(ok.value().root() == absolute_path(temp.path));

    LocalSourceProvider missing(temp.sub("absent"));
    auto err = missing.fetch(tmpl);
    REQUIRE(err.isErr());
    CHECK(err.error().code() == ErrorCode::SOURCE_NOT_FOUND);
}
