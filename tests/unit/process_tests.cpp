/**
 * Unit tests for process execution
 */

#include <scb/process.hpp>
#include <doctest/doctest.h>
#include "test_helpers.hpp"

using namespace scb;
using scb_test::TempTestDir;

TEST_CASE("run_process") {
    SUBCASE("exit status is reported") {
        auto ok = run_process({"sh", "-c", "exit 0"});
        CHECK(ok.ok);
        CHECK(ok.exit_code == 0);

        auto failed = run_process({"sh", "-c", "exit 3"});
        CHECK(failed.ok);
        CHECK(failed.exit_code == 3);
    }

    SUBCASE("output is captured") {
        ProcessOptions opts;
        opts.capture_output = true;
        auto r = run_process({"sh", "-c", "echo out; echo err 1>&2"}, opts);
        CHECK(r.exit_code == 0);
        CHECK(r.output.find("out") != std::string::npos);
        CHECK(r.output.find("err") != std::string::npos);
    }

    SUBCASE("working directory") {
        TempTestDir temp;
        ProcessOptions opts;
        opts.cwd = temp.path;
        auto r = run_process({"sh", "-c", "touch created"}, opts);
        CHECK(r.exit_code == 0);
        CHECK(is_regular_file(temp.sub("created")));
    }

    SUBCASE("timeout kills the child") {
        ProcessOptions opts;
        opts.timeout_seconds = 1;
        auto r = run_process({"sh", "-c", "sleep 10"}, opts);
        CHECK_FALSE(r.ok);
        CHECK(r.timed_out);
    }

    SUBCASE("missing executable exits 127") {
        auto r = run_process({"scb-definitely-not-a-command"});
        CHECK(r.ok);
        CHECK(r.exit_code == 127);
    }

    SUBCASE("empty argv") {
        auto r = run_process({});
        CHECK_FALSE(r.ok);
    }
}

TEST_CASE("find_executable") {
    CHECK(find_executable("sh").has_value());
    CHECK_FALSE(find_executable("scb-definitely-not-a-command").has_value());
}
