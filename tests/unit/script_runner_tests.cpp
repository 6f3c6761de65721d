#include <doctest/doctest.h>
#include <scb/layout.hpp>
#include <scb/platform.hpp>
#include <scb/script_runner.hpp>
#include "test_helpers.hpp"

using namespace scb;
using scb_test::TempTestDir;
using scb_test::read_text;
using scb_test::write_file;

TEST_CASE("bash script runner") {
    TempTestDir temp;
    std::string scripts = temp.sub("source");
    std::string target = temp.sub("target");
    write_file(target + "/keep", "");
    BashScriptRunner runner;

    SUBCASE("missing script is not an error") {
        CHECK_FALSE(runner.exists(scripts, kPreInstallScript));
        CHECK(runner.run(scripts, kPreInstallScript, target).isOk());
    }

    SUBCASE("script runs inside the target directory") {
        write_file(scripts + "/pre-install.sh", "pwd > ran-here.txt\n");
        CHECK(runner.exists(scripts, kPreInstallScript));
        REQUIRE(runner.run(scripts, kPreInstallScript, target).isOk());

        CHECK(read_text(target + "/ran-here.txt").find("target") != std::string::npos);
        // The staged copy is gone
        CHECK_FALSE(path_exists(target + "/pre-install.sh"));
    }

    SUBCASE("non-zero exit is reported") {
        write_file(scripts + "/post-install.sh", "exit 4\n");
        auto r = runner.run(scripts, kPostInstallScript, target);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::SCRIPT_FAILED);
        CHECK(r.error().message() == "post-install.sh exited with status 4");
    }

    SUBCASE("a project file with the script's name is left alone") {
        write_file(target + "/pre-install.sh", "project file\n");
        write_file(scripts + "/pre-install.sh", "true\n");
        REQUIRE(runner.run(scripts, kPreInstallScript, target).isOk());
        CHECK(read_text(target + "/pre-install.sh") == "project file\n");
        CHECK_FALSE(path_exists(target + "/pre-install-1.sh"));
    }
}
