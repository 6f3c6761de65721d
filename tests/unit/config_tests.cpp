#include <doctest/doctest.h>
#include <scb/config.hpp>

using namespace scb;

namespace {

InstallConfig base_config() {
    InstallConfig config;
    config.target_dir = "/work/project";
    return config;
}

std::string validation_message(const InstallConfig& config) {
    auto r = config.validate();
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::VALIDATION_FAILED);
    return r.error().message();
}

} // namespace

TEST_CASE("install config defaults are valid") {
    auto config = base_config();
    CHECK(config.template_id == "main");
    CHECK(config.ignore_mode == IgnoreMode::Track);
    CHECK(config.validate().isOk());
}

TEST_CASE("install config validation") {
    SUBCASE("empty target") {
        InstallConfig config;
        CHECK(validation_message(config) == "target directory cannot be empty");
    }

    SUBCASE("force and force-core") {
        auto config = base_config();
        config.force = true;
        config.force_core = true;
        CHECK(validation_message(config) == "cannot specify both --force and --force-core");
    }

    SUBCASE("no-backup and backup-dir") {
        auto config = base_config();
        config.no_backup = true;
        config.backup_dir = "/backups";
        CHECK(validation_message(config) == "cannot specify both --no-backup and --backup-dir");
    }

    SUBCASE("timeout") {
        auto config = base_config();
        config.git_timeout_seconds = 0;
        CHECK(validation_message(config) == "git timeout must be positive");
    }

    SUBCASE("unknown template") {
        auto config = base_config();
        config.template_id = "nope";
        CHECK(validation_message(config).rfind("unknown template 'nope'", 0) == 0);
    }
}

TEST_CASE("install config absolute paths") {
    InstallConfig config;
    config.target_dir = "relative/dir";
    config.backup_dir = "/abs/./backups";

    auto abs = config.with_absolute_paths();
    CHECK(abs.target_dir.front() == '/');
    CHECK(abs.target_dir.find("relative/dir") != std::string::npos);
    CHECK(abs.backup_dir == "/abs/backups");
    CHECK(config.target_dir == "relative/dir");
}

TEST_CASE("clean config validation") {
    CleanConfig config;
    CHECK(config.validate().isErr());
    config.target_dir = ".";
    CHECK(config.validate().isOk());
}

TEST_CASE("ignore modes") {
    CHECK(parse_ignore_mode("track") == IgnoreMode::Track);
    CHECK(parse_ignore_mode("all") == IgnoreMode::All);
    CHECK(parse_ignore_mode("non-user") == IgnoreMode::NonUser);
    CHECK_FALSE(parse_ignore_mode("ALL").has_value());
    CHECK_FALSE(parse_ignore_mode("").has_value());
    CHECK(std::string(ignore_mode_name(IgnoreMode::NonUser)) == "non-user");
}
