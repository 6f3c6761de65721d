/**
 * Unit tests for the error taxonomy and Result type
 */

#include <scb/error.hpp>
#include <doctest/doctest.h>

#include <string>
#include <system_error>

using namespace scb;

TEST_CASE("Result carries a value or an error") {
    SUBCASE("ok") {
        auto r = Result<int>::ok(42);
        CHECK(r.isOk());
        CHECK_FALSE(r.isErr());
        CHECK(r.value() == 42);
        CHECK(r.valueOr(7) == 42);
    }

    SUBCASE("err") {
        auto r = Result<int>::err(Error(ErrorCode::NOT_FOUND, "missing"));
        CHECK(r.isErr());
        CHECK(r.error().code() == ErrorCode::NOT_FOUND);
        CHECK(r.valueOr(7) == 7);
    }

    SUBCASE("map and flatMap") {
        auto r = Result<int>::ok(2).map([](int v) { return std::to_string(v * 2); });
        REQUIRE(r.isOk());
        CHECK(r.value() == "4");

        auto failed = Result<int>::err(Error(ErrorCode::IO_ERROR, "x"))
                          .flatMap([](int v) { return Result<int>::ok(v + 1); });
        CHECK(failed.isErr());
        CHECK(failed.error().code() == ErrorCode::IO_ERROR);
    }

    SUBCASE("void result") {
        CHECK(VoidResult::ok().isOk());
        auto e = VoidResult::err(Error(ErrorCode::IO_ERROR, "boom"));
        CHECK(e.isErr());
        CHECK(e.error().message() == "boom");
    }
}

TEST_CASE("Error context is prefixed") {
    Error e(ErrorCode::IO_ERROR, "/tmp/x: no space");
    e.withContext("copy framework").withContext("install");
    CHECK(e.message() == "install: copy framework: /tmp/x: no space");
    CHECK(e.toString() == e.message());
}

TEST_CASE("filesystem error codes map onto the taxonomy") {
    CHECK(error_from_errc(std::make_error_code(std::errc::permission_denied), "/p").code() ==
          ErrorCode::PERMISSION_DENIED);
    CHECK(error_from_errc(std::make_error_code(std::errc::operation_not_permitted), "/p").code() ==
          ErrorCode::PERMISSION_DENIED);
    CHECK(error_from_errc(std::make_error_code(std::errc::no_such_file_or_directory), "/p").code() ==
          ErrorCode::NOT_FOUND);
    CHECK(error_from_errc(std::make_error_code(std::errc::file_exists), "/p").code() ==
          ErrorCode::ALREADY_EXISTS);
    CHECK(error_from_errc(std::make_error_code(std::errc::no_space_on_device), "/p").code() ==
          ErrorCode::IO_ERROR);

    auto e = error_from_errc(std::make_error_code(std::errc::permission_denied), "/some/path");
    CHECK(e.message().rfind("/some/path: ", 0) == 0);
}

TEST_CASE("exit codes") {
    auto code = [](ErrorCode c) { return exit_code_for(Error(c, "")); };
    CHECK(code(ErrorCode::VALIDATION_FAILED) == 2);
    CHECK(code(ErrorCode::INVALID_PATH) == 2);
    CHECK(code(ErrorCode::PERMISSION_DENIED) == 3);
    CHECK(code(ErrorCode::SOURCE_TRANSPORT) == 4);
    CHECK(code(ErrorCode::SOURCE_NOT_FOUND) == 4);
    CHECK(code(ErrorCode::REVISION_NOT_FOUND) == 4);
    CHECK(code(ErrorCode::USER_CANCELLED) == 5);
    CHECK(code(ErrorCode::INSTALLATION_FAILED) == 6);
    CHECK(code(ErrorCode::BACKUP_FAILED) == 6);
    CHECK(code(ErrorCode::NOT_INSTALLED) == 8);
    CHECK(code(ErrorCode::IO_ERROR) == 1);
}

TEST_CASE("user messages add guidance") {
    Error denied(ErrorCode::PERMISSION_DENIED, "/x: Permission denied");
    std::string msg = user_message(denied);
    CHECK(msg.rfind("/x: Permission denied", 0) == 0);
    CHECK(msg.find("check that you own") != std::string::npos);

    Error io(ErrorCode::IO_ERROR, "plain");
    CHECK(user_message(io) == "plain");
    CHECK(std::string(error_code_name(ErrorCode::SCRIPT_FAILED)) == "script_failed");
}
