#include "scb/error.hpp"

namespace scb {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_FAILED: return "validation_failed";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::ALREADY_EXISTS: return "already_exists";
        case ErrorCode::INVALID_PATH: return "invalid_path";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::SYMLINK_INVALID: return "symlink_invalid";
        case ErrorCode::SYMLINK_CREATION_FAILED: return "symlink_creation_failed";
        case ErrorCode::INSTALLATION_FAILED: return "installation_failed";
        case ErrorCode::BACKUP_FAILED: return "backup_failed";
        case ErrorCode::NOT_INSTALLED: return "not_installed";
        case ErrorCode::USER_CANCELLED: return "user_cancelled";
        case ErrorCode::SOURCE_NOT_FOUND: return "source_not_found";
        case ErrorCode::SOURCE_TRANSPORT: return "source_transport";
        case ErrorCode::REVISION_NOT_FOUND: return "revision_not_found";
        case ErrorCode::SCRIPT_FAILED: return "script_failed";
    }
    return "unknown";
}

Error error_from_errc(const std::error_code& ec, const std::string& path) {
    ErrorCode code = ErrorCode::IO_ERROR;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PERMISSION_DENIED;
    } else if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::NOT_FOUND;
    } else if (ec == std::errc::file_exists) {
        code = ErrorCode::ALREADY_EXISTS;
    }
    return Error(code, path + ": " + ec.message());
}

std::string user_message(const Error& error) {
    std::string hint;
    switch (error.code()) {
        case ErrorCode::PERMISSION_DENIED:
            hint = "check that you own the target directory and can write to it";
            break;
        case ErrorCode::ALREADY_EXISTS:
            hint = "a file is in the way; move it aside and retry";
            break;
        case ErrorCode::VALIDATION_FAILED:
            hint = "run with --help to see valid option combinations";
            break;
        case ErrorCode::SOURCE_NOT_FOUND:
            hint = "make sure git is installed and on PATH";
            break;
        case ErrorCode::SOURCE_TRANSPORT:
            hint = "check your network connection and retry";
            break;
        case ErrorCode::REVISION_NOT_FOUND:
            hint = "the pinned template revision is unavailable upstream";
            break;
        case ErrorCode::NOT_INSTALLED:
            hint = "run 'scb init' first";
            break;
        case ErrorCode::INSTALLATION_FAILED:
            hint = "run 'scb status' to inspect the target, then 'scb init --force' to repair";
            break;
        default:
            break;
    }
    if (hint.empty()) return error.message();
    return error.message() + " (" + hint + ")";
}

int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::VALIDATION_FAILED:
        case ErrorCode::INVALID_PATH:
            return 2;
        case ErrorCode::PERMISSION_DENIED:
            return 3;
        case ErrorCode::SOURCE_NOT_FOUND:
        case ErrorCode::SOURCE_TRANSPORT:
        case ErrorCode::REVISION_NOT_FOUND:
            return 4;
        case ErrorCode::USER_CANCELLED:
            return 5;
        case ErrorCode::INSTALLATION_FAILED:
        case ErrorCode::BACKUP_FAILED:
        case ErrorCode::SCRIPT_FAILED:
        case ErrorCode::SYMLINK_CREATION_FAILED:
            return 6;
        case ErrorCode::NOT_INSTALLED:
            return 8;
        default:
            return 1;
    }
}

} // namespace scb
