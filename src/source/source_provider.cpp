#include "scb/source_provider.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"
#include "scb/process.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <thread>

namespace scb {

namespace fs = std::filesystem;

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// Last non-empty line of captured git output, for error messages.
std::string last_line(const std::string& output) {
    size_t end = output.find_last_not_of("\r\n");
    if (end == std::string::npos) return "";
    size_t start = output.find_last_of('\n', end);
    start = start == std::string::npos ? 0 : start + 1;
    return output.substr(start, end - start + 1);
}

void clear_directory(const std::string& dir) {
    std::error_code ec;
    for (const auto& name : list_directory(dir)) {
        fs::remove_all(join_path(dir, name), ec);
        if (ec) spdlog::warn("could not clear {}/{}: {}", dir, name, ec.message());
    }
}

} // namespace

// ============================================================================
// FetchedSource
// ============================================================================

FetchedSource::FetchedSource(std::string root, bool owned)
    : root_(std::move(root)), owned_(owned) {}

FetchedSource::~FetchedSource() {
    release();
}

FetchedSource::FetchedSource(FetchedSource&& other) noexcept
    : root_(std::move(other.root_)), owned_(other.owned_) {
    other.owned_ = false;
    other.root_.clear();
}

FetchedSource& FetchedSource::operator=(FetchedSource&& other) noexcept {
    if (this != &other) {
        release();
        root_ = std::move(other.root_);
        owned_ = other.owned_;
        other.owned_ = false;
        other.root_.clear();
    }
    return *this;
}

std::string FetchedSource::framework_root() const {
    return join_path(root_, kFrameworkDir);
}

void FetchedSource::release() {
    if (!owned_ || root_.empty()) return;
    owned_ = false;

    if (get_filename(root_).rfind(kScratchDirPrefix, 0) != 0) {
        spdlog::warn("not removing {}: not a scratch directory", root_);
        return;
    }

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        spdlog::warn("failed to remove scratch directory {}: {}", root_, ec.message());
    } else {
        spdlog::debug("removed scratch directory {}", root_);
    }
}

// ============================================================================
// GitSourceProvider
// ============================================================================

GitSourceProvider::GitSourceProvider(int timeout_seconds, int max_attempts)
    : timeout_seconds_(timeout_seconds), max_attempts_(max_attempts < 1 ? 1 : max_attempts) {}

Result<FetchedSource> GitSourceProvider::fetch(const Template& tmpl) {
    using R = Result<FetchedSource>;

    if (!find_executable("git")) {
        return R::err(Error(ErrorCode::SOURCE_NOT_FOUND, "git is not installed or not on PATH"));
    }

    auto scratch = make_scratch_directory(kScratchDirPrefix);
    if (scratch.isErr()) return R::err(scratch.error().withContext("create scratch directory"));
    FetchedSource source(scratch.value(), true);

    ProcessOptions opts;
    opts.timeout_seconds = timeout_seconds_;
    opts.capture_output = true;

    Error last_error(ErrorCode::SOURCE_TRANSPORT, "clone not attempted");
    bool cloned = false;

    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        spdlog::info("cloning {} (branch {}), attempt {}/{}", tmpl.repo_url, tmpl.branch, attempt,
                     max_attempts_);
        auto result = run_process({"git", "clone", "--quiet", "-b", tmpl.branch, tmpl.repo_url,
                                   source.root()}, opts);

        if (result.ok && result.exit_code == 0) {
            cloned = true;
            break;
        }

        std::string detail = result.timed_out ? result.error
                           : !result.ok      ? result.error
                                             : last_line(result.output);

        if (result.ok && (contains(result.output, "Repository not found") ||
                          contains(result.output, "does not appear to be a git repository"))) {
            return R::err(Error(ErrorCode::SOURCE_NOT_FOUND,
                                "repository " + tmpl.repo_url + " not found: " + detail));
        }
        if (result.ok && contains(result.output, "Remote branch") && contains(result.output, "not found")) {
            return R::err(Error(ErrorCode::REVISION_NOT_FOUND,
                                "branch " + tmpl.branch + " not found in " + tmpl.repo_url));
        }

        last_error = Error(ErrorCode::SOURCE_TRANSPORT,
                           "git clone " + tmpl.repo_url + " failed: " + detail);
        spdlog::warn("{}", last_error.message());

        clear_directory(source.root());
        if (attempt < max_attempts_) {
            std::this_thread::sleep_for(std::chrono::seconds(attempt));
        }
    }

    if (!cloned) {
        return R::err(last_error.withContext("after " + std::to_string(max_attempts_) + " attempts"));
    }

    auto checkout = run_process({"git", "-C", source.root(), "checkout", "--quiet", tmpl.commit}, opts);
    if (!checkout.ok || checkout.exit_code != 0) {
        std::string detail = checkout.ok ? last_line(checkout.output) : checkout.error;
        return R::err(Error(ErrorCode::REVISION_NOT_FOUND,
                            "git checkout " + tmpl.commit + " failed: " + detail));
    }

    spdlog::info("fetched {} at {}", tmpl.id, tmpl.commit);
    return R::ok(std::move(source));
}

// ============================================================================
// LocalSourceProvider
// ============================================================================

LocalSourceProvider::LocalSourceProvider(std::string directory)
    : directory_(std::move(directory)) {}

Result<FetchedSource> LocalSourceProvider::fetch(const Template& tmpl) {
    if (!is_directory(directory_)) {
        return Result<FetchedSource>::err(
            Error(ErrorCode::SOURCE_NOT_FOUND, directory_ + ": source directory does not exist"));
    }
    spdlog::info("using local source {} for template {}", directory_, tmpl.id);
    return Result<FetchedSource>::ok(FetchedSource(absolute_path(directory_), false));
}

} // namespace scb
