#include "scb/platform.hpp"
#include "scb/layout.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace scb {

namespace fs = std::filesystem;

namespace {

bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

VoidResult copy_entry(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    auto st = fs::symlink_status(src, ec);
    if (ec) return VoidResult::err(error_from_errc(ec, src.string()));

    if (fs::is_symlink(st)) {
        auto target = fs::read_symlink(src, ec);
        if (ec) return VoidResult::err(error_from_errc(ec, src.string()));
        if (fs::exists(fs::symlink_status(dst, ec))) {
            fs::remove(dst, ec);
            if (ec) return VoidResult::err(error_from_errc(ec, dst.string()));
        }
        fs::create_symlink(target, dst, ec);
        if (ec) return VoidResult::err(error_from_errc(ec, dst.string()));
        return VoidResult::ok();
    }

    if (fs::is_directory(st)) {
        fs::create_directories(dst, ec);
        if (ec) return VoidResult::err(error_from_errc(ec, dst.string()));

        fs::directory_iterator it(src, ec);
        if (ec) return VoidResult::err(error_from_errc(ec, src.string()));
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) return VoidResult::err(error_from_errc(ec, src.string()));
            auto child = copy_entry(it->path(), dst / it->path().filename());
            if (child.isErr()) return child;
        }
        if (ec) return VoidResult::err(error_from_errc(ec, src.string()));

        // Applied last so read-only directories can still be filled.
        fs::permissions(dst, st.permissions(), ec);
        if (ec) return VoidResult::err(error_from_errc(ec, dst.string()));
        return VoidResult::ok();
    }

    if (fs::is_regular_file(st)) {
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) return VoidResult::err(error_from_errc(ec, dst.string()));
        fs::permissions(dst, st.permissions(), ec);
        if (ec) return VoidResult::err(error_from_errc(ec, dst.string()));
        return VoidResult::ok();
    }

    spdlog::debug("skipping special file {}", src.string());
    return VoidResult::ok();
}

} // namespace

// ============================================================================
// Atomic File Operations
// ============================================================================

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    // temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Directory Primitives
// ============================================================================

VoidResult ensure_directory(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (!ec && fs::exists(st)) {
        if (fs::is_directory(st)) return VoidResult::ok();
        return VoidResult::err(Error(ErrorCode::ALREADY_EXISTS,
                                     path + ": exists and is not a directory"));
    }

    fs::create_directories(path, ec);
    if (ec) return VoidResult::err(error_from_errc(ec, path));
    spdlog::debug("created directory {}", path);
    return VoidResult::ok();
}

VoidResult copy_tree(const std::string& src, const std::string& dst) {
    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        return VoidResult::err(Error(ErrorCode::NOT_FOUND, src + ": source directory does not exist"));
    }
    spdlog::debug("copying {} -> {}", src, dst);
    return copy_entry(src, dst);
}

VoidResult copy_file_preserving(const std::string& src, const std::string& dst) {
    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) {
        return VoidResult::err(Error(ErrorCode::NOT_FOUND, src + ": file does not exist"));
    }
    return copy_entry(src, dst);
}

VoidResult remove_directory_named(const std::string& path, const std::string& expected_name) {
    if (path.empty()) {
        return VoidResult::err(Error(ErrorCode::INVALID_PATH, "refusing to remove an empty path"));
    }

    fs::path p(absolute_path(path));
    if (!p.has_filename()) p = p.parent_path();

    if (p.filename().string() != expected_name) {
        return VoidResult::err(Error(ErrorCode::INVALID_PATH,
            "refusing to remove " + p.string() + ": expected a directory named " + expected_name));
    }

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(p, ec))) return VoidResult::ok();

    fs::remove_all(p, ec);
    if (ec) return VoidResult::err(error_from_errc(ec, p.string()));
    spdlog::info("removed {}", p.string());
    return VoidResult::ok();
}

VoidResult remove_framework_directory(const std::string& target_dir) {
    return remove_directory_named(join_path(target_dir, kFrameworkDir), kFrameworkDir);
}

std::string unique_path(const std::string& stem, const std::string& ext) {
    std::string candidate = stem + ext;
    for (int n = 1; path_exists_no_follow(candidate); ++n) {
        candidate = stem + "-" + std::to_string(n) + ext;
    }
    return candidate;
}

std::string relative_path(const std::string& from_dir, const std::string& to) {
    fs::path from = fs::path(absolute_path(from_dir));
    fs::path dest = fs::path(absolute_path(to));
    return dest.lexically_relative(from).string();
}

// ============================================================================
// Queries
// ============================================================================

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) return fs::path(path).lexically_normal().string();
    return abs.lexically_normal().string();
}

bool path_exists_no_follow(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

bool is_writable(const std::string& path) {
    return access(path.c_str(), W_OK) == 0;
}

std::optional<std::string> read_symlink(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) return std::nullopt;
    return target.string();
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return ss.str();
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    fs::directory_iterator it(path, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string get_backup_timestamp() {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(a >> 32),
                  static_cast<unsigned>((a >> 16) & 0xFFFF),
                  static_cast<unsigned>(a & 0xFFFF),
                  static_cast<unsigned>(b >> 48),
                  static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));
    return buf;
}

Result<std::string> make_scratch_directory(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) return Result<std::string>::err(error_from_errc(ec, "temp directory"));

    std::string templ = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        return Result<std::string>::err(error_from_errc(
            std::error_code(errno, std::generic_category()), templ));
    }
    return Result<std::string>::ok(std::string(buf.data()));
}

} // namespace scb
