#include "scb/process.hpp"
#include "scb/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scb {

namespace {

// Translate a waitpid status into result fields.
void record_status(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv_strings, const ProcessOptions& options) {
    ProcessResult result;

    if (argv_strings.empty()) {
        result.error = "empty command line";
        return result;
    }

    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    int pipe_fds[2] = {-1, -1};
    if (options.capture_output && pipe(pipe_fds) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    spdlog::debug("exec: {}{}", argv_strings[0],
                  options.cwd.empty() ? "" : " (cwd " + options.cwd + ")");

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        if (options.capture_output) {
            close(pipe_fds[0]);
            close(pipe_fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        if (options.capture_output) {
            dup2(pipe_fds[1], STDOUT_FILENO);
            dup2(pipe_fds[1], STDERR_FILENO);
            close(pipe_fds[0]);
            close(pipe_fds[1]);
        }
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent process
    int read_fd = -1;
    if (options.capture_output) {
        close(pipe_fds[1]);
        read_fd = pipe_fds[0];
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options.timeout_seconds);
    bool reaped = false;
    int status = 0;

    while (!reaped) {
        if (read_fd >= 0) {
            struct pollfd pfd = {read_fd, POLLIN, 0};
            int ready = poll(&pfd, 1, 50);
            if (ready > 0) {
                char buf[4096];
                ssize_t n = read(read_fd, buf, sizeof(buf));
                if (n > 0) {
                    result.output.append(buf, static_cast<size_t>(n));
                } else if (n == 0) {
                    close(read_fd);
                    read_fd = -1;
                }
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited == -1 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            if (read_fd >= 0) close(read_fd);
            return result;
        }

        if (options.timeout_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            result.error = "timed out after " + std::to_string(options.timeout_seconds) + "s";
            if (read_fd >= 0) close(read_fd);
            return result;
        }
    }

    // Drain whatever the child wrote before exiting.
    if (read_fd >= 0) {
        char buf[4096];
        ssize_t n;
        while ((n = read(read_fd, buf, sizeof(buf))) > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        }
        close(read_fd);
    }

    record_status(status, result);
    return result;
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) return name;
        return std::nullopt;
    }

    auto path_env = get_env("PATH");
    if (!path_env) return std::nullopt;

    std::stringstream ss(*path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = join_path(dir, name);
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace scb
