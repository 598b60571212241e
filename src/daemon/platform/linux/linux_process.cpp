#include "platform/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <signal.h>
#include <string_view>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace fs = std::filesystem;

namespace platform {

namespace {

std::unexpected<Error> spawn_error(std::string message) {
    return std::unexpected(Error{ErrorCode::Spawn, std::move(message)});
}

// "KEY=VALUE" strings: the daemon's environment with `extra` layered on top.
std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string_view::npos && extra.contains(std::string(entry.substr(0, eq)))) {
            continue;
        }
        out.emplace_back(entry);
    }
    for (const auto& [key, value] : extra) out.push_back(key + "=" + value);
    return out;
}

std::vector<char*> to_argv(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(int log_fd, int null_fd, int err_fd, const char* cwd,
                             char* const argv[], char* const envp[]) {
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    ::setsid();

    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(log_fd, STDOUT_FILENO);
    ::dup2(log_fd, STDERR_FILENO);

    if (cwd && ::chdir(cwd) < 0) {
        int err = errno;
        ::write(err_fd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execve("/bin/sh", argv, envp);

    int err = errno;
    ::write(err_fd, &err, sizeof(err));
    ::_exit(127);
}

ExitStatus decode_status(int status) {
    ExitStatus st;
    if (WIFEXITED(status)) {
        st.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        st.signal = WTERMSIG(status);
        st.code = 128 + st.signal;
    }
    return st;
}

} // namespace

std::expected<int, Error> spawn_process_group(const SpawnRequest& req) {
    std::error_code ec;
    if (!req.cwd.empty() && !fs::is_directory(req.cwd, ec)) {
        return spawn_error("working directory does not exist: " + req.cwd);
    }

    auto log_dir = fs::path(req.log_path).parent_path();
    if (!log_dir.empty()) fs::create_directories(log_dir, ec);

    int log_fd = ::open(req.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        return spawn_error(std::format("open {}: {}", req.log_path, std::strerror(errno)));
    }
    if (!req.log_marker.empty()) {
        ::write(log_fd, req.log_marker.data(), req.log_marker.size());
    }

    int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    int err_pipe[2];
    if (null_fd < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = std::format("spawn setup failed: {}", std::strerror(errno));
        ::close(log_fd);
        if (null_fd >= 0) ::close(null_fd);
        return spawn_error(std::move(msg));
    }

    std::vector<std::string> args = {"sh", "-c", req.command};
    auto argv = to_argv(args);
    auto env_strings = build_environment(req.env);
    auto envp = to_argv(env_strings);
    const char* cwd = req.cwd.empty() ? nullptr : req.cwd.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = std::format("fork() failed: {}", std::strerror(errno));
        ::close(log_fd);
        ::close(null_fd);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return spawn_error(std::move(msg));
    }

    if (pid == 0) {
        exec_child(log_fd, null_fd, err_pipe[1], cwd, argv.data(), envp.data());
    }

    ::close(log_fd);
    ::close(null_fd);
    ::close(err_pipe[1]);

    // The pipe closes on successful exec; otherwise the child reports errno.
    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(err_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    ::close(err_pipe[0]);

    if (n > 0) {
        int status;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return spawn_error(std::format("exec /bin/sh failed: {}", std::strerror(child_errno)));
    }

    return pid;
}

ExitStatus wait_for_exit(int pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        // Already reaped elsewhere: nothing more to learn.
        return ExitStatus{.code = -1};
    }
    return decode_status(status);
}

bool signal_group(int pgid, int sig) {
    if (pgid <= 0) return false;
    return ::kill(-pgid, sig) == 0;
}

bool group_alive(int pgid) {
    if (pgid <= 0) return false;
    return ::kill(-pgid, 0) == 0 || errno == EPERM;
}

bool run_command(const std::string& command, const std::string& cwd,
                 const std::map<std::string, std::string>& env,
                 std::chrono::milliseconds timeout) {
    auto pid = spawn_process_group(SpawnRequest{
        .command = command, .cwd = cwd, .env = env, .log_path = "/dev/null"});
    if (!pid) return false;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        int status;
        pid_t r = ::waitpid(*pid, &status, WNOHANG);
        if (r == *pid) return decode_status(status).success();
        if (r < 0 && errno != EINTR) return false;
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    signal_group(*pid, SIGKILL);
    wait_for_exit(*pid);
    return false;
}

} // namespace platform
