#pragma once

#include "errors.hpp"

#include <chrono>
#include <expected>
#include <map>
#include <string>

struct ExitStatus {
    int code = 0;
    int signal = 0;            // terminating signal, 0 if exited normally
    bool spawn_failed = false; // the process never started

    bool success() const { return !spawn_failed && signal == 0 && code == 0; }
};

namespace platform {

struct SpawnRequest {
    std::string command;                     // run as `sh -c <command>`
    std::string cwd;
    std::map<std::string, std::string> env;  // added to the daemon's environment
    std::string log_path;                    // stdout and stderr, appended
    std::string log_marker;                  // written to the log before the child starts
};

// Starts `command` as the leader of a new session, so its pid is also its
// process group id. Fails if the log or working directory is unusable or the
// shell cannot be executed.
std::expected<int, Error> spawn_process_group(const SpawnRequest& req);

// Blocks until `pid` terminates and reaps it.
ExitStatus wait_for_exit(int pid);

bool signal_group(int pgid, int sig);
bool group_alive(int pgid);

// Runs a shell command to completion. If it outlives `timeout` its group is
// killed and false is returned.
bool run_command(const std::string& command, const std::string& cwd,
                 const std::map<std::string, std::string>& env,
                 std::chrono::milliseconds timeout);

} // namespace platform
