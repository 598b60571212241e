#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"
#include "storage/state_store.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <print>
#include <signal.h>
#include <string>
#include <unistd.h>

static bool daemon_running(const std::string& pid_path) {
    std::ifstream f(pid_path);
    int pid = 0;
    if (!(f >> pid) || pid <= 0 || pid == getpid()) return false;
    return kill(pid, 0) == 0;
}

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: driftd [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "driftd: unknown option '{}'", arg);
            return 2;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    auto pid_path = platform::daemon_pid_path();
    if (daemon_running(pid_path)) {
        std::println(stderr, "driftd: already running (see {})", pid_path);
        return 1;
    }

    if (!foreground) {
        platform::daemonize();
    }

    if (auto r = storage::write_atomic(pid_path, std::to_string(getpid())); !r) {
        std::println(stderr, "driftd: {}", r.error().message);
        return 1;
    }

    int status = 0;
    {
        LinuxEventLoop loop(std::move(config), verbose);
        if (loop.init()) {
            std::println(stderr, "drift daemon started (PID {})", getpid());
            loop.run();
            std::println(stderr, "drift daemon shutting down");
        } else {
            std::println(stderr, "Failed to initialize event loop");
            status = 1;
        }
    }

    std::error_code ec;
    std::filesystem::remove(pid_path, ec);
    return status;
}
