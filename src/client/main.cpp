#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  emit --type TYPE [--project P] [--source S] [--level L]");
    std::println(stderr, "       [--title T] [--body B]          Send one event to driftd");
    std::println(stderr, "  watch [--type GLOB] [--project P]  Follow events as they are published");
    std::println(stderr, "  open PROJECT | close PROJECT       Open or close a project");
    std::println(stderr, "  reload                             Reload project definitions");
    std::println(stderr, "--project defaults to $DRIFT_PROJECT.");
}

static std::string utc_now() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

static void print_event(const json& e) {
    auto ts = e.value("ts", "");
    auto time = ts.size() >= 19 ? ts.substr(11, 8) : ts;
    auto type = e.value("type", "");
    auto project = e.value("project", "");
    auto priority = e.value("priority", "");
    auto title = e.value("title", "");

    auto line = std::format("{}  {:<8} {:<25} {:<12}", time, priority, type, project);
    if (title.empty()) {
        std::println("{} {}", line, e.value("source", ""));
    } else {
        std::println("{} \"{}\"", line, title);
    }
}

static int emit(const json& event) {
    UnixSocketClient client;
    auto sock_path = platform::emit_endpoint();
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is driftd running?");
        return 1;
    }
    if (!client.send(event)) {
        std::println(stderr, "Failed to send event");
        return 1;
    }
    client.shutdown_write();
    std::println("Event sent");
    return 0;
}

static int watch(const json& filter) {
    UnixSocketClient client;
    auto sock_path = platform::subscribe_endpoint();
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is driftd running?");
        return 1;
    }
    if (!client.send(filter)) {
        std::println(stderr, "Failed to send filter");
        return 1;
    }
    // Nothing more to say; the daemon keeps streaming.
    client.shutdown_write();

    json e;
    while (client.recv(e, -1)) {
        print_event(e);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string type, source = "cli", level = "info", title, body, target;
    std::string project;
    if (const char* env = std::getenv("DRIFT_PROJECT")) project = env;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string { return i + 1 < argc ? argv[++i] : ""; };
        if (arg == "--type") {
            type = next();
        } else if (arg == "--project") {
            project = next();
        } else if (arg == "--source") {
            source = next();
        } else if (arg == "--level") {
            level = next();
        } else if (arg == "--title") {
            title = next();
        } else if (arg == "--body") {
            body = next();
        } else if (arg.starts_with("-")) {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        } else {
            target = arg;
        }
    }

    if (command == "watch") {
        json filter = json::object();
        if (!type.empty()) filter["type"] = type;
        if (!project.empty()) filter["project"] = project;
        return watch(filter);
    }

    if (command == "open" || command == "close") {
        if (target.empty()) {
            std::println(stderr, "{}: project name required", command);
            return 1;
        }
        project = target;
        type = command == "open" ? "drift.project.opened" : "drift.project.closed";
    } else if (command == "reload") {
        type = "drift.config.changed";
        if (project.empty()) project = "drift";
    } else if (command != "emit") {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    if (type.empty()) {
        std::println(stderr, "emit: --type is required");
        return 1;
    }
    if (project.empty()) {
        std::println(stderr, "No project specified. Use --project or set $DRIFT_PROJECT");
        return 1;
    }

    json event = {
        {"type", type},
        {"project", project},
        {"source", source},
        {"ts", utc_now()},
        {"level", level},
    };
    if (!title.empty()) event["title"] = title;
    if (!body.empty()) event["body"] = body;
    return emit(event);
}
