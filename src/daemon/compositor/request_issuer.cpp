#include "compositor/request_issuer.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <type_traits>

RequestIssuer::RequestIssuer(Compositor& compositor, size_t capacity, bool verbose)
    : compositor_(compositor), queue_(capacity), verbose_(verbose) {}

RequestIssuer::~RequestIssuer() {
    stop();
}

void RequestIssuer::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void RequestIssuer::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    queue_.close();
    worker_.join();
}

void RequestIssuer::submit(WorkspaceRequest req) {
    if (queue_.push_drop_oldest(std::move(req))) {
        std::println(stderr, "compositor: request queue full, dropped oldest request");
    }
}

void RequestIssuer::run(std::stop_token st) {
    while (!st.stop_requested()) {
        auto req = queue_.pop_for(std::chrono::milliseconds(500));
        if (!req) {
            if (queue_.closed()) break;
            continue;
        }
        if (auto r = execute(*req); !r) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            std::println(stderr, "compositor: {}", r.error().message);
        }
    }
}

std::expected<void, Error> RequestIssuer::execute(const WorkspaceRequest& req) {
    return std::visit(
        [this](const auto& r) -> std::expected<void, Error> {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, OpenProjectWorkspace>) {
                return open_workspace(r);
            } else if constexpr (std::is_same_v<T, CloseProjectWorkspace>) {
                return close_workspace(r);
            } else {
                return compositor_.set_window_urgent(r.window_id);
            }
        },
        req);
}

std::expected<void, Error> RequestIssuer::open_workspace(const OpenProjectWorkspace& req) {
    auto workspaces = compositor_.workspaces();
    if (!workspaces) return std::unexpected(workspaces.error());

    bool exists = std::ranges::any_of(*workspaces,
                                      [&](const Workspace& ws) { return ws.name == req.project; });
    if (exists) {
        log(std::format("focusing workspace '{}'", req.project));
        return compositor_.focus_workspace(req.project);
    }

    log(std::format("creating workspace '{}'", req.project));
    if (auto r = create_named_workspace(req.project); !r) return r;

    for (const auto& command : req.window_commands) {
        if (command.empty()) continue;
        if (auto r = compositor_.spawn({"sh", "-c", command}); !r) return r;
    }
    return {};
}

std::expected<void, Error> RequestIssuer::close_workspace(const CloseProjectWorkspace& req) {
    auto workspaces = compositor_.workspaces();
    if (!workspaces) return std::unexpected(workspaces.error());

    auto ws = std::ranges::find_if(*workspaces,
                                   [&](const Workspace& w) { return w.name == req.project; });
    if (ws == workspaces->end()) return {};

    auto windows = compositor_.windows();
    if (!windows) return std::unexpected(windows.error());

    for (const auto& w : *windows) {
        if (w.workspace_id != ws->id) continue;
        if (auto r = compositor_.close_window(w.id); !r) return r;
    }

    log(std::format("releasing workspace '{}'", req.project));
    return compositor_.unset_workspace_name(req.project);
}

// Moving down once per existing workspace lands on the trailing empty one.
std::expected<void, Error> RequestIssuer::create_named_workspace(const std::string& name) {
    auto workspaces = compositor_.workspaces();
    if (!workspaces) return std::unexpected(workspaces.error());

    for (size_t i = 0; i < workspaces->size(); ++i) {
        if (auto r = compositor_.focus_workspace_down(); !r) return r;
    }
    return compositor_.set_workspace_name(name);
}

void RequestIssuer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[driftd] {}", msg);
    }
}
