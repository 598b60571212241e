#pragma once

#include "channel.hpp"
#include "errors.hpp"
#include "platform/compositor.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <thread>
#include <variant>
#include <vector>

// Focus the project's workspace, or create it and launch its windows.
struct OpenProjectWorkspace {
    std::string project;
    std::vector<std::string> window_commands;
};

// Close every window on the project's workspace and drop its name.
struct CloseProjectWorkspace {
    std::string project;
};

struct MarkWindowUrgent {
    uint64_t window_id = 0;
};

using WorkspaceRequest = std::variant<OpenProjectWorkspace, CloseProjectWorkspace, MarkWindowUrgent>;

// Executes compositor requests one at a time on its own thread, so that no
// compositor round trip ever runs on the coordinator thread.
class RequestIssuer {
public:
    RequestIssuer(Compositor& compositor, size_t capacity, bool verbose = false);
    ~RequestIssuer();

    RequestIssuer(const RequestIssuer&) = delete;
    RequestIssuer& operator=(const RequestIssuer&) = delete;

    void start();
    void stop();

    // Never blocks; a full queue loses its oldest request.
    void submit(WorkspaceRequest req);

    // Runs one request synchronously on the calling thread.
    std::expected<void, Error> execute(const WorkspaceRequest& req);

    uint64_t failed_count() const { return failed_.load(std::memory_order_relaxed); }

private:
    void run(std::stop_token st);
    std::expected<void, Error> open_workspace(const OpenProjectWorkspace& req);
    std::expected<void, Error> close_workspace(const CloseProjectWorkspace& req);
    std::expected<void, Error> create_named_workspace(const std::string& name);
    void log(const std::string& msg);

    Compositor& compositor_;
    Channel<WorkspaceRequest> queue_;
    bool verbose_;

    std::atomic<uint64_t> failed_{0};
    std::jthread worker_;
};
