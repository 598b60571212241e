#pragma once

#include "platform/compositor.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

// niri JSON IPC: one JSON value per line over $NIRI_SOCKET.
class NiriCompositor : public Compositor {
public:
    static constexpr std::chrono::milliseconds DEFAULT_REPLY_TIMEOUT{5000};

    // Empty path: use $NIRI_SOCKET. `reply_timeout` bounds every wait for a
    // reply, including the event stream handshake.
    explicit NiriCompositor(std::string socket_path = {},
                            std::chrono::milliseconds reply_timeout = DEFAULT_REPLY_TIMEOUT);
    ~NiriCompositor() override;

    NiriCompositor(const NiriCompositor&) = delete;
    NiriCompositor& operator=(const NiriCompositor&) = delete;

    std::expected<void, Error> open_event_stream() override;
    std::expected<std::optional<CompositorEvent>, Error> read_event() override;
    void close_event_stream() override;
    void interrupt_event_stream() override;

    std::expected<std::vector<Workspace>, Error> workspaces() override;
    std::expected<std::vector<Window>, Error> windows() override;
    std::expected<std::optional<Window>, Error> focused_window() override;
    std::expected<std::string, Error> focused_output() override;

    std::expected<void, Error> focus_workspace(const std::string& name) override;
    std::expected<void, Error> focus_workspace_down() override;
    std::expected<void, Error> set_workspace_name(const std::string& name) override;
    std::expected<void, Error> unset_workspace_name(const std::string& name) override;
    std::expected<void, Error> spawn(const std::vector<std::string>& argv) override;
    std::expected<void, Error> close_window(uint64_t id) override;
    std::expected<void, Error> set_window_urgent(uint64_t id) override;

    const std::string& socket_path() const { return socket_path_; }

private:
    // Sends one request and returns the payload of {"Ok": ...}.
    std::expected<nlohmann::json, Error> request(const nlohmann::json& req);
    std::expected<void, Error> action(nlohmann::json body);
    void close_request_socket();
    void drop_stream();

    // Reads up to the next newline, keeping any surplus in `buf`.
    static std::expected<std::string, Error> read_line(int fd, std::string& buf);

    std::string socket_path_;
    std::chrono::milliseconds reply_timeout_;

    std::mutex request_mu_;
    int request_fd_ = -1;
    std::string request_buf_;

    std::atomic<int> stream_fd_{-1};
    std::atomic<bool> stream_interrupted_{false};
    std::string stream_buf_;
};
