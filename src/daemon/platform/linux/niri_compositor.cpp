#include "platform/linux/niri_compositor.hpp"

#include "platform/unix_socket.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <format>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

constexpr size_t MAX_REPLY = 16 * 1024 * 1024;

std::unexpected<Error> disconnected(std::string message) {
    return std::unexpected(Error{ErrorCode::CompositorDisconnected, std::move(message)});
}

std::unexpected<Error> rejected(std::string message) {
    return std::unexpected(Error{ErrorCode::CompositorRequest, std::move(message)});
}

json workspace_by_name(const std::string& name) {
    return {{"Name", name}};
}

// Zero: block indefinitely.
void set_recv_timeout(int fd, std::chrono::milliseconds timeout) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
    timeval tv{.tv_sec = static_cast<time_t>(us / 1'000'000),
               .tv_usec = static_cast<suseconds_t>(us % 1'000'000)};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

} // namespace

NiriCompositor::NiriCompositor(std::string socket_path, std::chrono::milliseconds reply_timeout)
    : socket_path_(std::move(socket_path)), reply_timeout_(reply_timeout) {
    if (socket_path_.empty()) {
        const char* sock = std::getenv("NIRI_SOCKET");
        if (sock) socket_path_ = sock;
    }
}

NiriCompositor::~NiriCompositor() {
    close_event_stream();
    close_request_socket();
}

// --- Event stream ---

std::expected<void, Error> NiriCompositor::open_event_stream() {
    drop_stream();
    if (socket_path_.empty()) return disconnected("niri: NIRI_SOCKET not set");

    int fd = platform::connect_unix(socket_path_);
    if (fd < 0) {
        return disconnected(std::format("niri: connect {}: {}", socket_path_, std::strerror(errno)));
    }

    // Published before the handshake so that an interrupt can reach it.
    stream_fd_.store(fd);
    if (stream_interrupted_.load()) {
        drop_stream();
        return disconnected("niri: event stream interrupted");
    }

    // A wedged compositor still accepts connections; don't wait on it forever.
    set_recv_timeout(fd, reply_timeout_);
    if (!platform::send_all(fd, "\"EventStream\"\n")) {
        drop_stream();
        return disconnected("niri: could not request event stream");
    }

    auto line = read_line(fd, stream_buf_);
    if (!line) {
        drop_stream();
        return std::unexpected(line.error());
    }

    auto reply = json::parse(*line, nullptr, false);
    if (reply.is_discarded() || !reply.contains("Ok")) {
        drop_stream();
        return rejected("niri: event stream refused: " + *line);
    }

    // Events may be minutes apart.
    set_recv_timeout(fd, std::chrono::milliseconds::zero());
    return {};
}

std::expected<std::optional<CompositorEvent>, Error> NiriCompositor::read_event() {
    int fd = stream_fd_.load();
    if (fd < 0) return disconnected("niri: event stream not open");

    auto line = read_line(fd, stream_buf_);
    if (!line) return std::unexpected(line.error());

    auto j = json::parse(*line, nullptr, false);
    if (j.is_discarded()) return std::optional<CompositorEvent>{};
    return parse_compositor_event(j);
}

void NiriCompositor::close_event_stream() {
    drop_stream();
    stream_interrupted_.store(false);
}

void NiriCompositor::interrupt_event_stream() {
    stream_interrupted_.store(true);
    int fd = stream_fd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void NiriCompositor::drop_stream() {
    int fd = stream_fd_.exchange(-1);
    if (fd >= 0) ::close(fd);
    stream_buf_.clear();
}

// --- Requests ---

std::expected<json, Error> NiriCompositor::request(const json& req) {
    std::lock_guard lock(request_mu_);

    if (request_fd_ < 0) {
        if (socket_path_.empty()) return disconnected("niri: NIRI_SOCKET not set");
        request_fd_ = platform::connect_unix(socket_path_);
        if (request_fd_ < 0) {
            return disconnected(
                std::format("niri: connect {}: {}", socket_path_, std::strerror(errno)));
        }
        set_recv_timeout(request_fd_, reply_timeout_);
        request_buf_.clear();
    }

    if (!platform::send_all(request_fd_, req.dump() + "\n")) {
        close_request_socket();
        return disconnected("niri: send failed");
    }

    auto line = read_line(request_fd_, request_buf_);
    if (!line) {
        close_request_socket();
        return std::unexpected(line.error());
    }

    auto reply = json::parse(*line, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) return rejected("niri: unreadable reply");
    if (auto err = reply.find("Err"); err != reply.end()) {
        return rejected("niri: " + (err->is_string() ? err->get<std::string>() : err->dump()));
    }
    if (auto ok = reply.find("Ok"); ok != reply.end()) return *ok;
    return rejected("niri: unexpected reply: " + *line);
}

std::expected<void, Error> NiriCompositor::action(json body) {
    auto reply = request(json{{"Action", std::move(body)}});
    if (!reply) return std::unexpected(reply.error());
    if (*reply != "Handled") return rejected("niri: unexpected reply: " + reply->dump());
    return {};
}

void NiriCompositor::close_request_socket() {
    if (request_fd_ >= 0) {
        ::close(request_fd_);
        request_fd_ = -1;
    }
    request_buf_.clear();
}

std::expected<std::vector<Workspace>, Error> NiriCompositor::workspaces() {
    auto reply = request("Workspaces");
    if (!reply) return std::unexpected(reply.error());
    if (!reply->contains("Workspaces")) return rejected("niri: expected Workspaces reply");

    std::vector<Workspace> out;
    try {
        for (const auto& ws : (*reply)["Workspaces"]) out.push_back(Workspace::from_json(ws));
    } catch (const json::exception& e) {
        return rejected(std::format("niri: bad workspace: {}", e.what()));
    }
    return out;
}

std::expected<std::vector<Window>, Error> NiriCompositor::windows() {
    auto reply = request("Windows");
    if (!reply) return std::unexpected(reply.error());
    if (!reply->contains("Windows")) return rejected("niri: expected Windows reply");

    std::vector<Window> out;
    try {
        for (const auto& w : (*reply)["Windows"]) out.push_back(Window::from_json(w));
    } catch (const json::exception& e) {
        return rejected(std::format("niri: bad window: {}", e.what()));
    }
    return out;
}

std::expected<std::optional<Window>, Error> NiriCompositor::focused_window() {
    auto reply = request("FocusedWindow");
    if (!reply) return std::unexpected(reply.error());
    if (!reply->contains("FocusedWindow")) return rejected("niri: expected FocusedWindow reply");

    const auto& w = (*reply)["FocusedWindow"];
    if (w.is_null()) return std::optional<Window>{};
    try {
        return std::optional<Window>{Window::from_json(w)};
    } catch (const json::exception& e) {
        return rejected(std::format("niri: bad window: {}", e.what()));
    }
}

std::expected<std::string, Error> NiriCompositor::focused_output() {
    auto reply = request("FocusedOutput");
    if (!reply) return std::unexpected(reply.error());
    if (!reply->contains("FocusedOutput")) return rejected("niri: expected FocusedOutput reply");

    const auto& out = (*reply)["FocusedOutput"];
    if (!out.is_object()) return std::string{};
    return out.value("name", "");
}

std::expected<void, Error> NiriCompositor::focus_workspace(const std::string& name) {
    return action({{"FocusWorkspace", {{"reference", workspace_by_name(name)}}}});
}

std::expected<void, Error> NiriCompositor::focus_workspace_down() {
    return action({{"FocusWorkspaceDown", json::object()}});
}

std::expected<void, Error> NiriCompositor::set_workspace_name(const std::string& name) {
    return action({{"SetWorkspaceName", {{"name", name}, {"workspace", nullptr}}}});
}

std::expected<void, Error> NiriCompositor::unset_workspace_name(const std::string& name) {
    return action({{"UnsetWorkspaceName", {{"reference", workspace_by_name(name)}}}});
}

std::expected<void, Error> NiriCompositor::spawn(const std::vector<std::string>& argv) {
    return action({{"Spawn", {{"command", argv}}}});
}

std::expected<void, Error> NiriCompositor::close_window(uint64_t id) {
    return action({{"CloseWindow", {{"id", id}}}});
}

std::expected<void, Error> NiriCompositor::set_window_urgent(uint64_t id) {
    return action({{"SetWindowUrgent", {{"id", id}}}});
}

// --- Line reader ---

std::expected<std::string, Error> NiriCompositor::read_line(int fd, std::string& buf) {
    for (;;) {
        auto pos = buf.find('\n');
        if (pos != std::string::npos) {
            std::string line = buf.substr(0, pos);
            buf.erase(0, pos + 1);
            return line;
        }
        if (buf.size() > MAX_REPLY) return disconnected("niri: reply too large");

        char chunk[8192];
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return disconnected("niri: timed out waiting for a reply");
        }
        if (n < 0) return disconnected(std::format("niri: recv: {}", std::strerror(errno)));
        if (n == 0) return disconnected("niri: connection closed");
        buf.append(chunk, static_cast<size_t>(n));
    }
}
