#include "bus/ingress.hpp"

#include "platform/unix_socket.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

bool is_blank(std::string_view line) {
    return std::ranges::all_of(line, [](char c) { return c == ' ' || c == '\t' || c == '\r'; });
}

} // namespace

IngressListener::IngressListener(Channel<Event>& out, bool verbose)
    : out_(out), verbose_(verbose) {}

IngressListener::~IngressListener() {
    stop();
}

std::expected<void, Error> IngressListener::bind(const std::string& path) {
    auto fd = platform::listen_unix(path);
    if (!fd) return std::unexpected(fd.error());
    server_fd_ = *fd;
    socket_path_ = path;

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (epoll_fd_ < 0 || wake_fd_ < 0) {
        return std::unexpected(Error{ErrorCode::Bind,
                                     std::format("ingress: epoll setup: {}", std::strerror(errno))});
    }

    epoll_event ev{.events = EPOLLIN, .data = {.fd = server_fd_}};
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev);
    ev = {.events = EPOLLIN, .data = {.fd = wake_fd_}};
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev);

    log("ingress listening on " + path);
    return {};
}

void IngressListener::start() {
    if (server_fd_ < 0 || worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void IngressListener::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        uint64_t val = 1;
        ::write(wake_fd_, &val, sizeof(val));
        worker_.join();
    }

    for (auto& c : clients_) ::close(c.fd);
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

void IngressListener::run(std::stop_token st) {
    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (!st.stop_requested()) {
        int n = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "ingress: epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == wake_fd_) continue;

            if (fd == server_fd_) {
                accept_clients();
                continue;
            }

            auto* client = find_client(fd);
            if (client && !read_client(*client)) close_client(fd);
        }
    }
}

void IngressListener::accept_clients() {
    for (;;) {
        int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) continue;
            return;
        }
        epoll_event ev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = fd}};
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            ::close(fd);
            continue;
        }
        clients_.push_back({fd, {}});
    }
}

bool IngressListener::read_client(Client& client) {
    char buf[8192];
    ssize_t n = ::recv(client.fd, buf, sizeof(buf), 0);
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) return true;

    if (n <= 0) {
        // EOF: a trailing record without newline still counts
        if (!client.buf.empty() && !is_blank(client.buf)) handle_line(client.buf);
        client.buf.clear();
        return false;
    }

    client.buf.append(buf, static_cast<size_t>(n));

    size_t start = 0;
    for (auto pos = client.buf.find('\n'); pos != std::string::npos;
         pos = client.buf.find('\n', start)) {
        std::string_view line(client.buf.data() + start, pos - start);
        if (!is_blank(line)) handle_line(line);
        start = pos + 1;
    }
    client.buf.erase(0, start);

    if (client.buf.size() > MAX_LINE) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        std::println(stderr, "ingress: record exceeds {} bytes, closing producer", MAX_LINE);
        client.buf.clear();
        return false;
    }
    return true;
}

void IngressListener::handle_line(std::string_view line) {
    if (line.size() > MAX_LINE) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto event = parse_event(line);
    if (!event) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        log("dropped malformed event: " + event.error().message);
        return;
    }

    accepted_.fetch_add(1, std::memory_order_relaxed);
    out_.push(std::move(*event));
}

void IngressListener::close_client(int fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ::close(fd);
    std::erase_if(clients_, [fd](const Client& c) { return c.fd == fd; });
}

IngressListener::Client* IngressListener::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

void IngressListener::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[driftd] {}", msg);
    }
}
