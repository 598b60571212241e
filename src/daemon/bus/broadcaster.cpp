#include "bus/broadcaster.hpp"

#include "platform/unix_socket.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

Broadcaster::Broadcaster(const Config::Events& cfg, bool verbose)
    : cfg_(cfg), verbose_(verbose),
      inbox_(cfg.channel_capacity),
      store_(cfg.buffer_size) {}

Broadcaster::~Broadcaster() {
    stop();
}

std::expected<void, Error> Broadcaster::bind(const std::string& path) {
    auto fd = platform::listen_unix(path);
    if (!fd) return std::unexpected(fd.error());
    server_fd_ = *fd;
    socket_path_ = path;

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        return std::unexpected(Error{ErrorCode::Bind,
                                     std::format("egress: epoll setup: {}", std::strerror(errno))});
    }

    epoll_event ev{.events = EPOLLIN, .data = {.fd = server_fd_}};
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev);
    ev = {.events = EPOLLIN, .data = {.fd = inbox_.notify_fd()}};
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, inbox_.notify_fd(), &ev);

    log("egress listening on " + path);
    return {};
}

void Broadcaster::start() {
    if (server_fd_ < 0 || worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void Broadcaster::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        inbox_.close(); // wakes epoll_wait
        worker_.join();
    }

    for (auto& [fd, _] : subscribers_) ::close(fd);
    subscribers_.clear();
    subscriber_count_.store(0, std::memory_order_relaxed);

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

void Broadcaster::publish(Event e) {
    inbox_.push_drop_oldest(std::move(e));
}

void Broadcaster::run(std::stop_token st) {
    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (!st.stop_requested()) {
        int n = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, next_timeout_ms());
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "egress: epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;
            uint32_t mask = events[i].events;

            if (fd == inbox_.notify_fd()) {
                inbox_.clear_notification();
                continue;
            }
            if (fd == server_fd_) {
                accept_subscribers();
                continue;
            }

            auto it = subscribers_.find(fd);
            if (it == subscribers_.end()) continue;
            auto& sub = it->second;

            bool keep = true;
            if (mask & (EPOLLERR | EPOLLHUP)) keep = false;
            if (keep && (mask & EPOLLIN)) keep = read_subscriber(sub);
            if (keep && (mask & EPOLLOUT)) keep = flush(sub);
            if (!keep) remove_subscriber(fd);
        }

        // Inbox is drained after accepting so that a subscriber accepted in
        // this pass sees these events as live, never as replay.
        drain_inbox();
        expire_handshakes();
    }
}

void Broadcaster::drain_inbox() {
    std::vector<int> broken;
    while (auto e = inbox_.try_pop()) {
        store_.append(*e);
        last_seq_ = e->seq;
        published_.fetch_add(1, std::memory_order_relaxed);

        for (auto& [fd, sub] : subscribers_) {
            if (!sub.ready) {
                if (sub.pending.size() >= cfg_.subscriber_queue) {
                    sub.pending.erase(sub.pending.begin());
                    dropped_.fetch_add(1, std::memory_order_relaxed);
                }
                sub.pending.push_back(*e);
                continue;
            }
            if (sub.filter.matches(*e)) enqueue(sub, *e);
        }
    }

    for (auto& [fd, sub] : subscribers_) {
        if (sub.ready && !sub.queue.empty() && !sub.want_write && !flush(sub)) {
            broken.push_back(fd);
        }
    }
    for (int fd : broken) remove_subscriber(fd);
}

void Broadcaster::accept_subscribers() {
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

        auto [it, _] = subscribers_.emplace(
            fd, Subscriber{.fd = fd,
                           .connect_seq = last_seq_,
                           .handshake_deadline = Clock::now() + cfg_.handshake()});
        subscriber_count_.store(subscribers_.size(), std::memory_order_relaxed);
        log(std::format("subscriber connected (fd {})", fd));

        if (cfg_.subscribe_handshake_ms == 0 && !finish_handshake(it->second, {})) {
            remove_subscriber(fd);
        }
    }
}

bool Broadcaster::read_subscriber(Subscriber& sub) {
    // Anything after the handshake is ignored.
    if (sub.ready) return true;

    char buf[1024];
    ssize_t n = ::recv(sub.fd, buf, sizeof(buf), 0);
    if (n < 0) return errno == EAGAIN || errno == EINTR;

    // A half-closed subscriber still reads; an unterminated line is its filter.
    if (n == 0) return finish_handshake(sub, parse_filter(sub.inbuf));

    sub.inbuf.append(buf, static_cast<size_t>(n));
    auto pos = sub.inbuf.find('\n');
    if (pos == std::string::npos) {
        if (sub.inbuf.size() > 4096) return finish_handshake(sub, {});
        return true;
    }
    return finish_handshake(sub, parse_filter(std::string_view(sub.inbuf).substr(0, pos)));
}

EventFilter Broadcaster::parse_filter(std::string_view line) {
    if (line.empty()) return {};
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) log("subscriber sent an unparsable filter, using none");
    return EventFilter::from_json(j);
}

bool Broadcaster::finish_handshake(Subscriber& sub, EventFilter filter) {
    sub.filter = std::move(filter);
    sub.ready = true;
    sub.inbuf.clear();
    sub.inbuf.shrink_to_fit();
    update_interest(sub);

    for (const auto& e : store_.recent(sub.filter, cfg_.replay_on_subscribe, sub.connect_seq)) {
        enqueue(sub, e);
    }
    for (const auto& e : sub.pending) {
        if (sub.filter.matches(e)) enqueue(sub, e);
    }
    sub.pending.clear();
    sub.pending.shrink_to_fit();

    return flush(sub);
}

void Broadcaster::enqueue(Subscriber& sub, const Event& e) {
    if (sub.queue.size() >= cfg_.subscriber_queue) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        // A partially written line must finish or the stream is corrupted.
        if (sub.front_offset == 0) {
            sub.queue.pop_front();
        } else if (sub.queue.size() > 1) {
            sub.queue.erase(sub.queue.begin() + 1);
        } else {
            return;
        }
    }
    sub.queue.push_back(to_line(e));
}

bool Broadcaster::flush(Subscriber& sub) {
    while (!sub.queue.empty()) {
        const auto& line = sub.queue.front();
        ssize_t n = ::send(sub.fd, line.data() + sub.front_offset, line.size() - sub.front_offset,
                           MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) return false;
            if (!sub.want_write) {
                sub.want_write = true;
                update_interest(sub);
            }
            return true;
        }
        sub.front_offset += static_cast<size_t>(n);
        if (sub.front_offset == line.size()) {
            sub.queue.pop_front();
            sub.front_offset = 0;
        }
    }

    if (sub.want_write) {
        sub.want_write = false;
        update_interest(sub);
    }
    return true;
}

// Input is only watched until the handshake completes. After that a closed
// peer shows up as EPOLLHUP or a failed send.
void Broadcaster::update_interest(const Subscriber& sub) {
    uint32_t events = sub.ready ? 0 : EPOLLIN | EPOLLRDHUP;
    if (sub.want_write) events |= EPOLLOUT;
    epoll_event ev{.events = events, .data = {.fd = sub.fd}};
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, sub.fd, &ev);
}

void Broadcaster::expire_handshakes() {
    auto now = Clock::now();
    std::vector<int> broken;
    for (auto& [fd, sub] : subscribers_) {
        if (!sub.ready && now >= sub.handshake_deadline && !finish_handshake(sub, {})) {
            broken.push_back(fd);
        }
    }
    for (int fd : broken) remove_subscriber(fd);
}

int Broadcaster::next_timeout_ms() const {
    auto now = Clock::now();
    int timeout = -1;
    for (const auto& [_, sub] : subscribers_) {
        if (sub.ready) continue;
        auto left = std::chrono::ceil<std::chrono::milliseconds>(sub.handshake_deadline - now);
        int ms = static_cast<int>(std::max<int64_t>(left.count(), 0));
        if (timeout < 0 || ms < timeout) timeout = ms;
    }
    return timeout;
}

void Broadcaster::remove_subscriber(int fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ::close(fd);
    subscribers_.erase(fd);
    subscriber_count_.store(subscribers_.size(), std::memory_order_relaxed);
    log(std::format("subscriber disconnected (fd {})", fd));
}

void Broadcaster::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[driftd] {}", msg);
    }
}
