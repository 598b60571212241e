#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto SHUTDOWN_GRACE = std::chrono::seconds(1);

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ingress_ch_(config_.events.channel_capacity),
      compositor_ch_(config_.events.channel_capacity),
      supervisor_ch_(config_.events.channel_capacity),
      ingress_(ingress_ch_, verbose_),
      broadcaster_(config_.events, verbose_),
      compositor_(config_.compositor.socket),
      tracker_(compositor_, compositor_ch_,
               std::chrono::milliseconds(config_.compositor.reconnect_base_ms),
               std::chrono::milliseconds(config_.compositor.reconnect_max_ms), verbose_),
      issuer_(compositor_, config_.events.channel_capacity, verbose_),
      core_(config_, supervisor_ch_,
            // PublishFn
            [this](const Event& e) { broadcaster_.publish(e); },
            // RequestFn
            [this](WorkspaceRequest req) { issuer_.submit(std::move(req)); },
            // ProjectLoader
            [] { return load_projects(platform::projects_dir()); },
            verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    // Block before any worker starts so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Bus sockets
    auto emit_path = platform::emit_endpoint();
    if (auto r = ingress_.bind(emit_path); !r) {
        std::println(stderr, "bus: {}", r.error().message);
        return false;
    }
    log("emit socket listening on " + emit_path);

    auto subscribe_path = platform::subscribe_endpoint();
    if (auto r = broadcaster_.bind(subscribe_path); !r) {
        std::println(stderr, "bus: {}", r.error().message);
        return false;
    }
    log("subscribe socket listening on " + subscribe_path);

    core_.set_malformed_counter([this] { return ingress_.malformed_count(); });
    core_.init();

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };
    if (!add_fd(signal_fd_) || !add_fd(ingress_ch_.notify_fd()) ||
        !add_fd(compositor_ch_.notify_fd()) || !add_fd(supervisor_ch_.notify_fd())) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    ingress_.start();
    broadcaster_.start();

    if (config_.compositor.enabled) {
        issuer_.start();
        tracker_.start();
    } else {
        log("compositor integration disabled");
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];
    bool pending = false;

    while (running_.load(std::memory_order_relaxed)) {
        int timeout_ms = 0;
        if (!pending) {
            auto wait = core_.next_deadline() - Clock::now();
            auto ms = std::chrono::ceil<std::chrono::milliseconds>(wait).count();
            timeout_ms = static_cast<int>(std::clamp<long long>(ms, 0, 60'000));
        }

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            if (events[i].data.fd != signal_fd_) continue;
            signalfd_siginfo info;
            ::read(signal_fd_, &info, sizeof(info));
            log("Received signal, shutting down");
            running_.store(false, std::memory_order_release);
        }
        if (!running_.load(std::memory_order_relaxed)) break;

        ingress_ch_.clear_notification();
        compositor_ch_.clear_notification();
        supervisor_ch_.clear_notification();

        pending = turn();
    }

    shutdown();
}

bool LinuxEventLoop::turn() {
    return core_.run_turn(compositor_ch_, supervisor_ch_, ingress_ch_, Clock::now());
}

void LinuxEventLoop::shutdown() {
    // Producers may be blocked on a full channel; closing releases them.
    ingress_ch_.close();
    compositor_ch_.close();

    // Services start stopping before any worker is joined, so a stalled
    // compositor cannot hold them up.
    core_.begin_shutdown();
    core_.end_turn();

    ingress_.stop();
    tracker_.stop();

    auto deadline = Clock::now() +
                    std::chrono::milliseconds(config_.supervisor.stop_timeout_ms) + SHUTDOWN_GRACE;
    if (!core_.wait_idle(deadline)) {
        std::println(stderr, "driftd: services still running after shutdown grace period");
    }

    core_.finish_shutdown();

    issuer_.stop();
    broadcaster_.stop();
    log("shutdown complete");
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[driftd] {}", msg);
    }
}
