#include "compositor/tracker.hpp"

#include "backoff.hpp"

#include <format>
#include <print>

CompositorTracker::CompositorTracker(Compositor& compositor, Channel<CompositorMsg>& out,
                                     std::chrono::milliseconds reconnect_base,
                                     std::chrono::milliseconds reconnect_max, bool verbose)
    : compositor_(compositor), out_(out),
      reconnect_base_(reconnect_base), reconnect_max_(reconnect_max),
      verbose_(verbose) {}

CompositorTracker::~CompositorTracker() {
    stop();
}

void CompositorTracker::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void CompositorTracker::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    compositor_.interrupt_event_stream();
    worker_.join();
}

void CompositorTracker::run(std::stop_token st) {
    uint32_t attempt = 0;

    while (!st.stop_requested()) {
        auto opened = compositor_.open_event_stream();
        if (!opened) {
            if (attempt == 0) {
                std::println(stderr, "compositor: {}, retrying", opened.error().message);
            }
            if (!sleep_for(st, exponential_backoff(reconnect_base_, reconnect_max_, attempt++))) {
                break;
            }
            continue;
        }

        // stop() may have run before the stream existed to be interrupted.
        if (st.stop_requested()) break;

        attempt = 0;
        connected_.store(true, std::memory_order_relaxed);
        log("compositor event stream connected");
        if (!out_.push({.kind = CompositorMsg::Kind::Connected})) break;

        std::string reason;
        while (!st.stop_requested()) {
            auto ev = compositor_.read_event();
            if (!ev) {
                reason = ev.error().message;
                break;
            }
            if (!*ev) continue;
            if (!out_.push({.kind = CompositorMsg::Kind::Event, .event = std::move(**ev)})) {
                reason = "shutting down";
                break;
            }
        }

        compositor_.close_event_stream();
        connected_.store(false, std::memory_order_relaxed);
        if (st.stop_requested()) break;

        std::println(stderr, "compositor: event stream lost ({}), reconnecting", reason);
        if (!out_.push({.kind = CompositorMsg::Kind::Disconnected, .reason = reason})) break;
        if (!sleep_for(st, exponential_backoff(reconnect_base_, reconnect_max_, attempt++))) break;
    }

    compositor_.close_event_stream();
    connected_.store(false, std::memory_order_relaxed);
}

bool CompositorTracker::sleep_for(std::stop_token st, std::chrono::milliseconds delay) {
    std::unique_lock lock(sleep_mu_);
    sleep_cv_.wait_for(lock, st, delay, [] { return false; });
    return !st.stop_requested();
}

void CompositorTracker::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[driftd] {}", msg);
    }
}
