#pragma once

#include "channel.hpp"
#include "compositor/types.hpp"
#include "platform/compositor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

struct CompositorMsg {
    enum class Kind { Connected, Disconnected, Event };

    Kind kind;
    std::optional<CompositorEvent> event; // set for Kind::Event
    std::string reason;                   // set for Kind::Disconnected
};

// Owns the compositor's event stream. Reconnects with exponential backoff
// and forwards everything it reads to the coordinator.
class CompositorTracker {
public:
    CompositorTracker(Compositor& compositor, Channel<CompositorMsg>& out,
                      std::chrono::milliseconds reconnect_base,
                      std::chrono::milliseconds reconnect_max, bool verbose = false);
    ~CompositorTracker();

    CompositorTracker(const CompositorTracker&) = delete;
    CompositorTracker& operator=(const CompositorTracker&) = delete;

    void start();
    void stop();

    bool connected() const { return connected_.load(std::memory_order_relaxed); }

private:
    void run(std::stop_token st);
    // Returns false if stop was requested while waiting.
    bool sleep_for(std::stop_token st, std::chrono::milliseconds delay);
    void log(const std::string& msg);

    Compositor& compositor_;
    Channel<CompositorMsg>& out_;
    std::chrono::milliseconds reconnect_base_;
    std::chrono::milliseconds reconnect_max_;
    bool verbose_;

    std::atomic<bool> connected_{false};
    std::mutex sleep_mu_;
    std::condition_variable_any sleep_cv_;
    std::jthread worker_;
};
