#pragma once

#include "bus/broadcaster.hpp"
#include "bus/event.hpp"
#include "bus/ingress.hpp"
#include "channel.hpp"
#include "compositor/request_issuer.hpp"
#include "compositor/tracker.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "platform/linux/niri_compositor.hpp"
#include "supervisor/supervisor.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    // One message from each channel. Returns true if any channel still has more.
    bool turn();
    void shutdown();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Worker -> coordinator
    Channel<Event> ingress_ch_;
    Channel<CompositorMsg> compositor_ch_;
    Channel<SupervisorMsg> supervisor_ch_;

    // Platform implementations (constructed before core_)
    IngressListener ingress_;
    Broadcaster broadcaster_;
    NiriCompositor compositor_;
    CompositorTracker tracker_;
    RequestIssuer issuer_;

    Coordinator core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
