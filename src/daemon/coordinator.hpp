#pragma once

#include "bus/event.hpp"
#include "channel.hpp"
#include "compositor/request_issuer.hpp"
#include "compositor/tracker.hpp"
#include "config.hpp"
#include "daemon_state.hpp"
#include "project.hpp"
#include "supervisor/supervisor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

// Sole owner of DaemonState. Every method runs on the main thread; the
// event loop feeds it one message per channel per turn.
class Coordinator {
public:
    using PublishFn = std::function<void(const Event&)>;
    using RequestFn = std::function<void(WorkspaceRequest)>;
    using ProjectLoader = std::function<std::map<std::string, ProjectConfig>()>;
    using CounterFn = std::function<uint64_t()>;

    Coordinator(Config config, Channel<SupervisorMsg>& supervisor_channel,
                PublishFn publish, RequestFn request, ProjectLoader loader,
                bool verbose = false);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    void init();

    void handle_ingress(Event event);
    void handle_compositor(CompositorMsg msg);
    void handle_supervisor(const SupervisorMsg& msg);

    // At most one message from each channel, compositor first so that an
    // event in the same turn is classified against the latest focus. Then
    // tick() and end_turn(). Returns true if any channel still has more.
    bool run_turn(Channel<CompositorMsg>& compositor, Channel<SupervisorMsg>& supervisor,
                  Channel<Event>& ingress, std::chrono::steady_clock::time_point now);

    // Supervisor restarts and the periodic daemon.json write.
    void tick(std::chrono::steady_clock::time_point now);
    std::chrono::steady_clock::time_point next_deadline() const;

    // Flushes whatever the turn made dirty.
    void end_turn();

    void begin_shutdown();
    bool services_live() const { return supervisor_.has_live_processes(); }
    bool wait_idle(std::chrono::steady_clock::time_point deadline) {
        return supervisor_.wait_idle(deadline);
    }
    void finish_shutdown();

    void set_malformed_counter(CounterFn fn) { malformed_ = std::move(fn); }

    const DaemonState& state() const { return state_; }
    Supervisor& supervisor() { return supervisor_; }
    const std::map<std::string, ProjectConfig>& projects() const { return projects_; }

private:
    void publish(Event event);
    void open_project(const std::string& name, bool ask_compositor);
    void close_project(const std::string& name, bool ask_compositor);
    void reload_projects();
    void mark_urgent(const Event& event);
    void write_snapshot(const WorkspaceSnapshot& snap);
    void write_daemon_state();
    void log(const std::string& msg);

    Config config_;
    PublishFn publish_;
    RequestFn request_;
    ProjectLoader loader_;
    bool verbose_;

    DaemonState state_;
    Supervisor supervisor_;
    std::map<std::string, ProjectConfig> projects_;
    CounterFn malformed_;

    uint64_t next_seq_ = 1;
    bool dirty_ = false;
    std::chrono::steady_clock::time_point next_state_write_;
};
