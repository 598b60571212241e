#include "coordinator.hpp"

#include "bus/priority.hpp"
#include "platform/platform_paths.hpp"
#include "storage/state_store.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <set>
#include <unistd.h>

namespace {

constexpr std::string_view PROJECT_OPENED = "drift.project.opened";
constexpr std::string_view PROJECT_CLOSED = "drift.project.closed";
constexpr std::string_view CONFIG_CHANGED = "drift.config.changed";

BackoffParams backoff_params(const Config::Supervisor& s) {
    return {
        .base = std::chrono::milliseconds(s.backoff_base_ms),
        .max = std::chrono::milliseconds(s.backoff_max_ms),
        .stability = std::chrono::milliseconds(s.stability_ms),
        .max_restarts = s.max_restarts,
    };
}

} // namespace

Coordinator::Coordinator(Config config, Channel<SupervisorMsg>& supervisor_channel,
                         PublishFn publish, RequestFn request, ProjectLoader loader,
                         bool verbose)
    : config_(std::move(config)),
      publish_(std::move(publish)),
      request_(std::move(request)),
      loader_(std::move(loader)),
      verbose_(verbose),
      state_(config_.events.buffer_size),
      supervisor_(backoff_params(config_.supervisor),
                  std::chrono::milliseconds(config_.supervisor.stop_timeout_ms),
                  supervisor_channel, [this](Event e) { publish(std::move(e)); }, verbose) {}

void Coordinator::init() {
    reload_projects();
    next_state_write_ = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.daemon.state_write_interval_ms);
    write_daemon_state();
}

// --- Ingress ---

void Coordinator::handle_ingress(Event event) {
    auto type = event.type;
    auto project = event.project;
    publish(std::move(event));

    if (type == PROJECT_OPENED) {
        open_project(project, true);
    } else if (type == PROJECT_CLOSED) {
        close_project(project, true);
    } else if (type == CONFIG_CHANGED) {
        reload_projects();
    }
}

// --- Compositor ---

void Coordinator::handle_compositor(CompositorMsg msg) {
    switch (msg.kind) {
    case CompositorMsg::Kind::Connected:
        state_.compositor_connected = true;
        dirty_ = true;
        log("compositor connected");
        return;
    case CompositorMsg::Kind::Disconnected:
        // active_project stays as last seen
        state_.compositor_connected = false;
        dirty_ = true;
        log(std::format("compositor disconnected: {}", msg.reason));
        return;
    case CompositorMsg::Kind::Event:
        break;
    }
    if (!msg.event) return;

    auto result = state_.workspace.apply(*msg.event);

    if (result.deactivated) write_snapshot(*result.deactivated);
    for (auto& e : result.events) publish(std::move(e));

    for (const auto& p : result.opened) open_project(p, false);
    for (const auto& p : result.closed) close_project(p, false);

    if (result.active_changed) {
        const auto& active = state_.workspace.active_project();
        log(std::format("active project: {}", active ? *active : "(none)"));
    }
    if (result.active_changed || result.structure_changed) dirty_ = true;
}

// --- Supervisor ---

void Coordinator::handle_supervisor(const SupervisorMsg& msg) {
    supervisor_.handle(msg);
}

bool Coordinator::run_turn(Channel<CompositorMsg>& compositor, Channel<SupervisorMsg>& supervisor,
                           Channel<Event>& ingress, std::chrono::steady_clock::time_point now) {
    if (auto msg = compositor.try_pop()) handle_compositor(std::move(*msg));
    if (auto msg = supervisor.try_pop()) handle_supervisor(*msg);
    if (auto e = ingress.try_pop()) handle_ingress(std::move(*e));

    tick(now);
    end_turn();

    return !compositor.empty() || !supervisor.empty() || !ingress.empty();
}

void Coordinator::tick(std::chrono::steady_clock::time_point now) {
    supervisor_.tick(now);

    if (now >= next_state_write_) {
        dirty_ = true;
        next_state_write_ = now + std::chrono::milliseconds(config_.daemon.state_write_interval_ms);
    }
}

std::chrono::steady_clock::time_point Coordinator::next_deadline() const {
    auto deadline = next_state_write_;
    if (auto d = supervisor_.next_deadline()) deadline = std::min(deadline, *d);
    return deadline;
}

void Coordinator::end_turn() {
    if (dirty_) write_daemon_state();
    supervisor_.persist_dirty();
}

// --- Shutdown ---

void Coordinator::begin_shutdown() {
    log("stopping all services");
    supervisor_.stop_everything();
}

void Coordinator::finish_shutdown() {
    for (const auto& project : state_.workspace.project_workspaces()) {
        write_snapshot(state_.workspace.snapshot(project));
    }
    for (const auto& project : supervisor_.projects()) supervisor_.persist(project);
    write_daemon_state();
}

// --- Internals ---

void Coordinator::publish(Event event) {
    const auto& active = state_.workspace.active_project();
    event.seq = next_seq_++;
    event.priority = classify(active && *active == event.project, event.level);

    state_.events.append(event);
    publish_(event);
    mark_urgent(event);
}

void Coordinator::open_project(const std::string& name, bool ask_compositor) {
    auto it = projects_.find(name);
    if (it == projects_.end()) {
        std::println(stderr, "coordinator: unknown project '{}'", name);
        return;
    }

    supervisor_.open_project(it->second);

    if (ask_compositor && config_.compositor.enabled) {
        OpenProjectWorkspace req{.project = name};
        for (const auto& w : it->second.windows) req.window_commands.push_back(w.command);
        request_(std::move(req));
    }
}

void Coordinator::close_project(const std::string& name, bool ask_compositor) {
    supervisor_.close_project(name);

    if (state_.workspace.workspace_for_project(name)) {
        write_snapshot(state_.workspace.snapshot(name));
    }
    if (ask_compositor && config_.compositor.enabled) {
        request_(CloseProjectWorkspace{.project = name});
    }
}

void Coordinator::reload_projects() {
    projects_ = loader_();

    std::set<std::string> names;
    for (const auto& [name, _] : projects_) names.insert(name);
    state_.workspace.set_known_projects(std::move(names));
    dirty_ = true;

    log(std::format("loaded {} project(s)", projects_.size()));
}

// A high-priority event for a project in the background flags one of its
// windows, so the compositor's bar shows where attention is needed.
void Coordinator::mark_urgent(const Event& event) {
    if (event.priority != Priority::High || event.type == "window.urgent") return;
    if (!config_.compositor.enabled || !state_.compositor_connected) return;

    auto windows = state_.workspace.windows_for_project(event.project);
    if (windows.empty()) return;
    if (std::ranges::any_of(windows, [](const Window& w) { return w.is_urgent; })) return;

    request_(MarkWindowUrgent{.window_id = windows.front().id});
}

void Coordinator::write_snapshot(const WorkspaceSnapshot& snap) {
    auto r = storage::write_json(platform::workspace_state_path(snap.project), snap.to_json());
    if (!r) std::println(stderr, "coordinator: {}", r.error().message);
}

void Coordinator::write_daemon_state() {
    uint64_t malformed = malformed_ ? malformed_() : 0;
    auto r = storage::write_json(platform::daemon_state_path(),
                                 state_.to_json(static_cast<int>(getpid()), malformed));
    if (!r) {
        std::println(stderr, "coordinator: {}", r.error().message);
        return;
    }
    dirty_ = false;
}

void Coordinator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[driftd] {}", msg);
    }
}
