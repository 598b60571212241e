#include "supervisor/supervisor.hpp"

#include "platform/platform_paths.hpp"
#include "storage/state_store.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <format>
#include <print>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

std::string iso_in(std::chrono::milliseconds delay) {
    auto t = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now() + delay);
    return std::format("{:%FT%TZ}", t);
}

std::string describe_exit(const ExitStatus& st) {
    if (st.signal != 0) return std::format("killed by signal {}", st.signal);
    return std::format("exit code {}", st.code);
}

std::string working_dir(const std::string& repo, const std::string& cwd) {
    if (cwd.empty() || cwd == ".") return repo;
    if (fs::path(cwd).is_absolute() || repo.empty()) return cwd;
    return (fs::path(repo) / cwd).string();
}

} // namespace

std::string_view to_string(ServiceStatus s) {
    switch (s) {
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Running: return "running";
        case ServiceStatus::Exited: return "exited";
        case ServiceStatus::Crashed: return "crashed";
        case ServiceStatus::Backoff: return "backoff";
        case ServiceStatus::Stopped: return "stopped";
        case ServiceStatus::FailedPermanently: return "failed-permanently";
    }
    return "stopped";
}

Supervisor::Supervisor(BackoffParams params, std::chrono::milliseconds stop_timeout,
                       Channel<SupervisorMsg>& channel, EventSink sink, bool verbose)
    : params_(params), stop_timeout_(stop_timeout), channel_(channel),
      sink_(std::move(sink)), verbose_(verbose) {}

Supervisor::~Supervisor() {
    // Watchers block in waitpid until their group dies, so nothing may
    // outlive the supervisor.
    for (auto& [_, rt] : projects_) {
        for (auto& svc : rt.services) {
            if (svc.live()) platform::signal_group(svc.pid, SIGKILL);
        }
    }
    channel_.close();
    workers_.clear();
}

// --- Projects ---

void Supervisor::open_project(const ProjectConfig& project) {
    if (project_open(project.name)) return;

    auto& rt = projects_[project.name];
    rt.repo = project.repo;
    rt.env = project.env;
    rt.closing = false;

    for (const auto& spec : project.services) {
        if (is_interactive_agent(spec)) continue;

        auto it = std::ranges::find_if(rt.services,
                                       [&](const ManagedService& s) { return s.spec.name == spec.name; });
        if (it == rt.services.end()) {
            ManagedService svc;
            svc.spec = spec;
            svc.log_path = platform::logs_dir(project.name) + "/" + spec.name + ".log";
            rt.services.push_back(std::move(svc));
        } else if (!it->live() && !it->stopping) {
            it->spec = spec;
        }
    }

    journal(project.name, "project opened");
    log(std::format("opening project '{}' ({} services)", project.name, rt.services.size()));

    for (auto& svc : rt.services) {
        if (svc.live() || svc.stopping || svc.status == ServiceStatus::Backoff) continue;
        svc.attempt = 0;
        if (auto r = start(project.name, svc.spec.name); !r) {
            std::println(stderr, "supervisor: {}", r.error().message);
        }
    }
}

void Supervisor::close_project(const std::string& project) {
    auto it = projects_.find(project);
    if (it == projects_.end()) return;

    it->second.closing = true;
    journal(project, "project closing");
    stop_all(project);
    maybe_forget_project(project);
}

bool Supervisor::project_open(const std::string& project) const {
    auto it = projects_.find(project);
    return it != projects_.end() && !it->second.closing;
}

// --- Start ---

std::expected<void, Error> Supervisor::start(const std::string& project,
                                             const std::string& service) {
    auto pit = projects_.find(project);
    auto* svc = find_mut(project, service);
    if (pit == projects_.end() || !svc) {
        return std::unexpected(
            Error{ErrorCode::Spawn, std::format("unknown service '{}/{}'", project, service)});
    }
    if (svc->live() || svc->stopping) return {};

    svc->restart_at.reset();
    svc->next_restart_at.clear();
    set_status(project, pit->second, *svc, ServiceStatus::Starting);

    auto r = spawn(project, pit->second, *svc);
    if (!r) {
        ExitStatus failed{.code = -1, .spawn_failed = true};
        set_status(project, pit->second, *svc, ServiceStatus::Crashed);
        emit(project, "service.crashed", "error",
             std::format("Service '{}' failed to start", service), r.error().message);
        apply_decision(project, pit->second, *svc, failed);
        return r;
    }

    emit(project, "service.started", "info", std::format("Service '{}' started", service), {},
         json{{"pid", svc->pid}});
    return {};
}

std::expected<void, Error> Supervisor::spawn(const std::string& project, ProjectRuntime& rt,
                                             ManagedService& svc) {
    auto env = rt.env;
    env["DRIFT_PROJECT"] = project;
    env["DRIFT_SERVICE"] = svc.spec.name;

    auto now_iso = iso_now();
    platform::SpawnRequest req{
        .command = launch_command(svc.spec, project),
        .cwd = working_dir(rt.repo, svc.spec.cwd),
        .env = std::move(env),
        .log_path = svc.log_path,
        .log_marker = std::format("\n--- service '{}' started at {} ---\n", svc.spec.name, now_iso),
    };

    auto pid = platform::spawn_process_group(req);
    if (!pid) {
        return std::unexpected(Error{
            ErrorCode::Spawn, std::format("service '{}/{}': {}", project, svc.spec.name,
                                          pid.error().message)});
    }

    svc.pid = *pid;
    ++svc.generation;
    svc.started = Clock::now();
    svc.started_at = now_iso;
    svc.latch = std::make_shared<ExitLatch>();
    set_status(project, rt, svc, ServiceStatus::Running);
    watch(project, svc);

    log(std::format("started '{}/{}' (pid {})", project, svc.spec.name, svc.pid));
    return {};
}

void Supervisor::watch(const std::string& project, ManagedService& svc) {
    run_worker([&channel = channel_, project, service = svc.spec.name, generation = svc.generation,
                pid = svc.pid, latch = svc.latch] {
        auto status = platform::wait_for_exit(pid);
        latch->set();
        channel.push(SupervisorMsg{.kind = SupervisorMsg::Kind::Exited,
                                   .project = project,
                                   .service = service,
                                   .generation = generation,
                                   .status = status});
    });
}

// --- Exit and restart ---

void Supervisor::handle(const SupervisorMsg& msg) {
    switch (msg.kind) {
        case SupervisorMsg::Kind::Exited:
            observe_exit(msg.project, msg.service, msg.generation, msg.status);
            break;
        case SupervisorMsg::Kind::StopFinished:
            on_stop_finished(msg.project, msg.service, msg.generation);
            break;
    }
    reap_workers();
}

void Supervisor::observe_exit(const std::string& project, const std::string& service,
                              uint64_t generation, const ExitStatus& status) {
    auto pit = projects_.find(project);
    auto* svc = find_mut(project, service);
    if (pit == projects_.end() || !svc || svc->generation != generation) {
        log(std::format("ignoring stale exit of '{}/{}'", project, service));
        return;
    }

    int pgid = svc->pid;
    svc->pid = 0;
    svc->last_exit_code = status.code;

    // The leader is gone; take the rest of its group with it.
    if (platform::group_alive(pgid)) platform::signal_group(pgid, SIGKILL);

    auto ran_for = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - svc->started);
    svc->attempt = effective_attempt(svc->attempt, ran_for, params_);

    if (status.success()) {
        set_status(project, pit->second, *svc, ServiceStatus::Exited);
        emit(project, "service.stopped", "info", std::format("Service '{}' exited", service),
             describe_exit(status));
    } else {
        set_status(project, pit->second, *svc, ServiceStatus::Crashed);
        emit(project, "service.crashed", "error", std::format("Service '{}' crashed", service),
             describe_exit(status), json{{"exit_code", status.code}});
    }

    apply_decision(project, pit->second, *svc, status);
    maybe_forget_project(project);
}

void Supervisor::apply_decision(const std::string& project, ProjectRuntime& rt,
                                ManagedService& svc, const ExitStatus& status) {
    if (rt.closing) {
        set_status(project, rt, svc, ServiceStatus::Stopped);
        return;
    }

    auto decision = decide_restart(svc.spec.restart, status, svc.attempt, params_);
    switch (decision.action) {
        case RestartDecision::Action::Stop:
            set_status(project, rt, svc, ServiceStatus::Stopped);
            break;

        case RestartDecision::Action::Restart:
            svc.restart_at = Clock::now() + decision.delay;
            svc.next_restart_at = iso_in(decision.delay);
            ++svc.attempt;
            set_status(project, rt, svc, ServiceStatus::Backoff);
            log(std::format("restarting '{}/{}' in {}ms", project, svc.spec.name,
                            decision.delay.count()));
            break;

        case RestartDecision::Action::GiveUp:
            set_status(project, rt, svc, ServiceStatus::FailedPermanently);
            emit(project, "service.failed", "error",
                 std::format("Service '{}' failed permanently", svc.spec.name),
                 std::format("gave up after {} restarts", svc.restart_count),
                 json{{"restart_count", svc.restart_count}});
            break;
    }
}

void Supervisor::tick(Clock::time_point now) {
    for (auto& [project, rt] : projects_) {
        for (auto& svc : rt.services) {
            if (svc.status != ServiceStatus::Backoff || !svc.restart_at || *svc.restart_at > now) {
                continue;
            }
            svc.restart_at.reset();
            svc.next_restart_at.clear();
            set_status(project, rt, svc, ServiceStatus::Starting);

            auto r = spawn(project, rt, svc);
            if (!r) {
                std::println(stderr, "supervisor: {}", r.error().message);
                set_status(project, rt, svc, ServiceStatus::Crashed);
                emit(project, "service.crashed", "error",
                     std::format("Service '{}' failed to restart", svc.spec.name),
                     r.error().message);
                apply_decision(project, rt, svc, ExitStatus{.code = -1, .spawn_failed = true});
                continue;
            }

            ++svc.restart_count;
            emit(project, "service.restarted", "warn",
                 std::format("Service '{}' restarted", svc.spec.name), {},
                 json{{"pid", svc.pid}, {"restart_count", svc.restart_count}});
        }
    }
    reap_workers();
}

std::optional<Clock::time_point> Supervisor::next_deadline() const {
    std::optional<Clock::time_point> next;
    for (const auto& [_, rt] : projects_) {
        for (const auto& svc : rt.services) {
            if (svc.status != ServiceStatus::Backoff || !svc.restart_at) continue;
            if (!next || *svc.restart_at < *next) next = svc.restart_at;
        }
    }
    return next;
}

// --- Stop ---

void Supervisor::stop(const std::string& project, const std::string& service) {
    auto pit = projects_.find(project);
    auto* svc = find_mut(project, service);
    if (pit == projects_.end() || !svc || svc->stopping) return;

    if (!svc->live()) {
        if (svc->status == ServiceStatus::Backoff) {
            svc->restart_at.reset();
            svc->next_restart_at.clear();
            set_status(project, pit->second, *svc, ServiceStatus::Stopped);
            emit(project, "service.stopped", "info", std::format("Service '{}' stopped", service));
        }
        return;
    }

    svc->stopping = true;
    ++svc->generation;
    journal(project, std::format("{}: stop requested", service));

    auto env = pit->second.env;
    env["DRIFT_PROJECT"] = project;
    env["DRIFT_SERVICE"] = service;

    run_worker([&channel = channel_, project, service, generation = svc->generation,
                pid = svc->pid, latch = svc->latch, stop_command = svc->spec.stop_command,
                cwd = working_dir(pit->second.repo, svc->spec.cwd), env = std::move(env),
                timeout = stop_timeout_] {
        // The stop command and the wait for exit share one budget.
        auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!stop_command.empty()) {
            if (!platform::run_command(stop_command, cwd, env, timeout)) {
                std::println(stderr, "supervisor: stop command for '{}/{}' failed", project,
                             service);
            }
        } else {
            platform::signal_group(pid, SIGTERM);
        }

        if (!latch->wait_until(deadline)) {
            platform::signal_group(pid, SIGKILL);
            latch->wait_for(std::chrono::seconds(1));
        }
        if (platform::group_alive(pid)) platform::signal_group(pid, SIGKILL);

        channel.push(SupervisorMsg{.kind = SupervisorMsg::Kind::StopFinished,
                                   .project = project,
                                   .service = service,
                                   .generation = generation,
                                   .status = {}});
    });
}

void Supervisor::on_stop_finished(const std::string& project, const std::string& service,
                                  uint64_t generation) {
    auto pit = projects_.find(project);
    auto* svc = find_mut(project, service);
    if (pit == projects_.end() || !svc || svc->generation != generation) return;

    svc->pid = 0;
    svc->stopping = false;
    svc->restart_at.reset();
    svc->next_restart_at.clear();
    set_status(project, pit->second, *svc, ServiceStatus::Stopped);
    emit(project, "service.stopped", "info", std::format("Service '{}' stopped", service));

    maybe_forget_project(project);
}

void Supervisor::stop_all(const std::string& project) {
    auto it = projects_.find(project);
    if (it == projects_.end()) return;

    std::vector<std::string> names;
    for (const auto& svc : it->second.services) names.push_back(svc.spec.name);
    for (const auto& name : names) stop(project, name);
}

void Supervisor::stop_everything() {
    for (auto& name : projects()) {
        projects_[name].closing = true;
        stop_all(name);
        maybe_forget_project(name);
    }
}

void Supervisor::maybe_forget_project(const std::string& project) {
    auto it = projects_.find(project);
    if (it == projects_.end() || !it->second.closing) return;

    bool busy = std::ranges::any_of(it->second.services, [](const ManagedService& s) {
        return s.live() || s.stopping;
    });
    if (busy) return;

    persist(project);
    journal(project, "project closed");
    projects_.erase(it);
}

bool Supervisor::has_live_processes() const {
    for (const auto& [_, rt] : projects_) {
        for (const auto& svc : rt.services) {
            if (svc.live() || svc.stopping) return true;
        }
    }
    return false;
}

bool Supervisor::wait_idle(std::chrono::steady_clock::time_point deadline) {
    while (has_live_processes()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto wait = std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                  std::chrono::milliseconds(100));
        if (auto msg = channel_.pop_for(wait)) handle(*msg);
    }
    return true;
}

// --- Persistence ---

bool Supervisor::dirty() const {
    return std::ranges::any_of(projects_, [](const auto& p) { return p.second.dirty; });
}

void Supervisor::persist_dirty() {
    for (auto& [project, rt] : projects_) {
        if (rt.dirty) persist(project);
    }
}

void Supervisor::persist(const std::string& project) {
    auto it = projects_.find(project);
    if (it == projects_.end()) return;

    auto r = storage::write_json(platform::services_state_path(project), state_json(project));
    if (!r) {
        std::println(stderr, "supervisor: {}", r.error().message);
        return;
    }
    it->second.dirty = false;
}

json Supervisor::state_json(const std::string& project) const {
    json services = json::array();
    auto it = projects_.find(project);
    if (it != projects_.end()) {
        for (const auto& svc : it->second.services) {
            auto* agent = svc.spec.agent();
            services.push_back({
                {"name", svc.spec.name},
                {"pid", svc.live() ? json(svc.pid) : json(nullptr)},
                {"status", std::string(to_string(svc.status))},
                {"restart_count", svc.restart_count},
                {"last_exit_code", svc.last_exit_code ? json(*svc.last_exit_code) : json(nullptr)},
                {"next_restart_at",
                 svc.next_restart_at.empty() ? json(nullptr) : json(svc.next_restart_at)},
                {"started_at", svc.started_at.empty() ? json(nullptr) : json(svc.started_at)},
                {"is_agent", agent != nullptr},
                {"agent_type", agent ? json(agent->kind) : json(nullptr)},
            });
        }
    }
    return {
        {"supervisor_pid", ::getpid()},
        {"project", project},
        {"services", std::move(services)},
    };
}

// --- Lookup ---

const ManagedService* Supervisor::find(const std::string& project,
                                       const std::string& service) const {
    auto it = projects_.find(project);
    if (it == projects_.end()) return nullptr;
    auto sit = std::ranges::find_if(it->second.services,
                                    [&](const ManagedService& s) { return s.spec.name == service; });
    return sit != it->second.services.end() ? &*sit : nullptr;
}

ManagedService* Supervisor::find_mut(const std::string& project, const std::string& service) {
    return const_cast<ManagedService*>(std::as_const(*this).find(project, service));
}

std::vector<std::string> Supervisor::projects() const {
    std::vector<std::string> out;
    for (const auto& [name, _] : projects_) out.push_back(name);
    return out;
}

// --- Helpers ---

void Supervisor::set_status(const std::string& project, ProjectRuntime& rt, ManagedService& svc,
                            ServiceStatus status) {
    if (svc.status == status) return;
    journal(project, std::format("{}: {} -> {}", svc.spec.name, to_string(svc.status),
                                 to_string(status)));
    svc.status = status;
    rt.dirty = true;
}

void Supervisor::run_worker(std::function<void()> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{
        .thread = std::jthread([fn = std::move(fn), done] {
            fn();
            done->store(true, std::memory_order_release);
        }),
        .done = done,
    });
}

void Supervisor::reap_workers() {
    std::erase_if(workers_, [](const Worker& w) { return w.done->load(std::memory_order_acquire); });
}

void Supervisor::emit(const std::string& project, std::string type, std::string level,
                      std::string title, std::string body, json meta) {
    if (!sink_) return;
    sink_(make_event(std::move(type), project, "supervisor", std::move(level), std::move(title),
                     std::move(body), std::move(meta)));
}

void Supervisor::journal(const std::string& project, const std::string& line) {
    auto path = platform::logs_dir(project) + "/supervisor.log";
    if (!storage::append_line(path, std::format("{} {}", iso_now(), line))) {
        log("could not append to " + path);
    }
}

void Supervisor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[driftd] {}", msg);
    }
}
