#include <catch2/catch_test_macros.hpp>

#include "platform/platform_paths.hpp"
#include "platform/process.hpp"
#include "storage/state_store.hpp"
#include "supervisor/supervisor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("drift_test_supervisor_" + std::to_string(getpid()));
        fs::remove_all(path);
        fs::create_directories(path / "repo");
        setenv("XDG_STATE_HOME", (path / "state").c_str(), 1);
    }

    ~TmpDir() { fs::remove_all(path); }
};

struct Harness {
    Channel<SupervisorMsg> channel{64};
    std::vector<Event> events;
    Supervisor sup;

    explicit Harness(BackoffParams params, std::chrono::milliseconds stop_timeout = 2s)
        : sup(params, stop_timeout, channel, [this](Event e) { events.push_back(std::move(e)); }) {}

    // Feeds watcher and stopper messages back in, as the coordinator loop does.
    bool pump_until(const std::function<bool()>& done, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            if (auto msg = channel.pop_for(20ms)) sup.handle(*msg);
            sup.tick(std::chrono::steady_clock::now());
        }
        return true;
    }

    size_t count(const std::string& type) const {
        return std::ranges::count_if(events, [&](const Event& e) { return e.type == type; });
    }

    ServiceStatus status(const std::string& service) const {
        auto* svc = sup.find("myapp", service);
        return svc ? svc->status : ServiceStatus::Stopped;
    }
};

ProjectConfig project_with(const fs::path& repo, std::vector<ServiceSpec> services) {
    ProjectConfig p;
    p.name = "myapp";
    p.repo = repo.string();
    p.env = {{"GREETING", "hello"}};
    p.services = std::move(services);
    return p;
}

ServiceSpec service(const std::string& name, const std::string& command,
                    RestartPolicy restart = RestartPolicy::Never) {
    ServiceSpec s;
    s.name = name;
    s.restart = restart;
    s.launch = ServiceLaunch{command};
    return s;
}

std::string slurp(const fs::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

BackoffParams fast_backoff() {
    return {.base = 20ms, .max = 200ms, .stability = 5s, .max_restarts = 0};
}

} // namespace

TEST_CASE("Supervisor", "[supervisor]") {
    TmpDir dir;

    SECTION("CleanExitWithNeverPolicy") {
        Harness h(fast_backoff());
        h.sup.open_project(project_with(dir.path / "repo", {service("once", "echo ran")}));
        REQUIRE(h.count("service.started") == 1);

        REQUIRE(h.pump_until([&] { return h.status("once") == ServiceStatus::Stopped; }));
        auto* svc = h.sup.find("myapp", "once");
        REQUIRE(svc->last_exit_code == 0);
        REQUIRE_FALSE(svc->live());
        REQUIRE(h.count("service.stopped") == 1);

        auto log = slurp(platform::logs_dir("myapp") + "/once.log");
        REQUIRE(log.find("--- service 'once' started at ") != std::string::npos);
        REQUIRE(log.find("ran") != std::string::npos);

        auto journal = slurp(platform::logs_dir("myapp") + "/supervisor.log");
        REQUIRE(journal.find("once") != std::string::npos);
    }

    SECTION("EnvironmentAndWorkingDirectory") {
        Harness h(fast_backoff());
        h.sup.open_project(project_with(
            dir.path / "repo",
            {service("env", R"(echo "$DRIFT_PROJECT/$DRIFT_SERVICE/$GREETING" > out.txt)")}));

        REQUIRE(h.pump_until([&] { return h.status("env") == ServiceStatus::Stopped; }));
        REQUIRE(slurp(dir.path / "repo" / "out.txt") == "myapp/env/hello\n");
    }

    SECTION("CrashRestartsWithBackoff") {
        Harness h(fast_backoff());
        h.sup.open_project(
            project_with(dir.path / "repo", {service("flaky", "exit 3", RestartPolicy::OnFailure)}));

        REQUIRE(h.pump_until([&] { return h.count("service.crashed") >= 1; }));
        auto* svc = h.sup.find("myapp", "flaky");
        REQUIRE(svc->last_exit_code == 3);
        REQUIRE(svc->status == ServiceStatus::Backoff);
        REQUIRE(svc->attempt == 1);
        REQUIRE_FALSE(svc->next_restart_at.empty());
        REQUIRE(h.sup.next_deadline().has_value());

        REQUIRE(h.pump_until([&] { return h.count("service.restarted") >= 2; }));
        REQUIRE(svc->restart_count >= 2);
        REQUIRE(svc->attempt >= 2);

        h.sup.stop("myapp", "flaky");
        REQUIRE(h.pump_until([&] { return h.status("flaky") == ServiceStatus::Stopped &&
                                          !h.sup.has_live_processes(); }));
    }

    SECTION("GivesUpAfterMaxRestarts") {
        auto params = fast_backoff();
        params.max_restarts = 2;
        Harness h(params);
        h.sup.open_project(
            project_with(dir.path / "repo", {service("broken", "exit 1", RestartPolicy::Always)}));

        REQUIRE(h.pump_until([&] { return h.status("broken") == ServiceStatus::FailedPermanently; }));
        REQUIRE(h.count("service.failed") == 1);
        REQUIRE(h.count("service.restarted") == 2);
        REQUIRE_FALSE(h.sup.next_deadline().has_value());
    }

    SECTION("GracefulStop") {
        Harness h(fast_backoff());
        h.sup.open_project(
            project_with(dir.path / "repo", {service("server", "sleep 30", RestartPolicy::Always)}));
        int pid = h.sup.find("myapp", "server")->pid;
        REQUIRE(pid > 0);

        h.sup.stop("myapp", "server");
        REQUIRE(h.pump_until([&] { return h.status("server") == ServiceStatus::Stopped &&
                                          !h.sup.has_live_processes(); }));
        REQUIRE_FALSE(platform::group_alive(pid));
        REQUIRE(h.count("service.restarted") == 0);
    }

    SECTION("WaitIdleAfterStopEverything") {
        Harness h(fast_backoff());
        h.sup.open_project(project_with(dir.path / "repo",
                                        {service("a", "sleep 30"), service("b", "sleep 30")}));
        REQUIRE_FALSE(h.sup.wait_idle(std::chrono::steady_clock::now() + 50ms));

        h.sup.stop_everything();
        REQUIRE(h.sup.wait_idle(std::chrono::steady_clock::now() + 5s));
        REQUIRE_FALSE(h.sup.project_open("myapp"));
        REQUIRE(h.count("service.stopped") == 2);
    }

    SECTION("ForcedStopAfterTimeout") {
        Harness h(fast_backoff(), 200ms);
        h.sup.open_project(project_with(dir.path / "repo",
                                        {service("stubborn", "trap '' TERM; sleep 30")}));
        int pid = h.sup.find("myapp", "stubborn")->pid;
        std::this_thread::sleep_for(50ms);

        auto start = std::chrono::steady_clock::now();
        h.sup.stop("myapp", "stubborn");
        REQUIRE(h.pump_until([&] { return !h.sup.has_live_processes(); }));
        REQUIRE(std::chrono::steady_clock::now() - start >= 200ms);
        REQUIRE(h.status("stubborn") == ServiceStatus::Stopped);
        REQUIRE_FALSE(platform::group_alive(pid));
    }

    SECTION("StopCommand") {
        Harness h(fast_backoff());
        auto svc = service("db", "sleep 30");
        svc.stop_command = "touch stopped.marker; kill -TERM -$(cat pid.txt)";
        svc.launch = ServiceLaunch{"echo $$ > pid.txt; exec sleep 30"};
        h.sup.open_project(project_with(dir.path / "repo", {svc}));
        REQUIRE(h.pump_until([&] { return fs::exists(dir.path / "repo" / "pid.txt") &&
                                          fs::file_size(dir.path / "repo" / "pid.txt") > 0; }));

        h.sup.stop("myapp", "db");
        REQUIRE(h.pump_until([&] { return !h.sup.has_live_processes(); }));
        REQUIRE(fs::exists(dir.path / "repo" / "stopped.marker"));
    }

    SECTION("HungStopCommandSharesStopTimeout") {
        Harness h(fast_backoff(), 500ms);
        auto svc = service("db", "exec sleep 30");
        svc.stop_command = "sleep 30";
        h.sup.open_project(project_with(dir.path / "repo", {svc}));
        int pid = h.sup.find("myapp", "db")->pid;

        auto start = std::chrono::steady_clock::now();
        h.sup.stop("myapp", "db");
        REQUIRE(h.pump_until([&] { return h.status("db") == ServiceStatus::Stopped; }));
        // One stop timeout in total, not one for the command and another for the exit.
        CHECK(std::chrono::steady_clock::now() - start < 900ms);
        CHECK_FALSE(platform::group_alive(pid));
    }

    SECTION("IgnoredStopCommandKilledAfterStopTimeout") {
        Harness h(fast_backoff(), 500ms);
        auto svc = service("db", "exec sleep 30");
        svc.stop_command = "true";
        h.sup.open_project(project_with(dir.path / "repo", {svc}));
        int pid = h.sup.find("myapp", "db")->pid;

        auto start = std::chrono::steady_clock::now();
        h.sup.stop("myapp", "db");
        REQUIRE(h.pump_until([&] { return h.status("db") == ServiceStatus::Stopped; }));
        CHECK(std::chrono::steady_clock::now() - start >= 500ms);
        CHECK(std::chrono::steady_clock::now() - start < 900ms);
        CHECK_FALSE(platform::group_alive(pid));
    }

    SECTION("StragglersKilledWithLeader") {
        Harness h(fast_backoff());
        h.sup.open_project(project_with(dir.path / "repo", {service("forks", "sleep 30 & exit 0")}));
        int pid = h.sup.find("myapp", "forks")->pid;

        REQUIRE(h.pump_until([&] { return h.status("forks") == ServiceStatus::Stopped; }));
        REQUIRE(h.pump_until([&] { return !platform::group_alive(pid); }, 2s));
    }

    SECTION("SpawnFailure") {
        Harness h(fast_backoff());
        auto svc = service("nowhere", "true");
        svc.cwd = "does/not/exist";
        h.sup.open_project(project_with(dir.path / "repo", {svc}));

        REQUIRE(h.count("service.crashed") == 1);
        REQUIRE(h.status("nowhere") == ServiceStatus::Stopped);

        auto r = h.sup.start("myapp", "nowhere");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::Spawn);
    }

    SECTION("InteractiveAgentsAreSkipped") {
        Harness h(fast_backoff());
        ServiceSpec chat;
        chat.name = "chat";
        chat.launch = AgentLaunch{.kind = "claude", .mode = "interactive"};
        h.sup.open_project(project_with(dir.path / "repo", {chat, service("web", "sleep 30")}));

        REQUIRE(h.sup.find("myapp", "chat") == nullptr);
        REQUIRE(h.sup.find("myapp", "web") != nullptr);
        h.sup.stop_all("myapp");
        REQUIRE(h.pump_until([&] { return !h.sup.has_live_processes(); }));
    }

    SECTION("ReopenDoesNotRestart") {
        Harness h(fast_backoff());
        auto project = project_with(dir.path / "repo", {service("once", "true")});
        h.sup.open_project(project);
        REQUIRE(h.pump_until([&] { return h.status("once") == ServiceStatus::Stopped; }));

        h.sup.open_project(project);
        REQUIRE(h.count("service.started") == 1);
    }

    SECTION("CloseProjectStopsAndForgets") {
        Harness h(fast_backoff());
        h.sup.open_project(project_with(dir.path / "repo",
                                        {service("a", "sleep 30"), service("b", "sleep 30")}));
        REQUIRE(h.sup.project_open("myapp"));

        h.sup.close_project("myapp");
        REQUIRE_FALSE(h.sup.project_open("myapp"));
        REQUIRE(h.pump_until([&] { return h.sup.projects().empty(); }));
        REQUIRE(h.count("service.stopped") == 2);

        auto state = storage::read_json(platform::services_state_path("myapp"));
        REQUIRE(state.has_value());
        for (const auto& s : (*state)["services"]) {
            REQUIRE(s["status"] == "stopped");
            REQUIRE(s["pid"].is_null());
        }
    }

    SECTION("PersistedState") {
        Harness h(fast_backoff());
        ServiceSpec agent;
        agent.name = "reviewer";
        agent.launch = AgentLaunch{.kind = "true"};
        h.sup.open_project(project_with(dir.path / "repo", {service("web", "sleep 30"), agent}));
        REQUIRE(h.sup.dirty());
        h.sup.persist_dirty();
        REQUIRE_FALSE(h.sup.dirty());

        auto state = storage::read_json(platform::services_state_path("myapp"));
        REQUIRE(state.has_value());
        REQUIRE((*state)["project"] == "myapp");
        REQUIRE((*state)["supervisor_pid"] == getpid());

        const auto& services = (*state)["services"];
        REQUIRE(services.size() == 2);
        REQUIRE(services[0]["name"] == "web");
        REQUIRE(services[0]["status"] == "running");
        REQUIRE(services[0]["pid"].is_number());
        REQUIRE(services[0]["is_agent"] == false);
        REQUIRE(services[1]["is_agent"] == true);
        REQUIRE(services[1]["agent_type"] == "true");

        h.sup.stop_everything();
        REQUIRE(h.pump_until([&] { return !h.sup.has_live_processes(); }));
    }
}
