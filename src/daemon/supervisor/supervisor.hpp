#pragma once

#include "bus/event.hpp"
#include "channel.hpp"
#include "errors.hpp"
#include "platform/process.hpp"
#include "project.hpp"
#include "supervisor/restart_policy.hpp"
#include "supervisor/service.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

enum class ServiceStatus { Starting, Running, Exited, Crashed, Backoff, Stopped, FailedPermanently };

std::string_view to_string(ServiceStatus s);

// Posted by exit watchers and stoppers; consumed on the coordinator thread.
struct SupervisorMsg {
    enum class Kind { Exited, StopFinished };

    Kind kind;
    std::string project;
    std::string service;
    uint64_t generation = 0; // stale messages are ignored
    ExitStatus status;
};

// Set by the exit watcher once the group leader has been reaped.
class ExitLatch {
public:
    void set() {
        {
            std::lock_guard lock(mu_);
            exited_ = true;
        }
        cv_.notify_all();
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mu_);
        return cv_.wait_for(lock, timeout, [this] { return exited_; });
    }

    bool wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock lock(mu_);
        return cv_.wait_until(lock, deadline, [this] { return exited_; });
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    bool exited_ = false;
};

struct ManagedService {
    ServiceSpec spec;
    ServiceStatus status = ServiceStatus::Stopped;
    int pid = 0;               // also the process group id
    uint32_t attempt = 0;      // consecutive quick restarts
    uint32_t restart_count = 0;
    std::optional<int> last_exit_code;
    uint64_t generation = 0;
    bool stopping = false;
    std::chrono::steady_clock::time_point started;
    std::string started_at;    // RFC 3339
    std::optional<std::chrono::steady_clock::time_point> restart_at;
    std::string next_restart_at;
    std::shared_ptr<ExitLatch> latch;
    std::string log_path;

    bool live() const { return pid > 0; }
};

// Lifecycle of every project's services. All methods run on the coordinator
// thread; blocking waits happen on watcher and stopper threads, which report
// back only through the channel.
class Supervisor {
public:
    using EventSink = std::function<void(Event)>;

    Supervisor(BackoffParams params, std::chrono::milliseconds stop_timeout,
               Channel<SupervisorMsg>& channel, EventSink sink, bool verbose = false);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Registers the project's services (interactive agents excluded) and
    // starts those not already running. No-op while the project is open.
    void open_project(const ProjectConfig& project);
    void close_project(const std::string& project);
    bool project_open(const std::string& project) const;

    std::expected<void, Error> start(const std::string& project, const std::string& service);
    void stop(const std::string& project, const std::string& service);
    void stop_all(const std::string& project);
    void stop_everything();

    void handle(const SupervisorMsg& msg);
    void observe_exit(const std::string& project, const std::string& service,
                      uint64_t generation, const ExitStatus& status);

    // Fires due restarts.
    void tick(std::chrono::steady_clock::time_point now);
    std::optional<std::chrono::steady_clock::time_point> next_deadline() const;

    bool has_live_processes() const;
    // Handles watcher and stopper reports until nothing is live or `deadline`
    // passes. Returns false on timeout.
    bool wait_idle(std::chrono::steady_clock::time_point deadline);
    bool dirty() const;
    void persist_dirty();
    void persist(const std::string& project);

    const ManagedService* find(const std::string& project, const std::string& service) const;
    std::vector<std::string> projects() const;
    nlohmann::json state_json(const std::string& project) const;

private:
    struct ProjectRuntime {
        std::string repo;
        std::map<std::string, std::string> env;
        std::vector<ManagedService> services;
        bool closing = false;
        bool dirty = false;
    };

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ManagedService* find_mut(const std::string& project, const std::string& service);
    std::expected<void, Error> spawn(const std::string& project, ProjectRuntime& rt,
                                     ManagedService& svc);
    void watch(const std::string& project, ManagedService& svc);
    void on_stop_finished(const std::string& project, const std::string& service,
                          uint64_t generation);
    void apply_decision(const std::string& project, ProjectRuntime& rt, ManagedService& svc,
                        const ExitStatus& status);
    void set_status(const std::string& project, ProjectRuntime& rt, ManagedService& svc,
                    ServiceStatus status);
    void maybe_forget_project(const std::string& project);
    void run_worker(std::function<void()> fn);
    void reap_workers();
    void emit(const std::string& project, std::string type, std::string level,
              std::string title, std::string body = {}, nlohmann::json meta = nullptr);
    void journal(const std::string& project, const std::string& line);
    void log(const std::string& msg);

    BackoffParams params_;
    std::chrono::milliseconds stop_timeout_;
    Channel<SupervisorMsg>& channel_;
    EventSink sink_;
    bool verbose_;

    std::map<std::string, ProjectRuntime> projects_;
    std::list<Worker> workers_;
};
