#pragma once

#include "platform/compositor.hpp"

#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <string>
#include <vector>

// Scripted stand-in for a compositor. Events are fed by the test and read
// by whichever thread owns the stream; every action is recorded.
class FakeCompositor : public Compositor {
public:
    // --- Test controls ---

    void feed(CompositorEvent e) {
        {
            std::lock_guard lock(mu_);
            stream_.push_back(std::move(e));
        }
        cv_.notify_all();
    }

    // The open stream fails on its next read.
    void drop_stream() {
        {
            std::lock_guard lock(mu_);
            drop_ = true;
        }
        cv_.notify_all();
    }

    void fail_next_opens(int n) {
        std::lock_guard lock(mu_);
        failing_opens_ = n;
    }

    void fail_actions(bool fail) {
        std::lock_guard lock(mu_);
        fail_actions_ = fail;
    }

    void set_workspaces(std::vector<Workspace> ws) {
        std::lock_guard lock(mu_);
        workspaces_ = std::move(ws);
    }

    void set_windows(std::vector<Window> w) {
        std::lock_guard lock(mu_);
        windows_ = std::move(w);
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(mu_);
        return calls_;
    }

    int opens() const {
        std::lock_guard lock(mu_);
        return opens_;
    }

    // --- Event stream ---

    std::expected<void, Error> open_event_stream() override {
        std::lock_guard lock(mu_);
        if (failing_opens_ > 0) {
            --failing_opens_;
            return std::unexpected(Error{ErrorCode::CompositorDisconnected, "fake: refused"});
        }
        ++opens_;
        open_ = true;
        return {};
    }

    std::expected<std::optional<CompositorEvent>, Error> read_event() override {
        std::unique_lock lock(mu_);
        cv_.wait(lock, [this] { return !stream_.empty() || drop_ || interrupted_ || !open_; });
        if (interrupted_ || !open_) {
            interrupted_ = false;
            return std::unexpected(Error{ErrorCode::CompositorDisconnected, "fake: interrupted"});
        }
        if (drop_) {
            drop_ = false;
            return std::unexpected(Error{ErrorCode::CompositorDisconnected, "fake: stream lost"});
        }
        auto e = std::move(stream_.front());
        stream_.pop_front();
        return std::optional<CompositorEvent>{std::move(e)};
    }

    void close_event_stream() override {
        std::lock_guard lock(mu_);
        open_ = false;
    }

    void interrupt_event_stream() override {
        {
            std::lock_guard lock(mu_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    // --- Queries ---

    std::expected<std::vector<Workspace>, Error> workspaces() override {
        std::lock_guard lock(mu_);
        return workspaces_;
    }

    std::expected<std::vector<Window>, Error> windows() override {
        std::lock_guard lock(mu_);
        return windows_;
    }

    std::expected<std::optional<Window>, Error> focused_window() override {
        std::lock_guard lock(mu_);
        for (const auto& w : windows_) {
            if (w.is_focused) return std::optional<Window>{w};
        }
        return std::optional<Window>{};
    }

    std::expected<std::string, Error> focused_output() override { return std::string("DP-1"); }

    // --- Actions ---

    std::expected<void, Error> focus_workspace(const std::string& name) override {
        return record(std::format("focus_workspace {}", name));
    }
    std::expected<void, Error> focus_workspace_down() override {
        return record("focus_workspace_down");
    }
    std::expected<void, Error> set_workspace_name(const std::string& name) override {
        return record(std::format("set_workspace_name {}", name));
    }
    std::expected<void, Error> unset_workspace_name(const std::string& name) override {
        return record(std::format("unset_workspace_name {}", name));
    }
    std::expected<void, Error> spawn(const std::vector<std::string>& argv) override {
        std::string cmd = "spawn";
        for (const auto& a : argv) cmd += " " + a;
        return record(cmd);
    }
    std::expected<void, Error> close_window(uint64_t id) override {
        return record(std::format("close_window {}", id));
    }
    std::expected<void, Error> set_window_urgent(uint64_t id) override {
        return record(std::format("set_window_urgent {}", id));
    }

private:
    std::expected<void, Error> record(std::string call) {
        std::lock_guard lock(mu_);
        if (fail_actions_) {
            return std::unexpected(Error{ErrorCode::CompositorRequest, "fake: " + call + " refused"});
        }
        calls_.push_back(std::move(call));
        return {};
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<CompositorEvent> stream_;
    bool open_ = false;
    bool drop_ = false;
    bool interrupted_ = false;
    int failing_opens_ = 0;
    int opens_ = 0;
    bool fail_actions_ = false;
    std::vector<Workspace> workspaces_;
    std::vector<Window> windows_;
    std::vector<std::string> calls_;
};
