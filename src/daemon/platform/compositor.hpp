#pragma once

#include "compositor/types.hpp"
#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Connection to the window compositor. The event stream and the request
// channel are independent: the stream is read by one thread while another
// issues requests. Requests are serialized by the implementation.
class Compositor {
public:
    virtual ~Compositor() = default;

    // --- Event stream ---
    virtual std::expected<void, Error> open_event_stream() = 0;
    // Blocks for the next event. nullopt: an event the daemon does not track.
    // An error means the stream is gone and must be reopened.
    virtual std::expected<std::optional<CompositorEvent>, Error> read_event() = 0;
    virtual void close_event_stream() = 0;
    // Makes a blocked read_event() return. Callable from any thread.
    virtual void interrupt_event_stream() = 0;

    // --- Queries ---
    virtual std::expected<std::vector<Workspace>, Error> workspaces() = 0;
    virtual std::expected<std::vector<Window>, Error> windows() = 0;
    virtual std::expected<std::optional<Window>, Error> focused_window() = 0;
    virtual std::expected<std::string, Error> focused_output() = 0;

    // --- Actions ---
    virtual std::expected<void, Error> focus_workspace(const std::string& name) = 0;
    virtual std::expected<void, Error> focus_workspace_down() = 0;
    virtual std::expected<void, Error> set_workspace_name(const std::string& name) = 0;
    virtual std::expected<void, Error> unset_workspace_name(const std::string& name) = 0;
    virtual std::expected<void, Error> spawn(const std::vector<std::string>& argv) = 0;
    virtual std::expected<void, Error> close_window(uint64_t id) = 0;
    virtual std::expected<void, Error> set_window_urgent(uint64_t id) = 0;
};
