#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Window {
    uint64_t id = 0;
    std::string title;
    std::string app_id;
    int pid = 0;
    std::optional<uint64_t> workspace_id; // unset while floating between workspaces
    bool is_focused = false;
    bool is_urgent = false;

    static Window from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct Workspace {
    uint64_t id = 0;
    uint32_t idx = 0;
    std::string name;   // empty for unnamed workspaces
    std::string output;
    bool is_active = false;  // visible on its output
    bool is_focused = false; // has keyboard focus

    static Workspace from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Events from the compositor's event stream that the daemon tracks.
namespace compositor_event {

struct WorkspacesChanged {
    std::vector<Workspace> workspaces;
};

struct WorkspaceActivated {
    uint64_t id = 0;
    bool focused = false;
};

struct WindowsChanged {
    std::vector<Window> windows;
};

struct WindowOpenedOrChanged {
    Window window;
};

struct WindowClosed {
    uint64_t id = 0;
};

struct WindowFocusChanged {
    std::optional<uint64_t> id;
};

struct WindowUrgencyChanged {
    uint64_t id = 0;
    bool urgent = false;
};

} // namespace compositor_event

using CompositorEvent =
    std::variant<compositor_event::WorkspacesChanged, compositor_event::WorkspaceActivated,
                 compositor_event::WindowsChanged, compositor_event::WindowOpenedOrChanged,
                 compositor_event::WindowClosed, compositor_event::WindowFocusChanged,
                 compositor_event::WindowUrgencyChanged>;

// One line of the event stream, e.g. {"WindowClosed":{"id":7}}. Returns
// nullopt for events the daemon does not track or cannot decode.
std::optional<CompositorEvent> parse_compositor_event(const nlohmann::json& j);
