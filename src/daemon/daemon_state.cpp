#include "daemon_state.hpp"

using json = nlohmann::json;

json DaemonState::to_json(int pid, uint64_t malformed_events) const {
    json recent = json::object();
    for (const auto& [project, ring] : events.rings()) {
        json list = json::array();
        for (const auto& e : ring.snapshot()) list.push_back(::to_json(e));
        recent[project] = std::move(list);
    }

    const auto& active = workspace.active_project();
    return {
        {"pid", pid},
        {"active_project", active ? json(*active) : json(nullptr)},
        {"compositor_connected", compositor_connected},
        {"workspace_projects", workspace.workspace_projects_json()},
        {"recent_events", std::move(recent)},
        {"malformed_events", malformed_events},
    };
}
