#pragma once

#include "bus/event.hpp"
#include "compositor/types.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

// What one project's workspace looked like when it lost focus.
struct WorkspaceSnapshot {
    std::string project;
    std::vector<Window> windows;
    std::vector<Workspace> workspaces;
    std::string saved_at;

    nlohmann::json to_json() const;
};

// Facts derived from one compositor event.
struct ApplyResult {
    std::vector<Event> events;             // workspace.* and window.urgent
    bool active_changed = false;
    bool structure_changed = false;        // project workspaces appeared or vanished
    std::vector<std::string> opened;       // projects whose workspace appeared
    std::vector<std::string> closed;       // projects whose workspace vanished
    std::optional<WorkspaceSnapshot> deactivated;
};

// The daemon's picture of the compositor: workspaces, windows and which
// project has focus. Only workspaces named after a known project take part.
class WorkspaceModel {
public:
    void set_known_projects(std::set<std::string> projects);
    bool is_known(const std::string& project) const { return known_.contains(project); }

    ApplyResult apply(const CompositorEvent& event);

    const std::optional<std::string>& active_project() const { return active_project_; }
    std::optional<std::string> project_for_workspace(uint64_t workspace_id) const;
    std::optional<uint64_t> workspace_for_project(const std::string& project) const;
    std::vector<Window> windows_for_project(const std::string& project) const;
    std::set<std::string> project_workspaces() const;
    WorkspaceSnapshot snapshot(const std::string& project) const;

    // daemon.json "workspace_projects"
    nlohmann::json workspace_projects_json() const;

    const std::map<uint64_t, Workspace>& workspaces() const { return workspaces_; }
    const std::map<uint64_t, Window>& windows() const { return windows_; }

private:
    ApplyResult on_workspaces_changed(const std::vector<Workspace>& workspaces);
    ApplyResult on_workspace_activated(uint64_t id, bool focused);
    ApplyResult on_urgency_changed(uint64_t id, bool urgent);
    void set_active(std::optional<std::string> project, ApplyResult& result);

    std::map<uint64_t, Workspace> workspaces_;
    std::map<uint64_t, Window> windows_;
    std::set<std::string> known_;
    std::optional<uint64_t> focused_workspace_;
    std::optional<std::string> active_project_;
};
