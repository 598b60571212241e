#include "compositor/workspace_model.hpp"

#include <algorithm>
#include <type_traits>

using json = nlohmann::json;

namespace {

Event workspace_event(const char* type, const std::string& project) {
    return make_event(type, project, "daemon", "info");
}

} // namespace

json WorkspaceSnapshot::to_json() const {
    json wins = json::array();
    for (const auto& w : windows) wins.push_back(w.to_json());
    json spaces = json::array();
    for (const auto& ws : workspaces) spaces.push_back(ws.to_json());
    return {
        {"project", project},
        {"windows", std::move(wins)},
        {"workspaces", std::move(spaces)},
        {"saved_at", saved_at},
    };
}

void WorkspaceModel::set_known_projects(std::set<std::string> projects) {
    known_ = std::move(projects);
    if (focused_workspace_) {
        active_project_ = project_for_workspace(*focused_workspace_);
    }
}

ApplyResult WorkspaceModel::apply(const CompositorEvent& event) {
    using namespace compositor_event;

    return std::visit(
        [this](const auto& ev) -> ApplyResult {
            using T = std::decay_t<decltype(ev)>;

            if constexpr (std::is_same_v<T, WorkspacesChanged>) {
                return on_workspaces_changed(ev.workspaces);
            } else if constexpr (std::is_same_v<T, WorkspaceActivated>) {
                return on_workspace_activated(ev.id, ev.focused);
            } else if constexpr (std::is_same_v<T, WindowsChanged>) {
                windows_.clear();
                for (const auto& w : ev.windows) windows_[w.id] = w;
                return {};
            } else if constexpr (std::is_same_v<T, WindowOpenedOrChanged>) {
                windows_[ev.window.id] = ev.window;
                return {};
            } else if constexpr (std::is_same_v<T, WindowClosed>) {
                windows_.erase(ev.id);
                return {};
            } else if constexpr (std::is_same_v<T, WindowFocusChanged>) {
                for (auto& [id, w] : windows_) w.is_focused = ev.id && *ev.id == id;
                return {};
            } else {
                return on_urgency_changed(ev.id, ev.urgent);
            }
        },
        event);
}

ApplyResult WorkspaceModel::on_workspaces_changed(const std::vector<Workspace>& workspaces) {
    ApplyResult result;
    auto before = project_workspaces();

    workspaces_.clear();
    focused_workspace_.reset();
    for (const auto& ws : workspaces) {
        workspaces_[ws.id] = ws;
        if (ws.is_focused) focused_workspace_ = ws.id;
    }

    auto after = project_workspaces();
    for (const auto& p : after) {
        if (before.contains(p)) continue;
        result.events.push_back(workspace_event("workspace.created", p));
        result.opened.push_back(p);
    }
    for (const auto& p : before) {
        if (after.contains(p)) continue;
        result.events.push_back(workspace_event("workspace.destroyed", p));
        result.closed.push_back(p);
    }
    result.structure_changed = !result.opened.empty() || !result.closed.empty();

    set_active(focused_workspace_ ? project_for_workspace(*focused_workspace_) : std::nullopt,
               result);
    return result;
}

ApplyResult WorkspaceModel::on_workspace_activated(uint64_t id, bool focused) {
    ApplyResult result;

    if (focused && focused_workspace_ && *focused_workspace_ != id) {
        if (auto prev = project_for_workspace(*focused_workspace_)) {
            result.deactivated = snapshot(*prev);
            result.events.push_back(workspace_event("workspace.deactivated", *prev));
        }
    }

    // Activation is per output; focus is global.
    if (auto it = workspaces_.find(id); it != workspaces_.end()) {
        auto output = it->second.output;
        for (auto& [ws_id, ws] : workspaces_) {
            if (ws.output == output) ws.is_active = ws_id == id;
        }
    }

    if (!focused) return result;

    for (auto& [ws_id, ws] : workspaces_) ws.is_focused = ws_id == id;
    focused_workspace_ = id;

    auto project = project_for_workspace(id);
    set_active(project, result);
    if (project) result.events.push_back(workspace_event("workspace.activated", *project));
    return result;
}

ApplyResult WorkspaceModel::on_urgency_changed(uint64_t id, bool urgent) {
    ApplyResult result;
    auto it = windows_.find(id);
    if (it == windows_.end()) return result;

    it->second.is_urgent = urgent;
    if (!urgent || !it->second.workspace_id) return result;

    auto project = project_for_workspace(*it->second.workspace_id);
    if (!project) return result;

    auto e = make_event("window.urgent", *project, "window", "warn", "Window needs attention",
                        it->second.title, json{{"window_id", id}, {"app_id", it->second.app_id}});
    result.events.push_back(std::move(e));
    return result;
}

void WorkspaceModel::set_active(std::optional<std::string> project, ApplyResult& result) {
    if (project == active_project_) return;
    active_project_ = std::move(project);
    result.active_changed = true;
}

std::optional<std::string> WorkspaceModel::project_for_workspace(uint64_t workspace_id) const {
    auto it = workspaces_.find(workspace_id);
    if (it == workspaces_.end() || !known_.contains(it->second.name)) return std::nullopt;
    return it->second.name;
}

std::optional<uint64_t> WorkspaceModel::workspace_for_project(const std::string& project) const {
    if (!known_.contains(project)) return std::nullopt;
    for (const auto& [id, ws] : workspaces_) {
        if (ws.name == project) return id;
    }
    return std::nullopt;
}

std::vector<Window> WorkspaceModel::windows_for_project(const std::string& project) const {
    std::vector<Window> out;
    auto ws = workspace_for_project(project);
    if (!ws) return out;
    for (const auto& [_, w] : windows_) {
        if (w.workspace_id == *ws) out.push_back(w);
    }
    return out;
}

std::set<std::string> WorkspaceModel::project_workspaces() const {
    std::set<std::string> out;
    for (const auto& [_, ws] : workspaces_) {
        if (known_.contains(ws.name)) out.insert(ws.name);
    }
    return out;
}

WorkspaceSnapshot WorkspaceModel::snapshot(const std::string& project) const {
    WorkspaceSnapshot snap;
    snap.project = project;
    snap.windows = windows_for_project(project);
    if (auto id = workspace_for_project(project)) snap.workspaces.push_back(workspaces_.at(*id));
    snap.saved_at = iso_now();
    return snap;
}

json WorkspaceModel::workspace_projects_json() const {
    json out = json::array();
    for (const auto& [id, ws] : workspaces_) {
        if (!known_.contains(ws.name)) continue;
        auto count = std::ranges::count_if(
            windows_, [id](const auto& entry) { return entry.second.workspace_id == id; });
        out.push_back({
            {"workspace_id", id},
            {"workspace_name", ws.name},
            {"project", ws.name},
            {"is_active", ws.is_active},
            {"is_focused", ws.is_focused},
            {"window_count", count},
        });
    }
    return out;
}
