#include "compositor/types.hpp"

using json = nlohmann::json;

namespace {

// niri sends null for absent strings and ids.
std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<uint64_t> optional_id(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) return std::nullopt;
    return it->get<uint64_t>();
}

template <typename T>
std::vector<T> parse_list(const json& j, const char* key) {
    std::vector<T> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) out.push_back(T::from_json(item));
    return out;
}

} // namespace

Window Window::from_json(const json& j) {
    Window w;
    w.id = j.value("id", uint64_t{0});
    w.title = string_or_empty(j, "title");
    w.app_id = string_or_empty(j, "app_id");
    if (auto it = j.find("pid"); it != j.end() && it->is_number_integer()) w.pid = it->get<int>();
    w.workspace_id = optional_id(j, "workspace_id");
    w.is_focused = j.value("is_focused", false);
    w.is_urgent = j.value("is_urgent", false);
    return w;
}

json Window::to_json() const {
    return {
        {"id", id},
        {"app_id", app_id},
        {"title", title},
        {"workspace_id", workspace_id ? json(*workspace_id) : json(nullptr)},
    };
}

Workspace Workspace::from_json(const json& j) {
    Workspace ws;
    ws.id = j.value("id", uint64_t{0});
    ws.idx = j.value("idx", uint32_t{0});
    ws.name = string_or_empty(j, "name");
    ws.output = string_or_empty(j, "output");
    ws.is_active = j.value("is_active", false);
    ws.is_focused = j.value("is_focused", false);
    return ws;
}

json Workspace::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"output", output},
    };
}

std::optional<CompositorEvent> parse_compositor_event(const json& j) {
    using namespace compositor_event;

    if (!j.is_object() || j.size() != 1) return std::nullopt;
    auto it = j.begin();
    const std::string& tag = it.key();
    const json& body = it.value();
    if (!body.is_object()) return std::nullopt;

    try {
        if (tag == "WorkspacesChanged") {
            return WorkspacesChanged{parse_list<Workspace>(body, "workspaces")};
        }
        if (tag == "WorkspaceActivated") {
            return WorkspaceActivated{body.at("id").get<uint64_t>(), body.value("focused", false)};
        }
        if (tag == "WindowsChanged") {
            return WindowsChanged{parse_list<Window>(body, "windows")};
        }
        if (tag == "WindowOpenedOrChanged") {
            return WindowOpenedOrChanged{Window::from_json(body.at("window"))};
        }
        if (tag == "WindowClosed") {
            return WindowClosed{body.at("id").get<uint64_t>()};
        }
        if (tag == "WindowFocusChanged") {
            return WindowFocusChanged{optional_id(body, "id")};
        }
        if (tag == "WindowUrgencyChanged") {
            return WindowUrgencyChanged{body.at("id").get<uint64_t>(), body.value("urgent", false)};
        }
    } catch (const json::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}
