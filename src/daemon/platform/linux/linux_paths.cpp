#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string home_relative(const char* xdg_var, const char* fallback) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/drift";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + fallback + "/drift";
}

} // namespace

std::string config_dir() {
    return home_relative("XDG_CONFIG_HOME", "/.config");
}

std::string projects_dir() {
    auto dir = config_dir();
    if (dir.empty()) return {};
    return dir + "/projects";
}

std::string state_base_dir() {
    auto dir = home_relative("XDG_STATE_HOME", "/.local/state");
    if (dir.empty()) return "/tmp/drift-state";
    return dir;
}

std::string state_dir(const std::string& project) {
    return state_base_dir() + "/" + project;
}

std::string logs_dir(const std::string& project) {
    return state_dir(project) + "/logs";
}

std::string daemon_pid_path() {
    return state_base_dir() + "/daemon.pid";
}

std::string daemon_state_path() {
    return state_base_dir() + "/daemon.json";
}

std::string services_state_path(const std::string& project) {
    return state_dir(project) + "/services.json";
}

std::string workspace_state_path(const std::string& project) {
    return state_dir(project) + "/workspace.json";
}

std::string runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/drift";
    return "/tmp/drift";
}

std::string emit_endpoint() {
    return runtime_dir() + "/emit.sock";
}

std::string subscribe_endpoint() {
    return runtime_dir() + "/subscribe.sock";
}

} // namespace platform
