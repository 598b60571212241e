#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/drift
std::string config_dir();
std::string projects_dir();

// $XDG_STATE_HOME/drift and its per-project subdirectories
std::string state_base_dir();
std::string state_dir(const std::string& project);
std::string logs_dir(const std::string& project);

std::string daemon_pid_path();
std::string daemon_state_path();
std::string services_state_path(const std::string& project);
std::string workspace_state_path(const std::string& project);

// $XDG_RUNTIME_DIR/drift/{emit,subscribe}.sock
std::string runtime_dir();
std::string emit_endpoint();
std::string subscribe_endpoint();

} // namespace platform
