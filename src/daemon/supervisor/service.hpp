#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class RestartPolicy { Never, OnFailure, Always };

std::string_view to_string(RestartPolicy p);
std::optional<RestartPolicy> restart_policy_from_string(std::string_view s);

struct ServiceLaunch {
    std::string command;
};

// An AI agent run as a service. The launch command is derived from these.
struct AgentLaunch {
    std::string kind;                  // "claude", "codex", or any executable
    std::string prompt;
    std::string mode = "oneshot";      // "oneshot" or "interactive"
    std::string model;
    std::string permissions = "full";  // "full" or "safe"
};

struct ServiceSpec {
    std::string name;
    std::string cwd = ".";             // relative to the project repo
    RestartPolicy restart = RestartPolicy::Never;
    std::string stop_command;
    std::variant<ServiceLaunch, AgentLaunch> launch;

    bool is_agent() const { return std::holds_alternative<AgentLaunch>(launch); }
    const AgentLaunch* agent() const { return std::get_if<AgentLaunch>(&launch); }
};

// Interactive agents run in a terminal window, not under the supervisor.
bool is_interactive_agent(const ServiceSpec& spec);

// Shell command handed to `sh -c`.
std::string launch_command(const ServiceSpec& spec, const std::string& project);

// Single-quotes `s` for POSIX sh.
std::string shell_quote(std::string_view s);
