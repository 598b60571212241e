#include "supervisor/service.hpp"

#include <format>

namespace {

constexpr std::string_view FULL_TOOLS =
    "Bash,Read,Edit,Write,Glob,Grep,WebFetch,WebSearch,NotebookEdit,Task";
constexpr std::string_view SAFE_TOOLS = "Read,Glob,Grep,WebFetch,WebSearch";
constexpr std::string_view DEFAULT_PROMPT = "You are an AI assistant.";

std::string agent_prompt(const AgentLaunch& agent, const std::string& project) {
    std::string_view prompt = agent.prompt.empty() ? DEFAULT_PROMPT : agent.prompt;
    return std::format(
        "You are working on drift project '{}'. {}\n\n"
        "Use `drift notify --type agent.completed --title \"<summary>\"` when you finish "
        "significant work.\n"
        "Use `drift notify --type agent.error --title \"<summary>\"` when you hit errors.",
        project, prompt);
}

std::string agent_command(const AgentLaunch& agent, const std::string& project) {
    auto prompt = shell_quote(agent_prompt(agent, project));
    bool full = agent.permissions == "full";
    bool interactive = agent.mode == "interactive";

    std::string cmd;
    if (agent.kind == "claude") {
        if (interactive) {
            cmd = std::format("claude --allowedTools '{}'", full ? FULL_TOOLS : SAFE_TOOLS);
        } else if (full) {
            cmd = "claude -p --dangerously-skip-permissions";
        } else {
            cmd = std::format("claude -p --allowedTools '{}'", SAFE_TOOLS);
        }
        if (!agent.model.empty()) cmd += " --model " + shell_quote(agent.model);
        return cmd + (interactive ? " --system-prompt " : " ") + prompt;
    }

    if (agent.kind == "codex") {
        cmd = interactive ? "codex" : "codex exec";
        if (full) cmd += " -s danger-full-access";
        if (!agent.model.empty()) cmd += " -m " + shell_quote(agent.model);
        return cmd + " " + prompt;
    }

    // Unknown agent: run it with the prompt as its only argument.
    return shell_quote(agent.kind) + " " + prompt;
}

} // namespace

std::string_view to_string(RestartPolicy p) {
    switch (p) {
        case RestartPolicy::Never: return "never";
        case RestartPolicy::OnFailure: return "on-failure";
        case RestartPolicy::Always: return "always";
    }
    return "never";
}

std::optional<RestartPolicy> restart_policy_from_string(std::string_view s) {
    if (s == "never") return RestartPolicy::Never;
    if (s == "on-failure" || s == "on_failure") return RestartPolicy::OnFailure;
    if (s == "always") return RestartPolicy::Always;
    return std::nullopt;
}

bool is_interactive_agent(const ServiceSpec& spec) {
    auto* agent = spec.agent();
    return agent && agent->mode == "interactive";
}

std::string launch_command(const ServiceSpec& spec, const std::string& project) {
    if (auto* agent = spec.agent()) return agent_command(*agent, project);
    return std::get<ServiceLaunch>(spec.launch).command;
}

std::string shell_quote(std::string_view s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}
