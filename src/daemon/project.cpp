#include "project.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::unexpected<Error> config_error(std::string message) {
    return std::unexpected(Error{ErrorCode::Config, std::move(message)});
}

std::expected<ServiceSpec, Error> service_from_json(const json& j) {
    ServiceSpec spec;
    spec.name = j.value("name", "");
    if (spec.name.empty()) return config_error("service without a name");

    spec.cwd = j.value("cwd", ".");
    spec.stop_command = j.value("stop_command", "");

    auto restart = j.value("restart", "never");
    auto policy = restart_policy_from_string(restart);
    if (!policy) {
        return config_error(std::format("service '{}': unknown restart policy '{}'", spec.name,
                                        restart));
    }
    spec.restart = *policy;

    if (j.contains("agent") && j["agent"].is_string()) {
        AgentLaunch agent;
        agent.kind = j["agent"].get<std::string>();
        agent.prompt = j.value("prompt", "");
        agent.mode = j.value("agent_mode", "oneshot");
        agent.model = j.value("agent_model", "");
        agent.permissions = j.value("agent_permissions", "full");
        spec.launch = std::move(agent);
    } else {
        auto command = j.value("command", "");
        if (command.empty()) return config_error(std::format("service '{}' has no command", spec.name));
        spec.launch = ServiceLaunch{std::move(command)};
    }
    return spec;
}

} // namespace

std::string expand_home(std::string_view path) {
    if (path.empty() || path[0] != '~') return std::string(path);
    if (path.size() > 1 && path[1] != '/') return std::string(path);
    const char* home = std::getenv("HOME");
    if (!home) return std::string(path);
    return std::string(home) + std::string(path.substr(1));
}

std::expected<ProjectConfig, Error> ProjectConfig::from_json(const json& j) {
    if (!j.is_object()) return config_error("project file is not a JSON object");

    try {
        ProjectConfig cfg;
        if (j.contains("project")) {
            auto& p = j["project"];
            cfg.name = p.value("name", "");
            cfg.repo = expand_home(p.value("repo", ""));
            cfg.folder = p.value("folder", "");
            cfg.icon = p.value("icon", "");
        }
        if (cfg.name.empty()) return config_error("missing project.name");

        if (j.contains("env")) {
            cfg.env = j["env"].get<std::map<std::string, std::string>>();
        }

        if (j.contains("services") && j["services"].contains("processes")) {
            for (const auto& s : j["services"]["processes"]) {
                auto spec = service_from_json(s);
                if (!spec) return std::unexpected(spec.error());
                cfg.services.push_back(std::move(*spec));
            }
        }

        if (j.contains("windows")) {
            for (const auto& w : j["windows"]) {
                cfg.windows.push_back({w.value("name", ""), w.value("command", "")});
            }
        }
        return cfg;
    } catch (const json::exception& e) {
        return config_error(std::format("project: {}", e.what()));
    }
}

std::expected<ProjectConfig, Error> ProjectConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return config_error("could not open " + path);

    json j = json::parse(f, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return config_error("parse error in " + path);

    auto cfg = from_json(j);
    if (!cfg) return std::unexpected(Error{cfg.error().code, path + ": " + cfg.error().message});
    return cfg;
}

std::map<std::string, ProjectConfig> load_projects(const std::string& dir) {
    std::map<std::string, ProjectConfig> out;
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) return out;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;

        auto cfg = ProjectConfig::load(entry.path().string());
        if (!cfg) {
            std::println(stderr, "config: skipping project: {}", cfg.error().message);
            continue;
        }
        auto name = cfg->name;
        out.insert_or_assign(std::move(name), std::move(*cfg));
    }
    return out;
}
