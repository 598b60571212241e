#pragma once

#include "errors.hpp"
#include "supervisor/service.hpp"

#include <expected>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

// A terminal or app opened in the project's workspace when it is created.
struct WindowSpec {
    std::string name;
    std::string command;
};

struct ProjectConfig {
    std::string name;
    std::string repo;   // absolute, `~` already expanded
    std::string folder;
    std::string icon;
    std::map<std::string, std::string> env;
    std::vector<ServiceSpec> services;
    std::vector<WindowSpec> windows;

    static std::expected<ProjectConfig, Error> load(const std::string& path);
    static std::expected<ProjectConfig, Error> from_json(const nlohmann::json& j);
};

// Every `<name>.json` in `dir`. Unreadable files are reported and skipped.
std::map<std::string, ProjectConfig> load_projects(const std::string& dir);

// Leading `~` or `~/` becomes $HOME.
std::string expand_home(std::string_view path);
