#pragma once

#include "event.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

// `*` matches any run of characters (including none); everything else is literal.
bool glob_match(std::string_view pattern, std::string_view text);

// Subscriber-side selection. Empty fields match everything.
struct EventFilter {
    std::string type_glob;
    std::string project;

    bool empty() const { return type_glob.empty() && project.empty(); }
    bool matches(const Event& e) const;

    // {"type": "<glob>", "project": "<name>"}; unknown keys and non-string
    // values are ignored.
    static EventFilter from_json(const nlohmann::json& j);
};
