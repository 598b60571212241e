#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class Priority { Critical, High, Medium, Low, Silent };

std::string_view to_string(Priority p);
std::optional<Priority> priority_from_string(std::string_view s);

// One bus record. `level` is kept verbatim so unknown levels survive to
// classification (which maps them to Silent).
struct Event {
    std::string type;     // dot-namespaced, e.g. "agent.completed"
    std::string project;
    std::string source;
    std::string ts;       // RFC 3339, UTC
    std::string level = "info";
    std::string title;
    std::string body;
    nlohmann::json meta;  // null when absent
    std::optional<Priority> priority;
    uint64_t seq = 0;     // publish order, assigned by the coordinator
};

// Current UTC time, e.g. "2026-02-12T15:30:00Z".
std::string iso_now();

// Parse one ingress line. Requires string `type` and `project`; fills
// defaults for `ts` and `level`.
std::expected<Event, Error> parse_event(std::string_view line);
std::expected<Event, Error> event_from_json(const nlohmann::json& j);

// Wire form. Empty optional fields are omitted; `seq` never leaves the daemon.
nlohmann::json to_json(const Event& e);
std::string to_line(const Event& e);

Event make_event(std::string type, std::string project, std::string source,
                 std::string level, std::string title = {}, std::string body = {},
                 nlohmann::json meta = nullptr);
