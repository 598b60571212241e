#include "event.hpp"

#include <chrono>
#include <format>

using json = nlohmann::json;

std::string_view to_string(Priority p) {
    switch (p) {
        case Priority::Critical: return "critical";
        case Priority::High: return "high";
        case Priority::Medium: return "medium";
        case Priority::Low: return "low";
        case Priority::Silent: return "silent";
    }
    return "silent";
}

std::optional<Priority> priority_from_string(std::string_view s) {
    if (s == "critical") return Priority::Critical;
    if (s == "high") return Priority::High;
    if (s == "medium") return Priority::Medium;
    if (s == "low") return Priority::Low;
    if (s == "silent") return Priority::Silent;
    return std::nullopt;
}

std::string iso_now() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

namespace {

std::unexpected<Error> malformed(std::string msg) {
    return std::unexpected(Error{ErrorCode::MalformedEvent, std::move(msg)});
}

// Optional string field: absent or null is fine, any other type is not.
bool read_optional_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

std::expected<Event, Error> event_from_json(const json& j) {
    if (!j.is_object()) return malformed("event is not a JSON object");

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string() || type_it->get<std::string>().empty()) {
        return malformed("missing or invalid \"type\"");
    }
    auto project_it = j.find("project");
    if (project_it == j.end() || !project_it->is_string() ||
        project_it->get<std::string>().empty()) {
        return malformed("missing or invalid \"project\"");
    }

    Event e;
    e.type = type_it->get<std::string>();
    e.project = project_it->get<std::string>();

    for (auto [key, field] : {std::pair{"source", &e.source}, std::pair{"ts", &e.ts},
                              std::pair{"level", &e.level}, std::pair{"title", &e.title},
                              std::pair{"body", &e.body}}) {
        if (!read_optional_string(j, key, *field)) {
            return malformed(std::format("field \"{}\" must be a string", key));
        }
    }

    if (e.ts.empty()) e.ts = iso_now();
    if (e.level.empty()) e.level = "info";

    if (auto it = j.find("meta"); it != j.end()) e.meta = *it;

    if (auto it = j.find("priority"); it != j.end() && it->is_string()) {
        e.priority = priority_from_string(it->get<std::string>());
    }

    return e;
}

std::expected<Event, Error> parse_event(std::string_view line) {
    json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return malformed("invalid JSON");
    return event_from_json(j);
}

json to_json(const Event& e) {
    json j = {
        {"type", e.type},
        {"project", e.project},
        {"source", e.source},
        {"ts", e.ts},
        {"level", e.level},
    };
    if (!e.title.empty()) j["title"] = e.title;
    if (!e.body.empty()) j["body"] = e.body;
    if (!e.meta.is_null()) j["meta"] = e.meta;
    if (e.priority) j["priority"] = std::string(to_string(*e.priority));
    return j;
}

std::string to_line(const Event& e) {
    return to_json(e).dump() + "\n";
}

Event make_event(std::string type, std::string project, std::string source,
                 std::string level, std::string title, std::string body, json meta) {
    Event e;
    e.type = std::move(type);
    e.project = std::move(project);
    e.source = std::move(source);
    e.ts = iso_now();
    e.level = std::move(level);
    e.title = std::move(title);
    e.body = std::move(body);
    e.meta = std::move(meta);
    return e;
}
