#include "filter.hpp"

bool glob_match(std::string_view pattern, std::string_view text) {
    size_t p = 0, t = 0;
    size_t star = std::string_view::npos, resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool EventFilter::matches(const Event& e) const {
    if (!project.empty() && e.project != project) return false;
    if (!type_glob.empty() && !glob_match(type_glob, e.type)) return false;
    return true;
}

EventFilter EventFilter::from_json(const nlohmann::json& j) {
    EventFilter f;
    if (!j.is_object()) return f;
    if (auto it = j.find("type"); it != j.end() && it->is_string()) {
        f.type_glob = it->get<std::string>();
    }
    if (auto it = j.find("project"); it != j.end() && it->is_string()) {
        f.project = it->get<std::string>();
    }
    return f;
}
