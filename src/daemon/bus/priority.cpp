#include "priority.hpp"

Priority classify(bool target_active, std::string_view level) {
    if (level == "error") {
        return target_active ? Priority::Critical : Priority::High;
    }
    if (level == "warn" || level == "warning" || level == "success") {
        return target_active ? Priority::High : Priority::Medium;
    }
    if (level == "info") {
        return target_active ? Priority::Medium : Priority::Low;
    }
    return Priority::Silent;
}
