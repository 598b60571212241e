#include "event_store.hpp"

#include <algorithm>

void EventStore::append(const Event& e) {
    auto it = rings_.find(e.project);
    if (it == rings_.end()) {
        it = rings_.emplace(e.project, EventRing(buffer_size_)).first;
    }
    it->second.push(e);
    last_seq_ = std::max(last_seq_, e.seq);
}

namespace {

// Newest-first scan of one ring, stopping after `limit` matches.
void collect_recent(const EventRing& ring, const EventFilter& filter, size_t limit,
                    uint64_t max_seq, std::vector<Event>& out) {
    size_t found = 0;
    for (size_t i = ring.size(); i > 0 && found < limit; --i) {
        const auto& e = ring.at(i - 1);
        if (e.seq > max_seq || !filter.matches(e)) continue;
        out.push_back(e);
        ++found;
    }
}

} // namespace

std::vector<Event> EventStore::recent(const EventFilter& filter, size_t limit,
                                      uint64_t max_seq) const {
    std::vector<Event> out;
    if (limit == 0) return out;

    if (!filter.project.empty()) {
        if (auto* r = ring(filter.project)) collect_recent(*r, filter, limit, max_seq, out);
    } else {
        for (const auto& [_, r] : rings_) collect_recent(r, filter, limit, max_seq, out);
    }

    std::ranges::sort(out, {}, &Event::seq);
    if (out.size() > limit) {
        out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(out.size() - limit));
    }
    return out;
}

const EventRing* EventStore::ring(const std::string& project) const {
    auto it = rings_.find(project);
    return it != rings_.end() ? &it->second : nullptr;
}
