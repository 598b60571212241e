#pragma once

#include "event_ring.hpp"
#include "filter.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

// Per-project event history, one bounded ring per project.
class EventStore {
public:
    explicit EventStore(size_t buffer_size) : buffer_size_(buffer_size == 0 ? 1 : buffer_size) {}

    void append(const Event& e);

    // Up to `limit` most recent events matching `filter` whose seq is at most
    // `max_seq`, oldest first. Across projects, events are merged by seq.
    std::vector<Event> recent(const EventFilter& filter, size_t limit,
                              uint64_t max_seq = std::numeric_limits<uint64_t>::max()) const;

    const EventRing* ring(const std::string& project) const;
    const std::map<std::string, EventRing>& rings() const { return rings_; }

    size_t buffer_size() const { return buffer_size_; }
    uint64_t last_seq() const { return last_seq_; }

private:
    size_t buffer_size_;
    std::map<std::string, EventRing> rings_;
    uint64_t last_seq_ = 0;
};
