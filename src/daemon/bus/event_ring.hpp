#pragma once

#include "event.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Fixed-capacity FIFO of events. Pushing into a full ring overwrites the
// oldest slot, so insertion is O(1) and eviction is strictly first-in first-out.
// Not thread-safe: each ring has a single owner.
class EventRing {
public:
    explicit EventRing(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
        buf_.reserve(capacity_);
    }

    void push(Event e) {
        if (buf_.size() < capacity_) {
            buf_.push_back(std::move(e));
            return;
        }
        // Full: head_ is the oldest slot.
        buf_[head_] = std::move(e);
        head_ = (head_ + 1) % capacity_;
        ++evicted_;
    }

    // i = 0 is the oldest retained event.
    const Event& at(size_t i) const { return buf_[(head_ + i) % buf_.size()]; }

    const Event& newest() const { return at(buf_.size() - 1); }

    std::vector<Event> snapshot() const {
        std::vector<Event> out;
        out.reserve(buf_.size());
        for (size_t i = 0; i < buf_.size(); ++i) out.push_back(at(i));
        return out;
    }

    size_t size() const { return buf_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return buf_.empty(); }
    uint64_t evicted() const { return evicted_; }

    void clear() {
        buf_.clear();
        head_ = 0;
    }

private:
    std::vector<Event> buf_;
    size_t capacity_;
    size_t head_ = 0;
    uint64_t evicted_ = 0;
};
