#include <catch2/catch_test_macros.hpp>

#include "bus/event_ring.hpp"

#include <string>

namespace {

Event numbered(uint64_t n) {
    auto e = make_event("test.event", "myapp", "test", "info", "event " + std::to_string(n));
    e.seq = n;
    return e;
}

} // namespace

TEST_CASE("EventRing", "[event_ring]") {

    SECTION("FillsInOrder") {
        EventRing ring(4);
        REQUIRE(ring.empty());
        for (uint64_t i = 1; i <= 3; ++i) ring.push(numbered(i));

        REQUIRE(ring.size() == 3);
        REQUIRE(ring.at(0).seq == 1);
        REQUIRE(ring.newest().seq == 3);
        REQUIRE(ring.evicted() == 0);
    }

    SECTION("EvictsOldestFirst") {
        EventRing ring(20);
        for (uint64_t i = 1; i <= 25; ++i) ring.push(numbered(i));

        REQUIRE(ring.size() == 20);
        REQUIRE(ring.capacity() == 20);
        REQUIRE(ring.evicted() == 5);

        auto snap = ring.snapshot();
        REQUIRE(snap.size() == 20);
        for (size_t i = 0; i < snap.size(); ++i) {
            REQUIRE(snap[i].seq == 6 + i);
        }
    }

    SECTION("NeverExceedsCapacity") {
        EventRing ring(3);
        for (uint64_t i = 1; i <= 100; ++i) {
            ring.push(numbered(i));
            REQUIRE(ring.size() <= 3);
        }
        REQUIRE(ring.at(0).seq == 98);
        REQUIRE(ring.newest().seq == 100);
    }

    SECTION("ZeroCapacityHoldsOne") {
        EventRing ring(0);
        ring.push(numbered(1));
        ring.push(numbered(2));
        REQUIRE(ring.size() == 1);
        REQUIRE(ring.newest().seq == 2);
    }

    SECTION("Clear") {
        EventRing ring(2);
        ring.push(numbered(1));
        ring.push(numbered(2));
        ring.push(numbered(3));
        ring.clear();
        REQUIRE(ring.empty());
        ring.push(numbered(4));
        REQUIRE(ring.at(0).seq == 4);
    }
}
