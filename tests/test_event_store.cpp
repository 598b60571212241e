#include <catch2/catch_test_macros.hpp>

#include "bus/event_store.hpp"

namespace {

Event event_for(const std::string& project, const std::string& type, uint64_t seq) {
    auto e = make_event(type, project, "test", "info");
    e.seq = seq;
    return e;
}

} // namespace

TEST_CASE("EventStore", "[event_store]") {
    EventStore store(20);

    SECTION("RingPerProject") {
        store.append(event_for("a", "x.one", 1));
        store.append(event_for("b", "x.one", 2));
        REQUIRE(store.rings().size() == 2);
        REQUIRE(store.ring("a")->size() == 1);
        REQUIRE(store.ring("missing") == nullptr);
        REQUIRE(store.last_seq() == 2);
    }

    SECTION("ReplayHoldsLastTwenty") {
        for (uint64_t i = 1; i <= 25; ++i) store.append(event_for("myapp", "build.step", i));

        auto replay = store.recent({}, 20);
        REQUIRE(replay.size() == 20);
        REQUIRE(replay.front().seq == 6);
        REQUIRE(replay.back().seq == 25);
    }

    SECTION("MergesProjectsBySeq") {
        store.append(event_for("a", "x", 1));
        store.append(event_for("b", "x", 2));
        store.append(event_for("a", "x", 3));
        store.append(event_for("b", "x", 4));

        auto all = store.recent({}, 3);
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].seq == 2);
        REQUIRE(all[1].seq == 3);
        REQUIRE(all[2].seq == 4);
    }

    SECTION("FilterAndCutoff") {
        store.append(event_for("a", "agent.completed", 1));
        store.append(event_for("a", "service.started", 2));
        store.append(event_for("b", "agent.failed", 3));
        store.append(event_for("a", "agent.started", 4));

        auto agents = store.recent({.type_glob = "agent.*"}, 10);
        REQUIRE(agents.size() == 3);

        auto only_a = store.recent({.type_glob = "agent.*", .project = "a"}, 10);
        REQUIRE(only_a.size() == 2);
        REQUIRE(only_a[1].seq == 4);

        auto before = store.recent({}, 10, 2);
        REQUIRE(before.size() == 2);
        REQUIRE(before.back().seq == 2);
    }

    SECTION("ZeroLimit") {
        store.append(event_for("a", "x", 1));
        REQUIRE(store.recent({}, 0).empty());
    }
}
