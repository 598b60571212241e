#include <catch2/catch_test_macros.hpp>

#include "channel.hpp"

#include <chrono>
#include <poll.h>
#include <thread>

using namespace std::chrono_literals;

namespace {

bool readable(int fd) {
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    return ::poll(&pfd, 1, 0) == 1;
}

} // namespace

TEST_CASE("Channel", "[channel]") {

    SECTION("FifoOrder") {
        Channel<int> ch(4);
        REQUIRE(ch.push(1));
        REQUIRE(ch.push(2));
        REQUIRE(ch.try_pop() == 1);
        REQUIRE(ch.try_pop() == 2);
        REQUIRE_FALSE(ch.try_pop().has_value());
    }

    SECTION("DropOldestWhenFull") {
        Channel<int> ch(2);
        REQUIRE_FALSE(ch.push_drop_oldest(1));
        REQUIRE_FALSE(ch.push_drop_oldest(2));
        REQUIRE(ch.push_drop_oldest(3));
        REQUIRE(ch.dropped() == 1);
        REQUIRE(ch.size() == 2);
        REQUIRE(ch.try_pop() == 2);
        REQUIRE(ch.try_pop() == 3);
    }

    SECTION("NotifyFd") {
        Channel<int> ch(4);
        REQUIRE_FALSE(readable(ch.notify_fd()));
        ch.push(1);
        REQUIRE(readable(ch.notify_fd()));
        ch.clear_notification();
        REQUIRE_FALSE(readable(ch.notify_fd()));
    }

    SECTION("BlockedPushReleasedByPop") {
        Channel<int> ch(1);
        ch.push(1);
        std::jthread producer([&] { ch.push(2); });
        std::this_thread::sleep_for(20ms);
        REQUIRE(ch.size() == 1);
        REQUIRE(ch.try_pop() == 1);
        producer.join();
        REQUIRE(ch.try_pop() == 2);
    }

    SECTION("CloseReleasesProducer") {
        Channel<int> ch(1);
        ch.push(1);
        bool pushed = true;
        std::jthread producer([&] { pushed = ch.push(2); });
        std::this_thread::sleep_for(20ms);
        ch.close();
        producer.join();
        REQUIRE_FALSE(pushed);
        REQUIRE(ch.closed());
    }

    SECTION("PopForTimesOut") {
        Channel<int> ch(1);
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(ch.pop_for(30ms).has_value());
        REQUIRE(std::chrono::steady_clock::now() - start >= 25ms);
    }
}
