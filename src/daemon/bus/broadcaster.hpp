#pragma once

#include "bus/event.hpp"
#include "bus/event_store.hpp"
#include "bus/filter.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

// subscribe.sock: fans published events out to every subscriber.
//
// A new subscriber may send one filter line; once it does (or the handshake
// window expires) it receives the most recent matching events buffered at the
// moment it connected, then every matching event published since, in publish
// order. Writes never block: each subscriber has a bounded queue that loses
// its oldest line when full.
class Broadcaster {
public:
    explicit Broadcaster(const Config::Events& cfg, bool verbose = false);
    ~Broadcaster();

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    std::expected<void, Error> bind(const std::string& path);
    void start();
    void stop();

    // Called by the coordinator with seq and priority already assigned.
    // Never blocks.
    void publish(Event e);

    uint64_t published_count() const { return published_.load(std::memory_order_relaxed); }
    size_t subscriber_count() const { return subscriber_count_.load(std::memory_order_relaxed); }
    // Lines lost to full subscriber queues plus events lost to a full inbox.
    uint64_t dropped_count() const {
        return dropped_.load(std::memory_order_relaxed) + inbox_.dropped();
    }

private:
    using Clock = std::chrono::steady_clock;

    struct Subscriber {
        int fd;
        uint64_t connect_seq;        // last seq buffered when it connected
        Clock::time_point handshake_deadline;
        bool ready = false;
        bool want_write = false;
        EventFilter filter;
        std::string inbuf;
        std::vector<Event> pending;  // published while the handshake is open
        std::deque<std::string> queue;
        size_t front_offset = 0;     // bytes of queue.front() already written
    };

    void run(std::stop_token st);
    void drain_inbox();
    void accept_subscribers();
    // Each returns false when the subscriber should be dropped.
    bool read_subscriber(Subscriber& sub);
    bool finish_handshake(Subscriber& sub, EventFilter filter);
    EventFilter parse_filter(std::string_view line);
    void update_interest(const Subscriber& sub);
    bool flush(Subscriber& sub);
    void enqueue(Subscriber& sub, const Event& e);
    void expire_handshakes();
    int next_timeout_ms() const;
    void remove_subscriber(int fd);
    void log(const std::string& msg);

    Config::Events cfg_;
    bool verbose_;

    Channel<Event> inbox_;
    EventStore store_;
    uint64_t last_seq_ = 0;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::string socket_path_;
    std::unordered_map<int, Subscriber> subscribers_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<size_t> subscriber_count_{0};

    std::jthread worker_;
};
