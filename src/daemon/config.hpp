#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Events {
        size_t buffer_size = 200;          // per-project ring capacity
        size_t replay_on_subscribe = 20;
        size_t subscriber_queue = 256;     // lines queued per subscriber
        uint32_t subscribe_handshake_ms = 200;
        size_t channel_capacity = 1024;

        std::chrono::milliseconds handshake() const {
            return std::chrono::milliseconds(subscribe_handshake_ms);
        }
    } events;

    struct Supervisor {
        uint32_t backoff_base_ms = 1000;
        uint32_t backoff_max_ms = 30000;
        uint32_t stability_ms = 5000;
        uint32_t stop_timeout_ms = 5000;
        uint32_t max_restarts = 0; // 0 = unlimited
    } supervisor;

    struct Compositor {
        bool enabled = true;
        std::string socket; // empty: $NIRI_SOCKET
        uint32_t reconnect_base_ms = 1000;
        uint32_t reconnect_max_ms = 30000;
    } compositor;

    struct Daemon {
        uint32_t state_write_interval_ms = 5000;
    } daemon;

    static Config load(const std::string& path);
    static Config load_default();
};
