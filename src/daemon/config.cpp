#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

void sanitize(Config& cfg) {
    cfg.events.buffer_size = std::max<size_t>(cfg.events.buffer_size, 1);
    cfg.events.subscriber_queue = std::max<size_t>(cfg.events.subscriber_queue, 1);
    cfg.events.channel_capacity = std::max<size_t>(cfg.events.channel_capacity, 1);
    cfg.events.replay_on_subscribe =
        std::min(cfg.events.replay_on_subscribe, cfg.events.buffer_size);

    cfg.supervisor.backoff_base_ms = std::max<uint32_t>(cfg.supervisor.backoff_base_ms, 1);
    cfg.supervisor.backoff_max_ms =
        std::max(cfg.supervisor.backoff_max_ms, cfg.supervisor.backoff_base_ms);

    cfg.compositor.reconnect_base_ms = std::max<uint32_t>(cfg.compositor.reconnect_base_ms, 1);
    cfg.compositor.reconnect_max_ms =
        std::max(cfg.compositor.reconnect_max_ms, cfg.compositor.reconnect_base_ms);

    cfg.daemon.state_write_interval_ms =
        std::max<uint32_t>(cfg.daemon.state_write_interval_ms, 100);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("events")) {
            auto& e = j["events"];
            read_key(e, "buffer_size", cfg.events.buffer_size);
            read_key(e, "replay_on_subscribe", cfg.events.replay_on_subscribe);
            read_key(e, "subscriber_queue", cfg.events.subscriber_queue);
            read_key(e, "subscribe_handshake_ms", cfg.events.subscribe_handshake_ms);
            read_key(e, "channel_capacity", cfg.events.channel_capacity);
        }

        if (j.contains("supervisor")) {
            auto& s = j["supervisor"];
            read_key(s, "backoff_base_ms", cfg.supervisor.backoff_base_ms);
            read_key(s, "backoff_max_ms", cfg.supervisor.backoff_max_ms);
            read_key(s, "stability_ms", cfg.supervisor.stability_ms);
            read_key(s, "stop_timeout_ms", cfg.supervisor.stop_timeout_ms);
            read_key(s, "max_restarts", cfg.supervisor.max_restarts);
        }

        if (j.contains("compositor")) {
            auto& c = j["compositor"];
            read_key(c, "enabled", cfg.compositor.enabled);
            read_key(c, "socket", cfg.compositor.socket);
            read_key(c, "reconnect_base_ms", cfg.compositor.reconnect_base_ms);
            read_key(c, "reconnect_max_ms", cfg.compositor.reconnect_max_ms);
        }

        if (j.contains("daemon")) {
            read_key(j["daemon"], "state_write_interval_ms", cfg.daemon.state_write_interval_ms);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    sanitize(cfg);
    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
