#pragma once

#include "bus/event.hpp"
#include "channel.hpp"
#include "errors.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// emit.sock: accepts any number of producers, each writing newline-delimited
// JSON events. Parsed events go to the coordinator channel; bad records are
// counted and dropped.
class IngressListener {
public:
    static constexpr size_t MAX_LINE = 64 * 1024;

    explicit IngressListener(Channel<Event>& out, bool verbose = false);
    ~IngressListener();

    IngressListener(const IngressListener&) = delete;
    IngressListener& operator=(const IngressListener&) = delete;

    std::expected<void, Error> bind(const std::string& path);
    void start();
    void stop();

    uint64_t accepted_count() const { return accepted_.load(std::memory_order_relaxed); }
    uint64_t malformed_count() const { return malformed_.load(std::memory_order_relaxed); }

private:
    struct Client {
        int fd;
        std::string buf;
    };

    void run(std::stop_token st);
    void accept_clients();
    // Returns false when the client should be dropped.
    bool read_client(Client& client);
    void handle_line(std::string_view line);
    void close_client(int fd);
    Client* find_client(int fd);
    void log(const std::string& msg);

    Channel<Event>& out_;
    bool verbose_;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::string socket_path_;
    std::vector<Client> clients_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> malformed_{0};

    std::jthread worker_;
};
