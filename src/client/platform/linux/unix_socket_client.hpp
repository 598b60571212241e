#pragma once

#include "platform/bus_client.hpp"

#include <string>

class UnixSocketClient : public BusClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& msg) override;
    bool recv(nlohmann::json& msg, int timeout_ms = 30000) override;
    void close() override;

    // Raw bytes, no newline added.
    bool send_raw(const std::string& data);
    // Half-close: the peer sees EOF after what was already sent.
    void shutdown_write();

    int fd() const { return fd_; }

private:
    int fd_ = -1;
    std::string buf_; // bytes after the last returned line
};
