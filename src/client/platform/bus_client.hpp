#pragma once

#include <nlohmann/json.hpp>
#include <string>

// One connection to a bus socket, newline-delimited JSON both ways.
class BusClient {
public:
    virtual ~BusClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& msg) = 0;
    // Next complete line; false on timeout, EOF or a line that is not JSON.
    virtual bool recv(nlohmann::json& msg, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
