#pragma once

#include <string>
#include <string_view>

enum class ErrorCode {
    Spawn,                  // child process could not be created
    MalformedEvent,         // ingress record failed to parse
    CompositorDisconnected, // compositor socket unavailable or closed
    CompositorRequest,      // compositor answered a request with an error
    Persistence,            // state file could not be written
    Bind,                   // bus socket could not be acquired
    Config,                 // config or project file unreadable
};

struct Error {
    ErrorCode code;
    std::string message;
};

inline std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Spawn: return "spawn";
        case ErrorCode::MalformedEvent: return "malformed-event";
        case ErrorCode::CompositorDisconnected: return "compositor-disconnected";
        case ErrorCode::CompositorRequest: return "compositor-request";
        case ErrorCode::Persistence: return "persistence";
        case ErrorCode::Bind: return "bind";
        case ErrorCode::Config: return "config";
    }
    return "unknown";
}
