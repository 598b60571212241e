#pragma once

#include "bus/event_store.hpp"
#include "compositor/workspace_model.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>

// Everything the coordinator owns. Nothing else reads or writes it.
struct DaemonState {
    explicit DaemonState(size_t buffer_size) : events(buffer_size) {}

    WorkspaceModel workspace;
    EventStore events;
    bool compositor_connected = false;

    // daemon.json
    nlohmann::json to_json(int pid, uint64_t malformed_events) const;
};
