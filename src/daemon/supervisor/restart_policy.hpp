#pragma once

#include "platform/process.hpp"
#include "supervisor/service.hpp"

#include <chrono>
#include <cstdint>

struct BackoffParams {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds max{30000};
    std::chrono::milliseconds stability{5000};
    uint32_t max_restarts = 0; // 0 = unlimited
};

struct RestartDecision {
    enum class Action { Stop, Restart, GiveUp };

    Action action = Action::Stop;
    std::chrono::milliseconds delay{0};
};

std::chrono::milliseconds backoff_delay(const BackoffParams& params, uint32_t attempt);

// Attempt counter to use after a run of `ran_for`: a run at least as long as
// the stability threshold resets it.
uint32_t effective_attempt(uint32_t attempt, std::chrono::milliseconds ran_for,
                           const BackoffParams& params);

// Pure: the same inputs always give the same decision. `attempt` counts
// consecutive restarts so far.
RestartDecision decide_restart(RestartPolicy policy, const ExitStatus& exit, uint32_t attempt,
                               const BackoffParams& params);
