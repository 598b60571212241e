#include "supervisor/restart_policy.hpp"

#include "backoff.hpp"

std::chrono::milliseconds backoff_delay(const BackoffParams& params, uint32_t attempt) {
    return exponential_backoff(params.base, params.max, attempt);
}

uint32_t effective_attempt(uint32_t attempt, std::chrono::milliseconds ran_for,
                           const BackoffParams& params) {
    return ran_for >= params.stability ? 0 : attempt;
}

RestartDecision decide_restart(RestartPolicy policy, const ExitStatus& exit, uint32_t attempt,
                               const BackoffParams& params) {
    using Action = RestartDecision::Action;

    bool wants_restart = false;
    switch (policy) {
        case RestartPolicy::Never: wants_restart = false; break;
        case RestartPolicy::OnFailure: wants_restart = !exit.success(); break;
        case RestartPolicy::Always: wants_restart = true; break;
    }
    if (!wants_restart) return {.action = Action::Stop};

    if (params.max_restarts > 0 && attempt >= params.max_restarts) {
        return {.action = Action::GiveUp};
    }
    return {.action = Action::Restart, .delay = backoff_delay(params, attempt)};
}
