#pragma once

#include <chrono>
#include <cstdint>

// base * 2^attempt, saturating at max.
inline std::chrono::milliseconds exponential_backoff(std::chrono::milliseconds base,
                                                     std::chrono::milliseconds max,
                                                     uint32_t attempt) {
    if (base <= std::chrono::milliseconds::zero()) return std::chrono::milliseconds::zero();
    if (base >= max) return max;

    auto delay = base;
    for (uint32_t i = 0; i < attempt; ++i) {
        if (delay >= max / 2) return max;
        delay *= 2;
    }
    return delay < max ? delay : max;
}
