#pragma once

#include <algorithm>
#include <chrono>

namespace ada_mcp {

/**
 * @brief Exponential backoff for restarting a crashed language server
 *
 * The n-th consecutive restart (n >= 1) waits base * multiplier^(n-1),
 * capped at max_delay. Once more than max_attempts consecutive crashes have
 * been seen the instance is given up on.
 */
struct RestartPolicy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    double multiplier = 2.0;
    int max_attempts = 5;

    std::chrono::milliseconds delay_for(int attempt) const {
        if (attempt < 1) {
            attempt = 1;
        }
        double delay = static_cast<double>(base_delay.count());
        double cap = static_cast<double>(max_delay.count());
        for (int i = 1; i < attempt && delay < cap; ++i) {
            delay *= multiplier;
        }
        return std::chrono::milliseconds(static_cast<long long>(std::min(delay, cap)));
    }

    bool exhausted(int consecutive_crashes) const {
        return consecutive_crashes > max_attempts;
    }
};

} // namespace ada_mcp
