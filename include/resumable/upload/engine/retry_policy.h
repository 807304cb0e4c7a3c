/**
 * @file retry_policy.h
 * @brief Bounded exponential backoff for transient remote failures
 */

#ifndef RESUMABLE_UPLOAD_ENGINE_RETRY_POLICY_H
#define RESUMABLE_UPLOAD_ENGINE_RETRY_POLICY_H

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>

namespace resumable::upload {

/**
 * @brief Retry schedule for connectivity errors
 *
 * max_attempts counts the first try, so the default allows two retries per
 * remote operation. The attempt counter is reset after every committed
 * chunk; a long upload over a flaky link is not failed by hiccups spread
 * across many chunks.
 */
struct retry_policy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before the given retry
     * @param retry 1 for the first retry, 2 for the second, ...
     */
    [[nodiscard]] auto delay_for(std::size_t retry) const -> std::chrono::milliseconds {
        if (retry == 0) {
            return std::chrono::milliseconds{0};
        }
        auto factor = std::pow(backoff_multiplier, static_cast<double>(retry - 1));
        auto delay = static_cast<double>(initial_delay.count()) * factor;
        auto capped = std::min(delay, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
    }

    /**
     * @brief Policy that fails on the first transient error
     */
    [[nodiscard]] static auto no_retry() -> retry_policy {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_ENGINE_RETRY_POLICY_H
