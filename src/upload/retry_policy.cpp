#include "capsync/upload/retry_policy.hpp"

#include <cmath>

namespace capsync::upload {
    using capsync::core::i64;
    using capsync::core::u32;

    i64 backoff_delay_ms(const RetryPolicy& policy, u32 attempts) noexcept {
        if (attempts == 0 || policy.base_delay_ms <= 0) {
            return 0;
        }
        i64 delay = policy.base_delay_ms;
        for (u32 i = 1; i < attempts; ++i) {
            if (delay >= policy.max_delay_ms) {
                break;
            }
            delay *= 2;
        }
        return delay < policy.max_delay_ms ? delay : policy.max_delay_ms;
    }

    i64 jittered_delay_ms(const RetryPolicy& policy, i64 delay_ms, double unit) noexcept {
        if (!(policy.jitter > 0.0) || delay_ms <= 0) {
            return delay_ms;
        }
        const double j = policy.jitter < 1.0 ? policy.jitter : 1.0;
        const double u = unit < 0.0 ? 0.0 : (unit > 1.0 ? 1.0 : unit);
        const double factor = 1.0 - j + 2.0 * j * u;
        return static_cast<i64>(std::llround(static_cast<double>(delay_ms) * factor));
    }

    bool retry_allowed(const RetryPolicy& policy, u32 attempts, capsync::core::Status failure) noexcept {
        if (capsync::core::is_ok(failure)) {
            return false;
        }
        if (!capsync::core::status_is_retryable(failure)) {
            return false;
        }
        return attempts < policy.max_attempts;
    }
} // namespace capsync::upload
