#pragma once

#include "capsync/core/errors.hpp"
#include "capsync/core/types.hpp"

namespace capsync::upload {

struct RetryPolicy {
    capsync::core::u32 max_attempts{3};
    capsync::core::i64 base_delay_ms{1'000};
    capsync::core::i64 max_delay_ms{60'000};
    double jitter{0.0};    // fraction in [0, 1]; 0.2 spreads delays over +-20%
};

// min(base * 2^(attempts-1), max); 0 before the first attempt.
[[nodiscard]] capsync::core::i64 backoff_delay_ms(const RetryPolicy& policy, capsync::core::u32 attempts) noexcept;

// Scales `delay_ms` by 1 - jitter + 2 * jitter * unit, with `unit` a uniform
// sample in [0, 1]. The result may exceed max_delay_ms by the jitter fraction.
[[nodiscard]] capsync::core::i64 jittered_delay_ms(const RetryPolicy& policy, capsync::core::i64 delay_ms, double unit) noexcept;

// Whether a chunk that has just finished attempt number `attempts` with
// `failure` goes back to pending.
[[nodiscard]] bool retry_allowed(const RetryPolicy& policy, capsync::core::u32 attempts, capsync::core::Status failure) noexcept;

} // namespace capsync::upload
