#pragma once

#include <atomic>

#include "capsync/core/types.hpp"

namespace capsync::core {
    class Clock {
    public:
        virtual ~Clock() = default;

        // Monotonic milliseconds; only differences are meaningful.
        virtual i64 monotonic_ms() noexcept = 0;
        // Wall-clock milliseconds since the Unix epoch, for persisted timestamps.
        virtual Timestamp wall_ms() noexcept = 0;
    };

    class SystemClock final : public Clock {
    public:
        i64 monotonic_ms() noexcept override;
        Timestamp wall_ms() noexcept override;
    };

    // Time only moves when told to.
    class ManualClock final : public Clock {
    public:
        explicit ManualClock(Timestamp wall_start = 1'700'000'000'000) noexcept
            : wall_start_(wall_start) {}

        i64 monotonic_ms() noexcept override { return now_.load(); }
        Timestamp wall_ms() noexcept override { return wall_start_ + now_.load(); }

        void advance(i64 ms) noexcept { now_.fetch_add(ms); }

    private:
        Timestamp wall_start_;
        std::atomic<i64> now_{0};
    };

    // Process-wide SystemClock; stateless.
    Clock& system_clock() noexcept;
} // namespace capsync::core
