#include "capsync/core/clock.hpp"

#include <chrono>

namespace capsync::core {
    i64 SystemClock::monotonic_ms() noexcept {
        const auto d = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    }

    Timestamp SystemClock::wall_ms() noexcept {
        const auto d = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    }

    Clock& system_clock() noexcept {
        static SystemClock clock;
        return clock;
    }
} // namespace capsync::core
