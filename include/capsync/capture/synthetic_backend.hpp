#pragma once

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "capsync/capture/backend.hpp"

namespace capsync::capture {

struct SyntheticBackendConfig {
    u32 bytes_per_second{256 * 1024};
    i64 tick_ms{100};
    bool permission_granted{true};
    capsync::core::u64 seed{0x9e3779b97f4a7c15ull};
};

// Headless capture source. A ticker thread appends deterministic
// pseudo-random bytes to the open segment at a fixed rate and reports
// progress every tick; segments are finalized synchronously inside
// rotate_segment() and stop_capture().
class SyntheticBackend final : public CaptureBackend {
public:
    explicit SyntheticBackend(SyntheticBackendConfig cfg);
    ~SyntheticBackend() override;

    SyntheticBackend(const SyntheticBackend&) = delete;
    SyntheticBackend& operator=(const SyntheticBackend&) = delete;

    void set_events(CaptureEvents* events) override;
    bool has_permission() override;

    capsync::core::Status start_capture(const std::string& first_segment_path) override;
    capsync::core::Status pause_capture() override;
    capsync::core::Status resume_capture() override;
    capsync::core::Status rotate_segment(const std::string& next_segment_path) override;
    capsync::core::Status stop_capture() override;
    capsync::core::Status abort_capture() override;

private:
    struct ClosedSegment {
        std::string path;
        capsync::core::ChunkId index{0};
        i64 duration_ms{0};
    };

    void ticker_loop();
    void join_ticker();
    capsync::core::Status open_segment_locked(const std::string& path);
    capsync::core::Status close_segment_locked(ClosedSegment* out);
    capsync::core::Status write_tick_locked();

    SyntheticBackendConfig cfg_;
    std::mutex mutex_;
    std::condition_variable cv_;
    CaptureEvents* events_{nullptr};
    bool running_{false};
    bool paused_{false};
    bool ticker_stop_{false};

    int fd_{-1};
    std::string segment_path_;
    capsync::core::ChunkId segment_index_{0};
    i64 segment_ms_{0};
    i64 elapsed_ms_{0};
    capsync::core::u64 rng_{0};

    std::thread ticker_;
};

} // namespace capsync::capture
