#pragma once

#include <string>

#include "capsync/core/errors.hpp"
#include "capsync/core/types.hpp"

namespace capsync::capture {

using u8 = capsync::core::u8;
using u32 = capsync::core::u32;
using i64 = capsync::core::i64;

enum class CaptureFault : u8 {
    FrameDrop = 0,          // recoverable, capture continues
    DeviceLost = 1,
    WriterFailed = 2,
    PermissionRevoked = 3,
};

const char* capture_fault_name(CaptureFault fault) noexcept;
[[nodiscard]] constexpr bool capture_fault_is_fatal(CaptureFault fault) noexcept {
    return fault != CaptureFault::FrameDrop;
}

// Events a backend reports. They may be delivered synchronously from inside
// a CaptureBackend call or later from a backend-owned thread.
class CaptureEvents {
public:
    virtual ~CaptureEvents() = default;

    // Segment `index` is closed and complete on disk at `path`. Indices start
    // at 0 for each start_capture and increase by one per segment.
    virtual void on_segment_finalized(const std::string& path, capsync::core::ChunkId index, i64 backend_duration_ms) = 0;
    virtual void on_progress(i64 elapsed_ms, u32 segment_count) = 0;
    virtual void on_fault(CaptureFault fault, const std::string& detail) = 0;
};

// Platform screen/audio recording boundary. Backends write segments to the
// paths they are given and never decide when to rotate.
class CaptureBackend {
public:
    virtual ~CaptureBackend() = default;

    virtual void set_events(CaptureEvents* events) = 0;
    virtual bool has_permission() = 0;

    virtual capsync::core::Status start_capture(const std::string& first_segment_path) = 0;
    virtual capsync::core::Status pause_capture() = 0;
    virtual capsync::core::Status resume_capture() = 0;
    // Closes the current segment (finalize event) and continues into next_segment_path.
    virtual capsync::core::Status rotate_segment(const std::string& next_segment_path) = 0;
    // Closes the current segment (finalize event) and ends capture.
    virtual capsync::core::Status stop_capture() = 0;
    // Ends capture without finalizing anything.
    virtual capsync::core::Status abort_capture() = 0;
};

} // namespace capsync::capture
