#pragma once

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "capsync/capture/backend.hpp"
#include "capsync/core/clock.hpp"
#include "capsync/core/errors.hpp"
#include "capsync/core/models.hpp"
#include "capsync/store/chunk_store.hpp"

namespace capsync::capture {

struct CaptureConfig {
    i64 chunk_duration_ms{60'000};
};

struct CaptureIssue {
    capsync::core::Status status{};
    bool fatal{false};          // the session is already stopped
    std::string detail;
};

// Invoked with no controller lock held, from the caller's thread or the
// backend's event thread.
struct CaptureCallbacks {
    std::function<void(const capsync::core::ChunkDescriptor&)> on_chunk;
    std::function<void(i64 recorded_ms, u32 chunk_count)> on_progress;
    std::function<void(const CaptureIssue&)> on_issue;
};

// Recording session state machine (stopped / recording / paused) that cuts
// the capture into fixed-duration chunks and emits one descriptor per
// finalized chunk, in order.
//
// Durations are the controller's own accounting of recording time, so the
// chunk durations of a session always add up to its recorded time with
// pauses excluded. Every rotated chunk is exactly chunk_duration_ms long;
// only the final one may be shorter.
//
// Backends must deliver the finalize event of the last segment either from
// inside stop_capture() or from a thread other than the one calling stop().
class CaptureController final : public CaptureEvents {
public:
    CaptureController(CaptureConfig cfg,
                      CaptureBackend& backend,
                      store::ChunkStore& store,
                      capsync::core::Clock& clock = capsync::core::system_clock());
    ~CaptureController() override;

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    // Must be called before start().
    void set_callbacks(CaptureCallbacks callbacks);

    // AlreadyActive unless stopped, then PermissionDenied, then
    // InsufficientStorage when free space is below the floor.
    [[nodiscard]] capsync::core::Status start(const std::string& recording_id);
    [[nodiscard]] capsync::core::Status pause();
    [[nodiscard]] capsync::core::Status resume();

    // Finalizes the in-progress chunk (possibly shorter than the target),
    // waits for its descriptor to be emitted, then reports stopped.
    [[nodiscard]] capsync::core::Status stop();

    // Stops without finalizing and deletes the recording's local chunks.
    // Always ends stopped; the status only reports a failure to delete files.
    capsync::core::Status cancel();

    // Advances duration accounting and rotates segments that reached the
    // target. Driven by backend progress events; owners may call it too.
    // Returns InsufficientStorage after stopping a session that ran out of space.
    capsync::core::Status poll();

    [[nodiscard]] capsync::core::SessionState state() const;
    [[nodiscard]] capsync::core::RecordingSession session() const;
    [[nodiscard]] i64 recorded_ms() const;
    [[nodiscard]] u32 chunk_count() const;

    void on_segment_finalized(const std::string& path, capsync::core::ChunkId index, i64 backend_duration_ms) override;
    void on_progress(i64 elapsed_ms, u32 segment_count) override;
    void on_fault(CaptureFault fault, const std::string& detail) override;

private:
    void accumulate_locked(i64 now);
    void emit_issue(const CaptureIssue& issue);

    CaptureConfig cfg_;
    CaptureBackend& backend_;
    store::ChunkStore& store_;
    capsync::core::Clock& clock_;
    CaptureCallbacks callbacks_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    capsync::core::SessionState state_{capsync::core::SessionState::Stopped};
    std::string recording_id_;
    capsync::core::Timestamp started_at_{0};
    capsync::core::u64 generation_{0};      // bumped by start and cancel
    bool session_open_{false};              // finalize events are accepted
    bool stopping_{false};
    bool rotating_{false};
    std::thread::id rotating_thread_{};
    bool storage_exhausted_{false};
    bool faulted_{false};
    capsync::core::Status fault_status_{};

    capsync::core::ChunkId current_index_{0};
    i64 chunk_accum_ms_{0};
    i64 recorded_ms_{0};
    i64 mark_ms_{0};
    capsync::core::ChunkId next_event_index_{0};
    u32 finalized_count_{0};
    std::map<capsync::core::ChunkId, i64> assigned_ms_;   // fixed at rotation/stop, awaiting finalize
};

} // namespace capsync::capture
