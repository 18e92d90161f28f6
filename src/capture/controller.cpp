#include "capsync/capture/controller.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace capsync::capture {

using namespace capsync::core;

namespace {

Status capture_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Capture, code, aux);
}

Status fault_status(CaptureFault fault) noexcept {
    switch (fault) {
        case CaptureFault::PermissionRevoked:
            return capture_status(StatusCode::PermissionDenied, static_cast<u32>(fault));
        case CaptureFault::WriterFailed:
            return capture_status(StatusCode::Io, static_cast<u32>(fault));
        case CaptureFault::FrameDrop:
        case CaptureFault::DeviceLost:
            break;
    }
    return capture_status(StatusCode::Unavailable, static_cast<u32>(fault));
}

} // namespace

CaptureController::CaptureController(CaptureConfig cfg,
                                     CaptureBackend& backend,
                                     store::ChunkStore& store,
                                     Clock& clock)
    : cfg_(cfg), backend_(backend), store_(store), clock_(clock) {
    backend_.set_events(this);
}

CaptureController::~CaptureController() {
    backend_.set_events(nullptr);
}

void CaptureController::set_callbacks(CaptureCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_ = std::move(callbacks);
}

void CaptureController::accumulate_locked(i64 now) {
    if (state_ == SessionState::Recording && !stopping_) {
        const i64 delta = now > mark_ms_ ? now - mark_ms_ : 0;
        chunk_accum_ms_ += delta;
        recorded_ms_ += delta;
    }
    mark_ms_ = now;
}

void CaptureController::emit_issue(const CaptureIssue& issue) {
    if (issue.fatal) {
        spdlog::error("capture: {} ({})", issue.detail, status_describe(issue.status));
    } else {
        spdlog::warn("capture: {} ({})", issue.detail, status_describe(issue.status));
    }
    if (callbacks_.on_issue) {
        callbacks_.on_issue(issue);
    }
}

// ========================================================================
// Session control
// ========================================================================

Status CaptureController::start(const std::string& recording_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Stopped || stopping_) {
            return capture_status(StatusCode::AlreadyActive);
        }
    }
    if (!recording_id_valid(recording_id)) {
        return capture_status(StatusCode::Invalid);
    }
    if (cfg_.chunk_duration_ms <= 0) {
        return capture_status(StatusCode::Invalid);
    }
    if (!backend_.has_permission()) {
        return capture_status(StatusCode::PermissionDenied);
    }

    bool low = false;
    Status s = store_.below_floor(&low);
    if (!is_ok(s)) {
        return s;
    }
    if (low) {
        spdlog::warn("not starting {}: free space below {} bytes", recording_id,
                     static_cast<unsigned long long>(store_.config().min_free_bytes));
        return capture_status(StatusCode::InsufficientStorage);
    }

    s = store_.prepare_recording(recording_id);
    if (!is_ok(s)) {
        return s;
    }
    std::string first_path;
    s = store_.chunk_path(recording_id, 0, &first_path);
    if (!is_ok(s)) {
        return s;
    }

    u64 gen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Stopped || stopping_) {
            return capture_status(StatusCode::AlreadyActive);
        }
        gen = ++generation_;
        session_open_ = true;
        faulted_ = false;
        fault_status_ = ok_status();
        storage_exhausted_ = false;
        recording_id_ = recording_id;
        started_at_ = clock_.wall_ms();
        current_index_ = 0;
        chunk_accum_ms_ = 0;
        recorded_ms_ = 0;
        next_event_index_ = 0;
        finalized_count_ = 0;
        assigned_ms_.clear();
        state_ = SessionState::Recording;
        mark_ms_ = clock_.monotonic_ms();
    }

    s = backend_.start_capture(first_path);
    if (!is_ok(s)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen == generation_) {
            state_ = SessionState::Stopped;
            session_open_ = false;
        }
        spdlog::error("capture backend did not start for {}: {}", recording_id, status_describe(s));
        return s;
    }

    spdlog::info("recording {} started ({} ms chunks)", recording_id, cfg_.chunk_duration_ms);
    return ok_status();
}

Status CaptureController::pause() {
    u64 gen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Recording || stopping_) {
            return capture_status(StatusCode::InvalidState);
        }
        accumulate_locked(clock_.monotonic_ms());
        state_ = SessionState::Paused;
        gen = generation_;
    }

    Status s = backend_.pause_capture();
    if (!is_ok(s)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen == generation_ && state_ == SessionState::Paused && !stopping_) {
            state_ = SessionState::Recording;
            mark_ms_ = clock_.monotonic_ms();
        }
        return s;
    }
    spdlog::info("recording paused");
    return ok_status();
}

Status CaptureController::resume() {
    u64 gen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Paused || stopping_) {
            return capture_status(StatusCode::InvalidState);
        }
        state_ = SessionState::Recording;
        mark_ms_ = clock_.monotonic_ms();
        gen = generation_;
    }

    Status s = backend_.resume_capture();
    if (!is_ok(s)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen == generation_ && state_ == SessionState::Recording && !stopping_) {
            accumulate_locked(clock_.monotonic_ms());
            state_ = SessionState::Paused;
        }
        return s;
    }
    spdlog::info("recording resumed");
    return ok_status();
}

Status CaptureController::stop() {
    u64 gen = 0;
    ChunkId last = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if ((state_ != SessionState::Recording && state_ != SessionState::Paused) || stopping_) {
            return capture_status(StatusCode::InvalidState);
        }
        if (rotating_) {
            if (rotating_thread_ == std::this_thread::get_id()) {
                // called from a callback while a rotation is on this stack
                return capture_status(StatusCode::Busy);
            }
            cv_.wait(lock, [&] { return !rotating_; });
            if ((state_ != SessionState::Recording && state_ != SessionState::Paused) || stopping_) {
                return capture_status(StatusCode::InvalidState);
            }
        }
        accumulate_locked(clock_.monotonic_ms());
        assigned_ms_[current_index_] = chunk_accum_ms_;
        chunk_accum_ms_ = 0;
        last = current_index_;
        stopping_ = true;
        gen = generation_;
    }

    const Status s = backend_.stop_capture();

    std::unique_lock<std::mutex> lock(mutex_);
    if (is_ok(s)) {
        cv_.wait(lock, [&] { return finalized_count_ > last || gen != generation_ || faulted_; });
    }
    if (gen != generation_) {
        return capture_status(StatusCode::Cancelled);
    }
    stopping_ = false;
    state_ = SessionState::Stopped;
    storage_exhausted_ = false;
    if (!is_ok(s)) {
        spdlog::error("capture backend failed to stop cleanly: {}", status_describe(s));
        return s;
    }
    if (faulted_) {
        return fault_status_;
    }
    session_open_ = false;
    spdlog::info("recording {} stopped: {} chunks, {} ms", recording_id_, finalized_count_, recorded_ms_);
    return ok_status();
}

Status CaptureController::cancel() {
    std::string recording_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Stopped && !stopping_) {
            return ok_status();
        }
        recording_id = recording_id_;
        ++generation_;
        session_open_ = false;
        state_ = SessionState::Stopped;
        stopping_ = false;
        storage_exhausted_ = false;
        assigned_ms_.clear();
    }
    cv_.notify_all();

    const Status a = backend_.abort_capture();
    if (!is_ok(a)) {
        spdlog::warn("capture backend abort reported {}", status_describe(a));
    }
    const Status p = store_.purge_recording(recording_id);
    spdlog::info("recording {} cancelled", recording_id);
    return p;
}

// ========================================================================
// Time-driven rotation
// ========================================================================

Status CaptureController::poll() {
    std::vector<CaptureIssue> issues;
    Status result = ok_status();
    bool exhausted = false;
    bool rotation_failed = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ == SessionState::Stopped || stopping_ || rotating_) {
            return ok_status();
        }
        accumulate_locked(clock_.monotonic_ms());

        const u64 gen = generation_;
        rotating_ = true;
        rotating_thread_ = std::this_thread::get_id();
        while (state_ == SessionState::Recording && !storage_exhausted_ &&
               chunk_accum_ms_ >= cfg_.chunk_duration_ms) {
            // the excess carries into the next chunk
            assigned_ms_[current_index_] = cfg_.chunk_duration_ms;
            chunk_accum_ms_ -= cfg_.chunk_duration_ms;
            ++current_index_;

            std::string next_path;
            Status s = store_.chunk_path(recording_id_, current_index_, &next_path);
            if (is_ok(s)) {
                lock.unlock();
                s = backend_.rotate_segment(next_path);
                lock.lock();
            }
            if (gen != generation_) {
                break;  // cancelled meanwhile
            }
            if (!is_ok(s)) {
                state_ = SessionState::Stopped;
                faulted_ = true;
                fault_status_ = s;
                rotation_failed = true;
                result = s;
                issues.push_back(CaptureIssue{s, true, "segment rotation failed"});
                break;
            }
            accumulate_locked(clock_.monotonic_ms());
        }
        rotating_ = false;
        rotating_thread_ = std::thread::id{};
        exhausted = storage_exhausted_ && state_ != SessionState::Stopped && gen == generation_;
    }
    cv_.notify_all();

    if (rotation_failed) {
        const Status a = backend_.abort_capture();
        if (!is_ok(a)) {
            spdlog::warn("capture backend abort reported {}", status_describe(a));
        }
    }
    for (const CaptureIssue& issue : issues) {
        emit_issue(issue);
    }
    if (exhausted) {
        const Status s = stop();
        if (!is_ok(s)) {
            spdlog::error("stop after running out of space failed: {}", status_describe(s));
        }
        return capture_status(StatusCode::InsufficientStorage);
    }
    return result;
}

// ========================================================================
// Backend events
// ========================================================================

void CaptureController::on_segment_finalized(const std::string& path, ChunkId index, i64 backend_duration_ms) {
    u64 gen = 0;
    i64 duration_ms = 0;
    std::string recording_id;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!session_open_) {
            spdlog::debug("ignoring finalize of segment {} outside a session", index);
            return;
        }
        if (index < next_event_index_) {
            spdlog::warn("ignoring repeated finalize of segment {}", index);
            return;
        }
        if (index > next_event_index_) {
            const ChunkId expected = next_event_index_;
            state_ = SessionState::Stopped;
            faulted_ = true;
            fault_status_ = capture_status(StatusCode::Corrupt, index);
            lock.unlock();
            cv_.notify_all();
            const Status a = backend_.abort_capture();
            if (!is_ok(a)) {
                spdlog::warn("capture backend abort reported {}", status_describe(a));
            }
            emit_issue(CaptureIssue{capture_status(StatusCode::Corrupt, index), true,
                                    "segment " + std::to_string(index) + " finalized before segment " +
                                        std::to_string(expected)});
            return;
        }
        ++next_event_index_;

        auto it = assigned_ms_.find(index);
        if (it != assigned_ms_.end()) {
            duration_ms = it->second;
            assigned_ms_.erase(it);
        } else {
            // segment closed by the backend on its own (e.g. after a fatal fault)
            duration_ms = backend_duration_ms;
        }
        gen = generation_;
        recording_id = recording_id_;
    }

    ChunkDescriptor d;
    const Status s = store_.describe_chunk(recording_id, index, path, duration_ms, &d);
    bool low = false;
    const Status ls = store_.below_floor(&low);

    bool newly_exhausted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen != generation_) {
            return;  // cancelled while hashing; the files are gone
        }
        if (is_ok(ls) && low && !storage_exhausted_ && !stopping_ && state_ != SessionState::Stopped) {
            storage_exhausted_ = true;
            newly_exhausted = true;
        }
    }

    if (is_ok(s)) {
        spdlog::info("chunk {}/{} finalized: {} bytes, {} ms", recording_id, index,
                     static_cast<unsigned long long>(d.size_bytes), d.duration_ms);
        if (callbacks_.on_chunk) {
            callbacks_.on_chunk(d);
        }
    } else {
        emit_issue(CaptureIssue{s, false, "chunk " + std::to_string(index) + " could not be described: " + path});
    }
    if (!is_ok(ls)) {
        spdlog::warn("free space check failed: {}", status_describe(ls));
    }
    if (newly_exhausted) {
        emit_issue(CaptureIssue{capture_status(StatusCode::InsufficientStorage), false,
                                "free space below the floor; the session will stop"});
    }

    // counted only once emitted, so stop() returns after the last descriptor is out
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen == generation_) {
            ++finalized_count_;
        }
    }
    cv_.notify_all();
}

void CaptureController::on_progress(i64 elapsed_ms, u32 segment_count) {
    (void)elapsed_ms;
    (void)segment_count;
    const Status s = poll();
    if (!is_ok(s)) {
        spdlog::debug("poll from progress event: {}", status_describe(s));
    }
    if (callbacks_.on_progress) {
        callbacks_.on_progress(recorded_ms(), chunk_count());
    }
}

void CaptureController::on_fault(CaptureFault fault, const std::string& detail) {
    const Status status = fault_status(fault);
    const std::string text = std::string(capture_fault_name(fault)) + (detail.empty() ? "" : ": " + detail);
    if (!capture_fault_is_fatal(fault)) {
        emit_issue(CaptureIssue{status, false, text});
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Stopped && !stopping_) {
            return;
        }
        accumulate_locked(clock_.monotonic_ms());
        state_ = SessionState::Stopped;
        faulted_ = true;
        fault_status_ = status;
    }
    cv_.notify_all();

    // the backend may still be writing the open segment
    const Status a = backend_.abort_capture();
    if (!is_ok(a)) {
        spdlog::warn("capture backend abort reported {}", status_describe(a));
    }
    emit_issue(CaptureIssue{status, true, text});
}

// ========================================================================
// Observation
// ========================================================================

SessionState CaptureController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

RecordingSession CaptureController::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RecordingSession{recording_id_, started_at_, state_};
}

i64 CaptureController::recorded_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    i64 total = recorded_ms_;
    if (state_ == SessionState::Recording && !stopping_) {
        const i64 now = clock_.monotonic_ms();
        if (now > mark_ms_) {
            total += now - mark_ms_;
        }
    }
    return total;
}

u32 CaptureController::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalized_count_;
}

} // namespace capsync::capture
