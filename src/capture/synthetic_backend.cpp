#include "capsync/capture/synthetic_backend.hpp"
#include "capsync/store/file_io.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

#include <spdlog/spdlog.h>

namespace capsync::capture {

using namespace capsync::core;

namespace {

Status backend_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Capture, code, aux);
}

// xorshift64
u64 next_random(u64* state) noexcept {
    u64 x = *state;
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    *state = x;
    return x;
}

} // namespace

SyntheticBackend::SyntheticBackend(SyntheticBackendConfig cfg) : cfg_(cfg) {}

SyntheticBackend::~SyntheticBackend() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticker_stop_ = true;
        events_ = nullptr;
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }
}

void SyntheticBackend::set_events(CaptureEvents* events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_ = events;
}

bool SyntheticBackend::has_permission() {
    return cfg_.permission_granted;
}

// ========================================================================
// Segment files
// ========================================================================

Status SyntheticBackend::open_segment_locked(const std::string& path) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return backend_status(StatusCode::Io, errno);
    }
    fd_ = fd;
    segment_path_ = path;
    segment_ms_ = 0;
    return ok_status();
}

Status SyntheticBackend::close_segment_locked(ClosedSegment* out) {
    if (fd_ < 0) {
        return backend_status(StatusCode::InvalidState);
    }
    Status s = ok_status();
    if (fsync(fd_) != 0) {
        s = backend_status(StatusCode::Io, errno);
    }
    close(fd_);
    fd_ = -1;
    out->path = segment_path_;
    out->index = segment_index_;
    out->duration_ms = segment_ms_;
    return s;
}

Status SyntheticBackend::write_tick_locked() {
    const u64 bytes = static_cast<u64>(cfg_.bytes_per_second) * static_cast<u64>(cfg_.tick_ms) / 1000u;
    std::vector<u8> buf(static_cast<size_t>(bytes));
    for (size_t i = 0; i < buf.size(); i += 8) {
        const u64 r = next_random(&rng_);
        for (size_t b = 0; b < 8 && i + b < buf.size(); ++b) {
            buf[i + b] = static_cast<u8>(r >> (b * 8));
        }
    }
    return store::write_all(fd_, buf.data(), buf.size(), StatusDomain::Capture);
}

// ========================================================================
// Ticker
// ========================================================================

void SyntheticBackend::ticker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait_for(lock, std::chrono::milliseconds(cfg_.tick_ms), [&] { return ticker_stop_; });
        if (ticker_stop_) {
            return;
        }
        if (!running_ || paused_ || fd_ < 0) {
            continue;
        }

        const Status s = write_tick_locked();
        CaptureEvents* events = events_;
        if (!is_ok(s)) {
            // the writer is gone; the session cannot continue
            close(fd_);
            fd_ = -1;
            running_ = false;
            ticker_stop_ = true;
            lock.unlock();
            if (events != nullptr) {
                events->on_fault(CaptureFault::WriterFailed, status_describe(s));
            }
            return;
        }
        segment_ms_ += cfg_.tick_ms;
        elapsed_ms_ += cfg_.tick_ms;
        const i64 elapsed = elapsed_ms_;
        const u32 count = segment_index_;

        lock.unlock();
        if (events != nullptr) {
            events->on_progress(elapsed, count);
        }
        lock.lock();
    }
}

void SyntheticBackend::join_ticker() {
    if (ticker_.joinable() && ticker_.get_id() != std::this_thread::get_id()) {
        ticker_.join();
    }
}

// ========================================================================
// CaptureBackend
// ========================================================================

Status SyntheticBackend::start_capture(const std::string& first_segment_path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return backend_status(StatusCode::AlreadyActive);
        }
        ticker_stop_ = true;
    }
    cv_.notify_all();
    join_ticker();
    if (ticker_.joinable()) {
        // start_capture from the ticker's own callback
        return backend_status(StatusCode::Busy);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Status s = open_segment_locked(first_segment_path);
    if (!is_ok(s)) {
        return s;
    }
    segment_index_ = 0;
    elapsed_ms_ = 0;
    rng_ = cfg_.seed != 0 ? cfg_.seed : 1;
    running_ = true;
    paused_ = false;
    ticker_stop_ = false;
    ticker_ = std::thread(&SyntheticBackend::ticker_loop, this);
    return ok_status();
}

Status SyntheticBackend::pause_capture() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || paused_) {
        return backend_status(StatusCode::InvalidState);
    }
    paused_ = true;
    return ok_status();
}

Status SyntheticBackend::resume_capture() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || !paused_) {
        return backend_status(StatusCode::InvalidState);
    }
    paused_ = false;
    return ok_status();
}

Status SyntheticBackend::rotate_segment(const std::string& next_segment_path) {
    ClosedSegment closed;
    CaptureEvents* events = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return backend_status(StatusCode::InvalidState);
        }
        Status s = close_segment_locked(&closed);
        if (!is_ok(s)) {
            return s;
        }
        s = open_segment_locked(next_segment_path);
        if (!is_ok(s)) {
            running_ = false;
            return s;
        }
        ++segment_index_;
        events = events_;
    }
    if (events != nullptr) {
        events->on_segment_finalized(closed.path, closed.index, closed.duration_ms);
    }
    return ok_status();
}

Status SyntheticBackend::stop_capture() {
    ClosedSegment closed;
    CaptureEvents* events = nullptr;
    Status s = ok_status();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return backend_status(StatusCode::InvalidState);
        }
        s = close_segment_locked(&closed);
        running_ = false;
        ticker_stop_ = true;
        events = events_;
    }
    cv_.notify_all();
    join_ticker();

    if (!is_ok(s)) {
        return s;
    }
    if (events != nullptr) {
        events->on_segment_finalized(closed.path, closed.index, closed.duration_ms);
    }
    return ok_status();
}

Status SyntheticBackend::abort_capture() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
            if (unlink(segment_path_.c_str()) != 0 && errno != ENOENT) {
                spdlog::warn("partial segment {} not removed: errno {}", segment_path_, errno);
            }
        }
        running_ = false;
        ticker_stop_ = true;
    }
    cv_.notify_all();
    join_ticker();
    return ok_status();
}

} // namespace capsync::capture
