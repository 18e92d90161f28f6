#include "capsync/upload/upload_queue.hpp"

#include <chrono>
#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace capsync::upload {

using namespace capsync::core;
using manifest::ChunkEntry;
using manifest::ManifestProgress;
using manifest::UploadManifest;
using manifest::UploadStatus;

struct UploadQueue::RecordingSlot {
    std::mutex mutex;
    bool loaded{false};
    bool released{false};
    UploadManifest manifest;
};

namespace {

Status upload_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Upload, code, aux);
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

UploadQueue::UploadQueue(UploadQueueConfig cfg,
                         manifest::ManifestStore& manifests,
                         Transport& transport,
                         Clock& clock)
    : cfg_(std::move(cfg)), manifests_(manifests), transport_(transport), clock_(clock),
      rng_(std::random_device{}()) {}

UploadQueue::~UploadQueue() {
    stop_processing();
    join_workers();
}

void UploadQueue::set_callbacks(QueueCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_ = std::move(callbacks);
}

// ========================================================================
// Lifecycle
// ========================================================================

Status UploadQueue::start() {
    if (cfg_.max_concurrent == 0) {
        return upload_status(StatusCode::Invalid);
    }
    u64 run = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return upload_status(StatusCode::AlreadyActive);
        }
        running_ = true;
        accepting_ = true;
        stopping_ = false;
        run = ++run_generation_;
    }
    // threads left over from a stop issued inside a callback; they belong to
    // an older run and leave once their callback returns
    join_workers();
    transport_.clear_abort();

    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (u32 i = 0; i < cfg_.max_concurrent; ++i) {
        workers_.emplace_back(&UploadQueue::worker_loop, this, run);
    }
    spdlog::info("upload queue started with {} workers", cfg_.max_concurrent);
    return ok_status();
}

void UploadQueue::stop_processing() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_running = running_;
        accepting_ = false;
        stopping_ = true;
        running_ = false;
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
    if (was_running) {
        transport_.request_abort();
        spdlog::info("upload queue stopping");
    }
    join_workers();
}

void UploadQueue::join_workers() {
    std::vector<std::thread> to_join;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        std::vector<std::thread> keep;
        for (auto& t : workers_) {
            // a worker stopping the queue from a callback cannot join itself
            if (t.get_id() == std::this_thread::get_id()) {
                keep.push_back(std::move(t));
            } else {
                to_join.push_back(std::move(t));
            }
        }
        workers_ = std::move(keep);
    }
    for (auto& t : to_join) {
        if (t.joinable()) {
            t.join();
        }
    }
}

bool UploadQueue::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

// ========================================================================
// Manifest slots
// ========================================================================

std::shared_ptr<UploadQueue::RecordingSlot> UploadQueue::slot_for_locked(const std::string& recording_id) {
    auto it = slots_.find(recording_id);
    if (it != slots_.end()) {
        return it->second;
    }
    auto slot = std::make_shared<RecordingSlot>();
    slots_.emplace(recording_id, slot);
    return slot;
}

// Caller holds slot.mutex.
Status UploadQueue::ensure_loaded(RecordingSlot& slot, const std::string& recording_id, bool create) {
    if (slot.loaded) {
        return ok_status();
    }
    UploadManifest m;
    Status s = manifests_.load(recording_id, &m);
    if (s.code == StatusCode::NotFound && create) {
        s = manifest::manifest_create(recording_id, cfg_.user_id, {}, clock_.wall_ms(), &m);
    }
    if (!is_ok(s)) {
        return s;
    }
    slot.manifest = std::move(m);
    slot.loaded = true;
    return ok_status();
}

// Caller holds slot.mutex.
void UploadQueue::save_logged(const RecordingSlot& slot) {
    const Status s = manifests_.save(slot.manifest);
    if (!is_ok(s)) {
        // the transition stays in memory; a restart replays from the last good file
        spdlog::error("manifest for {} not persisted: {}", slot.manifest.recording_id, status_describe(s));
    }
}

void UploadQueue::schedule(const std::vector<Key>& keys) {
    if (keys.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const Key& k : keys) {
            live_.insert(k);
            ready_.insert(k);
        }
    }
    work_cv_.notify_all();
}

// ========================================================================
// Producer side
// ========================================================================

Status UploadQueue::enqueue(const ChunkDescriptor& d, EnqueueOptions opts) {
    if (!recording_id_valid(d.recording_id) || d.local_path.empty() || d.checksum.empty()) {
        return upload_status(StatusCode::Invalid);
    }
    const Key key{d.chunk_id, d.recording_id};

    for (;;) {
        std::shared_ptr<RecordingSlot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepting_) {
                return upload_status(StatusCode::Unavailable);
            }
            if (live_.count(key) != 0) {
                return ok_status();  // already scheduled or in flight
            }
            if (live_.size() >= cfg_.buffer_capacity) {
                return upload_status(StatusCode::Busy, static_cast<u32>(live_.size()));
            }
            live_.insert(key);  // reservation
            slot = slot_for_locked(d.recording_id);
        }

        Status s = ok_status();
        bool scheduled = false;
        bool retry_slot = false;
        {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            if (slot->released) {
                retry_slot = true;
            } else {
                s = ensure_loaded(*slot, d.recording_id, true);
                if (is_ok(s)) {
                    UploadManifest& m = slot->manifest;
                    const Timestamp now = clock_.wall_ms();
                    const ChunkEntry* e = manifest::manifest_find_entry(m, d.chunk_id);
                    if (e == nullptr) {
                        s = manifest::manifest_add_entry(&m, d, now);
                        scheduled = is_ok(s);
                    } else if (e->status == UploadStatus::Completed) {
                        spdlog::debug("chunk {}/{} already uploaded", d.recording_id, d.chunk_id);
                    } else if (e->status == UploadStatus::Pending && !opts.reset_attempts) {
                        scheduled = true;
                    } else {
                        // failed, stale uploading (not in flight), or an explicit reset
                        s = manifest::manifest_reset_entry(&m, d.chunk_id, opts.reset_attempts, now);
                        scheduled = is_ok(s);
                    }
                    if (scheduled) {
                        s = manifests_.save(m);
                        if (!is_ok(s)) {
                            scheduled = false;
                        }
                    }
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (scheduled) {
                ready_.insert(key);
            } else {
                live_.erase(key);
            }
        }
        if (retry_slot) {
            continue;
        }
        if (scheduled) {
            work_cv_.notify_one();
            spdlog::debug("queued chunk {}/{}", d.recording_id, d.chunk_id);
        }
        return s;
    }
}

Status UploadQueue::resume_incomplete_uploads(ResumeReport* report) {
    std::vector<std::string> ids;
    Status s = manifests_.list(&ids);
    if (!is_ok(s)) {
        return s;
    }

    ResumeReport r;
    for (const std::string& id : ids) {
        std::shared_ptr<RecordingSlot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot = slot_for_locked(id);
        }

        std::vector<Key> keys;
        {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            s = ensure_loaded(*slot, id, false);
            if (s.code == StatusCode::Corrupt) {
                spdlog::error("manifest for {} is corrupt; leaving it for manual recovery", id);
                r.corrupt.push_back(id);
                continue;
            }
            if (!is_ok(s)) {
                spdlog::error("manifest for {} not loaded: {}", id, status_describe(s));
                continue;
            }
            ++r.manifests_scanned;

            UploadManifest& m = slot->manifest;
            const Timestamp now = clock_.wall_ms();
            bool changed = false;
            for (const ChunkEntry& e : m.chunks) {
                const Key k{e.chunk_id, id};
                bool live = false;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    live = live_.count(k) != 0;
                }
                if (live) {
                    continue;
                }
                if (e.status == UploadStatus::Uploading) {
                    const Status rs = manifest::manifest_reset_entry(&m, e.chunk_id, false, now);
                    if (!is_ok(rs)) {
                        spdlog::error("chunk {}/{} not reset: {}", id, e.chunk_id, status_describe(rs));
                        continue;
                    }
                    ++r.uploading_reset;
                    changed = true;
                    keys.push_back(k);
                } else if (e.status == UploadStatus::Pending) {
                    keys.push_back(k);
                } else if (e.status == UploadStatus::Failed) {
                    ++r.failed_left;
                }
            }
            if (changed) {
                save_logged(*slot);
            }
        }

        r.entries_scheduled += static_cast<u32>(keys.size());
        schedule(keys);
    }

    spdlog::info("resume: {} manifests, {} chunks scheduled ({} interrupted), {} failed, {} corrupt",
                 r.manifests_scanned, r.entries_scheduled, r.uploading_reset, r.failed_left, r.corrupt.size());
    if (report != nullptr) {
        *report = std::move(r);
    }
    return ok_status();
}

Status UploadQueue::retry_failed(const std::string& recording_id, bool reset_attempts, u32* requeued) {
    if (!recording_id_valid(recording_id)) {
        return upload_status(StatusCode::Invalid);
    }
    std::shared_ptr<RecordingSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return upload_status(StatusCode::Unavailable);
        }
        slot = slot_for_locked(recording_id);
    }

    std::vector<Key> keys;
    {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        Status s = ensure_loaded(*slot, recording_id, false);
        if (!is_ok(s)) {
            return s;
        }
        UploadManifest& m = slot->manifest;
        const Timestamp now = clock_.wall_ms();
        for (const ChunkEntry& e : m.chunks) {
            if (e.status != UploadStatus::Failed) {
                continue;
            }
            s = manifest::manifest_reset_entry(&m, e.chunk_id, reset_attempts, now);
            if (!is_ok(s)) {
                return s;
            }
            keys.emplace_back(e.chunk_id, recording_id);
        }
        if (!keys.empty()) {
            s = manifests_.save(m);
            if (!is_ok(s)) {
                return s;
            }
        }
    }

    if (requeued != nullptr) {
        *requeued = static_cast<u32>(keys.size());
    }
    spdlog::info("requeued {} failed chunks of {}", keys.size(), recording_id);
    schedule(keys);
    return ok_status();
}

// ========================================================================
// Workers
// ========================================================================

void UploadQueue::worker_loop(u64 run) {
    for (;;) {
        Key key;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            for (;;) {
                if (stopping_ || run != run_generation_) {
                    return;
                }
                const i64 now = clock_.monotonic_ms();
                while (!delayed_.empty() && delayed_.begin()->first <= now) {
                    ready_.insert(delayed_.begin()->second);
                    delayed_.erase(delayed_.begin());
                }
                if (!ready_.empty()) {
                    key = *ready_.begin();
                    ready_.erase(ready_.begin());
                    break;
                }
                if (!delayed_.empty()) {
                    const i64 wait_ms = delayed_.begin()->first - now;
                    work_cv_.wait_for(lock, std::chrono::milliseconds(wait_ms));
                } else {
                    work_cv_.wait(lock);
                }
            }
            ++in_flight_;
            if (in_flight_ > peak_in_flight_) {
                peak_in_flight_ = in_flight_;
            }
        }
        process(key);
    }
}

void UploadQueue::process(const Key& key) {
    const std::string& recording_id = key.second;
    const ChunkId chunk_id = key.first;

    std::shared_ptr<RecordingSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot = slot_for_locked(recording_id);
    }

    UploadRequest req;
    bool proceed = false;
    {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        const Status ls = ensure_loaded(*slot, recording_id, false);
        if (is_ok(ls)) {
            UploadManifest& m = slot->manifest;
            const ChunkEntry* e = manifest::manifest_find_entry(m, chunk_id);
            if (e != nullptr && e->status == UploadStatus::Pending) {
                const Status s = manifest::manifest_update_entry(&m, chunk_id, UploadStatus::Uploading, nullptr, clock_.wall_ms());
                if (is_ok(s)) {
                    save_logged(*slot);
                    req.recording_id = recording_id;
                    req.user_id = m.user_id;
                    req.chunk_id = chunk_id;
                    req.local_path = e->local_path;
                    req.remote_key = e->remote_key;
                    req.size_bytes = e->size_bytes;
                    req.checksum = e->checksum;
                    req.duration_ms = e->duration_ms;
                    proceed = true;
                }
            }
        } else {
            spdlog::error("chunk {}/{} skipped, manifest not loaded: {}", recording_id, chunk_id, status_describe(ls));
        }
    }

    Outcome outcome = Outcome::Dropped;
    UploadAck ack;
    std::string error_text;
    i64 retry_delay_ms = 0;
    ManifestProgress progress;

    if (proceed) {
        Status result;
        std::string detail;
        if (!file_exists(req.local_path)) {
            result = upload_status(StatusCode::NotFound);
            detail = "local chunk file is missing: " + req.local_path;
        } else {
            result = transport_.upload_chunk(req, &ack, &detail);
            if (is_ok(result) && ack.token.empty()) {
                result = make_status(StatusDomain::Transport, StatusCode::Unknown);
                detail = "transport reported success without an acknowledgment";
            }
        }

        bool stopping = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping = stopping_;
        }

        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        UploadManifest& m = slot->manifest;
        const Timestamp now = clock_.wall_ms();
        Status s = ok_status();

        if (is_ok(result)) {
            s = manifest::manifest_record_ack(&m, chunk_id, ack.token, now);
            if (is_ok(s)) {
                s = manifest::manifest_update_entry(&m, chunk_id, UploadStatus::Completed, nullptr, now);
            }
            outcome = Outcome::Completed;
        } else if (result.code == StatusCode::Cancelled && stopping) {
            // stays uploading on disk; resume_incomplete_uploads picks it up
            outcome = Outcome::Interrupted;
        } else {
            error_text = std::string(status_code_name(result.code)) + ": " + detail;
            const ChunkEntry* e = manifest::manifest_find_entry(m, chunk_id);
            const u32 attempts = (e != nullptr ? e->attempts : 0) + 1;
            if (retry_allowed(cfg_.retry, attempts, result)) {
                s = manifest::manifest_update_entry(&m, chunk_id, UploadStatus::Pending, &error_text, now);
                retry_delay_ms = backoff_delay_ms(cfg_.retry, attempts);
                if (cfg_.retry.jitter > 0.0) {
                    std::lock_guard<std::mutex> rng_lock(rng_mutex_);
                    retry_delay_ms = jittered_delay_ms(cfg_.retry, retry_delay_ms, unit_(rng_));
                }
                outcome = Outcome::Retry;
                spdlog::warn("upload of {}/{} failed (attempt {}), retrying in {} ms: {}",
                             recording_id, chunk_id, attempts, retry_delay_ms, error_text);
            } else {
                s = manifest::manifest_update_entry(&m, chunk_id, UploadStatus::Failed, &error_text, now);
                outcome = Outcome::Failed;
                spdlog::error("upload of {}/{} failed after {} attempts: {}",
                              recording_id, chunk_id, attempts, error_text);
            }
        }

        if (!is_ok(s)) {
            spdlog::error("chunk {}/{} transition rejected: {}", recording_id, chunk_id, status_describe(s));
        }
        if (outcome != Outcome::Interrupted) {
            save_logged(*slot);
        }
        progress = manifest::manifest_progress(m);
    }

    QueueCallbacks cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
        switch (outcome) {
            case Outcome::Retry:
                ++retried_;
                delayed_.emplace(clock_.monotonic_ms() + retry_delay_ms, key);
                break;
            case Outcome::Completed:
                ++uploaded_;
                live_.erase(key);
                break;
            case Outcome::Failed:
                ++failed_;
                live_.erase(key);
                break;
            case Outcome::Interrupted:
            case Outcome::Dropped:
                live_.erase(key);
                break;
        }
        cb = callbacks_;
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();

    if (outcome == Outcome::Completed) {
        spdlog::info("uploaded {}/{} as {}", recording_id, chunk_id, ack.remote_key.empty() ? req.remote_key : ack.remote_key);
        if (cfg_.delete_local_on_success && unlink(req.local_path.c_str()) != 0) {
            spdlog::warn("local chunk {} not deleted: errno {}", req.local_path, errno);
        }
        if (cb.on_uploaded) cb.on_uploaded(recording_id, chunk_id, ack);
    } else if (outcome == Outcome::Failed) {
        if (cb.on_failed) cb.on_failed(recording_id, chunk_id, error_text);
    }
    if (proceed && outcome != Outcome::Interrupted && cb.on_progress) {
        cb.on_progress(recording_id, progress);
    }
    if (outcome != Outcome::Retry && cb.on_capacity) {
        cb.on_capacity();
    }
}

// ========================================================================
// Observation
// ========================================================================

bool UploadQueue::wait_idle(i64 timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto idle = [&] { return live_.empty() || (stopping_ && in_flight_ == 0); };
    if (timeout_ms < 0) {
        idle_cv_.wait(lock, idle);
    } else {
        idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    return live_.empty();
}

Status UploadQueue::snapshot(const std::string& recording_id, UploadManifest* out) {
    if (out == nullptr || !recording_id_valid(recording_id)) {
        return upload_status(StatusCode::Invalid);
    }
    std::shared_ptr<RecordingSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(recording_id);
        if (it != slots_.end()) {
            slot = it->second;
        }
    }
    if (slot) {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->loaded) {
            *out = slot->manifest;
            return ok_status();
        }
    }
    return manifests_.load(recording_id, out);
}

Status UploadQueue::release_recording(const std::string& recording_id) {
    if (!recording_id_valid(recording_id)) {
        return upload_status(StatusCode::Invalid);
    }
    std::shared_ptr<RecordingSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const Key& k : live_) {
            if (k.second == recording_id) {
                return upload_status(StatusCode::Busy);
            }
        }
        slot = slot_for_locked(recording_id);
    }

    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    Status s = ensure_loaded(*slot, recording_id, false);
    if (!is_ok(s)) {
        return s;
    }
    if (slot->manifest.overall_status != UploadStatus::Completed) {
        return upload_status(StatusCode::InvalidState);
    }
    s = manifests_.remove(recording_id);
    if (!is_ok(s)) {
        return s;
    }
    slot->released = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(recording_id);
        if (it != slots_.end() && it->second == slot) {
            slots_.erase(it);
        }
    }
    spdlog::info("released manifest of {}", recording_id);
    return ok_status();
}

QueueStats UploadQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStats st;
    st.in_flight = in_flight_;
    st.peak_in_flight = peak_in_flight_;
    st.ready = static_cast<u32>(ready_.size());
    st.delayed = static_cast<u32>(delayed_.size());
    st.uploaded = uploaded_;
    st.failed = failed_;
    st.retried = retried_;
    return st;
}

} // namespace capsync::upload
