#pragma once

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "capsync/core/clock.hpp"
#include "capsync/core/errors.hpp"
#include "capsync/core/models.hpp"
#include "capsync/manifest/manifest.hpp"
#include "capsync/manifest/manifest_store.hpp"
#include "capsync/upload/retry_policy.hpp"
#include "capsync/upload/transport.hpp"

namespace capsync::upload {

struct UploadQueueConfig {
    std::string user_id{"local"};      // owner of manifests created by enqueue
    u32 max_concurrent{2};             // worker threads, and so the in-flight bound
    u32 buffer_capacity{32};           // scheduled entries accepted from enqueue before Busy
    RetryPolicy retry{};
    bool delete_local_on_success{false};
};

struct EnqueueOptions {
    bool reset_attempts{false};        // clear attempts/last_error of a failed entry
};

struct ResumeReport {
    u32 manifests_scanned{0};
    u32 entries_scheduled{0};
    u32 uploading_reset{0};            // found uploading, i.e. interrupted by a crash or stop
    u32 failed_left{0};                // failed entries left for explicit remediation
    std::vector<std::string> corrupt;  // recording ids whose manifest could not be read
};

struct QueueStats {
    u32 in_flight{0};
    u32 peak_in_flight{0};
    u32 ready{0};
    u32 delayed{0};
    u64 uploaded{0};
    u64 failed{0};
    u64 retried{0};
};

// Invoked from worker threads with no queue lock held.
struct QueueCallbacks {
    std::function<void(const std::string& recording_id, capsync::core::ChunkId chunk_id, const UploadAck& ack)> on_uploaded;
    std::function<void(const std::string& recording_id, capsync::core::ChunkId chunk_id, const std::string& error)> on_failed;
    std::function<void(const std::string& recording_id, const manifest::ManifestProgress& progress)> on_progress;
    std::function<void()> on_capacity;
};

// Durable, bounded-concurrency uploader. Every chunk transition is written
// to the recording's manifest before the next step; the in-memory manifest
// is a cache of the file. One mutex per recording makes each manifest
// single-writer.
class UploadQueue {
public:
    UploadQueue(UploadQueueConfig cfg,
                manifest::ManifestStore& manifests,
                Transport& transport,
                capsync::core::Clock& clock = capsync::core::system_clock());
    ~UploadQueue();

    UploadQueue(const UploadQueue&) = delete;
    UploadQueue& operator=(const UploadQueue&) = delete;

    // Must be called before start().
    void set_callbacks(QueueCallbacks callbacks);

    // Spawns max_concurrent workers. AlreadyActive if running.
    [[nodiscard]] capsync::core::Status start();

    // Records the chunk as pending and schedules it; never waits on the network.
    // Completed chunks and chunks already scheduled are no-ops. A failed chunk
    // goes back to pending. {Upload, Busy} when buffer_capacity entries are
    // scheduled, {Upload, Unavailable} after stop_processing().
    [[nodiscard]] capsync::core::Status enqueue(const capsync::core::ChunkDescriptor& d, EnqueueOptions opts = {});

    // Reconciles persisted manifests after a restart: uploading entries go
    // back to pending with attempts kept, pending entries are scheduled,
    // failed entries stay failed. Corrupt manifests are reported, never touched.
    [[nodiscard]] capsync::core::Status resume_incomplete_uploads(ResumeReport* report);

    // Explicit remediation of failed entries.
    [[nodiscard]] capsync::core::Status retry_failed(const std::string& recording_id, bool reset_attempts, u32* requeued);

    // Stops accepting work, cancels backoff waits and joins the workers once
    // their current transfer has an outcome. Safe from any thread, callbacks included.
    void stop_processing();

    // True once nothing is scheduled or in flight; timeout_ms < 0 waits forever.
    [[nodiscard]] bool wait_idle(i64 timeout_ms);

    [[nodiscard]] capsync::core::Status snapshot(const std::string& recording_id, manifest::UploadManifest* out);

    // Deletes the manifest of a fully completed recording. Busy while any of
    // its chunks is scheduled, InvalidState unless every entry is completed.
    [[nodiscard]] capsync::core::Status release_recording(const std::string& recording_id);

    [[nodiscard]] QueueStats stats() const;
    [[nodiscard]] bool running() const;

private:
    struct RecordingSlot;
    // Ordered so the lowest chunk id is served first.
    using Key = std::pair<capsync::core::ChunkId, std::string>;

    enum class Outcome {
        Completed,
        Retry,
        Failed,
        Interrupted,
        Dropped,
    };

    std::shared_ptr<RecordingSlot> slot_for_locked(const std::string& recording_id);
    capsync::core::Status ensure_loaded(RecordingSlot& slot, const std::string& recording_id, bool create);
    void save_logged(const RecordingSlot& slot);
    void schedule(const std::vector<Key>& keys);

    void worker_loop(u64 run);
    void process(const Key& key);
    void join_workers();

    UploadQueueConfig cfg_;
    manifest::ManifestStore& manifests_;
    Transport& transport_;
    capsync::core::Clock& clock_;
    QueueCallbacks callbacks_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::map<std::string, std::shared_ptr<RecordingSlot>> slots_;
    std::set<Key> ready_;
    std::multimap<i64, Key> delayed_;     // due time (monotonic ms) -> entry
    std::set<Key> live_;                  // ready, delayed or in flight
    u32 in_flight_{0};
    u32 peak_in_flight_{0};
    u64 uploaded_{0};
    u64 failed_{0};
    u64 retried_{0};
    bool accepting_{true};
    bool stopping_{false};
    bool running_{false};
    u64 run_generation_{0};               // bumped by start(); older workers exit

    std::mutex rng_mutex_;                // leaf lock; backoff jitter only
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};

    std::mutex threads_mutex_;
    std::vector<std::thread> workers_;
};

} // namespace capsync::upload
