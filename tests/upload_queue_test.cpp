#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "capsync/core/clock.hpp"
#include "capsync/manifest/manifest.hpp"
#include "capsync/manifest/manifest_store.hpp"
#include "capsync/store/chunk_store.hpp"
#include "capsync/upload/upload_queue.hpp"
#include "support/scripted_transport.hpp"
#include "support/temp_dir.hpp"

using namespace capsync::core;
using capsync::manifest::ChunkEntry;
using capsync::manifest::ManifestStore;
using capsync::manifest::ManifestStoreConfig;
using capsync::manifest::UploadManifest;
using capsync::manifest::UploadStatus;
using capsync::upload::QueueCallbacks;
using capsync::upload::ResumeReport;
using capsync::upload::RetryPolicy;
using capsync::upload::UploadQueue;
using capsync::upload::UploadQueueConfig;

namespace {

class UploadQueueTest : public ::testing::Test {
protected:
    UploadQueueTest()
        : chunks_(capsync::store::ChunkStoreConfig{.root = tmp_.sub("chunks"),
                                                   .extension = ".mov",
                                                   .min_free_bytes = 0,
                                                   .space_probe = {}}),
          manifests_(ManifestStoreConfig{.root = tmp_.sub("manifests")}) {}

    static UploadQueueConfig config(u32 concurrency = 2, u32 max_attempts = 3) {
        UploadQueueConfig cfg;
        cfg.user_id = "user-1";
        cfg.max_concurrent = concurrency;
        cfg.buffer_capacity = 32;
        cfg.retry = RetryPolicy{.max_attempts = max_attempts, .base_delay_ms = 1, .max_delay_ms = 4};
        return cfg;
    }

    // Writes a real chunk file and describes it.
    ChunkDescriptor make_chunk(const std::string& rec, ChunkId id) {
        EXPECT_TRUE(is_ok(chunks_.prepare_recording(rec)));
        std::string path;
        EXPECT_TRUE(is_ok(chunks_.chunk_path(rec, id, &path)));
        capsync::test::write_file(path, "chunk " + std::to_string(id) + " of " + rec);
        ChunkDescriptor d;
        EXPECT_TRUE(is_ok(chunks_.describe_chunk(rec, id, path, 60'000, &d)));
        return d;
    }

    UploadManifest load(const std::string& rec) {
        UploadManifest m;
        EXPECT_TRUE(is_ok(manifests_.load(rec, &m)));
        return m;
    }

    capsync::test::TempDir tmp_;
    capsync::store::ChunkStore chunks_;
    ManifestStore manifests_;
    capsync::test::ScriptedTransport transport_;
};

} // namespace

// ============================================================================
// Happy path and concurrency
// ============================================================================

TEST_F(UploadQueueTest, UploadsEveryChunkWithinConcurrencyBound) {
    transport_.set_delay_ms(20);
    UploadQueue queue(config(2), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));

    for (ChunkId i = 0; i < 5; ++i) {
        ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", i))));
    }
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    EXPECT_LE(transport_.peak_in_flight(), 2);
    EXPECT_LE(queue.stats().peak_in_flight, 2u);
    EXPECT_EQ(queue.stats().uploaded, 5u);

    const UploadManifest m = load("rec-1");
    ASSERT_EQ(m.chunks.size(), 5u);
    EXPECT_EQ(m.overall_status, UploadStatus::Completed);
    EXPECT_EQ(m.user_id, "user-1");
    for (const ChunkEntry& e : m.chunks) {
        EXPECT_EQ(e.status, UploadStatus::Completed);
        EXPECT_EQ(e.attempts, 1u);
        ASSERT_TRUE(e.ack_token.has_value());
        EXPECT_EQ(*e.ack_token, "etag-rec-1-" + std::to_string(e.chunk_id));
        EXPECT_TRUE(e.completed_at.has_value());
        EXPECT_FALSE(e.last_error.has_value());
    }
}

TEST_F(UploadQueueTest, RemoteKeysAreDeterministic) {
    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 1))));
    ASSERT_TRUE(queue.wait_idle(10'000));

    const auto uploaded = transport_.uploaded();
    ASSERT_EQ(uploaded.size(), 2u);
    EXPECT_EQ(uploaded.at(0), "users/user-1/raw-chunks/rec-1/part-0001");
    EXPECT_EQ(uploaded.at(1), "users/user-1/raw-chunks/rec-1/part-0002");
}

TEST_F(UploadQueueTest, CallbacksReportUploadsAndProgress) {
    std::atomic<int> uploaded{0};
    std::atomic<u32> last_completed{0};
    QueueCallbacks cb;
    cb.on_uploaded = [&](const std::string&, ChunkId, const capsync::upload::UploadAck& ack) {
        EXPECT_FALSE(ack.token.empty());
        ++uploaded;
    };
    cb.on_progress = [&](const std::string&, const capsync::manifest::ManifestProgress& p) {
        last_completed = p.completed;
    };

    UploadQueue queue(config(1), manifests_, transport_);
    queue.set_callbacks(cb);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 1))));
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    EXPECT_EQ(uploaded.load(), 2);
    EXPECT_EQ(last_completed.load(), 2u);
}

TEST_F(UploadQueueTest, LowestChunkIdIsServedFirst) {
    UploadQueue queue(config(1), manifests_, transport_);
    for (ChunkId id : {3u, 1u, 0u, 2u}) {
        ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", id))));
    }
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    EXPECT_EQ(transport_.order(), (std::vector<ChunkId>{0, 1, 2, 3}));
    const auto uploaded = transport_.uploaded();
    ASSERT_EQ(uploaded.size(), 4u);
    EXPECT_EQ(uploaded.at(0), "users/user-1/raw-chunks/rec-1/part-0001");
    EXPECT_EQ(uploaded.at(3), "users/user-1/raw-chunks/rec-1/part-0004");
}

TEST_F(UploadQueueTest, RestartsAfterStopFromCallback) {
    UploadQueue queue(config(1), manifests_, transport_);
    std::atomic<bool> stopped{false};
    QueueCallbacks cb;
    cb.on_uploaded = [&](const std::string&, ChunkId id, const capsync::upload::UploadAck&) {
        if (id == 0) {
            queue.stop_processing();
            stopped = true;
            // keep the worker inside its callback while the queue restarts
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    };
    queue.set_callbacks(cb);

    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(is_ok(queue.start()));
    for (int i = 0; i < 500 && !stopped; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(stopped.load());

    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 1))));
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    EXPECT_EQ(transport_.order(), (std::vector<ChunkId>{0, 1}));
    EXPECT_EQ(load("rec-1").overall_status, UploadStatus::Completed);
}

// ============================================================================
// Retries
// ============================================================================

TEST_F(UploadQueueTest, TransientFailuresAreRetried) {
    transport_.fail_next(0, capsync::test::ScriptedTransport::network_error(), 2);
    UploadQueue queue(config(1, 3), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    const UploadManifest m = load("rec-1");
    ASSERT_EQ(m.chunks.size(), 1u);
    EXPECT_EQ(m.chunks[0].status, UploadStatus::Completed);
    EXPECT_EQ(m.chunks[0].attempts, 3u);
    EXPECT_FALSE(m.chunks[0].last_error.has_value());
    EXPECT_EQ(queue.stats().retried, 2u);
}

TEST_F(UploadQueueTest, ExhaustedRetriesMarkFailed) {
    transport_.fail_always(0, capsync::test::ScriptedTransport::network_error());
    std::atomic<int> failures{0};
    QueueCallbacks cb;
    cb.on_failed = [&](const std::string&, ChunkId, const std::string& error) {
        EXPECT_NE(error.find("Network"), std::string::npos);
        ++failures;
    };

    UploadQueue queue(config(1, 3), manifests_, transport_);
    queue.set_callbacks(cb);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    const UploadManifest m = load("rec-1");
    EXPECT_EQ(m.chunks[0].status, UploadStatus::Failed);
    EXPECT_EQ(m.chunks[0].attempts, 3u);
    ASSERT_TRUE(m.chunks[0].last_error.has_value());
    EXPECT_EQ(m.overall_status, UploadStatus::Failed);
    EXPECT_EQ(transport_.calls(), 3);
    EXPECT_EQ(failures.load(), 1);
}

TEST_F(UploadQueueTest, NonRetryableFailureStopsAfterOneAttempt) {
    transport_.fail_always(0, capsync::test::ScriptedTransport::rejected());
    UploadQueue queue(config(1, 5), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(queue.wait_idle(10'000));

    const UploadManifest m = load("rec-1");
    EXPECT_EQ(m.chunks[0].status, UploadStatus::Failed);
    EXPECT_EQ(m.chunks[0].attempts, 1u);
    EXPECT_EQ(transport_.calls(), 1);
}

TEST_F(UploadQueueTest, MissingLocalFileFailsWithoutTransport) {
    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    const ChunkDescriptor d = make_chunk("rec-1", 0);
    std::filesystem::remove(d.local_path);
    ASSERT_TRUE(is_ok(queue.enqueue(d)));
    ASSERT_TRUE(queue.wait_idle(10'000));

    const UploadManifest m = load("rec-1");
    EXPECT_EQ(m.chunks[0].status, UploadStatus::Failed);
    EXPECT_EQ(transport_.calls(), 0);
}

TEST_F(UploadQueueTest, RetryFailedRequeuesAndResetsAttempts) {
    transport_.fail_next(0, capsync::test::ScriptedTransport::rejected());
    UploadQueue queue(config(1, 3), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(queue.wait_idle(10'000));
    ASSERT_EQ(load("rec-1").chunks[0].status, UploadStatus::Failed);

    u32 requeued = 0;
    ASSERT_TRUE(is_ok(queue.retry_failed("rec-1", true, &requeued)));
    EXPECT_EQ(requeued, 1u);
    ASSERT_TRUE(queue.wait_idle(10'000));

    const UploadManifest m = load("rec-1");
    EXPECT_EQ(m.chunks[0].status, UploadStatus::Completed);
    EXPECT_EQ(m.chunks[0].attempts, 1u);
}

// ============================================================================
// Enqueue semantics
// ============================================================================

TEST_F(UploadQueueTest, EnqueueOfCompletedChunkIsNoop) {
    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    const ChunkDescriptor d = make_chunk("rec-1", 0);
    ASSERT_TRUE(is_ok(queue.enqueue(d)));
    ASSERT_TRUE(queue.wait_idle(10'000));
    ASSERT_EQ(transport_.calls(), 1);

    ASSERT_TRUE(is_ok(queue.enqueue(d)));
    ASSERT_TRUE(queue.wait_idle(10'000));
    EXPECT_EQ(transport_.calls(), 1);
    EXPECT_EQ(load("rec-1").chunks[0].attempts, 1u);
}

TEST_F(UploadQueueTest, BusyWhenBufferIsFull) {
    UploadQueueConfig cfg = config(1);
    cfg.buffer_capacity = 2;
    UploadQueue queue(cfg, manifests_, transport_);
    // not started: nothing drains the buffer

    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 1))));
    const Status s = queue.enqueue(make_chunk("rec-1", 2));
    EXPECT_EQ(s.domain, StatusDomain::Upload);
    EXPECT_EQ(s.code, StatusCode::Busy);

    // the rejected chunk was never recorded
    EXPECT_EQ(load("rec-1").chunks.size(), 2u);

    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(queue.wait_idle(10'000));
    EXPECT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 2))));
}

TEST_F(UploadQueueTest, EnqueueRejectsInvalidDescriptor) {
    UploadQueue queue(config(1), manifests_, transport_);
    ChunkDescriptor d = make_chunk("rec-1", 0);
    d.checksum.clear();
    EXPECT_EQ(queue.enqueue(d).code, StatusCode::Invalid);
}

TEST_F(UploadQueueTest, EnqueueAfterStopIsUnavailable) {
    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    queue.stop_processing();
    EXPECT_EQ(queue.enqueue(make_chunk("rec-1", 0)).code, StatusCode::Unavailable);
}

// ============================================================================
// Restart recovery
// ============================================================================

TEST_F(UploadQueueTest, ResumesChunkLeftUploadingByCrash) {
    const ChunkDescriptor d0 = make_chunk("rec-1", 0);
    const ChunkDescriptor d1 = make_chunk("rec-1", 1);
    UploadManifest m;
    ASSERT_TRUE(is_ok(manifests_.create("rec-1", "user-1", {d0, d1}, 1'000, &m)));
    ASSERT_TRUE(is_ok(capsync::manifest::manifest_update_entry(&m, 0, UploadStatus::Uploading, nullptr, 2'000)));
    ASSERT_TRUE(is_ok(manifests_.save(m)));

    UploadQueue queue(config(2), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ResumeReport report;
    ASSERT_TRUE(is_ok(queue.resume_incomplete_uploads(&report)));
    EXPECT_EQ(report.manifests_scanned, 1u);
    EXPECT_EQ(report.uploading_reset, 1u);
    EXPECT_EQ(report.entries_scheduled, 2u);
    ASSERT_TRUE(queue.wait_idle(10'000));

    const UploadManifest after = load("rec-1");
    EXPECT_EQ(after.overall_status, UploadStatus::Completed);
    EXPECT_EQ(after.chunks[0].attempts, 1u);
}

TEST_F(UploadQueueTest, ResumeLeavesFailedEntriesAlone) {
    const ChunkDescriptor d0 = make_chunk("rec-1", 0);
    UploadManifest m;
    ASSERT_TRUE(is_ok(manifests_.create("rec-1", "user-1", {d0}, 1'000, &m)));
    const std::string err = "Rejected: scripted";
    ASSERT_TRUE(is_ok(capsync::manifest::manifest_update_entry(&m, 0, UploadStatus::Uploading, nullptr, 2'000)));
    ASSERT_TRUE(is_ok(capsync::manifest::manifest_update_entry(&m, 0, UploadStatus::Failed, &err, 3'000)));
    ASSERT_TRUE(is_ok(manifests_.save(m)));

    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ResumeReport report;
    ASSERT_TRUE(is_ok(queue.resume_incomplete_uploads(&report)));
    EXPECT_EQ(report.failed_left, 1u);
    EXPECT_EQ(report.entries_scheduled, 0u);
    ASSERT_TRUE(queue.wait_idle(10'000));
    EXPECT_EQ(transport_.calls(), 0);
    EXPECT_EQ(load("rec-1").chunks[0].status, UploadStatus::Failed);
}

TEST_F(UploadQueueTest, ResumeReportsCorruptManifest) {
    tmp_.write("manifests/rec-bad/manifest.json", "{ not json");
    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ResumeReport report;
    ASSERT_TRUE(is_ok(queue.resume_incomplete_uploads(&report)));
    ASSERT_EQ(report.corrupt.size(), 1u);
    EXPECT_EQ(report.corrupt[0], "rec-bad");
    EXPECT_EQ(capsync::test::read_file(manifests_.path_for("rec-bad")), "{ not json");
}

TEST_F(UploadQueueTest, StopDuringBackoffKeepsChunkPending) {
    transport_.fail_always(0, capsync::test::ScriptedTransport::network_error());
    UploadQueueConfig cfg = config(1, 5);
    cfg.retry.base_delay_ms = 60'000;
    cfg.retry.max_delay_ms = 60'000;
    UploadQueue queue(cfg, manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));

    for (int i = 0; i < 1000 && queue.stats().delayed == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(queue.stats().delayed, 1u);

    const auto before = std::chrono::steady_clock::now();
    queue.stop_processing();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(5));
    EXPECT_FALSE(queue.running());

    const UploadManifest m = load("rec-1");
    EXPECT_EQ(m.chunks[0].status, UploadStatus::Pending);
    EXPECT_EQ(m.chunks[0].attempts, 1u);
    EXPECT_TRUE(m.chunks[0].last_error.has_value());
}

TEST_F(UploadQueueTest, StopInterruptsTransferAndResumeFinishesIt) {
    transport_.set_delay_ms(5'000);
    {
        UploadQueue queue(config(1), manifests_, transport_);
        ASSERT_TRUE(is_ok(queue.start()));
        ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
        for (int i = 0; i < 1000 && queue.stats().in_flight == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        queue.stop_processing();
    }
    EXPECT_EQ(load("rec-1").chunks[0].status, UploadStatus::Uploading);

    transport_.set_delay_ms(0);
    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ResumeReport report;
    ASSERT_TRUE(is_ok(queue.resume_incomplete_uploads(&report)));
    EXPECT_EQ(report.uploading_reset, 1u);
    ASSERT_TRUE(queue.wait_idle(10'000));
    EXPECT_EQ(load("rec-1").chunks[0].status, UploadStatus::Completed);
}

// ============================================================================
// Release
// ============================================================================

TEST_F(UploadQueueTest, ReleaseRequiresCompletedRecording) {
    transport_.fail_always(1, capsync::test::ScriptedTransport::rejected());
    UploadQueue queue(config(1), manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-1", 0))));
    ASSERT_TRUE(is_ok(queue.enqueue(make_chunk("rec-2", 1))));
    ASSERT_TRUE(queue.wait_idle(10'000));

    EXPECT_TRUE(is_ok(queue.release_recording("rec-1")));
    bool exists = true;
    ASSERT_TRUE(is_ok(manifests_.exists("rec-1", &exists)));
    EXPECT_FALSE(exists);

    EXPECT_EQ(queue.release_recording("rec-2").code, StatusCode::InvalidState);
}

TEST_F(UploadQueueTest, DeletesLocalFileWhenConfigured) {
    UploadQueueConfig cfg = config(1);
    cfg.delete_local_on_success = true;
    UploadQueue queue(cfg, manifests_, transport_);
    ASSERT_TRUE(is_ok(queue.start()));
    const ChunkDescriptor d = make_chunk("rec-1", 0);
    ASSERT_TRUE(is_ok(queue.enqueue(d)));
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();
    EXPECT_FALSE(std::filesystem::exists(d.local_path));
}
