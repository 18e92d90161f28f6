#include <string>

#include <gtest/gtest.h>

#include "capsync/manifest/manifest_store.hpp"
#include "capsync/store/chunk_store.hpp"
#include "capsync/upload/handoff.hpp"
#include "capsync/upload/upload_queue.hpp"
#include "support/scripted_transport.hpp"
#include "support/temp_dir.hpp"

using namespace capsync::core;
using capsync::upload::ChunkHandoff;
using capsync::upload::UploadQueue;
using capsync::upload::UploadQueueConfig;

namespace {

class ChunkHandoffTest : public ::testing::Test {
protected:
    ChunkDescriptor make_chunk(ChunkId id) {
        EXPECT_TRUE(is_ok(chunks_.prepare_recording("rec-1")));
        std::string path;
        EXPECT_TRUE(is_ok(chunks_.chunk_path("rec-1", id, &path)));
        capsync::test::write_file(path, "segment " + std::to_string(id));
        ChunkDescriptor d;
        EXPECT_TRUE(is_ok(chunks_.describe_chunk("rec-1", id, path, 1'000, &d)));
        return d;
    }

    static UploadQueueConfig config() {
        UploadQueueConfig cfg;
        cfg.user_id = "user-1";
        cfg.max_concurrent = 1;
        cfg.buffer_capacity = 2;
        cfg.retry.base_delay_ms = 1;
        cfg.retry.max_delay_ms = 1;
        return cfg;
    }

    capsync::test::TempDir tmp_;
    capsync::store::ChunkStore chunks_{capsync::store::ChunkStoreConfig{.root = tmp_.sub("chunks")}};
    capsync::manifest::ManifestStore manifests_{capsync::manifest::ManifestStoreConfig{tmp_.sub("manifests")}};
    capsync::test::ScriptedTransport transport_;
};

} // namespace

TEST_F(ChunkHandoffTest, HoldsChunksWhileQueueIsFull) {
    UploadQueue queue(config(), manifests_, transport_);
    ChunkHandoff handoff(queue);

    EXPECT_TRUE(handoff.offer(make_chunk(0)));
    EXPECT_TRUE(handoff.offer(make_chunk(1)));
    EXPECT_FALSE(handoff.offer(make_chunk(2)));
    EXPECT_FALSE(handoff.offer(make_chunk(3)));
    EXPECT_EQ(handoff.backlog(), 2u);
    EXPECT_EQ(handoff.last_error().code, StatusCode::Busy);

    // nothing drains until the queue makes room
    EXPECT_EQ(handoff.pump(), 0u);

    ASSERT_TRUE(is_ok(queue.start()));
    ASSERT_TRUE(queue.wait_idle(10'000));
    EXPECT_EQ(handoff.pump(), 2u);
    EXPECT_EQ(handoff.backlog(), 0u);
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    capsync::manifest::UploadManifest m;
    ASSERT_TRUE(is_ok(manifests_.load("rec-1", &m)));
    ASSERT_EQ(m.chunks.size(), 4u);
    EXPECT_EQ(m.overall_status, capsync::manifest::UploadStatus::Completed);
}

TEST_F(ChunkHandoffTest, PumpFromCapacityCallback) {
    UploadQueue queue(config(), manifests_, transport_);
    ChunkHandoff handoff(queue);
    capsync::upload::QueueCallbacks cb;
    cb.on_capacity = [&handoff] { handoff.pump(); };
    queue.set_callbacks(cb);
    ASSERT_TRUE(is_ok(queue.start()));

    transport_.set_delay_ms(5);
    for (ChunkId i = 0; i < 6; ++i) {
        handoff.offer(make_chunk(i));
    }
    for (int i = 0; i < 200 && handoff.backlog() != 0; ++i) {
        ASSERT_TRUE(queue.wait_idle(1'000));
        handoff.pump();
    }
    ASSERT_TRUE(queue.wait_idle(10'000));
    queue.stop_processing();

    EXPECT_EQ(handoff.backlog(), 0u);
    EXPECT_EQ(transport_.uploaded().size(), 6u);
}

TEST_F(ChunkHandoffTest, StoppedQueueKeepsBacklog) {
    UploadQueue queue(config(), manifests_, transport_);
    ChunkHandoff handoff(queue);
    queue.stop_processing();

    EXPECT_FALSE(handoff.offer(make_chunk(0)));
    EXPECT_EQ(handoff.backlog(), 1u);
    EXPECT_EQ(handoff.last_error().code, StatusCode::Unavailable);
}
