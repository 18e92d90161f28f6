#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "capsync/manifest/manifest_store.hpp"
#include "support/temp_dir.hpp"

using namespace capsync::core;
using namespace capsync::manifest;

namespace {

class ManifestStoreTest : public ::testing::Test {
protected:
    ChunkDescriptor descriptor(const std::string& rec, ChunkId id) {
        ChunkDescriptor d;
        d.recording_id = rec;
        d.chunk_id = id;
        d.local_path = tmp_.sub("chunks/" + rec + "/chunk.mov");
        d.size_bytes = 50;
        d.duration_ms = 1'000;
        d.checksum = std::string(64, 'd');
        return d;
    }

    capsync::test::TempDir tmp_;
    ManifestStore store_{ManifestStoreConfig{tmp_.sub("manifests")}};
};

} // namespace

TEST_F(ManifestStoreTest, CreatePersistsAndLoads) {
    UploadManifest m;
    ASSERT_TRUE(is_ok(store_.create("rec-1", "user-1", {descriptor("rec-1", 0), descriptor("rec-1", 1)}, 100, &m)));
    EXPECT_EQ(store_.path_for("rec-1"), tmp_.sub("manifests/rec-1/manifest.json"));
    EXPECT_TRUE(std::filesystem::exists(store_.path_for("rec-1")));

    UploadManifest loaded;
    ASSERT_TRUE(is_ok(store_.load("rec-1", &loaded)));
    EXPECT_EQ(loaded.user_id, "user-1");
    ASSERT_EQ(loaded.chunks.size(), 2u);
    EXPECT_EQ(loaded.chunks[1].remote_key, "users/user-1/raw-chunks/rec-1/part-0002");
}

TEST_F(ManifestStoreTest, CreateTwiceConflicts) {
    UploadManifest m;
    ASSERT_TRUE(is_ok(store_.create("rec-1", "user-1", {}, 100, &m)));
    const Status s = store_.create("rec-1", "user-1", {}, 200, &m);
    EXPECT_EQ(s.domain, StatusDomain::Manifest);
    EXPECT_EQ(s.code, StatusCode::Conflict);
}

TEST_F(ManifestStoreTest, SaveReplacesWholeFile) {
    UploadManifest m;
    ASSERT_TRUE(is_ok(store_.create("rec-1", "user-1", {descriptor("rec-1", 0)}, 100, &m)));
    ASSERT_TRUE(is_ok(manifest_update_entry(&m, 0, UploadStatus::Uploading, nullptr, 150)));
    ASSERT_TRUE(is_ok(store_.save(m)));

    UploadManifest loaded;
    ASSERT_TRUE(is_ok(store_.load("rec-1", &loaded)));
    EXPECT_EQ(loaded.chunks[0].status, UploadStatus::Uploading);
    EXPECT_EQ(loaded.updated_at, 150);
    EXPECT_EQ(loaded.overall_status, UploadStatus::Uploading);
}

TEST_F(ManifestStoreTest, LoadMissingAndCorrupt) {
    UploadManifest out;
    Status s = store_.load("rec-none", &out);
    EXPECT_EQ(s.domain, StatusDomain::Manifest);
    EXPECT_EQ(s.code, StatusCode::NotFound);

    capsync::test::write_file(store_.path_for("rec-bad"), "{\"formatVersion\": 1, \"recordingId\": ");
    s = store_.load("rec-bad", &out);
    EXPECT_EQ(s.code, StatusCode::Corrupt);

    EXPECT_EQ(store_.load("../escape", &out).code, StatusCode::Invalid);
}

TEST_F(ManifestStoreTest, LoadRejectsManifestOfAnotherRecording) {
    UploadManifest m;
    ASSERT_TRUE(is_ok(store_.create("rec-1", "user-1", {}, 100, &m)));
    capsync::test::write_file(store_.path_for("rec-2"), capsync::test::read_file(store_.path_for("rec-1")));

    UploadManifest out;
    EXPECT_EQ(store_.load("rec-2", &out).code, StatusCode::Corrupt);
}

TEST_F(ManifestStoreTest, ListAndRemove) {
    std::vector<std::string> ids;
    ASSERT_TRUE(is_ok(store_.list(&ids)));
    EXPECT_TRUE(ids.empty());

    UploadManifest m;
    ASSERT_TRUE(is_ok(store_.create("rec-b", "u", {}, 1, &m)));
    ASSERT_TRUE(is_ok(store_.create("rec-a", "u", {}, 1, &m)));
    std::filesystem::create_directories(tmp_.sub("manifests/empty-dir"));

    ASSERT_TRUE(is_ok(store_.list(&ids)));
    EXPECT_EQ(ids, (std::vector<std::string>{"rec-a", "rec-b"}));

    bool present = false;
    ASSERT_TRUE(is_ok(store_.exists("rec-a", &present)));
    EXPECT_TRUE(present);

    ASSERT_TRUE(is_ok(store_.remove("rec-a")));
    ASSERT_TRUE(is_ok(store_.exists("rec-a", &present)));
    EXPECT_FALSE(present);
    EXPECT_EQ(store_.remove("rec-a").code, StatusCode::NotFound);

    ASSERT_TRUE(is_ok(store_.list(&ids)));
    EXPECT_EQ(ids, (std::vector<std::string>{"rec-b"}));
}
