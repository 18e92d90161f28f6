#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "capsync/core/errors.hpp"
#include "capsync/core/models.hpp"
#include "capsync/core/types.hpp"

namespace capsync::manifest {

using u8 = capsync::core::u8;
using u32 = capsync::core::u32;
using u64 = capsync::core::u64;
using i64 = capsync::core::i64;

enum class UploadStatus : u8 {
    Pending = 0,
    Uploading = 1,
    Completed = 2,
    Failed = 3,
};

const char* upload_status_name(UploadStatus status) noexcept;
[[nodiscard]] bool upload_status_parse(std::string_view name, UploadStatus* out) noexcept;

struct ChunkEntry {
    capsync::core::ChunkId chunk_id{0};
    std::string local_path;
    std::string remote_key;
    u64 size_bytes{0};
    std::string checksum;
    i64 duration_ms{0};
    UploadStatus status{UploadStatus::Pending};
    u32 attempts{0};                                      // finished attempts, success or failure
    std::optional<std::string> last_error;
    std::optional<capsync::core::Timestamp> last_attempt_at;
    std::optional<capsync::core::Timestamp> completed_at;
    std::optional<std::string> ack_token;                 // remote confirmation of a completed upload
};

// Durable upload state of one recording. Entries are kept ordered by chunk_id.
struct UploadManifest {
    std::string recording_id;
    std::string user_id;
    capsync::core::Timestamp created_at{0};
    capsync::core::Timestamp updated_at{0};
    std::vector<ChunkEntry> chunks;
    UploadStatus overall_status{UploadStatus::Pending};
};

struct ManifestProgress {
    u32 total{0};
    u32 pending{0};
    u32 uploading{0};
    u32 completed{0};
    u32 failed{0};
    u64 bytes_total{0};
    u64 bytes_completed{0};
};

// users/{user_id}/raw-chunks/{recording_id}/part-NNNN, NNNN = chunk_id + 1.
std::string remote_key_for(std::string_view user_id, std::string_view recording_id, capsync::core::ChunkId chunk_id);

// completed iff every entry is completed (and there is at least one);
// failed iff some entry failed and none is pending or uploading;
// uploading iff some entry is uploading; pending otherwise.
UploadStatus manifest_derive_status(const std::vector<ChunkEntry>& chunks) noexcept;

capsync::core::Status manifest_create(const std::string& recording_id,
                                      const std::string& user_id,
                                      const std::vector<capsync::core::ChunkDescriptor>& chunks,
                                      capsync::core::Timestamp now,
                                      UploadManifest* out);

// Appends a pending entry for the descriptor. Conflict if the chunk id exists.
capsync::core::Status manifest_add_entry(UploadManifest* m,
                                         const capsync::core::ChunkDescriptor& d,
                                         capsync::core::Timestamp now);

const ChunkEntry* manifest_find_entry(const UploadManifest& m, capsync::core::ChunkId chunk_id) noexcept;
ChunkEntry* manifest_find_entry(UploadManifest* m, capsync::core::ChunkId chunk_id) noexcept;

// Entry state machine. Legal moves:
//   pending   -> uploading   stamps last_attempt_at
//   uploading -> completed   counts the attempt; needs remote_key and an ack token
//   uploading -> pending     failed attempt to be retried; counts it, records error
//   uploading -> failed      counts the attempt, records error
//   failed    -> pending     re-enqueue; attempts kept
// Same-state updates are no-ops. Anything else is InvalidState.
capsync::core::Status manifest_update_entry(UploadManifest* m,
                                            capsync::core::ChunkId chunk_id,
                                            UploadStatus next,
                                            const std::string* error,
                                            capsync::core::Timestamp now);

capsync::core::Status manifest_record_ack(UploadManifest* m,
                                          capsync::core::ChunkId chunk_id,
                                          const std::string& ack_token,
                                          capsync::core::Timestamp now);

// Recovery transition: uploading|failed|pending -> pending. Completed entries
// are InvalidState.
capsync::core::Status manifest_reset_entry(UploadManifest* m,
                                           capsync::core::ChunkId chunk_id,
                                           bool reset_attempts,
                                           capsync::core::Timestamp now);

// Checks the persisted invariants; Corrupt on the first violation.
capsync::core::Status manifest_validate(const UploadManifest& m);

ManifestProgress manifest_progress(const UploadManifest& m) noexcept;

} // namespace capsync::manifest
