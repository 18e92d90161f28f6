#pragma once

#include <string>
#include <vector>

#include "capsync/core/errors.hpp"
#include "capsync/manifest/manifest.hpp"
#include "capsync/manifest/manifest_store.hpp"
#include "capsync/store/chunk_store.hpp"

namespace capsync::upload {

// Replaces the manifest of `recording_id` with one describing the chunk files
// currently on disk, every entry pending. Remote keys are deterministic, so
// chunks uploaded before are simply written again. Durations are unknown (0).
// NotFound when the recording has no chunk directory.
capsync::core::Status rebuild_manifest(const store::ChunkStore& chunks,
                                       manifest::ManifestStore& manifests,
                                       const std::string& recording_id,
                                       const std::string& user_id,
                                       capsync::core::Timestamp now,
                                       manifest::UploadManifest* out);

struct VerifyReport {
    capsync::core::u32 checked{0};
    capsync::core::u32 valid{0};
    capsync::core::u32 missing{0};                                  // includes completed chunks deleted after upload
    std::vector<capsync::core::ChunkId> mismatched;  // present but different from what was recorded
};

// Recomputes local checksums against the manifest.
capsync::core::Status verify_recording(const store::ChunkStore& chunks,
                                       const manifest::UploadManifest& m,
                                       VerifyReport* out);

} // namespace capsync::upload
