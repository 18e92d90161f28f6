#pragma once

#include <string>
#include <vector>

#include "capsync/core/errors.hpp"
#include "capsync/core/models.hpp"
#include "capsync/manifest/manifest.hpp"

namespace capsync::manifest {

struct ManifestStoreConfig {
    std::string root;    // {root}/{recording_id}/manifest.json
};

// Durable manifest files. Holds no per-recording state: callers serialize
// writes to one recording (UploadQueue keeps one writer per recording).
class ManifestStore {
public:
    explicit ManifestStore(ManifestStoreConfig cfg);

    [[nodiscard]] const ManifestStoreConfig& config() const noexcept { return cfg_; }

    [[nodiscard]] std::string path_for(const std::string& recording_id) const;

    // Builds and persists a new manifest. Conflict if one already exists.
    [[nodiscard]] capsync::core::Status create(const std::string& recording_id,
                                               const std::string& user_id,
                                               const std::vector<capsync::core::ChunkDescriptor>& chunks,
                                               capsync::core::Timestamp now,
                                               UploadManifest* out);

    // Atomic replace of the whole file.
    [[nodiscard]] capsync::core::Status save(const UploadManifest& m);

    // {Manifest, NotFound} when absent, {Manifest, Corrupt} when unreadable.
    [[nodiscard]] capsync::core::Status load(const std::string& recording_id, UploadManifest* out) const;

    [[nodiscard]] capsync::core::Status exists(const std::string& recording_id, bool* out) const;

    [[nodiscard]] capsync::core::Status remove(const std::string& recording_id);

    // Recording ids with a manifest file, sorted.
    [[nodiscard]] capsync::core::Status list(std::vector<std::string>* out) const;

private:
    ManifestStoreConfig cfg_;
};

} // namespace capsync::manifest
