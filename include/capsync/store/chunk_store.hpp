#pragma once

#include <functional>
#include <string>
#include <vector>

#include "capsync/core/clock.hpp"
#include "capsync/core/errors.hpp"
#include "capsync/core/models.hpp"
#include "capsync/core/types.hpp"

namespace capsync::store {

using u64 = capsync::core::u64;

// Reports available bytes for the chunk volume.
using SpaceProbe = std::function<capsync::core::Status(u64* free_bytes)>;

struct ChunkStoreConfig {
    std::string root;                        // {root}/{recording_id}/chunk_00000.mov
    std::string extension{".mov"};
    u64 min_free_bytes{1'000'000'000};       // floor for starting / continuing a session
    SpaceProbe space_probe;                  // empty: statvfs on root
};

// Owns where chunk files live and how they are described. Stateless apart
// from its config; safe to share between threads.
class ChunkStore {
public:
    explicit ChunkStore(ChunkStoreConfig cfg, capsync::core::Clock& clock = capsync::core::system_clock());

    [[nodiscard]] const ChunkStoreConfig& config() const noexcept { return cfg_; }

    [[nodiscard]] std::string recording_dir(const std::string& recording_id) const;

    // Deterministic: the same (recording_id, chunk_id) always names the same file.
    [[nodiscard]] capsync::core::Status chunk_path(const std::string& recording_id,
                                                   capsync::core::ChunkId chunk_id,
                                                   std::string* out) const;

    // Creates the recording directory.
    [[nodiscard]] capsync::core::Status prepare_recording(const std::string& recording_id);

    // Stats and checksums a finalized segment. This is the only place a
    // descriptor's checksum is produced; nothing recomputes it implicitly.
    [[nodiscard]] capsync::core::Status describe_chunk(const std::string& recording_id,
                                                       capsync::core::ChunkId chunk_id,
                                                       const std::string& path,
                                                       capsync::core::i64 duration_ms,
                                                       capsync::core::ChunkDescriptor* out) const;

    [[nodiscard]] capsync::core::Status compute_checksum(const std::string& path,
                                                         std::string* hex_out,
                                                         u64* size_out) const;

    // Explicit integrity check of a descriptor against the file on disk.
    // A missing file is reported as *valid = false, not as an error.
    [[nodiscard]] capsync::core::Status verify_chunk(const capsync::core::ChunkDescriptor& d, bool* valid) const;

    [[nodiscard]] capsync::core::Status free_bytes(u64* out) const;
    [[nodiscard]] capsync::core::Status below_floor(bool* out) const;

    // Removes the recording directory and every chunk in it.
    [[nodiscard]] capsync::core::Status purge_recording(const std::string& recording_id);

    // Chunk ids present on disk, ascending.
    [[nodiscard]] capsync::core::Status list_chunks(const std::string& recording_id,
                                                    std::vector<capsync::core::ChunkId>* out) const;

private:
    ChunkStoreConfig cfg_;
    capsync::core::Clock& clock_;
};

} // namespace capsync::store
