#include "capsync/store/chunk_store.hpp"
#include "capsync/store/file_io.hpp"
#include "capsync/store/hashing.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace capsync::store {

using namespace capsync::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {

constexpr const char* kChunkPrefix = "chunk_";

Status store_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Store, code, aux);
}

// "chunk_00042.mov" -> 42
bool parse_chunk_name(const std::string& name, const std::string& ext, ChunkId* out) {
    const std::string prefix = kChunkPrefix;
    if (name.size() <= prefix.size() + ext.size()) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    if (name.compare(name.size() - ext.size(), ext.size(), ext) != 0) return false;

    const char* begin = name.data() + prefix.size();
    const char* end = name.data() + name.size() - ext.size();
    ChunkId v = 0;
    auto r = std::from_chars(begin, end, v, 10);
    if (r.ec != std::errc() || r.ptr != end) return false;
    *out = v;
    return true;
}

// statvfs needs an existing path; walk up until one exists
std::string nearest_existing(const std::string& path) {
    std::string p = path;
    for (;;) {
        struct stat st;
        if (stat(p.c_str(), &st) == 0) {
            return p;
        }
        const std::string parent = parent_directory(p);
        if (parent == p) {
            return p;
        }
        p = parent;
    }
}

} // namespace

// ========================================================================
// Public API Implementation
// ========================================================================

ChunkStore::ChunkStore(ChunkStoreConfig cfg, Clock& clock)
    : cfg_(std::move(cfg)), clock_(clock) {}

std::string ChunkStore::recording_dir(const std::string& recording_id) const {
    return cfg_.root + "/" + recording_id;
}

Status ChunkStore::chunk_path(const std::string& recording_id, ChunkId chunk_id, std::string* out) const {
    if (out == nullptr) {
        return store_status(StatusCode::Invalid);
    }
    if (!recording_id_valid(recording_id)) {
        return store_status(StatusCode::Invalid);
    }
    char name[32];
    std::snprintf(name, sizeof(name), "%s%05u", kChunkPrefix, chunk_id);
    *out = recording_dir(recording_id) + "/" + name + cfg_.extension;
    return ok_status();
}

Status ChunkStore::prepare_recording(const std::string& recording_id) {
    if (!recording_id_valid(recording_id)) {
        return store_status(StatusCode::Invalid);
    }
    return ensure_directory(recording_dir(recording_id), StatusDomain::Store);
}

Status ChunkStore::describe_chunk(const std::string& recording_id,
                                  ChunkId chunk_id,
                                  const std::string& path,
                                  i64 duration_ms,
                                  ChunkDescriptor* out) const {
    if (out == nullptr || duration_ms < 0) {
        return store_status(StatusCode::Invalid);
    }
    if (!recording_id_valid(recording_id)) {
        return store_status(StatusCode::Invalid);
    }

    std::string file = path;
    if (file.empty()) {
        Status s = chunk_path(recording_id, chunk_id, &file);
        if (!is_ok(s)) {
            return s;
        }
    }

    std::string checksum;
    u64 size = 0;
    Status s = compute_checksum(file, &checksum, &size);
    if (!is_ok(s)) {
        return s;
    }

    ChunkDescriptor d;
    d.recording_id = recording_id;
    d.chunk_id = chunk_id;
    d.local_path = std::move(file);
    d.size_bytes = size;
    d.duration_ms = duration_ms;
    d.checksum = std::move(checksum);
    d.created_at = clock_.wall_ms();
    *out = std::move(d);
    return ok_status();
}

Status ChunkStore::compute_checksum(const std::string& path, std::string* hex_out, u64* size_out) const {
    if (hex_out == nullptr) {
        return store_status(StatusCode::Invalid);
    }
    Hash256 h{};
    Status s = hash_file(path.c_str(), &h, size_out);
    if (!is_ok(s)) {
        return s;
    }
    *hex_out = hash_hex(h);
    return ok_status();
}

Status ChunkStore::verify_chunk(const ChunkDescriptor& d, bool* valid) const {
    if (valid == nullptr) {
        return store_status(StatusCode::Invalid);
    }
    *valid = false;

    std::string checksum;
    u64 size = 0;
    Status s = compute_checksum(d.local_path, &checksum, &size);
    if (s.code == StatusCode::NotFound) {
        return ok_status();  // File missing, not valid
    }
    if (!is_ok(s)) {
        return s;
    }

    *valid = (checksum == d.checksum && size == d.size_bytes);
    return ok_status();
}

Status ChunkStore::free_bytes(u64* out) const {
    if (out == nullptr) {
        return store_status(StatusCode::Invalid);
    }
    if (cfg_.space_probe) {
        return cfg_.space_probe(out);
    }

    struct statvfs vfs;
    const std::string probe = nearest_existing(cfg_.root);
    if (statvfs(probe.c_str(), &vfs) != 0) {
        return store_status(StatusCode::Io, errno);
    }
    *out = static_cast<u64>(vfs.f_bavail) * static_cast<u64>(vfs.f_frsize);
    return ok_status();
}

Status ChunkStore::below_floor(bool* out) const {
    if (out == nullptr) {
        return store_status(StatusCode::Invalid);
    }
    u64 avail = 0;
    Status s = free_bytes(&avail);
    if (!is_ok(s)) {
        return s;
    }
    *out = avail < cfg_.min_free_bytes;
    return ok_status();
}

Status ChunkStore::purge_recording(const std::string& recording_id) {
    if (!recording_id_valid(recording_id)) {
        return store_status(StatusCode::Invalid);
    }
    std::error_code ec;
    const auto removed = std::filesystem::remove_all(recording_dir(recording_id), ec);
    if (ec) {
        spdlog::error("purge of recording {} failed: {}", recording_id, ec.message());
        return store_status(StatusCode::Io, static_cast<u32>(ec.value()));
    }
    spdlog::info("purged recording {} ({} entries)", recording_id, static_cast<unsigned long long>(removed));
    return ok_status();
}

Status ChunkStore::list_chunks(const std::string& recording_id, std::vector<ChunkId>* out) const {
    if (out == nullptr) {
        return store_status(StatusCode::Invalid);
    }
    if (!recording_id_valid(recording_id)) {
        return store_status(StatusCode::Invalid);
    }
    out->clear();

    std::error_code ec;
    std::filesystem::directory_iterator it(recording_dir(recording_id), ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return store_status(StatusCode::NotFound);
        }
        return store_status(StatusCode::Io, static_cast<u32>(ec.value()));
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        ChunkId id = 0;
        if (parse_chunk_name(entry.path().filename().string(), cfg_.extension, &id)) {
            out->push_back(id);
        }
    }
    std::sort(out->begin(), out->end());
    return ok_status();
}

} // namespace capsync::store
