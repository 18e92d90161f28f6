#include "capsync/upload/recovery.hpp"

#include <cerrno>
#include <sys/stat.h>

#include <spdlog/spdlog.h>

namespace capsync::upload {

using namespace capsync::core;

Status rebuild_manifest(const store::ChunkStore& chunks,
                        manifest::ManifestStore& manifests,
                        const std::string& recording_id,
                        const std::string& user_id,
                        Timestamp now,
                        manifest::UploadManifest* out) {
    std::vector<ChunkId> ids;
    Status s = chunks.list_chunks(recording_id, &ids);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<ChunkDescriptor> descriptors;
    descriptors.reserve(ids.size());
    for (ChunkId id : ids) {
        ChunkDescriptor d;
        s = chunks.describe_chunk(recording_id, id, std::string(), 0, &d);
        if (!is_ok(s)) {
            return s;
        }
        descriptors.push_back(std::move(d));
    }

    manifest::UploadManifest m;
    s = manifest::manifest_create(recording_id, user_id, descriptors, now, &m);
    if (!is_ok(s)) {
        return s;
    }
    s = manifests.save(m);
    if (!is_ok(s)) {
        return s;
    }
    spdlog::info("rebuilt manifest of {} from {} chunk files", recording_id, descriptors.size());
    if (out != nullptr) {
        *out = std::move(m);
    }
    return ok_status();
}

Status verify_recording(const store::ChunkStore& chunks, const manifest::UploadManifest& m, VerifyReport* out) {
    if (out == nullptr) {
        return make_status(StatusDomain::Upload, StatusCode::Invalid);
    }
    VerifyReport r;
    for (const manifest::ChunkEntry& e : m.chunks) {
        ++r.checked;

        struct stat st;
        if (stat(e.local_path.c_str(), &st) != 0) {
            if (errno != ENOENT) {
                return make_status(StatusDomain::Store, StatusCode::Io, errno);
            }
            ++r.missing;
            continue;
        }

        ChunkDescriptor d;
        d.recording_id = m.recording_id;
        d.chunk_id = e.chunk_id;
        d.local_path = e.local_path;
        d.size_bytes = e.size_bytes;
        d.checksum = e.checksum;

        bool valid = false;
        Status s = chunks.verify_chunk(d, &valid);
        if (!is_ok(s)) {
            return s;
        }
        if (valid) {
            ++r.valid;
        } else {
            r.mismatched.push_back(e.chunk_id);
        }
    }
    *out = std::move(r);
    return ok_status();
}

} // namespace capsync::upload
