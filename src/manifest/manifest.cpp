#include "capsync/manifest/manifest.hpp"

#include <algorithm>
#include <cstdio>
#include <set>

namespace capsync::manifest {

using namespace capsync::core;

namespace {

Status manifest_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Manifest, code, aux);
}

void touch(UploadManifest* m, Timestamp now) noexcept {
    m->overall_status = manifest_derive_status(m->chunks);
    if (now > m->updated_at) {
        m->updated_at = now;
    }
}

} // namespace

const char* upload_status_name(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Pending: return "pending";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
    }
    return "unknown";
}

bool upload_status_parse(std::string_view name, UploadStatus* out) noexcept {
    if (out == nullptr) return false;
    if (name == "pending") { *out = UploadStatus::Pending; return true; }
    if (name == "uploading") { *out = UploadStatus::Uploading; return true; }
    if (name == "completed") { *out = UploadStatus::Completed; return true; }
    if (name == "failed") { *out = UploadStatus::Failed; return true; }
    return false;
}

std::string remote_key_for(std::string_view user_id, std::string_view recording_id, ChunkId chunk_id) {
    char part[32];
    std::snprintf(part, sizeof(part), "part-%04u", chunk_id + 1);
    std::string key;
    key.reserve(user_id.size() + recording_id.size() + 40);
    key += "users/";
    key += user_id;
    key += "/raw-chunks/";
    key += recording_id;
    key += "/";
    key += part;
    return key;
}

UploadStatus manifest_derive_status(const std::vector<ChunkEntry>& chunks) noexcept {
    if (chunks.empty()) {
        return UploadStatus::Pending;
    }
    bool all_completed = true;
    bool any_failed = false;
    bool any_pending = false;
    bool any_uploading = false;
    for (const ChunkEntry& e : chunks) {
        switch (e.status) {
            case UploadStatus::Completed: break;
            case UploadStatus::Failed: any_failed = true; break;
            case UploadStatus::Pending: any_pending = true; break;
            case UploadStatus::Uploading: any_uploading = true; break;
        }
        if (e.status != UploadStatus::Completed) {
            all_completed = false;
        }
    }
    if (all_completed) return UploadStatus::Completed;
    if (any_failed && !any_pending && !any_uploading) return UploadStatus::Failed;
    if (any_uploading) return UploadStatus::Uploading;
    return UploadStatus::Pending;
}

Status manifest_create(const std::string& recording_id,
                       const std::string& user_id,
                       const std::vector<ChunkDescriptor>& chunks,
                       Timestamp now,
                       UploadManifest* out) {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    if (!recording_id_valid(recording_id) || !recording_id_valid(user_id)) {
        return manifest_status(StatusCode::Invalid);
    }

    UploadManifest m;
    m.recording_id = recording_id;
    m.user_id = user_id;
    m.created_at = now;
    m.updated_at = now;
    for (const ChunkDescriptor& d : chunks) {
        if (d.recording_id != recording_id) {
            return manifest_status(StatusCode::Invalid);
        }
        Status s = manifest_add_entry(&m, d, now);
        if (!is_ok(s)) {
            return s;
        }
    }
    m.overall_status = manifest_derive_status(m.chunks);
    *out = std::move(m);
    return ok_status();
}

Status manifest_add_entry(UploadManifest* m, const ChunkDescriptor& d, Timestamp now) {
    if (m == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    if (d.local_path.empty() || d.checksum.empty()) {
        return manifest_status(StatusCode::Invalid);
    }

    auto pos = std::lower_bound(m->chunks.begin(), m->chunks.end(), d.chunk_id,
        [](const ChunkEntry& e, ChunkId id) { return e.chunk_id < id; });
    if (pos != m->chunks.end() && pos->chunk_id == d.chunk_id) {
        return manifest_status(StatusCode::Conflict, d.chunk_id);
    }

    ChunkEntry e;
    e.chunk_id = d.chunk_id;
    e.local_path = d.local_path;
    e.remote_key = remote_key_for(m->user_id, m->recording_id, d.chunk_id);
    e.size_bytes = d.size_bytes;
    e.checksum = d.checksum;
    e.duration_ms = d.duration_ms;
    m->chunks.insert(pos, std::move(e));
    touch(m, now);
    return ok_status();
}

const ChunkEntry* manifest_find_entry(const UploadManifest& m, ChunkId chunk_id) noexcept {
    auto pos = std::lower_bound(m.chunks.begin(), m.chunks.end(), chunk_id,
        [](const ChunkEntry& e, ChunkId id) { return e.chunk_id < id; });
    if (pos == m.chunks.end() || pos->chunk_id != chunk_id) {
        return nullptr;
    }
    return &*pos;
}

ChunkEntry* manifest_find_entry(UploadManifest* m, ChunkId chunk_id) noexcept {
    if (m == nullptr) return nullptr;
    return const_cast<ChunkEntry*>(manifest_find_entry(static_cast<const UploadManifest&>(*m), chunk_id));
}

Status manifest_update_entry(UploadManifest* m,
                             ChunkId chunk_id,
                             UploadStatus next,
                             const std::string* error,
                             Timestamp now) {
    ChunkEntry* e = manifest_find_entry(m, chunk_id);
    if (e == nullptr) {
        return manifest_status(StatusCode::NotFound, chunk_id);
    }

    const UploadStatus cur = e->status;
    if (cur == next) {
        return ok_status();
    }

    switch (next) {
        case UploadStatus::Uploading:
            if (cur != UploadStatus::Pending) {
                return manifest_status(StatusCode::InvalidState, chunk_id);
            }
            e->last_attempt_at = now;
            break;

        case UploadStatus::Completed:
            if (cur != UploadStatus::Uploading) {
                return manifest_status(StatusCode::InvalidState, chunk_id);
            }
            if (e->remote_key.empty() || !e->ack_token || e->ack_token->empty()) {
                return manifest_status(StatusCode::Invalid, chunk_id);
            }
            ++e->attempts;
            e->completed_at = now;
            e->last_error.reset();
            break;

        case UploadStatus::Pending:
            if (cur == UploadStatus::Uploading) {
                ++e->attempts;
                if (error != nullptr) {
                    e->last_error = *error;
                }
            } else if (cur != UploadStatus::Failed) {
                return manifest_status(StatusCode::InvalidState, chunk_id);
            }
            break;

        case UploadStatus::Failed:
            if (cur != UploadStatus::Uploading) {
                return manifest_status(StatusCode::InvalidState, chunk_id);
            }
            ++e->attempts;
            e->last_error = error != nullptr ? *error : std::string("unknown error");
            break;
    }

    e->status = next;
    touch(m, now);
    return ok_status();
}

Status manifest_record_ack(UploadManifest* m, ChunkId chunk_id, const std::string& ack_token, Timestamp now) {
    ChunkEntry* e = manifest_find_entry(m, chunk_id);
    if (e == nullptr) {
        return manifest_status(StatusCode::NotFound, chunk_id);
    }
    if (ack_token.empty()) {
        return manifest_status(StatusCode::Invalid, chunk_id);
    }
    if (e->status == UploadStatus::Completed) {
        return manifest_status(StatusCode::InvalidState, chunk_id);
    }
    e->ack_token = ack_token;
    touch(m, now);
    return ok_status();
}

Status manifest_reset_entry(UploadManifest* m, ChunkId chunk_id, bool reset_attempts, Timestamp now) {
    ChunkEntry* e = manifest_find_entry(m, chunk_id);
    if (e == nullptr) {
        return manifest_status(StatusCode::NotFound, chunk_id);
    }
    if (e->status == UploadStatus::Completed) {
        return manifest_status(StatusCode::InvalidState, chunk_id);
    }
    e->status = UploadStatus::Pending;
    // an ack only means something together with completed
    e->ack_token.reset();
    if (reset_attempts) {
        e->attempts = 0;
        e->last_error.reset();
    }
    touch(m, now);
    return ok_status();
}

Status manifest_validate(const UploadManifest& m) {
    if (!recording_id_valid(m.recording_id) || !recording_id_valid(m.user_id)) {
        return manifest_status(StatusCode::Corrupt);
    }

    std::set<ChunkId> seen;
    for (const ChunkEntry& e : m.chunks) {
        if (!seen.insert(e.chunk_id).second) {
            return manifest_status(StatusCode::Corrupt, e.chunk_id);
        }
        if (e.local_path.empty() || e.checksum.empty()) {
            return manifest_status(StatusCode::Corrupt, e.chunk_id);
        }
        if (e.status == UploadStatus::Completed) {
            if (e.remote_key.empty() || !e.ack_token || e.ack_token->empty()) {
                return manifest_status(StatusCode::Corrupt, e.chunk_id);
            }
        }
        if (e.status == UploadStatus::Failed && e.attempts < 1) {
            return manifest_status(StatusCode::Corrupt, e.chunk_id);
        }
    }

    if (!std::is_sorted(m.chunks.begin(), m.chunks.end(),
            [](const ChunkEntry& a, const ChunkEntry& b) { return a.chunk_id < b.chunk_id; })) {
        return manifest_status(StatusCode::Corrupt);
    }

    if (m.overall_status != manifest_derive_status(m.chunks)) {
        return manifest_status(StatusCode::Corrupt);
    }
    return ok_status();
}

ManifestProgress manifest_progress(const UploadManifest& m) noexcept {
    ManifestProgress p;
    for (const ChunkEntry& e : m.chunks) {
        ++p.total;
        p.bytes_total += e.size_bytes;
        switch (e.status) {
            case UploadStatus::Pending: ++p.pending; break;
            case UploadStatus::Uploading: ++p.uploading; break;
            case UploadStatus::Completed:
                ++p.completed;
                p.bytes_completed += e.size_bytes;
                break;
            case UploadStatus::Failed: ++p.failed; break;
        }
    }
    return p;
}

} // namespace capsync::manifest
