#include "capsync/manifest/manifest_codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace capsync::manifest {

using namespace capsync::core;
using nlohmann::json;

namespace {

Status corrupt(u32 aux = 0) noexcept {
    return make_status(StatusDomain::Manifest, StatusCode::Corrupt, aux);
}

json entry_to_json(const ChunkEntry& e) {
    json j = {
        {"chunkId", e.chunk_id},
        {"localPath", e.local_path},
        {"remoteKey", e.remote_key},
        {"sizeBytes", e.size_bytes},
        {"durationMs", e.duration_ms},
        {"checksum", e.checksum},
        {"status", upload_status_name(e.status)},
        {"attempts", e.attempts},
    };
    if (e.last_error) j["lastError"] = *e.last_error;
    if (e.last_attempt_at) j["lastAttemptAt"] = *e.last_attempt_at;
    if (e.completed_at) j["completedAt"] = *e.completed_at;
    if (e.ack_token) j["ackToken"] = *e.ack_token;
    return j;
}

// Throws json::exception on missing or ill-typed fields; false on an
// unknown status name.
bool entry_from_json(const json& j, ChunkEntry* out) {
    ChunkEntry& e = *out;
    e.chunk_id = j.at("chunkId").get<ChunkId>();
    e.local_path = j.at("localPath").get<std::string>();
    e.remote_key = j.at("remoteKey").get<std::string>();
    e.size_bytes = j.at("sizeBytes").get<u64>();
    e.duration_ms = j.at("durationMs").get<i64>();
    e.checksum = j.at("checksum").get<std::string>();
    if (!upload_status_parse(j.at("status").get<std::string>(), &e.status)) {
        return false;
    }
    e.attempts = j.at("attempts").get<u32>();
    if (j.contains("lastError")) e.last_error = j.at("lastError").get<std::string>();
    if (j.contains("lastAttemptAt")) e.last_attempt_at = j.at("lastAttemptAt").get<Timestamp>();
    if (j.contains("completedAt")) e.completed_at = j.at("completedAt").get<Timestamp>();
    if (j.contains("ackToken")) e.ack_token = j.at("ackToken").get<std::string>();
    return true;
}

} // namespace

Status manifest_encode(const UploadManifest& m, std::string* out) {
    if (out == nullptr) {
        return make_status(StatusDomain::Manifest, StatusCode::Invalid);
    }

    json chunks = json::array();
    for (const ChunkEntry& e : m.chunks) {
        chunks.push_back(entry_to_json(e));
    }

    json j = {
        {"formatVersion", kManifestFormatVersion},
        {"recordingId", m.recording_id},
        {"userId", m.user_id},
        {"createdAt", m.created_at},
        {"updatedAt", m.updated_at},
        {"overallStatus", upload_status_name(m.overall_status)},
        {"chunks", std::move(chunks)},
    };
    *out = j.dump(2);
    return ok_status();
}

Status manifest_decode(std::string_view text, UploadManifest* out) {
    if (out == nullptr) {
        return make_status(StatusDomain::Manifest, StatusCode::Invalid);
    }

    const json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return corrupt();
    }

    UploadManifest m;
    try {
        const u32 version = j.at("formatVersion").get<u32>();
        if (version != kManifestFormatVersion) {
            spdlog::warn("manifest format version {} is not supported", version);
            return corrupt(version);
        }
        m.recording_id = j.at("recordingId").get<std::string>();
        m.user_id = j.at("userId").get<std::string>();
        m.created_at = j.at("createdAt").get<Timestamp>();
        m.updated_at = j.at("updatedAt").get<Timestamp>();
        if (!upload_status_parse(j.at("overallStatus").get<std::string>(), &m.overall_status)) {
            return corrupt();
        }
        const json& chunks = j.at("chunks");
        if (!chunks.is_array()) {
            return corrupt();
        }
        m.chunks.reserve(chunks.size());
        for (const json& c : chunks) {
            ChunkEntry e;
            if (!entry_from_json(c, &e)) {
                return corrupt();
            }
            m.chunks.push_back(std::move(e));
        }
    } catch (const json::exception& e) {
        spdlog::debug("manifest decode failed: {}", e.what());
        return corrupt();
    }

    Status s = manifest_validate(m);
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(m);
    return ok_status();
}

} // namespace capsync::manifest
