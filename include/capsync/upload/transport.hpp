#pragma once

#include <string>
#include <utility>
#include <vector>

#include "capsync/core/errors.hpp"
#include "capsync/core/types.hpp"

namespace capsync::upload {

using u32 = capsync::core::u32;
using u64 = capsync::core::u64;
using i64 = capsync::core::i64;

struct UploadRequest {
    std::string recording_id;
    std::string user_id;
    capsync::core::ChunkId chunk_id{0};
    std::string local_path;
    std::string remote_key;
    u64 size_bytes{0};
    std::string checksum;          // hex BLAKE3 recorded at capture time
    i64 duration_ms{0};
};

struct UploadAck {
    std::string remote_key;
    std::string token;             // etag, version id or content hash; never empty on success
};

// Object metadata attached to an uploaded chunk.
std::vector<std::pair<std::string, std::string>> upload_metadata(const UploadRequest& req);

// Remote object storage boundary. Implementations must be callable from
// several worker threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Uploads one chunk. On failure, `detail` receives a human-readable reason;
    // core::status_is_retryable() decides whether the queue tries again.
    virtual capsync::core::Status upload_chunk(const UploadRequest& req, UploadAck* ack, std::string* detail) = 0;

    // Asks in-flight transfers to stop. Transports that can abort without
    // leaving a partial remote object return {Transport, Cancelled} from the
    // interrupted upload_chunk; the default does nothing.
    virtual void request_abort() {}

    // Re-arms the transport after request_abort(), before new work starts.
    virtual void clear_abort() {}
};

} // namespace capsync::upload
