#include "capsync/upload/transport.hpp"

#include <cstdio>

namespace capsync::upload {
    std::vector<std::pair<std::string, std::string>> upload_metadata(const UploadRequest& req) {
        char duration[32];
        std::snprintf(duration, sizeof(duration), "%.3f", static_cast<double>(req.duration_ms) / 1000.0);

        return {
            {"checksum-blake3", req.checksum},
            {"recording-id", req.recording_id},
            {"chunk-index", std::to_string(req.chunk_id)},
            {"duration-seconds", duration},
        };
    }
} // namespace capsync::upload
