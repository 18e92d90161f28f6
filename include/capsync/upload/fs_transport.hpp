#pragma once

#include <atomic>
#include <string>

#include "capsync/core/errors.hpp"
#include "capsync/upload/transport.hpp"

namespace capsync::upload {

struct FsTransportConfig {
    std::string root;               // objects land at {root}/{remote_key}
    bool verify_checksum{true};     // re-hash while copying and compare
};

// Transport whose remote is a directory tree: a mounted bucket, a network
// share or a local mirror. Objects appear atomically (temp file + rename),
// so an aborted or failed copy never leaves a partial object behind.
class FsTransport final : public Transport {
public:
    explicit FsTransport(FsTransportConfig cfg);

    capsync::core::Status upload_chunk(const UploadRequest& req, UploadAck* ack, std::string* detail) override;

    void request_abort() override;
    void clear_abort() override;

    // Maps a remote key to its path; Invalid for keys that would escape root.
    [[nodiscard]] capsync::core::Status object_path(const std::string& remote_key, std::string* out) const;

private:
    FsTransportConfig cfg_;
    std::atomic<bool> abort_{false};
};

} // namespace capsync::upload
