#include "capsync/upload/fs_transport.hpp"
#include "capsync/store/file_io.hpp"
#include "capsync/store/hashing.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#include <spdlog/spdlog.h>

namespace capsync::upload {

using namespace capsync::core;

namespace {

Status transport_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Transport, code, aux);
}

void set_detail(std::string* detail, const std::string& text) {
    if (detail != nullptr) {
        *detail = text;
    }
}

std::string errno_text(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

// Closes both descriptors and drops the temp file.
void abandon(int src, int dst, const std::string& tmp) {
    close(src);
    close(dst);
    unlink(tmp.c_str());
}

} // namespace

FsTransport::FsTransport(FsTransportConfig cfg) : cfg_(std::move(cfg)) {}

void FsTransport::request_abort() {
    abort_.store(true);
}

void FsTransport::clear_abort() {
    abort_.store(false);
}

Status FsTransport::object_path(const std::string& remote_key, std::string* out) const {
    if (out == nullptr || remote_key.empty() || remote_key.front() == '/') {
        return transport_status(StatusCode::Invalid);
    }
    // reject any ".." segment
    size_t start = 0;
    while (start <= remote_key.size()) {
        size_t end = remote_key.find('/', start);
        if (end == std::string::npos) end = remote_key.size();
        const std::string seg = remote_key.substr(start, end - start);
        if (seg.empty() || seg == "." || seg == "..") {
            return transport_status(StatusCode::Invalid);
        }
        start = end + 1;
    }
    *out = cfg_.root + "/" + remote_key;
    return ok_status();
}

Status FsTransport::upload_chunk(const UploadRequest& req, UploadAck* ack, std::string* detail) {
    if (ack == nullptr) {
        return transport_status(StatusCode::Invalid);
    }

    std::string dest;
    Status s = object_path(req.remote_key, &dest);
    if (!is_ok(s)) {
        set_detail(detail, "invalid remote key '" + req.remote_key + "'");
        return s;
    }

    int src = open(req.local_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (src < 0) {
        const int err = errno;
        set_detail(detail, errno_text("open local chunk", err));
        if (err == ENOENT) {
            return transport_status(StatusCode::NotFound);
        }
        // unreadable local file is not something a retry fixes
        return make_status(StatusDomain::Store, StatusCode::Io, err);
    }

    s = store::ensure_directory(store::parent_directory(dest), StatusDomain::Transport);
    if (!is_ok(s)) {
        close(src);
        set_detail(detail, "cannot create remote directory");
        return s;
    }

    const std::string tmp = store::temp_path_for(dest);
    int dst = open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (dst < 0) {
        const int err = errno;
        close(src);
        set_detail(detail, errno_text("create remote object", err));
        return transport_status(StatusCode::Io, err);
    }

    store::HashStream hasher;
    u64 copied = 0;
    u8 buf[64 * 1024];
    for (;;) {
        if (abort_.load()) {
            abandon(src, dst, tmp);
            set_detail(detail, "upload aborted");
            return transport_status(StatusCode::Cancelled);
        }
        ssize_t n = read(src, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            abandon(src, dst, tmp);
            set_detail(detail, errno_text("read local chunk", err));
            return make_status(StatusDomain::Store, StatusCode::Io, err);
        }
        if (n == 0) break;  // EOF

        s = store::write_all(dst, buf, static_cast<size_t>(n), StatusDomain::Transport);
        if (!is_ok(s)) {
            abandon(src, dst, tmp);
            set_detail(detail, errno_text("write remote object", static_cast<int>(s.aux)));
            return s;
        }
        hasher.update(buf, static_cast<size_t>(n));
        copied += static_cast<u64>(n);
    }
    close(src);

    if (copied != req.size_bytes) {
        close(dst);
        unlink(tmp.c_str());
        set_detail(detail, "local chunk size changed since capture");
        return transport_status(StatusCode::ChecksumMismatch, 1);
    }

    Hash256 digest{};
    hasher.finalize(&digest);
    const std::string hex = store::hash_hex(digest);
    if (cfg_.verify_checksum && hex != req.checksum) {
        close(dst);
        unlink(tmp.c_str());
        set_detail(detail, "checksum mismatch: expected " + req.checksum + ", read " + hex);
        return transport_status(StatusCode::ChecksumMismatch);
    }

    // Sync to disk before the rename publishes the object
    if (fsync(dst) != 0) {
        const int err = errno;
        close(dst);
        unlink(tmp.c_str());
        set_detail(detail, errno_text("fsync remote object", err));
        return transport_status(StatusCode::Io, err);
    }
    close(dst);

    if (rename(tmp.c_str(), dest.c_str()) != 0) {
        const int err = errno;
        unlink(tmp.c_str());
        set_detail(detail, errno_text("publish remote object", err));
        return transport_status(StatusCode::Io, err);
    }
    s = store::fsync_directory(store::parent_directory(dest), StatusDomain::Transport);
    if (!is_ok(s)) {
        set_detail(detail, "fsync remote directory");
        return s;
    }

    spdlog::debug("stored {} ({} bytes) at {}", req.remote_key, static_cast<unsigned long long>(copied), dest);
    ack->remote_key = req.remote_key;
    ack->token = hex;
    return ok_status();
}

} // namespace capsync::upload
