#include "capsync/manifest/manifest_store.hpp"
#include "capsync/manifest/manifest_codec.hpp"
#include "capsync/store/file_io.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>

#include <spdlog/spdlog.h>

namespace capsync::manifest {

using namespace capsync::core;

namespace {

constexpr const char* kManifestFile = "manifest.json";

Status manifest_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Manifest, code, aux);
}

Status read_whole_file(const std::string& path, std::string* out) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return manifest_status(StatusCode::NotFound);
        }
        return manifest_status(StatusCode::Io, errno);
    }

    out->clear();
    char buf[16 * 1024];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            close(fd);
            return manifest_status(StatusCode::Io, err);
        }
        if (n == 0) break;  // EOF
        out->append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return ok_status();
}

} // namespace

ManifestStore::ManifestStore(ManifestStoreConfig cfg) : cfg_(std::move(cfg)) {}

std::string ManifestStore::path_for(const std::string& recording_id) const {
    return cfg_.root + "/" + recording_id + "/" + kManifestFile;
}

Status ManifestStore::create(const std::string& recording_id,
                             const std::string& user_id,
                             const std::vector<ChunkDescriptor>& chunks,
                             Timestamp now,
                             UploadManifest* out) {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    bool present = false;
    Status s = exists(recording_id, &present);
    if (!is_ok(s)) {
        return s;
    }
    if (present) {
        return manifest_status(StatusCode::Conflict);
    }

    UploadManifest m;
    s = manifest_create(recording_id, user_id, chunks, now, &m);
    if (!is_ok(s)) {
        return s;
    }
    s = save(m);
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(m);
    return ok_status();
}

Status ManifestStore::save(const UploadManifest& m) {
    if (!recording_id_valid(m.recording_id)) {
        return manifest_status(StatusCode::Invalid);
    }

    std::string text;
    Status s = manifest_encode(m, &text);
    if (!is_ok(s)) {
        return s;
    }

    const store::BufferView data{reinterpret_cast<const u8*>(text.data()), static_cast<u32>(text.size())};
    s = store::write_file_atomic(path_for(m.recording_id), data, StatusDomain::Manifest);
    if (!is_ok(s)) {
        spdlog::error("manifest save for {} failed: {}", m.recording_id, status_describe(s));
    }
    return s;
}

Status ManifestStore::load(const std::string& recording_id, UploadManifest* out) const {
    if (out == nullptr || !recording_id_valid(recording_id)) {
        return manifest_status(StatusCode::Invalid);
    }

    std::string text;
    Status s = read_whole_file(path_for(recording_id), &text);
    if (!is_ok(s)) {
        return s;
    }

    UploadManifest m;
    s = manifest_decode(text, &m);
    if (!is_ok(s)) {
        spdlog::warn("manifest for {} is unreadable: {}", recording_id, status_describe(s));
        return s;
    }
    if (m.recording_id != recording_id) {
        // file was moved or copied under another recording's directory
        return manifest_status(StatusCode::Corrupt);
    }
    *out = std::move(m);
    return ok_status();
}

Status ManifestStore::exists(const std::string& recording_id, bool* out) const {
    if (out == nullptr || !recording_id_valid(recording_id)) {
        return manifest_status(StatusCode::Invalid);
    }
    struct stat st;
    if (stat(path_for(recording_id).c_str(), &st) == 0) {
        *out = S_ISREG(st.st_mode);
        return ok_status();
    }
    if (errno == ENOENT || errno == ENOTDIR) {
        *out = false;
        return ok_status();
    }
    return manifest_status(StatusCode::Io, errno);
}

Status ManifestStore::remove(const std::string& recording_id) {
    if (!recording_id_valid(recording_id)) {
        return manifest_status(StatusCode::Invalid);
    }
    const std::string path = path_for(recording_id);
    if (unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return manifest_status(StatusCode::NotFound);
        }
        return manifest_status(StatusCode::Io, errno);
    }

    // the per-recording directory only ever holds the manifest and its temp files
    std::error_code ec;
    std::filesystem::remove_all(cfg_.root + "/" + recording_id, ec);
    if (ec) {
        spdlog::warn("manifest directory for {} not removed: {}", recording_id, ec.message());
    }
    return store::fsync_directory(cfg_.root, StatusDomain::Manifest);
}

Status ManifestStore::list(std::vector<std::string>* out) const {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    out->clear();

    std::error_code ec;
    std::filesystem::directory_iterator it(cfg_.root, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return ok_status();  // nothing persisted yet
        }
        return manifest_status(StatusCode::Io, static_cast<u32>(ec.value()));
    }

    for (const auto& entry : it) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        const std::string id = entry.path().filename().string();
        if (!recording_id_valid(id)) {
            continue;
        }
        bool present = false;
        if (is_ok(exists(id, &present)) && present) {
            out->push_back(id);
        }
    }
    std::sort(out->begin(), out->end());
    return ok_status();
}

} // namespace capsync::manifest
