#include "capsync/store/file_io.hpp"

#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <functional>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace capsync::store {

using namespace capsync::core;

std::string parent_directory(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::string temp_path_for(const std::string& path) {
    // pid + thread + time keeps concurrent writers of one path apart
    const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    const auto ns = std::chrono::steady_clock::now().time_since_epoch().count();
    char suffix[96];
    std::snprintf(suffix, sizeof(suffix), ".tmp-%ld-%zx-%llx",
                  static_cast<long>(getpid()),
                  tid,
                  static_cast<unsigned long long>(ns));
    return path + suffix;
}

Status ensure_directory(const std::string& dir, StatusDomain domain) noexcept {
    if (dir.empty()) {
        return make_status(domain, StatusCode::Invalid);
    }
    if (dir.size() >= 1024) {
        return make_status(domain, StatusCode::Invalid);
    }

    char tmp[1024];
    std::snprintf(tmp, sizeof(tmp), "%s", dir.c_str());

    // Try to create directory
    if (mkdir(tmp, 0755) == 0 || errno == EEXIST) {
        return ok_status();
    }

    if (errno == ENOENT) {
        // Parent doesn't exist, recurse
        char* last_slash = std::strrchr(tmp, '/');
        if (last_slash == nullptr || last_slash == tmp) {
            return make_status(domain, StatusCode::Io, ENOENT);
        }
        *last_slash = '\0';
        Status s = ensure_directory(tmp, domain);
        if (!is_ok(s)) return s;

        if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            return make_status(domain, StatusCode::Io, errno);
        }
        return ok_status();
    }

    return make_status(domain, StatusCode::Io, errno);
}

Status fsync_directory(const std::string& dir, StatusDomain domain) noexcept {
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return make_status(domain, StatusCode::Io, errno);
    }
    if (fsync(fd) != 0) {
        const int err = errno;
        close(fd);
        return make_status(domain, StatusCode::Io, err);
    }
    close(fd);
    return ok_status();
}

Status write_all(int fd, const void* data, size_t len, StatusDomain domain) noexcept {
    const u8* p = static_cast<const u8*>(data);
    size_t written = 0;
    while (written < len) {
        ssize_t n = write(fd, p + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == ENOSPC) {
                return make_status(domain, StatusCode::InsufficientStorage, ENOSPC);
            }
            return make_status(domain, StatusCode::Io, errno);
        }
        written += static_cast<size_t>(n);
    }
    return ok_status();
}

Status write_file_atomic(const std::string& path, BufferView data, StatusDomain domain) {
    if (data.len > 0 && data.data == nullptr) {
        return make_status(domain, StatusCode::Invalid);
    }

    const std::string dir = parent_directory(path);
    Status s = ensure_directory(dir, domain);
    if (!is_ok(s)) {
        return s;
    }

    const std::string tmp = temp_path_for(path);
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_status(domain, StatusCode::Io, errno);
    }

    s = write_all(fd, data.data, data.len, domain);
    if (!is_ok(s)) {
        close(fd);
        unlink(tmp.c_str());  // Cleanup partial write
        return s;
    }

    // Sync to disk before the rename makes it visible
    if (fsync(fd) != 0) {
        const int err = errno;
        close(fd);
        unlink(tmp.c_str());
        return make_status(domain, StatusCode::Io, err);
    }
    close(fd);

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        unlink(tmp.c_str());
        return make_status(domain, StatusCode::Io, err);
    }

    return fsync_directory(dir, domain);
}

} // namespace capsync::store
