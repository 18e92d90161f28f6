#pragma once

#include <string>

#include "capsync/core/errors.hpp"
#include "capsync/core/types.hpp"
#include "capsync/store/buffer.hpp"

namespace capsync::store {
    // mkdir -p. Errors carry the domain of the caller.
    capsync::core::Status ensure_directory(const std::string& dir, capsync::core::StatusDomain domain) noexcept;

    capsync::core::Status fsync_directory(const std::string& dir, capsync::core::StatusDomain domain) noexcept;

    // Full write with EINTR retry; leaves fd open.
    capsync::core::Status write_all(int fd, const void* data, size_t len, capsync::core::StatusDomain domain) noexcept;

    // Crash-safe replace: writes <path>.tmp-<pid>-<seq>, fsyncs it, renames it over
    // <path> and fsyncs the parent directory. Readers see the old or the new
    // contents, never a torn file.
    capsync::core::Status write_file_atomic(const std::string& path, BufferView data, capsync::core::StatusDomain domain);

    // Unique sibling name for a temp file next to `path`.
    std::string temp_path_for(const std::string& path);

    std::string parent_directory(const std::string& path);
} // namespace capsync::store
