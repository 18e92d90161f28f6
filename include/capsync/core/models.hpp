#pragma once
#include <string>
#include <string_view>

#include "capsync/core/types.hpp"

namespace capsync::core {
    enum class SessionState : u8 {
        Stopped = 0,
        Recording = 1,
        Paused = 2,
    };

    // Immutable once emitted by the capture side.
    struct ChunkDescriptor {
        std::string recording_id;
        ChunkId chunk_id{0};
        std::string local_path;
        u64 size_bytes{0};
        i64 duration_ms{0};
        std::string checksum;          // lowercase hex BLAKE3-256 of the file
        Timestamp created_at{0};

        [[nodiscard]] double duration_seconds() const noexcept {
            return static_cast<double>(duration_ms) / 1000.0;
        }
    };

    struct RecordingSession {
        std::string recording_id;
        Timestamp started_at{0};
        SessionState state{SessionState::Stopped};
    };

    const char* session_state_name(SessionState state) noexcept;

    // Recording ids end up in directory names and remote keys:
    // 1..128 bytes of [A-Za-z0-9._-], never "." or "..".
    [[nodiscard]] bool recording_id_valid(std::string_view id) noexcept;
} // namespace capsync::core
