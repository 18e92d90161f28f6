#include "capsync/core/models.hpp"

namespace capsync::core {
    const char* session_state_name(SessionState state) noexcept {
        switch (state) {
            case SessionState::Stopped: return "stopped";
            case SessionState::Recording: return "recording";
            case SessionState::Paused: return "paused";
        }
        return "unknown";
    }

    bool recording_id_valid(std::string_view id) noexcept {
        if (id.empty() || id.size() > 128) {
            return false;
        }
        if (id == "." || id == "..") {
            return false;
        }
        for (char c : id) {
            const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
            if (!alnum && c != '.' && c != '_' && c != '-') {
                return false;
            }
        }
        return true;
    }
} // namespace capsync::core
