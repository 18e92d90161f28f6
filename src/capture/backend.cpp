#include "capsync/capture/backend.hpp"

namespace capsync::capture {
    const char* capture_fault_name(CaptureFault fault) noexcept {
        switch (fault) {
            case CaptureFault::FrameDrop: return "frame-drop";
            case CaptureFault::DeviceLost: return "device-lost";
            case CaptureFault::WriterFailed: return "writer-failed";
            case CaptureFault::PermissionRevoked: return "permission-revoked";
        }
        return "unknown";
    }
} // namespace capsync::capture
