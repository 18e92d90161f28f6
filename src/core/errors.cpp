#include "capsync/core/errors.hpp"

#include <cstdio>
#include <cstring>

namespace capsync::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::PermissionDenied: return "PermissionDenied";
            case StatusCode::AlreadyActive: return "AlreadyActive";
            case StatusCode::InvalidState: return "InvalidState";
            case StatusCode::InsufficientStorage: return "InsufficientStorage";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Network: return "Network";
            case StatusCode::Throttled: return "Throttled";
            case StatusCode::Rejected: return "Rejected";
            case StatusCode::ChecksumMismatch: return "ChecksumMismatch";
            case StatusCode::Cancelled: return "Cancelled";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Store: return "Store";
            case StatusDomain::Capture: return "Capture";
            case StatusDomain::Manifest: return "Manifest";
            case StatusDomain::Upload: return "Upload";
            case StatusDomain::Transport: return "Transport";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    bool status_is_retryable(Status s) noexcept {
        switch (s.code) {
            case StatusCode::Network:
            case StatusCode::Throttled:
            case StatusCode::Unavailable:
            case StatusCode::Busy:
            case StatusCode::Unknown:
                return true;
            case StatusCode::Io:
                // A local read failure on the chunk file will not fix itself.
                return s.domain == StatusDomain::Transport;
            default:
                return false;
        }
    }

    std::string status_describe(Status s) {
        char buf[256];
        if (s.code == StatusCode::Io && s.aux != 0) {
            std::snprintf(buf, sizeof(buf), "%s/%s (aux=%u: %s)",
                          status_code_name(s.code),
                          status_domain_name(s.domain),
                          s.aux,
                          std::strerror(static_cast<int>(s.aux)));
        } else if (s.aux != 0) {
            std::snprintf(buf, sizeof(buf), "%s/%s (aux=%u)",
                          status_code_name(s.code),
                          status_domain_name(s.domain),
                          s.aux);
        } else {
            std::snprintf(buf, sizeof(buf), "%s/%s",
                          status_code_name(s.code),
                          status_domain_name(s.domain));
        }
        return std::string(buf);
    }
} // namespace capsync::core
