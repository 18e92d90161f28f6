#pragma once
#include <cstdint>
#include <string>
#include <type_traits>

namespace capsync::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        PermissionDenied,
        AlreadyActive,
        InvalidState,
        InsufficientStorage,
        Busy,
        Corrupt,
        Io,
        Network,
        Throttled,
        Rejected,
        ChecksumMismatch,
        Cancelled,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Store,
        Capture,
        Manifest,
        Upload,
        Transport,
        Cli,
        External,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;

    // True for failures a transfer may recover from by trying again later
    // (connectivity, throttling, a transient remote or local I/O fault).
    // Integrity and rejection failures are never retryable.
    [[nodiscard]] bool status_is_retryable(Status s) noexcept;

    // "Io/Transport (aux=28: No space left on device)"
    std::string status_describe(Status s);

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace capsync::core
