#pragma once

#include <string>

#include "capsync/core/errors.hpp"
#include "capsync/core/types.hpp"

namespace capsync::core {
    // Application-level settings. Components never read this directly; the
    // CLI maps it onto each component's own config struct.
    struct AppConfig {
        std::string data_root;              // chunks/ and manifests/ live under here
        std::string remote_root;            // FsTransport destination
        std::string user_id{"local"};

        i64 chunk_duration_ms{60'000};
        u64 min_free_bytes{1'000'000'000};

        u32 max_concurrent_uploads{2};
        u32 max_upload_attempts{3};
        i64 initial_backoff_ms{1'000};
        i64 max_backoff_ms{60'000};
        double backoff_jitter{0.0};
        u32 upload_buffer_capacity{32};
        bool delete_local_on_success{false};

        std::string log_level{"info"};
        std::string log_file;
    };

    std::string config_chunk_root(const AppConfig& cfg);
    std::string config_manifest_root(const AppConfig& cfg);

    // Defaults rooted at $HOME/capsync, or /tmp/capsync without HOME.
    void config_defaults(AppConfig* out);

    // `key = value` lines, '#' comments. Unknown keys are Invalid.
    [[nodiscard]] Status config_load_file(const std::string& path, AppConfig* cfg);

    // CAPSYNC_* environment overrides.
    [[nodiscard]] Status config_apply_env(AppConfig* cfg);

    // Applies one setting by its file key (also used for env and CLI overrides).
    [[nodiscard]] Status config_set(AppConfig* cfg, const std::string& key, const std::string& value);

    [[nodiscard]] Status config_validate(const AppConfig& cfg);
} // namespace capsync::core
