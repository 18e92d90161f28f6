#include "capsync/core/config.hpp"
#include "capsync/core/models.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace capsync::core {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

template <typename T>
[[nodiscard]] bool parse_number(const std::string& s, T* out) noexcept {
    if (s.empty()) {
        return false;
    }
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    T v{};
    auto r = std::from_chars(begin, end, v, 10);
    if (r.ec != std::errc() || r.ptr != end) {
        return false;
    }
    *out = v;
    return true;
}

[[nodiscard]] bool parse_double(const std::string& s, double* out) noexcept {
    if (s.empty()) {
        return false;
    }
    const char* end = s.data() + s.size();
    double v{};
    auto r = std::from_chars(s.data(), end, v);
    if (r.ec != std::errc() || r.ptr != end) {
        return false;
    }
    *out = v;
    return true;
}

[[nodiscard]] bool parse_bool(const std::string& s, bool* out) noexcept {
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        *out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        *out = false;
        return true;
    }
    return false;
}

Status invalid(u32 aux = 0) noexcept {
    return make_status(StatusDomain::Core, StatusCode::Invalid, aux);
}

struct EnvBinding {
    const char* env;
    const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"CAPSYNC_ROOT", "data_root"},
    {"CAPSYNC_REMOTE_ROOT", "remote_root"},
    {"CAPSYNC_USER", "user_id"},
    {"CAPSYNC_CHUNK_SECONDS", "chunk_seconds"},
    {"CAPSYNC_MIN_FREE_MB", "min_free_mb"},
    {"CAPSYNC_MAX_CONCURRENCY", "max_concurrent_uploads"},
    {"CAPSYNC_MAX_ATTEMPTS", "max_upload_attempts"},
    {"CAPSYNC_BACKOFF_MS", "initial_backoff_ms"},
    {"CAPSYNC_MAX_BACKOFF_MS", "max_backoff_ms"},
    {"CAPSYNC_BACKOFF_JITTER", "backoff_jitter"},
    {"CAPSYNC_DELETE_LOCAL", "delete_local_on_success"},
    {"CAPSYNC_LOG_LEVEL", "log_level"},
    {"CAPSYNC_LOG_FILE", "log_file"},
};

} // namespace

std::string config_chunk_root(const AppConfig& cfg) {
    return cfg.data_root + "/chunks";
}

std::string config_manifest_root(const AppConfig& cfg) {
    return cfg.data_root + "/manifests";
}

void config_defaults(AppConfig* out) {
    *out = AppConfig{};
    const char* home = std::getenv("HOME");
    if (home && *home) {
        out->data_root = std::string(home) + "/capsync";
    } else {
        out->data_root = "/tmp/capsync";
    }
    out->remote_root = out->data_root + "/remote";
}

Status config_set(AppConfig* cfg, const std::string& key, const std::string& value) {
    if (cfg == nullptr) {
        return invalid();
    }

    if (key == "data_root") {
        // remote_root follows data_root unless it was set explicitly
        const bool remote_default = cfg->remote_root == cfg->data_root + "/remote";
        cfg->data_root = value;
        if (remote_default) {
            cfg->remote_root = value + "/remote";
        }
    } else if (key == "remote_root") {
        cfg->remote_root = value;
    } else if (key == "user_id") {
        cfg->user_id = value;
    } else if (key == "chunk_seconds") {
        i64 v = 0;
        if (!parse_number(value, &v)) return invalid();
        cfg->chunk_duration_ms = v * 1000;
    } else if (key == "chunk_ms") {
        if (!parse_number(value, &cfg->chunk_duration_ms)) return invalid();
    } else if (key == "min_free_mb") {
        u64 v = 0;
        if (!parse_number(value, &v)) return invalid();
        cfg->min_free_bytes = v * 1'000'000ull;
    } else if (key == "max_concurrent_uploads") {
        if (!parse_number(value, &cfg->max_concurrent_uploads)) return invalid();
    } else if (key == "max_upload_attempts") {
        if (!parse_number(value, &cfg->max_upload_attempts)) return invalid();
    } else if (key == "initial_backoff_ms") {
        if (!parse_number(value, &cfg->initial_backoff_ms)) return invalid();
    } else if (key == "max_backoff_ms") {
        if (!parse_number(value, &cfg->max_backoff_ms)) return invalid();
    } else if (key == "backoff_jitter") {
        if (!parse_double(value, &cfg->backoff_jitter)) return invalid();
    } else if (key == "upload_buffer_capacity") {
        if (!parse_number(value, &cfg->upload_buffer_capacity)) return invalid();
    } else if (key == "delete_local_on_success") {
        if (!parse_bool(value, &cfg->delete_local_on_success)) return invalid();
    } else if (key == "log_level") {
        cfg->log_level = value;
    } else if (key == "log_file") {
        cfg->log_file = value;
    } else {
        return make_status(StatusDomain::Core, StatusCode::NotFound);
    }
    return ok_status();
}

Status config_load_file(const std::string& path, AppConfig* cfg) {
    if (cfg == nullptr) {
        return invalid();
    }
    std::ifstream stream(path);
    if (!stream.is_open()) {
        return make_status(StatusDomain::Core, StatusCode::NotFound);
    }

    std::string line;
    u32 line_no = 0;
    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            return invalid(line_no);
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        const Status s = config_set(cfg, key, value);
        if (!is_ok(s)) {
            // report the offending line
            return invalid(line_no);
        }
    }
    return ok_status();
}

Status config_apply_env(AppConfig* cfg) {
    if (cfg == nullptr) {
        return invalid();
    }
    for (const EnvBinding& b : kEnvBindings) {
        const char* v = std::getenv(b.env);
        if (v == nullptr || *v == '\0') {
            continue;
        }
        const Status s = config_set(cfg, b.key, v);
        if (!is_ok(s)) {
            return s;
        }
    }
    return ok_status();
}

Status config_validate(const AppConfig& cfg) {
    if (cfg.data_root.empty() || cfg.remote_root.empty() || cfg.user_id.empty()) {
        return invalid();
    }
    // user ids share the recording id alphabet; both end up in remote keys
    if (!recording_id_valid(cfg.user_id)) {
        return invalid();
    }
    if (cfg.chunk_duration_ms <= 0) {
        return invalid();
    }
    if (cfg.max_concurrent_uploads == 0 || cfg.max_upload_attempts == 0 || cfg.upload_buffer_capacity == 0) {
        return invalid();
    }
    if (cfg.initial_backoff_ms < 0 || cfg.max_backoff_ms < cfg.initial_backoff_ms) {
        return invalid();
    }
    if (!(cfg.backoff_jitter >= 0.0 && cfg.backoff_jitter <= 1.0)) {
        return invalid();
    }
    return ok_status();
}

} // namespace capsync::core
