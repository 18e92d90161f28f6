#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "capsync/capture/controller.hpp"
#include "capsync/capture/synthetic_backend.hpp"
#include "capsync/cli/commands.hpp"
#include "capsync/cli/options.hpp"
#include "capsync/core/clock.hpp"
#include "capsync/core/config.hpp"
#include "capsync/core/errors.hpp"
#include "capsync/core/log.hpp"
#include "capsync/manifest/manifest.hpp"
#include "capsync/manifest/manifest_store.hpp"
#include "capsync/store/chunk_store.hpp"
#include "capsync/upload/fs_transport.hpp"
#include "capsync/upload/handoff.hpp"
#include "capsync/upload/recovery.hpp"
#include "capsync/upload/upload_queue.hpp"

using capsync::core::AppConfig;
using capsync::core::Status;
using capsync::core::u32;
using capsync::core::u64;
using capsync::core::i64;

namespace cli = capsync::cli;
namespace manifest = capsync::manifest;
namespace upload = capsync::upload;

// ========================================================================
// Global State
// ========================================================================

// Incremented per SIGINT: the first ends a recording, the next abandons
// the upload wait.
volatile sig_atomic_t g_interrupts = 0;

// ========================================================================
// Signal Handler
// ========================================================================

void sigint_handler(int sig) {
    (void)sig;
    g_interrupts = g_interrupts + 1;
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, Status s) {
    fprintf(stderr, "error: %s failed (%s)\n", context, capsync::core::status_describe(s).c_str());
}

// ========================================================================
// Components
// ========================================================================

// Everything a command needs, wired from one AppConfig.
struct Components {
    capsync::store::ChunkStore chunks;
    manifest::ManifestStore manifests;
    upload::FsTransport transport;
    upload::UploadQueue queue;

    explicit Components(const AppConfig& cfg)
        : chunks(capsync::store::ChunkStoreConfig{
              .root = capsync::core::config_chunk_root(cfg),
              .extension = ".mov",
              .min_free_bytes = cfg.min_free_bytes,
              .space_probe = {}}),
          manifests(manifest::ManifestStoreConfig{.root = capsync::core::config_manifest_root(cfg)}),
          transport(upload::FsTransportConfig{.root = cfg.remote_root, .verify_checksum = true}),
          queue(upload::UploadQueueConfig{
                    .user_id = cfg.user_id,
                    .max_concurrent = cfg.max_concurrent_uploads,
                    .buffer_capacity = cfg.upload_buffer_capacity,
                    .retry = upload::RetryPolicy{
                        .max_attempts = cfg.max_upload_attempts,
                        .base_delay_ms = cfg.initial_backoff_ms,
                        .max_delay_ms = cfg.max_backoff_ms,
                        .jitter = cfg.backoff_jitter},
                    .delete_local_on_success = cfg.delete_local_on_success},
                manifests,
                transport) {}
};

void install_queue_logging(upload::UploadQueue& queue, upload::ChunkHandoff* handoff) {
    upload::QueueCallbacks cb;
    cb.on_uploaded = [](const std::string& rec, capsync::core::ChunkId id, const upload::UploadAck& ack) {
        spdlog::info("uploaded {}/{} -> {}", rec, id, ack.remote_key);
    };
    cb.on_failed = [](const std::string& rec, capsync::core::ChunkId id, const std::string& error) {
        spdlog::error("upload of {}/{} failed permanently: {}", rec, id, error);
    };
    if (handoff != nullptr) {
        cb.on_capacity = [handoff]() { (void)handoff->pump(); };
    }
    queue.set_callbacks(std::move(cb));
}

// Waits until the queue is idle, or returns false once another SIGINT
// arrives after `interrupt_mark`.
bool wait_for_uploads(upload::UploadQueue& queue, upload::ChunkHandoff* handoff, sig_atomic_t interrupt_mark) {
    while (g_interrupts <= interrupt_mark) {
        if (handoff != nullptr) {
            (void)handoff->pump();
        }
        const bool backlog_empty = handoff == nullptr || handoff->backlog() == 0;
        if (queue.wait_idle(200) && backlog_empty) {
            return true;
        }
    }
    return false;
}

void print_progress_line(const manifest::UploadManifest& m) {
    const manifest::ManifestProgress p = manifest::manifest_progress(m);
    printf("%-32s %-10s %u/%u chunks  %llu/%llu bytes",
           m.recording_id.c_str(),
           manifest::upload_status_name(m.overall_status),
           p.completed,
           p.total,
           static_cast<unsigned long long>(p.bytes_completed),
           static_cast<unsigned long long>(p.bytes_total));
    if (p.failed > 0) {
        printf("  (%u failed)", p.failed);
    }
    printf("\n");
}

// 0 only when the recording is fully uploaded.
int report_recording(upload::UploadQueue& queue, const std::string& recording_id) {
    manifest::UploadManifest m;
    const Status s = queue.snapshot(recording_id, &m);
    if (!capsync::core::is_ok(s)) {
        print_status_error("snapshot", s);
        return EXIT_FAILURE;
    }
    print_progress_line(m);
    return m.overall_status == manifest::UploadStatus::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
}

// Parses a command's options and operand; prints why on failure.
bool parse_invocation(const cli::CommandInvocation& cmd, cli::ParsedOptions* opts, std::string* recording_id) {
    const char* operand = nullptr;
    const Status s = cli::parse_command_args(cmd, opts, &operand);
    if (capsync::core::is_ok(s)) {
        if (operand != nullptr) {
            *recording_id = operand;
        }
        return true;
    }
    const char* name = cmd.spec->name;
    switch (static_cast<cli::ArgError>(s.aux)) {
        case cli::ArgError::MissingOperand:
            fprintf(stderr, "error: %s: expected a recording id\n", name);
            break;
        case cli::ArgError::ExtraArgument:
            fprintf(stderr, "error: %s: unexpected argument\n", name);
            break;
        case cli::ArgError::BadRecordingId:
            fprintf(stderr, "error: %s: invalid recording id\n", name);
            break;
        default:
            print_status_error(name, s);
            break;
    }
    return false;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: capsync [options] <command> [args]\n");
    printf("\n");
    printf("Options:\n");
    printf("  -c, --config <file>  Read key = value settings from file\n");
    printf("  --root <dir>         Data root (chunks/ and manifests/)\n");
    printf("  --remote <dir>       Upload destination directory\n");
    printf("  -u, --user <id>      Owner of new recordings\n");
    printf("  --log-level <lvl>    trace|debug|info|warn|error|off\n");
    printf("  -v, --verbose        Same as --log-level debug\n");
    printf("\n");
    printf("Commands:\n");
    u32 count = 0;
    const cli::CommandSpec* commands = cli::command_table(&count);
    for (u32 i = 0; i < count; ++i) {
        std::string line = std::string(commands[i].name) + " " + commands[i].usage;
        if (line.size() > 20) {
            printf("  %s\n  %-20s %s\n", line.c_str(), "", commands[i].summary);
        } else {
            printf("  %-20s %s\n", line.c_str(), commands[i].summary);
        }
    }
    printf("\n");
    printf("Ctrl-C ends a recording; a second Ctrl-C stops waiting for uploads.\n");
}

int handle_record(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOption buf[16]{};
    cli::ParsedOptions opts{buf, 0, 16};
    std::string recording_id;
    if (!parse_invocation(cmd, &opts, &recording_id)) {
        return EXIT_FAILURE;
    }

    i64 seconds = 0;
    i64 chunk_ms = cfg.chunk_duration_ms;
    i64 rate = 256 * 1024;
    if (const cli::ParsedOption* o = cli::find_option(opts, cli::OptionId::Seconds)) {
        seconds = o->value.i64v;
    }
    if (const cli::ParsedOption* o = cli::find_option(opts, cli::OptionId::ChunkSeconds)) {
        chunk_ms = o->value.i64v * 1000;
    }
    if (const cli::ParsedOption* o = cli::find_option(opts, cli::OptionId::Rate)) {
        rate = o->value.i64v;
    }
    if (seconds < 0 || chunk_ms <= 0 || rate <= 0 || rate > INT32_MAX) {
        print_error("record: --seconds, --chunk-seconds and --rate must be positive");
        return EXIT_FAILURE;
    }

    Components c(cfg);
    upload::ChunkHandoff handoff(c.queue);
    install_queue_logging(c.queue, &handoff);

    capsync::capture::SyntheticBackend backend(capsync::capture::SyntheticBackendConfig{
        .bytes_per_second = static_cast<u32>(rate),
        .tick_ms = 100,
        .permission_granted = true,
        .seed = static_cast<u64>(capsync::core::system_clock().wall_ms())});
    capsync::capture::CaptureController controller(
        capsync::capture::CaptureConfig{.chunk_duration_ms = chunk_ms}, backend, c.chunks);

    std::atomic<bool> capture_failed{false};
    capsync::capture::CaptureCallbacks callbacks;
    callbacks.on_chunk = [&handoff](const capsync::core::ChunkDescriptor& d) {
        spdlog::info("chunk {} of {} ready: {} bytes, {} ms", d.chunk_id, d.recording_id, d.size_bytes, d.duration_ms);
        if (!handoff.offer(d)) {
            spdlog::debug("chunk {} held until the upload queue has room", d.chunk_id);
        }
    };
    callbacks.on_issue = [&capture_failed](const capsync::capture::CaptureIssue& issue) {
        if (issue.fatal) {
            capture_failed = true;
            spdlog::error("recording stopped: {} {}", capsync::core::status_describe(issue.status), issue.detail);
        } else {
            spdlog::warn("recording issue: {} {}", capsync::core::status_describe(issue.status), issue.detail);
        }
    };
    controller.set_callbacks(std::move(callbacks));

    Status s = c.queue.start();
    if (!capsync::core::is_ok(s)) {
        print_status_error("upload queue start", s);
        return EXIT_FAILURE;
    }

    s = controller.start(recording_id);
    if (!capsync::core::is_ok(s)) {
        print_status_error("record", s);
        c.queue.stop_processing();
        return EXIT_FAILURE;
    }
    printf("recording %s (Ctrl-C to stop)\n", recording_id.c_str());

    const sig_atomic_t mark = g_interrupts;
    const i64 started = capsync::core::system_clock().monotonic_ms();
    while (g_interrupts == mark && controller.state() != capsync::core::SessionState::Stopped) {
        if (seconds > 0 && capsync::core::system_clock().monotonic_ms() - started >= seconds * 1000) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        (void)handoff.pump();
    }

    int rc = EXIT_SUCCESS;
    if (controller.state() != capsync::core::SessionState::Stopped) {
        s = controller.stop();
        if (!capsync::core::is_ok(s)) {
            print_status_error("stop", s);
            rc = EXIT_FAILURE;
        }
    }
    if (capture_failed) {
        rc = EXIT_FAILURE;
    }
    printf("recorded %lld ms in %u chunks\n",
           static_cast<long long>(controller.recorded_ms()),
           controller.chunk_count());

    if (!wait_for_uploads(c.queue, &handoff, g_interrupts)) {
        fprintf(stderr, "info: upload wait interrupted; run 'capsync resume' to continue\n");
        rc = EXIT_FAILURE;
    }
    c.queue.stop_processing();

    if (handoff.backlog() > 0) {
        // never reached the manifest; rebuild picks the files up from disk
        fprintf(stderr, "error: %zu chunks were not queued; run 'capsync rebuild %s'\n",
                handoff.backlog(), recording_id.c_str());
        rc = EXIT_FAILURE;
    }
    if (controller.chunk_count() > 0 && report_recording(c.queue, recording_id) != EXIT_SUCCESS) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

int handle_resume(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOptions opts{};
    std::string unused;
    if (!parse_invocation(cmd, &opts, &unused)) {
        return EXIT_FAILURE;
    }
    Components c(cfg);
    install_queue_logging(c.queue, nullptr);

    Status s = c.queue.start();
    if (!capsync::core::is_ok(s)) {
        print_status_error("upload queue start", s);
        return EXIT_FAILURE;
    }

    upload::ResumeReport report;
    s = c.queue.resume_incomplete_uploads(&report);
    if (!capsync::core::is_ok(s)) {
        print_status_error("resume", s);
        c.queue.stop_processing();
        return EXIT_FAILURE;
    }
    printf("scanned %u manifests: %u chunks scheduled (%u interrupted), %u failed left\n",
           report.manifests_scanned,
           report.entries_scheduled,
           report.uploading_reset,
           report.failed_left);

    int rc = EXIT_SUCCESS;
    if (!wait_for_uploads(c.queue, nullptr, g_interrupts)) {
        fprintf(stderr, "info: upload wait interrupted\n");
        rc = EXIT_FAILURE;
    }
    c.queue.stop_processing();

    for (const std::string& rec : report.corrupt) {
        fprintf(stderr, "error: manifest of %s is corrupt; run 'capsync rebuild %s'\n", rec.c_str(), rec.c_str());
        rc = EXIT_FAILURE;
    }

    std::vector<std::string> ids;
    s = c.manifests.list(&ids);
    if (!capsync::core::is_ok(s)) {
        print_status_error("list", s);
        return EXIT_FAILURE;
    }
    for (const std::string& rec : ids) {
        manifest::UploadManifest m;
        if (!capsync::core::is_ok(c.queue.snapshot(rec, &m))) {
            continue;
        }
        if (m.overall_status != manifest::UploadStatus::Completed) {
            print_progress_line(m);
            rc = EXIT_FAILURE;
        }
    }
    return rc;
}

int handle_status(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOptions opts{};
    std::string recording_id;
    if (!parse_invocation(cmd, &opts, &recording_id)) {
        return EXIT_FAILURE;
    }

    manifest::ManifestStore manifests(manifest::ManifestStoreConfig{.root = capsync::core::config_manifest_root(cfg)});
    manifest::UploadManifest m;
    const Status s = manifests.load(recording_id, &m);
    if (!capsync::core::is_ok(s)) {
        print_status_error("status", s);
        return EXIT_FAILURE;
    }

    printf("recording: %s\n", m.recording_id.c_str());
    printf("user:      %s\n", m.user_id.c_str());
    print_progress_line(m);
    printf("\n%-6s %-10s %-8s %-12s %-9s %s\n", "chunk", "status", "attempts", "bytes", "seconds", "remote key");
    for (const manifest::ChunkEntry& e : m.chunks) {
        printf("%-6u %-10s %-8u %-12llu %-9.1f %s\n",
               e.chunk_id,
               manifest::upload_status_name(e.status),
               e.attempts,
               static_cast<unsigned long long>(e.size_bytes),
               static_cast<double>(e.duration_ms) / 1000.0,
               e.remote_key.c_str());
        if (e.last_error && e.status != manifest::UploadStatus::Completed) {
            printf("       last error: %s\n", e.last_error->c_str());
        }
    }
    return EXIT_SUCCESS;
}

int handle_list(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOptions opts{};
    std::string unused;
    if (!parse_invocation(cmd, &opts, &unused)) {
        return EXIT_FAILURE;
    }
    manifest::ManifestStore manifests(manifest::ManifestStoreConfig{.root = capsync::core::config_manifest_root(cfg)});
    std::vector<std::string> ids;
    Status s = manifests.list(&ids);
    if (!capsync::core::is_ok(s)) {
        print_status_error("list", s);
        return EXIT_FAILURE;
    }
    if (ids.empty()) {
        printf("(no recordings)\n");
        return EXIT_SUCCESS;
    }

    int rc = EXIT_SUCCESS;
    for (const std::string& rec : ids) {
        manifest::UploadManifest m;
        s = manifests.load(rec, &m);
        if (!capsync::core::is_ok(s)) {
            printf("%-32s unreadable (%s)\n", rec.c_str(), capsync::core::status_describe(s).c_str());
            rc = EXIT_FAILURE;
            continue;
        }
        print_progress_line(m);
    }
    return rc;
}

int handle_retry(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOption buf[4]{};
    cli::ParsedOptions opts{buf, 0, 4};
    std::string recording_id;
    if (!parse_invocation(cmd, &opts, &recording_id)) {
        return EXIT_FAILURE;
    }
    const bool reset = cli::find_option(opts, cli::OptionId::Reset) != nullptr;

    Components c(cfg);
    install_queue_logging(c.queue, nullptr);
    Status s = c.queue.start();
    if (!capsync::core::is_ok(s)) {
        print_status_error("upload queue start", s);
        return EXIT_FAILURE;
    }

    u32 requeued = 0;
    s = c.queue.retry_failed(recording_id, reset, &requeued);
    if (!capsync::core::is_ok(s)) {
        print_status_error("retry", s);
        c.queue.stop_processing();
        return EXIT_FAILURE;
    }
    printf("re-queued %u failed chunks of %s\n", requeued, recording_id.c_str());

    int rc = EXIT_SUCCESS;
    if (!wait_for_uploads(c.queue, nullptr, g_interrupts)) {
        fprintf(stderr, "info: upload wait interrupted\n");
        rc = EXIT_FAILURE;
    }
    c.queue.stop_processing();
    if (report_recording(c.queue, recording_id) != EXIT_SUCCESS) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

int handle_verify(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOptions opts{};
    std::string recording_id;
    if (!parse_invocation(cmd, &opts, &recording_id)) {
        return EXIT_FAILURE;
    }

    Components c(cfg);
    manifest::UploadManifest m;
    Status s = c.manifests.load(recording_id, &m);
    if (!capsync::core::is_ok(s)) {
        print_status_error("verify", s);
        return EXIT_FAILURE;
    }

    upload::VerifyReport report;
    s = upload::verify_recording(c.chunks, m, &report);
    if (!capsync::core::is_ok(s)) {
        print_status_error("verify", s);
        return EXIT_FAILURE;
    }
    printf("%s: %u checked, %u valid, %u missing, %zu mismatched\n",
           recording_id.c_str(),
           report.checked,
           report.valid,
           report.missing,
           report.mismatched.size());
    for (const capsync::core::ChunkId id : report.mismatched) {
        printf("  chunk %u differs from its manifest entry\n", id);
    }
    return report.mismatched.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int handle_rebuild(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOptions opts{};
    std::string recording_id;
    if (!parse_invocation(cmd, &opts, &recording_id)) {
        return EXIT_FAILURE;
    }

    Components c(cfg);
    manifest::UploadManifest m;
    const Status s = upload::rebuild_manifest(
        c.chunks, c.manifests, recording_id, cfg.user_id, capsync::core::system_clock().wall_ms(), &m);
    if (!capsync::core::is_ok(s)) {
        print_status_error("rebuild", s);
        return EXIT_FAILURE;
    }
    printf("rebuilt manifest of %s with %zu pending chunks; run 'capsync resume' to upload\n",
           recording_id.c_str(),
           m.chunks.size());
    return EXIT_SUCCESS;
}

int handle_release(const AppConfig& cfg, const cli::CommandInvocation& cmd) {
    cli::ParsedOption buf[4]{};
    cli::ParsedOptions opts{buf, 0, 4};
    std::string recording_id;
    if (!parse_invocation(cmd, &opts, &recording_id)) {
        return EXIT_FAILURE;
    }

    Components c(cfg);
    Status s = c.queue.release_recording(recording_id);
    if (!capsync::core::is_ok(s)) {
        print_status_error("release", s);
        return EXIT_FAILURE;
    }
    if (cli::find_option(opts, cli::OptionId::Purge) != nullptr) {
        s = c.chunks.purge_recording(recording_id);
        if (!capsync::core::is_ok(s)) {
            print_status_error("purge", s);
            return EXIT_FAILURE;
        }
    }
    printf("released %s\n", recording_id.c_str());
    return EXIT_SUCCESS;
}

// ========================================================================
// Configuration
// ========================================================================

// defaults < --config file < CAPSYNC_* environment < command-line options
Status assemble_config(const cli::ParsedOptions& opts, AppConfig* cfg) {
    capsync::core::config_defaults(cfg);

    if (const cli::ParsedOption* o = cli::find_option(opts, cli::OptionId::Config)) {
        const Status s = capsync::core::config_load_file(o->value.str, cfg);
        if (!capsync::core::is_ok(s)) {
            return s;
        }
    }

    Status s = capsync::core::config_apply_env(cfg);
    if (!capsync::core::is_ok(s)) {
        return s;
    }

    struct Override {
        cli::OptionId id;
        const char* key;
    };
    const Override overrides[] = {
        {cli::OptionId::Root, "data_root"},
        {cli::OptionId::Remote, "remote_root"},
        {cli::OptionId::User, "user_id"},
        {cli::OptionId::LogLevel, "log_level"},
    };
    for (const Override& ov : overrides) {
        if (const cli::ParsedOption* o = cli::find_option(opts, ov.id)) {
            s = capsync::core::config_set(cfg, ov.key, o->value.str);
            if (!capsync::core::is_ok(s)) {
                return s;
            }
        }
    }
    if (cli::find_option(opts, cli::OptionId::Verbose) != nullptr) {
        cfg->log_level = "debug";
    }
    return capsync::core::config_validate(*cfg);
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    const cli::OptionSpec global_specs[] = {
        {cli::OptionId::Config, cli::OptionType::String, "config", 'c'},
        {cli::OptionId::Root, cli::OptionType::String, "root", '\0'},
        {cli::OptionId::Remote, cli::OptionType::String, "remote", '\0'},
        {cli::OptionId::User, cli::OptionType::String, "user", 'u'},
        {cli::OptionId::LogLevel, cli::OptionType::String, "log-level", '\0'},
        {cli::OptionId::Verbose, cli::OptionType::Flag, "verbose", 'v'},
    };
    const u32 global_count = sizeof(global_specs) / sizeof(global_specs[0]);


    const cli::CliArgs all{argv + 1, argc > 0 ? static_cast<u32>(argc - 1) : 0u};
    cli::ParsedOption buf[32]{};
    cli::ParsedOptions opts{buf, 0, 32};
    u32 consumed = 0;
    Status s = cli::parse_options(all, global_specs, global_count, &opts, &consumed);
    if (!capsync::core::is_ok(s)) {
        print_status_error("option parsing", s);
        handle_help();
        return EXIT_FAILURE;
    }

    const cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (rest.argc == 0) {
        handle_help();
        return EXIT_FAILURE;
    }

    cli::CommandInvocation cmd;
    u32 cmd_consumed = 0;
    s = cli::parse_command(rest, &cmd, &cmd_consumed);
    if (!capsync::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s'\n", rest.argv[0]);
        handle_help();
        return EXIT_FAILURE;
    }
    if (cmd.id == cli::CommandId::Help) {
        cli::ParsedOptions none{};
        std::string unused;
        if (!parse_invocation(cmd, &none, &unused)) {
            return EXIT_FAILURE;
        }
        handle_help();
        return EXIT_SUCCESS;
    }

    AppConfig cfg;
    s = assemble_config(opts, &cfg);
    if (!capsync::core::is_ok(s)) {
        print_status_error("configuration", s);
        return EXIT_FAILURE;
    }

    s = capsync::core::log_init(capsync::core::LogConfig{.level = cfg.log_level, .file = cfg.log_file});
    if (!capsync::core::is_ok(s)) {
        print_status_error("logging setup", s);
        return EXIT_FAILURE;
    }
    spdlog::debug("data_root={} remote_root={} user={}", cfg.data_root, cfg.remote_root, cfg.user_id);

    switch (cmd.id) {
        case cli::CommandId::Record:
            return handle_record(cfg, cmd);
        case cli::CommandId::Resume:
            return handle_resume(cfg, cmd);
        case cli::CommandId::Status:
            return handle_status(cfg, cmd);
        case cli::CommandId::List:
            return handle_list(cfg, cmd);
        case cli::CommandId::Retry:
            return handle_retry(cfg, cmd);
        case cli::CommandId::Verify:
            return handle_verify(cfg, cmd);
        case cli::CommandId::Rebuild:
            return handle_rebuild(cfg, cmd);
        case cli::CommandId::Release:
            return handle_release(cfg, cmd);
        default:
            break;
    }
    print_error("unknown command");
    return EXIT_FAILURE;
}
