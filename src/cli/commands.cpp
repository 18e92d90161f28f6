#include "capsync/cli/commands.hpp"
#include "capsync/core/models.hpp"

#include <cstring>

namespace capsync::cli {
    namespace {
        using capsync::core::Status;
        using capsync::core::StatusCode;
        using capsync::core::StatusDomain;

        [[nodiscard]] constexpr Status cli_status(StatusCode code, ArgError why = ArgError::None) noexcept {
            return capsync::core::make_status(StatusDomain::Cli, code, static_cast<u32>(why));
        }

        constexpr OptionSpec kRecordOptions[] = {
            {OptionId::Seconds, OptionType::I64, "seconds", 's'},
            {OptionId::ChunkSeconds, OptionType::I64, "chunk-seconds", '\0'},
            {OptionId::Rate, OptionType::I64, "rate", '\0'},
        };

        constexpr OptionSpec kRetryOptions[] = {
            {OptionId::Reset, OptionType::Flag, "reset", '\0'},
        };

        constexpr OptionSpec kReleaseOptions[] = {
            {OptionId::Purge, OptionType::Flag, "purge", '\0'},
        };

        constexpr CommandSpec kCommands[] = {
            {CommandId::Record, "record", Operand::RecordingId, kRecordOptions, 3,
                "<id> [--seconds N] [--chunk-seconds S] [--rate BYTES_PER_S]",
                "Capture a synthetic session and upload its chunks"},
            {CommandId::Resume, "resume", Operand::None, nullptr, 0, "", "Continue every unfinished upload"},
            {CommandId::Status, "status", Operand::RecordingId, nullptr, 0, "<id>", "Show the upload manifest of a recording"},
            {CommandId::List, "list", Operand::None, nullptr, 0, "", "List recordings with upload progress"},
            {CommandId::Retry, "retry", Operand::RecordingId, kRetryOptions, 1, "<id> [--reset]",
                "Re-queue failed chunks (--reset clears attempt counts)"},
            {CommandId::Verify, "verify", Operand::RecordingId, nullptr, 0, "<id>",
                "Recompute local checksums against the manifest"},
            {CommandId::Rebuild, "rebuild", Operand::RecordingId, nullptr, 0, "<id>",
                "Recreate a manifest from the chunk files on disk"},
            {CommandId::Release, "release", Operand::RecordingId, kReleaseOptions, 1, "<id> [--purge]",
                "Forget a fully uploaded recording (--purge deletes local chunks)"},
            {CommandId::Help, "help", Operand::None, nullptr, 0, "", "Show this help"},
        };

        constexpr u32 kCommandCount = sizeof(kCommands) / sizeof(kCommands[0]);

        // Parses options from `args` and appends them after what `opts` holds.
        [[nodiscard]] Status append_options(const CliArgs& args,
            const CommandSpec& spec,
            ParsedOptions* opts,
            u32* consumed) noexcept {
            ParsedOptions tail{opts->data + opts->len, 0, opts->cap - opts->len};
            const Status s = parse_options(args, spec.options, spec.option_count, &tail, consumed);
            if (!capsync::core::is_ok(s)) {
                return s;
            }
            opts->len += tail.len;
            return capsync::core::ok_status();
        }
    } // namespace

    const CommandSpec* command_table(u32* count) noexcept {
        if (count != nullptr) {
            *count = kCommandCount;
        }
        return kCommands;
    }

    const CommandSpec* find_command(const char* name) noexcept {
        if (name == nullptr) {
            return nullptr;
        }
        for (const CommandSpec& c : kCommands) {
            if (std::strcmp(c.name, name) == 0) {
                return &c;
            }
        }
        return nullptr;
    }

    capsync::core::Status parse_command(const CliArgs& args,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        if (args.argv[0][0] == '-') {
            return cli_status(StatusCode::Invalid);
        }

        const CommandSpec* spec = find_command(args.argv[0]);
        if (spec == nullptr) {
            return cli_status(StatusCode::NotFound);
        }
        out->spec = spec;
        out->id = spec->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return capsync::core::ok_status();
    }

    capsync::core::Status parse_command_args(const CommandInvocation& cmd,
        ParsedOptions* opts,
        const char** operand) noexcept {
        if (cmd.spec == nullptr || opts == nullptr || operand == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        *operand = nullptr;
        opts->len = 0;

        u32 pos = 0;
        u32 used = 0;
        Status s = append_options(cmd.args, *cmd.spec, opts, &used);
        if (!capsync::core::is_ok(s)) {
            return s;
        }
        pos += used;

        if (cmd.spec->operand == Operand::RecordingId) {
            if (pos >= cmd.args.argc) {
                return cli_status(StatusCode::Invalid, ArgError::MissingOperand);
            }
            const char* id = cmd.args.argv[pos++];
            if (!capsync::core::recording_id_valid(id)) {
                return cli_status(StatusCode::Invalid, ArgError::BadRecordingId);
            }
            *operand = id;

            // "--" already ended option parsing; nothing may follow the operand
            const bool ended = used > 0 && std::strcmp(cmd.args.argv[used - 1], "--") == 0;
            if (!ended) {
                const CliArgs rest{cmd.args.argv + pos, cmd.args.argc - pos};
                s = append_options(rest, *cmd.spec, opts, &used);
                if (!capsync::core::is_ok(s)) {
                    return s;
                }
                pos += used;
            }
        }

        if (pos != cmd.args.argc) {
            return cli_status(StatusCode::Invalid, ArgError::ExtraArgument);
        }
        return capsync::core::ok_status();
    }
} // namespace capsync::cli
