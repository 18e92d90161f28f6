#pragma once

#include <type_traits>

#include "capsync/cli/options.hpp"
#include "capsync/core/errors.hpp"

namespace capsync::cli {
    using u32 = capsync::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Record = 2,
        Resume = 3,
        Status = 4,
        List = 5,
        Retry = 6,
        Verify = 7,
        Rebuild = 8,
        Release = 9,
    };

    // Positional argument a command expects after its name.
    enum class Operand : u32 {
        None = 0,
        RecordingId = 1,
    };

    // aux of the {Cli, Invalid} status returned by parse_command_args when
    // the options parsed but the positional arguments did not fit.
    enum class ArgError : u32 {
        None = 0,
        MissingOperand = 1,
        ExtraArgument = 2,
        BadRecordingId = 3,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        Operand operand{Operand::None};
        const OptionSpec* options{nullptr};
        u32 option_count{0};
        const char* usage{nullptr};    // arguments after the name, for help
        const char* summary{nullptr};
    };

    struct CommandInvocation {
        const CommandSpec* spec{nullptr};
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Every command capsync understands, in help order.
    [[nodiscard]] const CommandSpec* command_table(u32* count) noexcept;

    // nullptr for unknown names.
    [[nodiscard]] const CommandSpec* find_command(const char* name) noexcept;

    // Matches argv[0] against the command table; the invocation's args are
    // the rest. {Cli, NotFound} for unknown commands, {Cli, Invalid} when
    // argv is empty or starts with an option.
    capsync::core::Status parse_command(const CliArgs& args,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // Parses the command's own options around its operand:
    //   [options] [operand] [options]
    // Options land in caller-owned `opts`; `operand` points into argv and is
    // nullptr for commands without one.
    capsync::core::Status parse_command_args(const CommandInvocation& cmd,
        ParsedOptions* opts,
        const char** operand) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace capsync::cli
