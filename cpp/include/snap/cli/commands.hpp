#pragma once

#include <type_traits>

#include "snap/cli/options.hpp"
#include "snap/core/errors.hpp"

namespace snap::cli {
    using u32 = snap::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Submit = 2,
        Access = 3,
        Enqueue = 4,
        Drain = 5,
        Sweep = 6,
        Stats = 7,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    snap::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace snap::cli
