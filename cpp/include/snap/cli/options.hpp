#pragma once

#include <type_traits>

#include "snap/core/errors.hpp"
#include "snap/core/types.hpp"

namespace snap::cli {
    using u8 = snap::core::u8;
    using u32 = snap::core::u32;
    using i64 = snap::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Db = 1,
        LogLevel = 2,
        Prompt = 3,
        Answer = 4,
        ExpireIn = 5,
        BaseLink = 6,
        ReplyTo = 7,
        Max = 8,
        Help = 9,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    struct Positionals {
        const char** data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Without positionals, parsing stops at the first non-option token (global
    // options before a command). With positionals, options and operands may
    // interleave and every operand is collected. "--" ends option parsing; "-"
    // is an operand.
    snap::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        Positionals* positionals,
        u32* consumed) noexcept;

    // Last occurrence wins; nullptr if absent.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_trivially_copyable_v<Positionals>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace snap::cli
