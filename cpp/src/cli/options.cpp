#include "snap/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace snap::cli {
    namespace {
        [[nodiscard]] constexpr snap::core::Status invalid() noexcept {
            return snap::core::make_status(snap::core::StatusDomain::Cli, snap::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] snap::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return snap::core::ok_status();
        }

        [[nodiscard]] snap::core::Status push_positional(Positionals* out, const char* tok) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = tok;
            return snap::core::ok_status();
        }

        // Fills opt from a non-flag value.
        [[nodiscard]] snap::core::Status set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            if (spec.type == OptionType::String) {
                opt->value.str = value;
                return snap::core::ok_status();
            }
            if (spec.type == OptionType::I64) {
                i64 v{};
                if (!parse_i64(value, &v)) {
                    return invalid();
                }
                opt->value.i64v = v;
                return snap::core::ok_status();
            }
            return invalid();
        }
    } // namespace

    snap::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        Positionals* positionals,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;
        if (positionals != nullptr) {
            positionals->len = 0;
        }

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                if (positionals != nullptr) {
                    for (; i < args.argc && args.argv[i] != nullptr; ++i) {
                        const snap::core::Status s = push_positional(positionals, args.argv[i]);
                        if (!snap::core::is_ok(s)) {
                            return s;
                        }
                    }
                }
                break;
            }
            if (tok[0] != '-' || tok[1] == '\0') {
                if (positionals == nullptr) {
                    break;
                }
                const snap::core::Status s = push_positional(positionals, tok);
                if (!snap::core::is_ok(s)) {
                    return s;
                }
                ++i;
                continue;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            char name_buf[128]{};

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec != nullptr && tok[2] != '\0') {
                    if (spec->type == OptionType::Flag) {
                        return invalid();
                    }
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (value != nullptr) {
                    return invalid();
                }
                opt.value.boolv = 1;
                ++i;
            } else if (value != nullptr) {
                ++i;
            } else {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return invalid();
                }
                value = args.argv[i + 1];
                i += 2;
            }

            if (spec->type != OptionType::Flag) {
                const snap::core::Status s = set_value(*spec, value, &opt);
                if (!snap::core::is_ok(s)) {
                    return s;
                }
            }

            const snap::core::Status s = push_option(out, opt);
            if (!snap::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return snap::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace snap::cli
