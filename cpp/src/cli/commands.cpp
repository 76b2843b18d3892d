#include "snap/cli/commands.hpp"

#include <cstring>

namespace snap::cli {
    namespace {
        [[nodiscard]] constexpr snap::core::Status invalid() noexcept {
            return snap::core::make_status(snap::core::StatusDomain::Cli, snap::core::StatusCode::Invalid);
        }

        [[nodiscard]] const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, const char* name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }
    } // namespace

    snap::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        const char* name = args.argv[0];
        if (name[0] == '-') {
            return invalid();
        }

        const CommandSpec* match = find_command(specs, spec_count, name);
        if (match == nullptr) {
            return snap::core::make_status(snap::core::StatusDomain::Cli, snap::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return snap::core::ok_status();
    }
} // namespace snap::cli
