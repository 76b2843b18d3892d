#pragma once

#include <cstdio>

#include "snap/cli/options.hpp"
#include "snap/config/config.hpp"
#include "snap/core/errors.hpp"

namespace snap::cli {

    inline constexpr int kExitOk = 0;
    inline constexpr int kExitError = 1;
    inline constexpr int kExitChallenge = 2;

    struct CliIo {
        std::FILE* in{stdin};
        std::FILE* out{stdout};
        std::FILE* err{stderr};
    };

    // Runs one command line (without the program name) on top of base, which
    // normally comes from config_from_env(). Returns the process exit code.
    [[nodiscard]] int run(const CliArgs& args, const snap::config::Config& base, const CliIo& io);

    void print_usage(std::FILE* out);
    void print_status_error(std::FILE* err, const char* context, snap::core::Status s);

} // namespace snap::cli
