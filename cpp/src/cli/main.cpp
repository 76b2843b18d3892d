#include <cstdio>
#include <cstdlib>

#include "snap/cli/app.hpp"
#include "snap/config/config.hpp"
#include "snap/core/log.hpp"

int main(int argc, char** argv) {
    snap::config::Config cfg;
    const snap::core::Status s = snap::config::config_from_env(&cfg);
    if (!snap::core::is_ok(s)) {
        snap::cli::print_status_error(stderr, "configuration", s);
        return EXIT_FAILURE;
    }

    // Keep stderr quiet for interactive use unless asked otherwise.
    if (std::getenv("SNAP_LOG_LEVEL") == nullptr) {
        cfg.log.level = spdlog::level::warn;
    }

    const snap::cli::CliArgs args{
        argc > 1 ? argv + 1 : nullptr,
        argc > 1 ? static_cast<snap::cli::u32>(argc - 1) : 0u,
    };
    return snap::cli::run(args, cfg, snap::cli::CliIo{});
}
