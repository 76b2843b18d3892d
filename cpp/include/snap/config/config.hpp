#pragma once

#include <chrono>
#include <string_view>

#include "snap/core/errors.hpp"
#include "snap/core/log.hpp"
#include "snap/db/db.hpp"
#include "snap/ingest/adapter.hpp"
#include "snap/lifecycle/orchestrator.hpp"
#include "snap/store/secret_store.hpp"

namespace snap::config {

    struct Config {
        snap::core::LogConfig log{};
        snap::db::DbConfig db{};
        snap::store::StoreConfig store{};
        snap::lifecycle::LifecycleConfig lifecycle{};
        snap::ingest::IngestConfig ingest{};
        std::chrono::milliseconds sweep_interval{60'000};
    };

    // Defaults for a process: a durable database file instead of :memory:.
    [[nodiscard]] Config default_config();

    // Applies one SNAP_* variable. Unknown names are ignored; malformed values
    // yield Invalid (Core) and leave *cfg untouched.
    [[nodiscard]] snap::core::Status config_apply(Config* cfg, std::string_view name, std::string_view value);

    // Starts from default_config() and applies every SNAP_* variable that is set.
    [[nodiscard]] snap::core::Status config_from_env(Config* out);

    [[nodiscard]] bool answer_match_from_string(std::string_view s, snap::core::AnswerMatch* out) noexcept;

} // namespace snap::config
