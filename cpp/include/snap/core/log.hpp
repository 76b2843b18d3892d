#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace snap::core {

    struct LogConfig {
        spdlog::level::level_enum level{spdlog::level::info};
        bool color{true};
    };

    // Parses trace|debug|info|warn|error|critical|off.
    [[nodiscard]] bool log_level_from_string(std::string_view name, spdlog::level::level_enum* out) noexcept;

    // Named spdlog loggers sharing one stderr sink. get() creates a logger on
    // first use, so library code works even if the host never called init().
    class LogRegistry {
    public:
        static void init(const LogConfig& cfg);

        static std::shared_ptr<spdlog::logger> get(const std::string& name);

        static std::shared_ptr<spdlog::logger> snap()      { return get("snap"); }
        static std::shared_ptr<spdlog::logger> store()     { return get("store"); }
        static std::shared_ptr<spdlog::logger> db()        { return get("db"); }
        static std::shared_ptr<spdlog::logger> lifecycle() { return get("lifecycle"); }
        static std::shared_ptr<spdlog::logger> ingest()    { return get("ingest"); }

        [[nodiscard]] static bool isInitialized();
    };

} // namespace snap::core
