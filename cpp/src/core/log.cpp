#include "snap/core/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>

namespace snap::core {

namespace {
    struct LogState {
        std::mutex mutex;
        spdlog::sink_ptr sink;
        spdlog::level::level_enum level{spdlog::level::info};
        bool initialized{false};
    };

    LogState& state() {
        static LogState s;
        return s;
    }

    constexpr std::array<const char*, 5> kSubsystems = {"snap", "store", "db", "lifecycle", "ingest"};

    // Caller holds state().mutex.
    std::shared_ptr<spdlog::logger> make_logger(LogState& st, const std::string& name) {
        if (!st.sink) {
            st.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            st.sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
        }
        auto logger = std::make_shared<spdlog::logger>(name, st.sink);
        logger->set_level(st.level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        return logger;
    }
} // namespace

bool log_level_from_string(std::string_view name, spdlog::level::level_enum* out) noexcept {
    if (out == nullptr) {
        return false;
    }
    struct Entry {
        std::string_view name;
        spdlog::level::level_enum level;
    };
    static constexpr Entry kLevels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const Entry& e : kLevels) {
        if (e.name == name) {
            *out = e.level;
            return true;
        }
    }
    return false;
}

void LogRegistry::init(const LogConfig& cfg) {
    LogState& st = state();
    std::lock_guard<std::mutex> lock(st.mutex);

    st.level = cfg.level;
    if (cfg.color) {
        st.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        st.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(spdlog::color_mode::never);
    }
    st.sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

    for (const char* name : kSubsystems) {
        spdlog::drop(name);
        (void)make_logger(st, name);
    }

    st.initialized = true;
    spdlog::get("snap")->debug("[LogRegistry] Initialized at level {}", spdlog::level::to_string_view(cfg.level));
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    LogState& st = state();
    std::lock_guard<std::mutex> lock(st.mutex);

    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    return make_logger(st, name);
}

bool LogRegistry::isInitialized() {
    LogState& st = state();
    std::lock_guard<std::mutex> lock(st.mutex);
    return st.initialized;
}

} // namespace snap::core
