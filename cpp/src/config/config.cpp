#include "snap/config/config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

namespace snap::config {

using namespace snap::core;

namespace {
    constexpr const char* kVars[] = {
        "SNAP_DB_PATH",
        "SNAP_DB_JOURNAL_MODE",
        "SNAP_DB_BUSY_TIMEOUT_MS",
        "SNAP_MAX_TTL_SECONDS",
        "SNAP_MAX_TEXT_CHARS",
        "SNAP_MAX_ANSWER_ATTEMPTS",
        "SNAP_ANSWER_MATCH",
        "SNAP_QUEUE_NAME",
        "SNAP_QUEUE_VISIBILITY_SECONDS",
        "SNAP_QUEUE_MAX_DEQUEUE",
        "SNAP_SWEEP_INTERVAL_SECONDS",
        "SNAP_LOG_LEVEL",
    };

    [[nodiscard]] bool parse_u64(std::string_view s, u64* out) noexcept {
        if (s.empty()) return false;
        u64 v = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc() || ptr != s.data() + s.size()) return false;
        *out = v;
        return true;
    }

    [[nodiscard]] bool parse_u32(std::string_view s, u32* out) noexcept {
        u64 v = 0;
        if (!parse_u64(s, &v) || v > std::numeric_limits<u32>::max()) return false;
        *out = static_cast<u32>(v);
        return true;
    }

    // Seconds to milliseconds without overflowing the signed duration type.
    [[nodiscard]] bool parse_seconds(std::string_view s, DurationMs* out) noexcept {
        u64 v = 0;
        if (!parse_u64(s, &v)) return false;
        if (v > static_cast<u64>(std::numeric_limits<DurationMs>::max() / kMillisPerSecond)) return false;
        *out = static_cast<DurationMs>(v) * kMillisPerSecond;
        return true;
    }

    [[nodiscard]] Status invalid(u32 index) noexcept {
        return make_status(StatusDomain::Core, StatusCode::Invalid, index);
    }
}

bool answer_match_from_string(std::string_view s, AnswerMatch* out) noexcept {
    if (!out) return false;
    if (s == "exact") {
        *out = AnswerMatch::Exact;
        return true;
    }
    if (s == "ignore-case") {
        *out = AnswerMatch::IgnoreAsciiCase;
        return true;
    }
    return false;
}

Config default_config() {
    Config cfg;
    cfg.db.path = "snap.db";
    return cfg;
}

Status config_apply(Config* cfg, std::string_view name, std::string_view value) {
    if (!cfg) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    u32 index = 0;
    for (const char* v : kVars) {
        if (name == v) break;
        ++index;
    }

    switch (index) {
        case 0:
            if (value.empty()) return invalid(index);
            cfg->db.path = std::string(value);
            return ok_status();
        case 1: {
            std::string mode(value);
            for (char& c : mode) {
                if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
            }
            if (mode != "WAL" && mode != "DELETE" && mode != "TRUNCATE" &&
                mode != "PERSIST" && mode != "MEMORY" && mode != "OFF") {
                return invalid(index);
            }
            cfg->db.journal_mode = mode;
            return ok_status();
        }
        case 2: {
            u32 v = 0;
            if (!parse_u32(value, &v)) return invalid(index);
            cfg->db.busy_timeout_ms = v;
            return ok_status();
        }
        case 3: {
            DurationMs v = 0;
            if (!parse_seconds(value, &v)) return invalid(index);
            cfg->store.max_ttl_ms = v;
            return ok_status();
        }
        case 4: {
            u32 v = 0;
            if (!parse_u32(value, &v) || v == 0) return invalid(index);
            cfg->store.limits.max_text_chars = v;
            cfg->lifecycle.limits.max_text_chars = v;
            return ok_status();
        }
        case 5: {
            u32 v = 0;
            if (!parse_u32(value, &v)) return invalid(index);
            cfg->store.max_answer_attempts = v;
            return ok_status();
        }
        case 6: {
            AnswerMatch m{};
            if (!answer_match_from_string(value, &m)) return invalid(index);
            cfg->lifecycle.answer_match = m;
            return ok_status();
        }
        case 7:
            if (value.empty()) return invalid(index);
            cfg->ingest.queue_name = std::string(value);
            return ok_status();
        case 8: {
            DurationMs v = 0;
            if (!parse_seconds(value, &v)) return invalid(index);
            cfg->ingest.visibility_timeout_ms = v;
            return ok_status();
        }
        case 9: {
            u32 v = 0;
            if (!parse_u32(value, &v)) return invalid(index);
            cfg->ingest.max_dequeue_count = v;
            return ok_status();
        }
        case 10: {
            DurationMs v = 0;
            if (!parse_seconds(value, &v) || v == 0) return invalid(index);
            cfg->sweep_interval = std::chrono::milliseconds(v);
            return ok_status();
        }
        case 11: {
            spdlog::level::level_enum lvl{};
            if (!log_level_from_string(value, &lvl)) return invalid(index);
            cfg->log.level = lvl;
            return ok_status();
        }
        default:
            return ok_status();
    }
}

Status config_from_env(Config* out) {
    if (!out) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    Config cfg = default_config();
    for (const char* name : kVars) {
        const char* value = std::getenv(name);
        if (value == nullptr) continue;
        const Status s = config_apply(&cfg, name, value);
        if (!is_ok(s)) {
            return s;
        }
    }

    *out = cfg;
    return ok_status();
}

} // namespace snap::config
