#include "snap/core/errors.hpp"

namespace snap::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Mismatch: return "Mismatch";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Crypto: return "Crypto";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Store: return "Store";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Security: return "Security";
        case StatusDomain::Lifecycle: return "Lifecycle";
        case StatusDomain::Ingest: return "Ingest";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
    }
    return "Unknown";
}

} // namespace snap::core
