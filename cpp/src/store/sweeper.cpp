#include "snap/store/sweeper.hpp"
#include "snap/core/log.hpp"

namespace snap::store {

using namespace snap::core;

Sweeper::Sweeper(SecretStore& store, std::chrono::milliseconds interval)
    : AsyncService("Sweeper"), store_(store), interval_(interval) {}

Sweeper::~Sweeper() {
    stop();
}

Status Sweeper::sweep_once(u64* removed) noexcept {
    u64 n = 0;
    const Status s = store_.sweep_expired(&n);
    if (!is_ok(s)) {
        return s;
    }
    total_removed_.fetch_add(n);
    if (removed) {
        *removed = n;
    }
    return ok_status();
}

void Sweeper::runLoop() {
    while (!shouldStop()) {
        u64 removed = 0;
        const Status s = sweep_once(&removed);
        if (!is_ok(s)) {
            LogRegistry::store()->warn("[Sweeper] Sweep failed: {}/{} ({})",
                                       status_domain_name(s.domain), status_code_name(s.code), s.aux);
        } else if (removed > 0) {
            LogRegistry::store()->debug("[Sweeper] Removed {} expired secrets", removed);
        }

        lazySleep(interval_);
    }
}

} // namespace snap::store
