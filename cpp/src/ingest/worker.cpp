#include "snap/ingest/worker.hpp"
#include "snap/core/log.hpp"

namespace snap::ingest {

using namespace snap::core;

IngestionWorker::IngestionWorker(IngestionAdapter& adapter, std::chrono::milliseconds poll_interval)
    : AsyncService("IngestionWorker"), adapter_(adapter), poll_interval_(poll_interval) {}

IngestionWorker::~IngestionWorker() {
    stop();
}

Status IngestionWorker::drain(u64 max, u64* handled) noexcept {
    u64 n = 0;
    Status s = ok_status();
    while (max == 0 || n < max) {
        bool processed = false;
        s = adapter_.process_one(&processed);
        if (!is_ok(s) || !processed) {
            break;
        }
        ++n;
    }
    if (handled) {
        *handled = n;
    }
    return s;
}

void IngestionWorker::runLoop() {
    while (!shouldStop()) {
        u64 handled = 0;
        const Status s = drain(0, &handled);
        if (!is_ok(s)) {
            LogRegistry::ingest()->warn("[IngestionWorker] Stopped draining after {} messages: {}/{} ({})",
                                        handled, status_domain_name(s.domain), status_code_name(s.code), s.aux);
        }
        lazySleep(poll_interval_);
    }
}

} // namespace snap::ingest
