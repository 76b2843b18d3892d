#pragma once

#include <chrono>

#include "snap/core/async_service.hpp"
#include "snap/ingest/adapter.hpp"

namespace snap::ingest {

    // Drains the queue through the adapter, then sleeps poll_interval.
    class IngestionWorker final : public snap::core::AsyncService {
    public:
        IngestionWorker(IngestionAdapter& adapter, std::chrono::milliseconds poll_interval);
        ~IngestionWorker() override;

        // Processes until the queue is empty, an error occurs or max messages
        // were handled (0 = no limit). Used by the loop and by "snap drain".
        [[nodiscard]] snap::core::Status drain(u64 max, u64* handled) noexcept;

    protected:
        void runLoop() override;

    private:
        IngestionAdapter& adapter_;
        std::chrono::milliseconds poll_interval_;
    };

} // namespace snap::ingest
