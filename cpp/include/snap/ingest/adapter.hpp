#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "snap/core/errors.hpp"
#include "snap/ingest/message.hpp"
#include "snap/ingest/queue.hpp"
#include "snap/lifecycle/orchestrator.hpp"

namespace snap::ingest {

    struct IngestConfig {
        std::string queue_name{"snap-create"};
        snap::core::DurationMs visibility_timeout_ms{30 * snap::core::kMillisPerSecond};
        // Deliveries allowed before a message is treated as poison.
        u32 max_dequeue_count{5};
        std::chrono::milliseconds poll_interval{1000};
    };

    // Outcome of one asynchronous create, addressed to the producer.
    struct Reply {
        std::string reply_to;
        snap::lifecycle::LifecycleError error{snap::lifecycle::LifecycleError::None};
        std::string link;    // base_link + id on success
        std::string message; // error text otherwise
    };

    class ReplySink {
    public:
        virtual ~ReplySink() = default;
        [[nodiscard]] virtual snap::core::Status deliver(const Reply& reply) noexcept = 0;
    };

    struct IngestStats {
        u64 created{0};
        u64 rejected{0};
        u64 dead_lettered{0};
        u64 retried{0};
    };

    // Bridges an at-least-once queue to Orchestrator::submit. A message is
    // acked only after its reply went out; redelivery may create a second,
    // independent secret.
    class IngestionAdapter {
    public:
        IngestionAdapter(MessageQueue& queue,
                         snap::lifecycle::Orchestrator& orchestrator,
                         ReplySink& replies,
                         IngestConfig cfg = {}) noexcept;

        // Producer side.
        [[nodiscard]] snap::core::Status enqueue(const CreateSecretMessage& msg) noexcept;

        // Handles at most one message. *processed is false when the queue had
        // nothing visible. A non-ok status means the message was left for redelivery.
        [[nodiscard]] snap::core::Status process_one(bool* processed) noexcept;

        [[nodiscard]] IngestStats stats() const noexcept;
        [[nodiscard]] const IngestConfig& config() const noexcept { return cfg_; }

    private:
        [[nodiscard]] snap::core::Status poison(const QueueMessage& msg, const char* why) noexcept;

        MessageQueue& queue_;
        snap::lifecycle::Orchestrator& orchestrator_;
        ReplySink& replies_;
        IngestConfig cfg_;

        std::atomic<u64> created_{0};
        std::atomic<u64> rejected_{0};
        std::atomic<u64> dead_lettered_{0};
        std::atomic<u64> retried_{0};
    };

} // namespace snap::ingest
