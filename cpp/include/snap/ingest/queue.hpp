#pragma once

#include <vector>

#include "snap/core/errors.hpp"
#include "snap/core/types.hpp"

namespace snap::ingest {

    using i64 = snap::core::i64;
    using u64 = snap::core::u64;

    struct QueueMessage {
        i64 id{0};
        std::vector<snap::core::u8> body;
        snap::core::u32 dequeue_count{0}; // includes the current delivery
        u64 receipt{0};                   // valid only for the current delivery
        snap::core::Timestamp enqueued_at{0};
    };

    // At-least-once queue. A received message stays invisible for the
    // visibility timeout; unless acked it is delivered again afterwards.
    //
    // Status conventions (domain Ingest):
    //   NotFound    receive found nothing visible
    //   Conflict    ack/release/dead_letter with a stale receipt
    class MessageQueue {
    public:
        virtual ~MessageQueue() = default;

        [[nodiscard]] virtual snap::core::Status enqueue(const std::vector<snap::core::u8>& body) noexcept = 0;
        [[nodiscard]] virtual snap::core::Status receive(snap::core::DurationMs visibility_timeout,
                                                         QueueMessage* out) noexcept = 0;
        [[nodiscard]] virtual snap::core::Status ack(const QueueMessage& msg) noexcept = 0;
        // Makes the message visible again immediately.
        [[nodiscard]] virtual snap::core::Status release(const QueueMessage& msg) noexcept = 0;
        [[nodiscard]] virtual snap::core::Status dead_letter(const QueueMessage& msg) noexcept = 0;
        // Pending messages, in flight or not.
        [[nodiscard]] virtual snap::core::Status depth(u64* out) noexcept = 0;
    };

    [[nodiscard]] constexpr snap::core::Status queue_empty_status() noexcept {
        return snap::core::make_status(snap::core::StatusDomain::Ingest, snap::core::StatusCode::NotFound);
    }

} // namespace snap::ingest
