#pragma once

#include <string>

#include "snap/core/clock.hpp"
#include "snap/db/db.hpp"
#include "snap/ingest/queue.hpp"

namespace snap::ingest {

    // Named queue in the queue_messages table. Several named queues share one
    // database; dead letters move to "<name>-poison".
    class SqliteMessageQueue final : public MessageQueue {
    public:
        explicit SqliteMessageQueue(std::string name,
                                    const snap::core::Clock& clock = snap::core::system_clock());

        [[nodiscard]] snap::core::Status open(const snap::db::DbConfig& cfg) noexcept;
        void close() noexcept;

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] const std::string& poison_name() const noexcept { return poison_name_; }

        [[nodiscard]] snap::core::Status enqueue(const std::vector<snap::core::u8>& body) noexcept override;
        [[nodiscard]] snap::core::Status receive(snap::core::DurationMs visibility_timeout,
                                                 QueueMessage* out) noexcept override;
        [[nodiscard]] snap::core::Status ack(const QueueMessage& msg) noexcept override;
        [[nodiscard]] snap::core::Status release(const QueueMessage& msg) noexcept override;
        [[nodiscard]] snap::core::Status dead_letter(const QueueMessage& msg) noexcept override;
        [[nodiscard]] snap::core::Status depth(u64* out) noexcept override;

    private:
        std::string name_;
        std::string poison_name_;
        const snap::core::Clock& clock_;
        snap::db::Database db_;
    };

} // namespace snap::ingest
