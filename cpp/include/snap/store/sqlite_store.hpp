#pragma once

#include "snap/core/clock.hpp"
#include "snap/db/db.hpp"
#include "snap/store/secret_store.hpp"

namespace snap::store {

// Durable backend. Every check-and-delete runs inside BEGIN IMMEDIATE, so
// several processes sharing one database file still reveal a secret at most once.
class SqliteSecretStore final : public SecretStore {
public:
    explicit SqliteSecretStore(StoreConfig cfg = {},
                               const snap::core::Clock& clock = snap::core::system_clock()) noexcept;

    [[nodiscard]] snap::core::Status open(const snap::db::DbConfig& cfg) noexcept;
    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return db_.is_open(); }

    [[nodiscard]] snap::core::Status create(const snap::core::SecretDraft& draft,
                                            snap::core::SecretId* out_id) noexcept override;
    [[nodiscard]] snap::core::Status consume_if_valid(const snap::core::SecretId& id,
                                                      ConsumeResult* out) noexcept override;
    [[nodiscard]] snap::core::Status validate_and_consume(const snap::core::SecretId& id,
                                                          std::string_view answer,
                                                          ConsumeResult* out) noexcept override;
    [[nodiscard]] snap::core::Status sweep_expired(u64* removed) noexcept override;
    [[nodiscard]] snap::core::Status count(u64* out) noexcept override;

    // Row count including expired rows not yet swept; for tests and stats.
    [[nodiscard]] snap::core::Status stored_rows(u64* out) noexcept;

private:
    StoreConfig cfg_;
    const snap::core::Clock& clock_;
    snap::db::Database db_;
};

} // namespace snap::store
