#pragma once

#include <mutex>
#include <unordered_map>

#include "snap/core/clock.hpp"
#include "snap/store/secret_store.hpp"

namespace snap::store {

// Process-local backend. One mutex guards the map; each operation's
// check-and-erase runs inside a single critical section.
class MemorySecretStore final : public SecretStore {
public:
    explicit MemorySecretStore(StoreConfig cfg = {},
                               const snap::core::Clock& clock = snap::core::system_clock()) noexcept;

    [[nodiscard]] snap::core::Status create(const snap::core::SecretDraft& draft,
                                            snap::core::SecretId* out_id) noexcept override;
    [[nodiscard]] snap::core::Status consume_if_valid(const snap::core::SecretId& id,
                                                      ConsumeResult* out) noexcept override;
    [[nodiscard]] snap::core::Status validate_and_consume(const snap::core::SecretId& id,
                                                          std::string_view answer,
                                                          ConsumeResult* out) noexcept override;
    [[nodiscard]] snap::core::Status sweep_expired(u64* removed) noexcept override;
    [[nodiscard]] snap::core::Status count(u64* out) noexcept override;

private:
    using Map = std::unordered_map<snap::core::Hash256, snap::core::SecretRecord, snap::core::HashKeyHasher>;

    // Caller holds mutex_. Returns end() for unknown and (after erasing) expired entries.
    Map::iterator find_live(const snap::core::Hash256& key, snap::core::Timestamp now) noexcept;

    StoreConfig cfg_;
    const snap::core::Clock& clock_;
    std::mutex mutex_;
    Map entries_;
};

} // namespace snap::store
