#pragma once

#include <string>
#include <string_view>

#include "snap/core/errors.hpp"
#include "snap/core/secret.hpp"
#include "snap/core/types.hpp"

namespace snap::store {

using u32 = snap::core::u32;
using u64 = snap::core::u64;

struct StoreConfig {
    snap::core::Limits limits{};
    // Upper bound on any secret's lifetime; also the lifetime of secrets
    // submitted without one. 0 disables the bound.
    snap::core::DurationMs max_ttl_ms{7 * snap::core::kMillisPerDay};
    // Failed answers tolerated before the secret is destroyed; 0 = unlimited.
    u32 max_answer_attempts{0};
};

enum class ConsumeOutcome : snap::core::u8 {
    Revealed = 0,
    ChallengeRequired = 1,
};

struct ConsumeResult {
    ConsumeOutcome outcome{ConsumeOutcome::Revealed};
    std::string text;   // set when Revealed
    std::string prompt; // set when ChallengeRequired
};

// ========================================================================
// Secret store contract
// ========================================================================
//
// Every access path treats an expired entry exactly like a missing one.
// A successful reveal deletes the entry in the same atomic step that checks
// existence and expiry, so at most one caller ever observes the text.
//
// Status conventions:
//   Invalid (Core)            draft violates the secret invariants
//   NotFound (Store)          unknown, consumed or expired
//   Mismatch (Security)       challenge answer did not match
//   anything else             backend failure
class SecretStore {
public:
    virtual ~SecretStore() = default;

    // Assigns the id, created_at and expires_at, then persists.
    [[nodiscard]] virtual snap::core::Status create(const snap::core::SecretDraft& draft,
                                                    snap::core::SecretId* out_id) noexcept = 0;

    // Unchallenged: atomically delete and return the text.
    // Challenged: return the prompt only and mark the entry PendingAnswer.
    [[nodiscard]] virtual snap::core::Status consume_if_valid(const snap::core::SecretId& id,
                                                              ConsumeResult* out) noexcept = 0;

    // Atomically check the answer and, on match, delete and return the text.
    // An entry without a challenge is consumed regardless of the answer.
    [[nodiscard]] virtual snap::core::Status validate_and_consume(const snap::core::SecretId& id,
                                                                  std::string_view answer,
                                                                  ConsumeResult* out) noexcept = 0;

    // Physically removes expired entries.
    [[nodiscard]] virtual snap::core::Status sweep_expired(u64* removed) noexcept = 0;

    // Live (unexpired) entries.
    [[nodiscard]] virtual snap::core::Status count(u64* out) noexcept = 0;
};

// Shared by the backends: validates the draft and builds the persisted record.
[[nodiscard]] snap::core::Status build_record(const StoreConfig& cfg,
                                              const snap::core::SecretDraft& draft,
                                              const snap::core::SecretId& id,
                                              snap::core::Timestamp now,
                                              snap::core::SecretRecord* out) noexcept;

[[nodiscard]] constexpr snap::core::Status not_found_status() noexcept {
    return snap::core::make_status(snap::core::StatusDomain::Store, snap::core::StatusCode::NotFound);
}

[[nodiscard]] constexpr snap::core::Status mismatch_status() noexcept {
    return snap::core::make_status(snap::core::StatusDomain::Security, snap::core::StatusCode::Mismatch);
}

} // namespace snap::store
