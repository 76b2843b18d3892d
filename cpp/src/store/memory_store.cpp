#include "snap/store/memory_store.hpp"
#include "snap/core/log.hpp"
#include "snap/security/challenge.hpp"
#include "snap/security/id.hpp"

#include <utility>

namespace snap::store {

using namespace snap::core;

MemorySecretStore::MemorySecretStore(StoreConfig cfg, const Clock& clock) noexcept
    : cfg_(std::move(cfg)), clock_(clock) {}

MemorySecretStore::Map::iterator MemorySecretStore::find_live(const Hash256& key, Timestamp now) noexcept {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return it;
    }
    if (is_expired(it->second.expires_at, now)) {
        entries_.erase(it);
        return entries_.end();
    }
    return it;
}

Status MemorySecretStore::create(const SecretDraft& draft, SecretId* out_id) noexcept {
    if (!out_id) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    SecretId id{};
    Status s = security::secret_id_generate(&id);
    if (!is_ok(s)) {
        return s;
    }

    SecretRecord rec;
    s = build_record(cfg_, draft, id, clock_.now_ms(), &rec);
    if (!is_ok(s)) {
        return s;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto [it, inserted] = entries_.emplace(rec.key, std::move(rec));
        (void)it;
        if (!inserted) {
            // 128 random bits colliding means the RNG is broken.
            LogRegistry::store()->critical("[MemorySecretStore] Identifier collision on create");
            return make_status(StatusDomain::Store, StatusCode::Conflict);
        }
    }

    *out_id = id;
    return ok_status();
}

Status MemorySecretStore::consume_if_valid(const SecretId& id, ConsumeResult* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    const Hash256 key = security::secret_id_lookup_key(id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_live(key, clock_.now_ms());
    if (it == entries_.end()) {
        return not_found_status();
    }

    SecretRecord& rec = it->second;
    if (rec.has_challenge()) {
        rec.state = SecretState::PendingAnswer;
        out->outcome = ConsumeOutcome::ChallengeRequired;
        out->prompt = rec.prompt.value_or(std::string());
        out->text.clear();
        return ok_status();
    }

    out->outcome = ConsumeOutcome::Revealed;
    out->text = std::move(rec.text);
    out->prompt.clear();
    entries_.erase(it);
    return ok_status();
}

Status MemorySecretStore::validate_and_consume(const SecretId& id, std::string_view answer, ConsumeResult* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    const Hash256 key = security::secret_id_lookup_key(id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_live(key, clock_.now_ms());
    if (it == entries_.end()) {
        return not_found_status();
    }

    SecretRecord& rec = it->second;
    if (rec.has_challenge() &&
        !security::challenge_matches(*rec.answer_digest, id, answer, rec.answer_match)) {
        rec.failed_attempts++;
        if (cfg_.max_answer_attempts > 0 && rec.failed_attempts >= cfg_.max_answer_attempts) {
            LogRegistry::store()->info("[MemorySecretStore] Secret destroyed after {} failed answers",
                                       rec.failed_attempts);
            entries_.erase(it);
        }
        return mismatch_status();
    }

    out->outcome = ConsumeOutcome::Revealed;
    out->text = std::move(rec.text);
    out->prompt.clear();
    entries_.erase(it);
    return ok_status();
}

Status MemorySecretStore::sweep_expired(u64* removed) noexcept {
    if (!removed) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    const Timestamp now = clock_.now_ms();
    u64 n = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(it->second.expires_at, now)) {
            it = entries_.erase(it);
            ++n;
        } else {
            ++it;
        }
    }

    *removed = n;
    return ok_status();
}

Status MemorySecretStore::count(u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    const Timestamp now = clock_.now_ms();
    u64 n = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, rec] : entries_) {
        (void)key;
        if (!is_expired(rec.expires_at, now)) {
            ++n;
        }
    }

    *out = n;
    return ok_status();
}

} // namespace snap::store
