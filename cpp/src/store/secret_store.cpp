#include "snap/store/secret_store.hpp"
#include "snap/security/challenge.hpp"
#include "snap/security/id.hpp"

#include <utility>

namespace snap::store {

using namespace snap::core;

Status build_record(const StoreConfig& cfg,
                    const SecretDraft& draft,
                    const SecretId& id,
                    Timestamp now,
                    SecretRecord* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    Status s = secret_validate(draft, cfg.limits);
    if (!is_ok(s)) {
        return s;
    }

    SecretRecord rec;
    rec.key = security::secret_id_lookup_key(id);
    rec.text = draft.text;
    rec.prompt = draft.prompt;
    rec.answer_match = draft.answer_match;
    rec.created_at = now;
    rec.expires_at = resolve_expiry(now, draft.expire_in, cfg.max_ttl_ms);
    rec.state = SecretState::Sealed;
    rec.failed_attempts = 0;

    if (draft.answer.has_value()) {
        Hash256 digest{};
        s = security::challenge_digest(id, *draft.answer, draft.answer_match, &digest);
        if (!is_ok(s)) {
            return s;
        }
        rec.answer_digest = digest;
    }

    *out = std::move(rec);
    return ok_status();
}

} // namespace snap::store
