#include "snap/lifecycle/orchestrator.hpp"
#include "snap/core/log.hpp"
#include "snap/security/id.hpp"

#include <utility>

namespace snap::lifecycle {

using namespace snap::core;
using snap::store::ConsumeOutcome;
using snap::store::ConsumeResult;

namespace {
    [[nodiscard]] LifecycleResult fail(LifecycleError e, Status cause) noexcept {
        return LifecycleResult{e, cause};
    }
}

const char* lifecycle_error_name(LifecycleError e) noexcept {
    switch (e) {
        case LifecycleError::None: return "None";
        case LifecycleError::ValidationFailed: return "ValidationFailed";
        case LifecycleError::NotFound: return "NotFound";
        case LifecycleError::ChallengeFailed: return "ChallengeFailed";
        case LifecycleError::StorageFailure: return "StorageFailure";
    }
    return "Unknown";
}

int lifecycle_error_http_status(LifecycleError e) noexcept {
    switch (e) {
        case LifecycleError::None: return 0;
        case LifecycleError::ValidationFailed: return 400;
        case LifecycleError::NotFound: return 404;
        case LifecycleError::ChallengeFailed: return 403;
        case LifecycleError::StorageFailure: return 503;
    }
    return 500;
}

LifecycleError lifecycle_error_from_status(Status s) noexcept {
    if (is_ok(s)) {
        return LifecycleError::None;
    }
    switch (s.code) {
        case StatusCode::Invalid:
            if (s.domain == StatusDomain::Core || s.domain == StatusDomain::Security) {
                return LifecycleError::ValidationFailed;
            }
            return LifecycleError::StorageFailure;
        case StatusCode::NotFound:
            return LifecycleError::NotFound;
        case StatusCode::Mismatch:
            return LifecycleError::ChallengeFailed;
        default:
            return LifecycleError::StorageFailure;
    }
}

std::string link_for(std::string_view base, const SecretId& id) {
    std::string link(base);
    link += security::secret_id_to_hex(id);
    return link;
}

Orchestrator::Orchestrator(snap::store::SecretStore& store, LifecycleConfig cfg) noexcept
    : store_(store), cfg_(cfg) {}

LifecycleResult Orchestrator::submit(const SubmitRequest& request, SecretId* out_id) noexcept {
    if (!out_id) {
        return fail(LifecycleError::StorageFailure, make_status(StatusDomain::Lifecycle, StatusCode::Invalid));
    }

    SecretDraft draft;
    draft.text = request.text;
    draft.prompt = request.prompt;
    draft.answer = request.answer;
    draft.expire_in = request.expire_in;
    draft.answer_match = cfg_.answer_match;

    Status s = secret_validate(draft, cfg_.limits);
    if (!is_ok(s)) {
        LogRegistry::lifecycle()->info("submit rejected: {}",
                                       invalid_reason_name(static_cast<InvalidReason>(s.aux)));
        return fail(LifecycleError::ValidationFailed, s);
    }

    SecretId id{};
    s = store_.create(draft, &id);
    if (!is_ok(s)) {
        const LifecycleError e = lifecycle_error_from_status(s);
        if (e == LifecycleError::ValidationFailed) {
            LogRegistry::lifecycle()->info("submit rejected by store: {}",
                                           invalid_reason_name(static_cast<InvalidReason>(s.aux)));
        } else {
            LogRegistry::lifecycle()->error("submit failed: {}/{} ({})",
                                            status_domain_name(s.domain), status_code_name(s.code), s.aux);
        }
        return fail(e, s);
    }

    // ttl=-1 means the store's default applies.
    LogRegistry::lifecycle()->info("submit id={} challenge={} ttl={}",
                                   security::secret_id_log_tag(id).data(),
                                   draft.answer.has_value(),
                                   draft.expire_in.value_or(-1));
    *out_id = id;
    return LifecycleResult{};
}

LifecycleResult Orchestrator::access(std::string_view id_text,
                                     std::optional<std::string_view> answer,
                                     AccessResult* out) noexcept {
    if (!out) {
        return fail(LifecycleError::StorageFailure, make_status(StatusDomain::Lifecycle, StatusCode::Invalid));
    }

    SecretId id{};
    if (!security::secret_id_from_hex(id_text, &id)) {
        // Indistinguishable from an unknown id.
        LogRegistry::lifecycle()->info("access malformed id -> NotFound");
        return fail(LifecycleError::NotFound, make_status(StatusDomain::Lifecycle, StatusCode::NotFound));
    }
    const security::SecretIdLogTag tag = security::secret_id_log_tag(id);

    ConsumeResult r;
    const Status s = answer.has_value()
        ? store_.validate_and_consume(id, *answer, &r)
        : store_.consume_if_valid(id, &r);

    if (!is_ok(s)) {
        const LifecycleError e = lifecycle_error_from_status(s);
        if (e == LifecycleError::StorageFailure) {
            LogRegistry::lifecycle()->error("access id={} failed: {}/{} ({})", tag.data(),
                                            status_domain_name(s.domain), status_code_name(s.code), s.aux);
        } else {
            LogRegistry::lifecycle()->info("access id={} -> {}", tag.data(), lifecycle_error_name(e));
        }
        return fail(e, s);
    }

    if (r.outcome == ConsumeOutcome::ChallengeRequired) {
        LogRegistry::lifecycle()->info("access id={} -> challenge required", tag.data());
        out->kind = AccessKind::ChallengeRequired;
        out->prompt = std::move(r.prompt);
        out->text.clear();
        return LifecycleResult{};
    }

    LogRegistry::lifecycle()->info("access id={} -> revealed", tag.data());
    out->kind = AccessKind::Revealed;
    out->text = std::move(r.text);
    out->prompt.clear();
    return LifecycleResult{};
}

} // namespace snap::lifecycle
