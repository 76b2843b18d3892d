#include "snap/ingest/adapter.hpp"
#include "snap/core/log.hpp"
#include "snap/security/id.hpp"

#include <utility>
#include <vector>

namespace snap::ingest {

using namespace snap::core;
using snap::lifecycle::LifecycleError;
using snap::lifecycle::LifecycleResult;
using snap::lifecycle::SubmitRequest;

namespace {
    [[nodiscard]] std::string rejection_text(const LifecycleResult& r) {
        std::string text = snap::lifecycle::lifecycle_error_name(r.error);
        if (r.error == LifecycleError::ValidationFailed && r.cause.domain == StatusDomain::Core) {
            text += ": ";
            text += invalid_reason_name(static_cast<InvalidReason>(r.cause.aux));
        }
        return text;
    }
}

IngestionAdapter::IngestionAdapter(MessageQueue& queue,
                                   snap::lifecycle::Orchestrator& orchestrator,
                                   ReplySink& replies,
                                   IngestConfig cfg) noexcept
    : queue_(queue), orchestrator_(orchestrator), replies_(replies), cfg_(std::move(cfg)) {}

Status IngestionAdapter::enqueue(const CreateSecretMessage& msg) noexcept {
    std::vector<u8> body;
    Status s = message_encode(msg, &body);
    if (!is_ok(s)) {
        LogRegistry::ingest()->info("[IngestionAdapter] Refused to enqueue a {} byte request", s.aux);
        return s;
    }
    s = queue_.enqueue(body);
    if (!is_ok(s)) {
        LogRegistry::ingest()->error("[IngestionAdapter] Enqueue failed: {}/{} ({})",
                                     status_domain_name(s.domain), status_code_name(s.code), s.aux);
    }
    return s;
}

Status IngestionAdapter::poison(const QueueMessage& msg, const char* why) noexcept {
    LogRegistry::ingest()->warn("[IngestionAdapter] Dead-lettering message {}: {}", msg.id, why);
    const Status s = queue_.dead_letter(msg);
    if (is_ok(s)) {
        dead_lettered_.fetch_add(1);
    }
    return s;
}

Status IngestionAdapter::process_one(bool* processed) noexcept {
    if (!processed) {
        return make_status(StatusDomain::Ingest, StatusCode::Invalid);
    }
    *processed = false;

    QueueMessage msg;
    Status s = queue_.receive(cfg_.visibility_timeout_ms, &msg);
    if (s.code == StatusCode::NotFound && s.domain == StatusDomain::Ingest) {
        return ok_status();
    }
    if (!is_ok(s)) {
        return s;
    }
    *processed = true;

    if (cfg_.max_dequeue_count > 0 && msg.dequeue_count > cfg_.max_dequeue_count) {
        return poison(msg, "delivery limit exceeded");
    }

    CreateSecretMessage request;
    if (message_decode(msg.body.data(), static_cast<u32>(msg.body.size()), &request) != MessageParseResult::Ok) {
        return poison(msg, "undecodable body");
    }

    SubmitRequest submit;
    submit.text = std::move(request.text);
    submit.prompt = std::move(request.prompt);
    submit.answer = std::move(request.answer);
    submit.expire_in = request.expire_in_ms;

    SecretId id{};
    const LifecycleResult r = orchestrator_.submit(submit, &id);

    Reply reply;
    reply.reply_to = request.reply_to;
    reply.error = r.error;

    if (r.ok()) {
        reply.link = snap::lifecycle::link_for(request.base_link, id);
    } else if (r.error == LifecycleError::ValidationFailed) {
        reply.message = rejection_text(r);
    } else {
        // Transient; the visibility timeout brings it back.
        retried_.fetch_add(1);
        LogRegistry::ingest()->warn("[IngestionAdapter] Message {} left for redelivery (attempt {})",
                                    msg.id, msg.dequeue_count);
        return r.cause;
    }

    s = replies_.deliver(reply);
    if (!is_ok(s)) {
        retried_.fetch_add(1);
        LogRegistry::ingest()->warn("[IngestionAdapter] Reply for message {} failed; left for redelivery", msg.id);
        return s;
    }

    s = queue_.ack(msg);
    if (!is_ok(s)) {
        LogRegistry::ingest()->warn("[IngestionAdapter] Ack for message {} failed: {}",
                                    msg.id, status_code_name(s.code));
        return s;
    }

    if (r.ok()) {
        created_.fetch_add(1);
        LogRegistry::ingest()->debug("[IngestionAdapter] Message {} created id={}", msg.id,
                                     security::secret_id_log_tag(id).data());
    } else {
        rejected_.fetch_add(1);
    }
    return ok_status();
}

IngestStats IngestionAdapter::stats() const noexcept {
    IngestStats st;
    st.created = created_.load();
    st.rejected = rejected_.load();
    st.dead_lettered = dead_lettered_.load();
    st.retried = retried_.load();
    return st;
}

} // namespace snap::ingest
