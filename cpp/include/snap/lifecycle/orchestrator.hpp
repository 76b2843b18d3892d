#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "snap/core/errors.hpp"
#include "snap/core/secret.hpp"
#include "snap/core/types.hpp"
#include "snap/store/secret_store.hpp"

namespace snap::lifecycle {

    using u8 = snap::core::u8;

    struct LifecycleConfig {
        snap::core::Limits limits{};
        snap::core::AnswerMatch answer_match{snap::core::AnswerMatch::Exact};
    };

    struct SubmitRequest {
        std::string text;
        std::optional<std::string> prompt;
        std::optional<std::string> answer;
        std::optional<snap::core::DurationMs> expire_in;
    };

    enum class AccessKind : u8 {
        Revealed = 0,
        ChallengeRequired = 1,
    };

    struct AccessResult {
        AccessKind kind{AccessKind::Revealed};
        std::string text;
        std::string prompt;
    };

    // Public failure taxonomy. NotFound deliberately covers unknown, consumed
    // and expired alike.
    enum class LifecycleError : u8 {
        None = 0,
        ValidationFailed,
        NotFound,
        ChallengeFailed,
        StorageFailure,
    };

    struct LifecycleResult {
        LifecycleError error{LifecycleError::None};
        snap::core::Status cause{}; // underlying status, for diagnostics only

        [[nodiscard]] bool ok() const noexcept { return error == LifecycleError::None; }
    };

    [[nodiscard]] const char* lifecycle_error_name(LifecycleError e) noexcept;

    // 0 for None; success codes belong to the transport.
    [[nodiscard]] int lifecycle_error_http_status(LifecycleError e) noexcept;

    [[nodiscard]] LifecycleError lifecycle_error_from_status(snap::core::Status s) noexcept;

    // Reply link handed back to asynchronous producers.
    [[nodiscard]] std::string link_for(std::string_view base, const snap::core::SecretId& id);

    // Stateless apart from its references; safe to share between threads.
    class Orchestrator {
    public:
        explicit Orchestrator(snap::store::SecretStore& store, LifecycleConfig cfg = {}) noexcept;

        [[nodiscard]] LifecycleResult submit(const SubmitRequest& request, snap::core::SecretId* out_id) noexcept;

        [[nodiscard]] LifecycleResult access(std::string_view id_text,
                                             std::optional<std::string_view> answer,
                                             AccessResult* out) noexcept;

        [[nodiscard]] const LifecycleConfig& config() const noexcept { return cfg_; }

    private:
        snap::store::SecretStore& store_;
        LifecycleConfig cfg_;
    };

} // namespace snap::lifecycle
