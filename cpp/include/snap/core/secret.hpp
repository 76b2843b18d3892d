#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "snap/core/errors.hpp"
#include "snap/core/types.hpp"

namespace snap::core {

    // Size bounds, counted in Unicode code points.
    struct Limits {
        u32 max_text_chars{10'000};
        u32 max_prompt_chars{1'000};
        u32 max_answer_chars{1'000};
    };

    // Carried in Status::aux when secret_validate() rejects a draft.
    enum class InvalidReason : u32 {
        None = 0,
        EmptyText,
        TextTooLong,
        TextEncoding,
        PartialChallenge,
        EmptyPrompt,
        PromptTooLong,
        PromptEncoding,
        EmptyAnswer,
        AnswerTooLong,
        AnswerEncoding,
        NegativeTtl,
    };

    [[nodiscard]] const char* invalid_reason_name(InvalidReason r) noexcept;

    // Caller-supplied shape of a new secret, before the store assigns id and timestamps.
    struct SecretDraft {
        std::string text;
        std::optional<std::string> prompt;
        std::optional<std::string> answer;
        std::optional<DurationMs> expire_in;
        AnswerMatch answer_match{AnswerMatch::Exact};
    };

    // Bookkeeping only: stores record when a prompt has been shown, but
    // validate_and_consume accepts an answer in either state.
    enum class SecretState : u8 {
        Sealed = 0,
        PendingAnswer = 1, // prompt shown at least once, not consumed
    };

    // Persisted form. The raw id and the clear answer never reach storage.
    struct SecretRecord {
        Hash256 key{};
        std::string text;
        std::optional<std::string> prompt;
        std::optional<Hash256> answer_digest;
        AnswerMatch answer_match{AnswerMatch::Exact};
        Timestamp created_at{0};
        std::optional<Timestamp> expires_at;
        SecretState state{SecretState::Sealed};
        u32 failed_attempts{0};

        [[nodiscard]] bool has_challenge() const noexcept { return answer_digest.has_value(); }
    };

    // Counts code points; false if the input is not well-formed UTF-8.
    [[nodiscard]] bool text_char_count(std::string_view utf8, u32* out) noexcept;

    [[nodiscard]] Status secret_validate(const SecretDraft& draft, const Limits& limits) noexcept;

    // max_ttl <= 0 disables the system maximum.
    [[nodiscard]] std::optional<Timestamp> resolve_expiry(Timestamp created_at,
        std::optional<DurationMs> expire_in,
        DurationMs max_ttl) noexcept;

    [[nodiscard]] constexpr bool is_expired(std::optional<Timestamp> expires_at, Timestamp now) noexcept {
        return expires_at.has_value() && now >= *expires_at;
    }

} // namespace snap::core
