#include "snap/core/secret.hpp"

#include <limits>

namespace snap::core {
    namespace {
        [[nodiscard]] Status invalid(InvalidReason r) noexcept {
            return make_status(StatusDomain::Core, StatusCode::Invalid, static_cast<u32>(r));
        }

        // ttl is non-negative; a sum past the largest timestamp pins to it.
        [[nodiscard]] Timestamp saturating_expiry(Timestamp created_at, DurationMs ttl) noexcept {
            constexpr Timestamp kLatest = std::numeric_limits<Timestamp>::max();
            if (created_at > 0 && ttl > kLatest - created_at) {
                return kLatest;
            }
            return created_at + ttl;
        }

        [[nodiscard]] Status check_field(std::string_view value,
            u32 max_chars,
            InvalidReason empty,
            InvalidReason too_long,
            InvalidReason encoding) noexcept {
            if (value.empty()) {
                return invalid(empty);
            }
            u32 chars = 0;
            if (!text_char_count(value, &chars)) {
                return invalid(encoding);
            }
            if (chars > max_chars) {
                return invalid(too_long);
            }
            return ok_status();
        }
    } // namespace

    const char* invalid_reason_name(InvalidReason r) noexcept {
        switch (r) {
            case InvalidReason::None: return "none";
            case InvalidReason::EmptyText: return "text is empty";
            case InvalidReason::TextTooLong: return "text is too long";
            case InvalidReason::TextEncoding: return "text is not valid UTF-8";
            case InvalidReason::PartialChallenge: return "prompt and answer must be given together";
            case InvalidReason::EmptyPrompt: return "prompt is empty";
            case InvalidReason::PromptTooLong: return "prompt is too long";
            case InvalidReason::PromptEncoding: return "prompt is not valid UTF-8";
            case InvalidReason::EmptyAnswer: return "answer is empty";
            case InvalidReason::AnswerTooLong: return "answer is too long";
            case InvalidReason::AnswerEncoding: return "answer is not valid UTF-8";
            case InvalidReason::NegativeTtl: return "expiry must not be negative";
        }
        return "invalid";
    }

    bool text_char_count(std::string_view utf8, u32* out) noexcept {
        if (out == nullptr) {
            return false;
        }

        u32 count = 0;
        std::size_t i = 0;
        const std::size_t n = utf8.size();
        while (i < n) {
            const u8 lead = static_cast<u8>(utf8[i]);
            u32 cp = 0;
            std::size_t extra = 0;
            if (lead < 0x80u) {
                cp = lead;
            } else if ((lead & 0xe0u) == 0xc0u) {
                cp = lead & 0x1fu;
                extra = 1;
            } else if ((lead & 0xf0u) == 0xe0u) {
                cp = lead & 0x0fu;
                extra = 2;
            } else if ((lead & 0xf8u) == 0xf0u) {
                cp = lead & 0x07u;
                extra = 3;
            } else {
                return false;
            }

            if (extra > n - i - 1) {
                return false; // truncated sequence
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                const u8 c = static_cast<u8>(utf8[i + k]);
                if ((c & 0xc0u) != 0x80u) {
                    return false;
                }
                cp = (cp << 6) | (c & 0x3fu);
            }

            // Overlong forms, surrogates and out-of-range values.
            if ((extra == 1 && cp < 0x80u) || (extra == 2 && cp < 0x800u) || (extra == 3 && cp < 0x10000u)) {
                return false;
            }
            if ((cp >= 0xd800u && cp <= 0xdfffu) || cp > 0x10ffffu) {
                return false;
            }

            i += extra + 1;
            ++count;
        }

        *out = count;
        return true;
    }

    Status secret_validate(const SecretDraft& draft, const Limits& limits) noexcept {
        Status s = check_field(draft.text,
            limits.max_text_chars,
            InvalidReason::EmptyText,
            InvalidReason::TextTooLong,
            InvalidReason::TextEncoding);
        if (!is_ok(s)) {
            return s;
        }

        if (draft.prompt.has_value() != draft.answer.has_value()) {
            return invalid(InvalidReason::PartialChallenge);
        }

        if (draft.prompt.has_value()) {
            s = check_field(*draft.prompt,
                limits.max_prompt_chars,
                InvalidReason::EmptyPrompt,
                InvalidReason::PromptTooLong,
                InvalidReason::PromptEncoding);
            if (!is_ok(s)) {
                return s;
            }
            s = check_field(*draft.answer,
                limits.max_answer_chars,
                InvalidReason::EmptyAnswer,
                InvalidReason::AnswerTooLong,
                InvalidReason::AnswerEncoding);
            if (!is_ok(s)) {
                return s;
            }
        }

        if (draft.expire_in.has_value() && *draft.expire_in < 0) {
            return invalid(InvalidReason::NegativeTtl);
        }

        return ok_status();
    }

    std::optional<Timestamp> resolve_expiry(Timestamp created_at,
        std::optional<DurationMs> expire_in,
        DurationMs max_ttl) noexcept {
        if (!expire_in.has_value()) {
            if (max_ttl <= 0) {
                return std::nullopt;
            }
            return saturating_expiry(created_at, max_ttl);
        }

        DurationMs ttl = *expire_in < 0 ? 0 : *expire_in;
        if (max_ttl > 0 && ttl > max_ttl) {
            ttl = max_ttl;
        }
        return saturating_expiry(created_at, ttl);
    }

} // namespace snap::core
