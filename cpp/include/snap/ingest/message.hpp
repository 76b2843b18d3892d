#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "snap/core/errors.hpp"
#include "snap/core/types.hpp"

namespace snap::ingest {
    using u8 = snap::core::u8;
    using u16 = snap::core::u16;
    using u32 = snap::core::u32;

    // Asynchronous create request as it travels through the queue.
    struct CreateSecretMessage {
        std::string text;
        std::optional<std::string> prompt;
        std::optional<std::string> answer;
        std::optional<snap::core::DurationMs> expire_in_ms;
        std::string base_link; // reply link prefix; the id is appended
        std::string reply_to;  // opaque token handed back to the ReplySink
    };

    enum class MessageType : u16 {
        CreateSecret = 1,
    };

    enum class FieldTag : u16 {
        Text = 1,
        Prompt = 2,
        Answer = 3,
        ExpireInMs = 4,
        BaseLink = 5,
        ReplyTo = 6,
    };

    inline constexpr u16 kMessageVersion = 1;
    inline constexpr u16 kFlagChallenge = 0x0001;

    // Header layout (big-endian):
    // 0..1 version(u16), 2..3 type(u16), 4..5 flags(u16), 6..7 reserved(u16=0),
    // 8..11 payload_len(u32), 12..15 field_count(u32).
    // Each field: tag(u16), len(u32), len bytes. ExpireInMs carries an i64.
    inline constexpr u32 kMessageHeaderBytes = 16;
    inline constexpr u32 kFieldHeaderBytes = 6;
    inline constexpr u32 kMaxMessageBytes = 64 * 1024;

    struct MessageHeader {
        u16 version{kMessageVersion};
        MessageType type{MessageType::CreateSecret};
        u16 flags{0};
        u32 payload_len{0};
        u32 field_count{0};
    };

    enum class MessageParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    // Invalid (Ingest) when the encoded form would exceed kMaxMessageBytes.
    [[nodiscard]] snap::core::Status message_encode(const CreateSecretMessage& msg, std::vector<u8>* out);

    [[nodiscard]] MessageParseResult message_read_header(const u8* data, u32 len, MessageHeader* out) noexcept;

    // Rejects unknown versions, types and tags, duplicate fields, trailing
    // bytes and anything larger than kMaxMessageBytes. NeedMore means truncated.
    [[nodiscard]] MessageParseResult message_decode(const u8* data, u32 len, CreateSecretMessage* out);

    static_assert(std::is_trivially_copyable_v<MessageHeader>);
    static_assert(std::is_standard_layout_v<MessageHeader>);

} // namespace snap::ingest
