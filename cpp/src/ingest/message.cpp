#include "snap/ingest/message.hpp"

#include <cstring>
#include <utility>

namespace snap::ingest {
    using snap::core::i64;
    using snap::core::u64;

    static void put_u16_be(u8* p, u16 v) noexcept {
        p[0] = static_cast<u8>((v >> 8) & 0xffu);
        p[1] = static_cast<u8>((v >> 0) & 0xffu);
    }

    static void put_u32_be(u8* p, u32 v) noexcept {
        p[0] = static_cast<u8>((v >> 24) & 0xffu);
        p[1] = static_cast<u8>((v >> 16) & 0xffu);
        p[2] = static_cast<u8>((v >> 8) & 0xffu);
        p[3] = static_cast<u8>((v >> 0) & 0xffu);
    }

    static void put_u64_be(u8* p, u64 v) noexcept {
        put_u32_be(p, static_cast<u32>(v >> 32));
        put_u32_be(p + 4, static_cast<u32>(v & 0xffffffffu));
    }

    static u16 get_u16_be(const u8* p) noexcept {
        return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
    }

    static u32 get_u32_be(const u8* p) noexcept {
        return (static_cast<u32>(p[0]) << 24) |
               (static_cast<u32>(p[1]) << 16) |
               (static_cast<u32>(p[2]) << 8) |
               (static_cast<u32>(p[3]) << 0);
    }

    static u64 get_u64_be(const u8* p) noexcept {
        return (static_cast<u64>(get_u32_be(p)) << 32) | static_cast<u64>(get_u32_be(p + 4));
    }

    static void append_field(std::vector<u8>& buf, FieldTag tag, const void* data, u32 len) {
        const std::size_t at = buf.size();
        buf.resize(at + kFieldHeaderBytes + len);
        put_u16_be(buf.data() + at, static_cast<u16>(tag));
        put_u32_be(buf.data() + at + 2, len);
        if (len > 0) {
            std::memcpy(buf.data() + at + kFieldHeaderBytes, data, len);
        }
    }

    static void append_string(std::vector<u8>& buf, FieldTag tag, const std::string& s) {
        append_field(buf, tag, s.data(), static_cast<u32>(s.size()));
    }

    snap::core::Status message_encode(const CreateSecretMessage& msg, std::vector<u8>* out) {
        using snap::core::StatusCode;
        using snap::core::StatusDomain;

        if (out == nullptr) {
            return snap::core::make_status(StatusDomain::Ingest, StatusCode::Invalid);
        }

        std::size_t need = kMessageHeaderBytes + kFieldHeaderBytes * 3 +
                           msg.text.size() + msg.base_link.size() + msg.reply_to.size();
        if (msg.prompt) need += kFieldHeaderBytes + msg.prompt->size();
        if (msg.answer) need += kFieldHeaderBytes + msg.answer->size();
        if (msg.expire_in_ms) need += kFieldHeaderBytes + 8;
        if (need > kMaxMessageBytes) {
            return snap::core::make_status(StatusDomain::Ingest, StatusCode::Invalid, static_cast<u32>(need));
        }

        std::vector<u8> buf(kMessageHeaderBytes);
        buf.reserve(need);

        u32 fields = 0;
        append_string(buf, FieldTag::Text, msg.text);
        ++fields;
        if (msg.prompt) {
            append_string(buf, FieldTag::Prompt, *msg.prompt);
            ++fields;
        }
        if (msg.answer) {
            append_string(buf, FieldTag::Answer, *msg.answer);
            ++fields;
        }
        if (msg.expire_in_ms) {
            u8 v[8];
            put_u64_be(v, static_cast<u64>(*msg.expire_in_ms));
            append_field(buf, FieldTag::ExpireInMs, v, sizeof(v));
            ++fields;
        }
        append_string(buf, FieldTag::BaseLink, msg.base_link);
        ++fields;
        append_string(buf, FieldTag::ReplyTo, msg.reply_to);
        ++fields;

        const u16 flags = (msg.prompt || msg.answer) ? kFlagChallenge : 0;

        put_u16_be(buf.data() + 0, kMessageVersion);
        put_u16_be(buf.data() + 2, static_cast<u16>(MessageType::CreateSecret));
        put_u16_be(buf.data() + 4, flags);
        put_u16_be(buf.data() + 6, 0); // reserved
        put_u32_be(buf.data() + 8, static_cast<u32>(buf.size() - kMessageHeaderBytes));
        put_u32_be(buf.data() + 12, fields);

        *out = std::move(buf);
        return snap::core::ok_status();
    }

    MessageParseResult message_read_header(const u8* data, u32 len, MessageHeader* out) noexcept {
        if (out == nullptr) return MessageParseResult::Invalid;
        if (data == nullptr) return MessageParseResult::NeedMore;
        if (len < kMessageHeaderBytes) return MessageParseResult::NeedMore;

        const u16 version = get_u16_be(data + 0);
        const u16 type_u16 = get_u16_be(data + 2);
        const u16 flags = get_u16_be(data + 4);
        const u16 reserved = get_u16_be(data + 6);
        const u32 payload_len = get_u32_be(data + 8);
        const u32 field_count = get_u32_be(data + 12);

        if (version != kMessageVersion) return MessageParseResult::Invalid;
        if (reserved != 0) return MessageParseResult::Invalid;
        if (type_u16 != static_cast<u16>(MessageType::CreateSecret)) return MessageParseResult::Invalid;
        if ((flags & ~kFlagChallenge) != 0) return MessageParseResult::Invalid;
        if (payload_len > kMaxMessageBytes - kMessageHeaderBytes) return MessageParseResult::Invalid;

        MessageHeader h{};
        h.version = version;
        h.type = static_cast<MessageType>(type_u16);
        h.flags = flags;
        h.payload_len = payload_len;
        h.field_count = field_count;

        *out = h;
        return MessageParseResult::Ok;
    }

    MessageParseResult message_decode(const u8* data, u32 len, CreateSecretMessage* out) {
        if (out == nullptr) return MessageParseResult::Invalid;

        MessageHeader h{};
        const MessageParseResult hr = message_read_header(data, len, &h);
        if (hr != MessageParseResult::Ok) return hr;

        if (len - kMessageHeaderBytes < h.payload_len) return MessageParseResult::NeedMore;
        if (len - kMessageHeaderBytes > h.payload_len) return MessageParseResult::Invalid;

        CreateSecretMessage msg;
        u32 seen = 0; // bit per FieldTag
        const u8* p = data + kMessageHeaderBytes;
        u32 remaining = h.payload_len;

        for (u32 i = 0; i < h.field_count; ++i) {
            // The whole payload is present, so an overrun is malformed, not truncated.
            if (remaining < kFieldHeaderBytes) return MessageParseResult::Invalid;
            const u16 tag = get_u16_be(p);
            const u32 flen = get_u32_be(p + 2);
            p += kFieldHeaderBytes;
            remaining -= kFieldHeaderBytes;
            if (flen > remaining) return MessageParseResult::Invalid;

            if (tag < static_cast<u16>(FieldTag::Text) || tag > static_cast<u16>(FieldTag::ReplyTo)) {
                return MessageParseResult::Invalid;
            }
            const u32 bit = 1u << tag;
            if (seen & bit) return MessageParseResult::Invalid;
            seen |= bit;

            const std::string value(reinterpret_cast<const char*>(p), flen);
            switch (static_cast<FieldTag>(tag)) {
            case FieldTag::Text:
                msg.text = value;
                break;
            case FieldTag::Prompt:
                msg.prompt = value;
                break;
            case FieldTag::Answer:
                msg.answer = value;
                break;
            case FieldTag::ExpireInMs:
                if (flen != 8) return MessageParseResult::Invalid;
                msg.expire_in_ms = static_cast<i64>(get_u64_be(p));
                break;
            case FieldTag::BaseLink:
                msg.base_link = value;
                break;
            case FieldTag::ReplyTo:
                msg.reply_to = value;
                break;
            }

            p += flen;
            remaining -= flen;
        }

        if (remaining != 0) return MessageParseResult::Invalid;
        if ((seen & (1u << static_cast<u16>(FieldTag::Text))) == 0) return MessageParseResult::Invalid;

        const bool challenge = msg.prompt.has_value() || msg.answer.has_value();
        if (challenge != ((h.flags & kFlagChallenge) != 0)) return MessageParseResult::Invalid;

        *out = std::move(msg);
        return MessageParseResult::Ok;
    }
} // namespace snap::ingest
