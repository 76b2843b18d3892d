#include "snap/security/challenge.hpp"

#include <cstddef>

#include <blake3.h>
#include <sodium.h>

namespace snap::security {
    namespace {
        void put_u32_be(snap::core::u8 out[4], snap::core::u32 v) noexcept {
            out[0] = static_cast<snap::core::u8>((v >> 24) & 0xffu);
            out[1] = static_cast<snap::core::u8>((v >> 16) & 0xffu);
            out[2] = static_cast<snap::core::u8>((v >> 8) & 0xffu);
            out[3] = static_cast<snap::core::u8>((v >> 0) & 0xffu);
        }

        [[nodiscard]] char fold_ascii(char c) noexcept {
            if (c >= 'A' && c <= 'Z') {
                return static_cast<char>(c - 'A' + 'a');
            }
            return c;
        }
    } // namespace

    snap::core::Status challenge_digest(const snap::core::SecretId& id,
        std::string_view answer,
        snap::core::AnswerMatch match,
        snap::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return snap::core::make_status(snap::core::StatusDomain::Security, snap::core::StatusCode::Invalid);
        }

        blake3_hasher h;
        blake3_hasher_init_derive_key(&h, "snap.challenge.answer.v1");
        blake3_hasher_update(&h, id.b.data(), id.b.size());

        snap::core::u8 buf4[4];
        put_u32_be(buf4, static_cast<snap::core::u32>(match));
        blake3_hasher_update(&h, buf4, sizeof(buf4));

        put_u32_be(buf4, static_cast<snap::core::u32>(answer.size()));
        blake3_hasher_update(&h, buf4, sizeof(buf4));

        if (match == snap::core::AnswerMatch::IgnoreAsciiCase) {
            char chunk[64];
            std::size_t pos = 0;
            while (pos < answer.size()) {
                std::size_t n = 0;
                while (n < sizeof(chunk) && pos < answer.size()) {
                    chunk[n++] = fold_ascii(answer[pos++]);
                }
                blake3_hasher_update(&h, chunk, n);
            }
            sodium_memzero(chunk, sizeof(chunk));
        } else if (!answer.empty()) {
            blake3_hasher_update(&h, answer.data(), answer.size());
        }

        blake3_hasher_finalize(&h, out->b.data(), out->b.size());
        return snap::core::ok_status();
    }

    bool challenge_matches(const snap::core::Hash256& stored,
        const snap::core::SecretId& id,
        std::string_view supplied,
        snap::core::AnswerMatch match) noexcept {
        snap::core::Hash256 computed{};
        if (!snap::core::is_ok(challenge_digest(id, supplied, match, &computed))) {
            return false;
        }
        return sodium_memcmp(computed.b.data(), stored.b.data(), stored.b.size()) == 0;
    }

} // namespace snap::security
