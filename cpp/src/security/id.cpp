#include "snap/security/id.hpp"

#include <cstddef>

#include <blake3.h>
#include <sodium.h>

namespace snap::security {
    namespace {
        constexpr char kHex[] = "0123456789abcdef";

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    snap::core::Status ensure_sodium() noexcept {
        if (sodium_init() < 0) {
            return snap::core::make_status(snap::core::StatusDomain::External, snap::core::StatusCode::Unavailable);
        }
        return snap::core::ok_status();
    }

    snap::core::Status secret_id_generate(snap::core::SecretId* out) noexcept {
        if (out == nullptr) {
            return snap::core::make_status(snap::core::StatusDomain::Security, snap::core::StatusCode::Invalid);
        }
        const snap::core::Status init = ensure_sodium();
        if (!snap::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out->b.data(), out->b.size());
        return snap::core::ok_status();
    }

    std::string secret_id_to_hex(const snap::core::SecretId& id) {
        std::string out;
        out.reserve(snap::core::kSecretIdHexChars);
        for (const snap::core::u8 byte : id.b) {
            out.push_back(kHex[(byte >> 4) & 0xf]);
            out.push_back(kHex[byte & 0xf]);
        }
        return out;
    }

    bool secret_id_from_hex(std::string_view hex, snap::core::SecretId* out) noexcept {
        if (out == nullptr || hex.size() != snap::core::kSecretIdHexChars) {
            return false;
        }
        snap::core::SecretId id{};
        for (std::size_t i = 0; i < id.b.size(); ++i) {
            const int hi = hex_value(hex[i * 2]);
            const int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            id.b[i] = static_cast<snap::core::u8>((hi << 4) | lo);
        }
        *out = id;
        return true;
    }

    snap::core::Hash256 secret_id_lookup_key(const snap::core::SecretId& id) noexcept {
        blake3_hasher h;
        blake3_hasher_init_derive_key(&h, "snap.secret.lookup-key.v1");
        blake3_hasher_update(&h, id.b.data(), id.b.size());

        snap::core::Hash256 key{};
        blake3_hasher_finalize(&h, key.b.data(), key.b.size());
        return key;
    }

    SecretIdLogTag secret_id_log_tag(const snap::core::SecretId& id) noexcept {
        SecretIdLogTag tag{};
        for (snap::core::u32 i = 0; i < kLogTagChars / 2; ++i) {
            tag[i * 2] = kHex[(id.b[i] >> 4) & 0xf];
            tag[i * 2 + 1] = kHex[id.b[i] & 0xf];
        }
        return tag;
    }

    snap::core::Status random_u64(snap::core::u64* out) noexcept {
        if (out == nullptr) {
            return snap::core::make_status(snap::core::StatusDomain::Security, snap::core::StatusCode::Invalid);
        }
        const snap::core::Status init = ensure_sodium();
        if (!snap::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out, sizeof(*out));
        return snap::core::ok_status();
    }

} // namespace snap::security
