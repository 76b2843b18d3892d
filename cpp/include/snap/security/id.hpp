#pragma once

#include <array>
#include <string>
#include <string_view>

#include "snap/core/errors.hpp"
#include "snap/core/types.hpp"

namespace snap::security {

    // libsodium must be initialised before ids or receipts are generated.
    [[nodiscard]] snap::core::Status ensure_sodium() noexcept;

    [[nodiscard]] snap::core::Status secret_id_generate(snap::core::SecretId* out) noexcept;

    [[nodiscard]] std::string secret_id_to_hex(const snap::core::SecretId& id);

    // Accepts exactly 32 hex digits, either case.
    [[nodiscard]] bool secret_id_from_hex(std::string_view hex, snap::core::SecretId* out) noexcept;

    // Storage key; BLAKE3 of the id under its own derivation context.
    [[nodiscard]] snap::core::Hash256 secret_id_lookup_key(const snap::core::SecretId& id) noexcept;

    inline constexpr snap::core::u32 kLogTagChars = 8;
    using SecretIdLogTag = std::array<char, kLogTagChars + 1>;

    // First 8 hex digits, NUL-terminated; enough to correlate log lines,
    // useless as a credential.
    [[nodiscard]] SecretIdLogTag secret_id_log_tag(const snap::core::SecretId& id) noexcept;

    [[nodiscard]] snap::core::Status random_u64(snap::core::u64* out) noexcept;

} // namespace snap::security
