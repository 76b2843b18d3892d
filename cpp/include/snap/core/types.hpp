#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace snap::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Unix time in milliseconds.
    using Timestamp = i64;

    // Durations are plain milliseconds as well.
    using DurationMs = i64;

    inline constexpr DurationMs kMillisPerSecond = 1000;
    inline constexpr DurationMs kMillisPerHour = 60 * 60 * kMillisPerSecond;
    inline constexpr DurationMs kMillisPerDay = 24 * kMillisPerHour;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Hash256&, const Hash256&) noexcept = default;
        friend constexpr auto operator<=>(const Hash256&, const Hash256&) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // 128 random bits; the only credential for an unchallenged secret.
    struct SecretId {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const SecretId&, const SecretId&) noexcept = default;
    };
    static_assert(sizeof(SecretId) == 16);

    inline constexpr u32 kSecretIdHexChars = 32;

    enum class AnswerMatch : u8 {
        Exact = 0,
        IgnoreAsciiCase = 1,
    };

    struct HashKeyHasher {
        [[nodiscard]] std::size_t operator()(const Hash256& h) const noexcept {
            std::size_t v = 0;
            for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
                v = (v << 8) | h.b[i];
            }
            return v;
        }
    };

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<SecretId>);
    static_assert(std::is_standard_layout_v<Hash256>);
    static_assert(std::is_standard_layout_v<SecretId>);

} // namespace snap::core
