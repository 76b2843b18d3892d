#pragma once

#include <string_view>

#include "snap/core/errors.hpp"
#include "snap/core/types.hpp"

namespace snap::security {

    // Salted digest of a challenge answer. The secret id is the salt, so equal
    // answers on different secrets never share a digest.
    [[nodiscard]] snap::core::Status challenge_digest(const snap::core::SecretId& id,
        std::string_view answer,
        snap::core::AnswerMatch match,
        snap::core::Hash256* out) noexcept;

    // Pure comparison, constant time over the digest. Does not consume anything.
    [[nodiscard]] bool challenge_matches(const snap::core::Hash256& stored,
        const snap::core::SecretId& id,
        std::string_view supplied,
        snap::core::AnswerMatch match) noexcept;

} // namespace snap::security
