#include "snap/core/clock.hpp"

#include <chrono>

namespace snap::core {

Timestamp SystemClock::now_ms() const noexcept {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

const Clock& system_clock() noexcept {
    static const SystemClock clock;
    return clock;
}

} // namespace snap::core
