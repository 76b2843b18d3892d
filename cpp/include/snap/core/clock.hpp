#pragma once

#include <atomic>

#include "snap/core/types.hpp"

namespace snap::core {

    class Clock {
    public:
        virtual ~Clock() = default;
        [[nodiscard]] virtual Timestamp now_ms() const noexcept = 0;
    };

    class SystemClock final : public Clock {
    public:
        [[nodiscard]] Timestamp now_ms() const noexcept override;
    };

    // Process-wide system clock used when a component is not given one.
    [[nodiscard]] const Clock& system_clock() noexcept;

    // Test clock; starts at the given instant and only moves when told to.
    class ManualClock final : public Clock {
    public:
        explicit ManualClock(Timestamp start = 1'700'000'000'000) noexcept : now_(start) {}

        [[nodiscard]] Timestamp now_ms() const noexcept override { return now_.load(); }

        void set(Timestamp t) noexcept { now_.store(t); }
        void advance(DurationMs d) noexcept { now_.fetch_add(d); }

    private:
        std::atomic<Timestamp> now_;
    };

} // namespace snap::core
