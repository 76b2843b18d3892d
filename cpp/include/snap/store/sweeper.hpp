#pragma once

#include <atomic>
#include <chrono>

#include "snap/core/async_service.hpp"
#include "snap/store/secret_store.hpp"

namespace snap::store {

// Periodically removes expired secrets. Expiry is already enforced on every
// read; sweeping only reclaims storage.
class Sweeper final : public snap::core::AsyncService {
public:
    Sweeper(SecretStore& store, std::chrono::milliseconds interval);
    ~Sweeper() override;

    // One pass; also used by the CLI "sweep" command.
    [[nodiscard]] snap::core::Status sweep_once(u64* removed) noexcept;

    [[nodiscard]] u64 total_removed() const noexcept { return total_removed_.load(); }

protected:
    void runLoop() override;

private:
    SecretStore& store_;
    std::chrono::milliseconds interval_;
    std::atomic<u64> total_removed_{0};
};

} // namespace snap::store
