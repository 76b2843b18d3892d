#include "snap/core/async_service.hpp"
#include "snap/core/log.hpp"

#include <exception>
#include <utility>

namespace snap::core {

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    // A loop that ended by itself leaves a joinable thread behind.
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::snap()->error("[{}] Service error: {}", serviceName_, e.what());
        }
        running_.store(false, std::memory_order_release);
    });

    LogRegistry::snap()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    {
        std::lock_guard<std::mutex> lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        LogRegistry::snap()->info("[{}] Service stopped.", serviceName_);
    }

    running_.store(false, std::memory_order_release);
}

void AsyncService::lazySleep(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(sleepMutex_);
    sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
}

} // namespace snap::core
