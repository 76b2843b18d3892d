#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace snap::core {

    // Background loop owned by one thread. Subclasses implement runLoop() and
    // poll shouldStop(); lazySleep() returns early when stop() is called.
    class AsyncService {
    public:
        explicit AsyncService(std::string serviceName);
        virtual ~AsyncService();

        AsyncService(const AsyncService&) = delete;
        AsyncService& operator=(const AsyncService&) = delete;

        virtual void start();
        virtual void stop();

        [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }
        [[nodiscard]] const std::string& name() const noexcept { return serviceName_; }

    protected:
        virtual void runLoop() = 0;

        [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }
        void lazySleep(std::chrono::milliseconds d);

        std::string serviceName_;

    private:
        std::atomic<bool> running_{false};
        std::atomic<bool> interruptFlag_{false};
        std::mutex sleepMutex_;
        std::condition_variable sleepCv_;
        std::thread worker_;
    };

} // namespace snap::core
