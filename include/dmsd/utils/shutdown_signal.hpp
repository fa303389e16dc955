/**
 * @file shutdown_signal.hpp
 * @brief Cancellation flag with interruptible waits.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dmsd {
namespace utils {

/**
 * @class ShutdownSignal
 * @brief Shared stop request observed by long-running loops.
 *
 * Loops sleep with waitFor() instead of std::this_thread::sleep_for()
 * so a stop request wakes them immediately.
 *
 * @code
 * while (!signal.waitFor(std::chrono::seconds(1))) {
 *     tick();
 * }
 * @endcode
 */
class ShutdownSignal {
public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    /**
     * @brief Clear a previous stop request so the owner can restart.
     */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }

    /**
     * @brief Sleep for up to timeout.
     * @return True if stop was requested (before or during the wait).
     */
    template<typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopped_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
};

}  // namespace utils
}  // namespace dmsd
