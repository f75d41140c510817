#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <thread>
#include "VPB/Error.h"

namespace spdlog {
    class logger;
}

namespace VPB {
namespace Stream {

class Pacer;

/**
 * @class PacingThread
 * @brief Runs a Pacer on its own thread, sleeping between steps.
 *
 * Sleeps wait on a condition variable against a steady_clock deadline, so
 * stop() interrupts them immediately.
 */
class PacingThread {
public:
    explicit PacingThread(std::shared_ptr<spdlog::logger> logger);
    ~PacingThread();

    PacingThread(const PacingThread&) = delete;
    PacingThread& operator=(const PacingThread&) = delete;

    /**
     * @brief Take ownership of a pacer and start stepping it.
     * @return InvalidState if already running, ThreadStartFailed if the thread could not be created
     */
    std::expected<void, BridgeError> start(std::unique_ptr<Pacer> pacer);

    /// Stop and join. Idempotent.
    void stop();

    bool isRunning() const { return running_.load(); }
    uint64_t iterations() const { return iterations_.load(std::memory_order_relaxed); }

private:
    void pacingLoop();

    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<Pacer> pacer_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shouldExit_{false};
    std::atomic<uint64_t> iterations_{0};

    std::mutex condMutex_;
    std::condition_variable wakeCond_;
};

} // namespace Stream
} // namespace VPB
