#include "Stream/core/PacingThread.hpp"
#include "Stream/core/Pacer.hpp"
#include <spdlog/spdlog.h>
#include <pthread.h>
#include <chrono>

namespace VPB {
namespace Stream {

PacingThread::PacingThread(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
}

PacingThread::~PacingThread() {
    stop();
}

std::expected<void, BridgeError> PacingThread::start(std::unique_ptr<Pacer> pacer) {
    if (!pacer) {
        return std::unexpected(BridgeError::BadArgument);
    }
    if (running_.load()) {
        if (logger_) {
            logger_->warn("PacingThread::start: Already running");
        }
        return std::unexpected(BridgeError::InvalidState);
    }

    pacer_ = std::move(pacer);
    shouldExit_.store(false);
    iterations_.store(0, std::memory_order_relaxed);

    try {
        thread_ = std::thread(&PacingThread::pacingLoop, this);
        running_.store(true);
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("PacingThread::start: Failed to start thread: {}", e.what());
        }
        pacer_.reset();
        return std::unexpected(BridgeError::ThreadStartFailed);
    }

    if (logger_) {
        logger_->info("PacingThread started (slice {}ms, preroll {} bytes)",
                      pacer_->sliceMs(), pacer_->prerollBytes());
    }
    return {};
}

void PacingThread::stop() {
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(condMutex_);
        shouldExit_.store(true);
    }
    wakeCond_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
    pacer_.reset();

    if (logger_) {
        logger_->info("PacingThread stopped after {} iterations", iterations());
    }
}

void PacingThread::pacingLoop() {
#if defined(__APPLE__)
    pthread_setname_np("vpb-pacing");
#else
    pthread_setname_np(pthread_self(), "vpb-pacing");
#endif

    const auto slice = std::chrono::milliseconds(pacer_->sliceMs());

    while (!shouldExit_.load()) {
        const PacerStep result = pacer_->step();
        iterations_.fetch_add(1, std::memory_order_relaxed);

        if (result.sleepSlices == 0) {
            continue;
        }

        const auto deadline = std::chrono::steady_clock::now() + slice * result.sleepSlices;
        std::unique_lock<std::mutex> lock(condMutex_);
        wakeCond_.wait_until(lock, deadline, [this] { return shouldExit_.load(); });
    }

    if (logger_) {
        logger_->debug("PacingThread: loop exited");
    }
}

} // namespace Stream
} // namespace VPB
