#include "Stream/hardware/SyntheticAudioHardware.hpp"
#include "Stream/interfaces/IHardwareAudioSource.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <numbers>

namespace VPB {
namespace Stream {

SyntheticAudioHardware::SyntheticAudioHardware(std::shared_ptr<spdlog::logger> logger, SyntheticClock clock)
    : logger_(std::move(logger))
    , clock_(std::move(clock)) {
    if (clock_.renderPullFrames.empty()) {
        clock_.renderPullFrames.push_back(160);
    }
}

SyntheticAudioHardware::~SyntheticAudioHardware() {
    close();
}

std::expected<void, BridgeError> SyntheticAudioHardware::open(const BridgeConfig& config, IHardwareAudioSource& source) {
    if (opened_.load()) {
        return std::unexpected(BridgeError::InvalidState);
    }
    source_ = &source;
    sampleRate_ = config.sampleRate;
    phase_ = 0.0;

    const uint32_t maxPull = *std::max_element(clock_.renderPullFrames.begin(), clock_.renderPullFrames.end());
    renderBuffer_.assign(static_cast<size_t>(maxPull) * kBytesPerFrame, 0);
    opened_.store(true);

    if (logger_) {
        logger_->info("SyntheticAudioHardware: opened at {} Hz ({})",
                      sampleRate_, clock_.clockDriven ? "clock driven" : "manually driven");
    }
    return {};
}

std::expected<void, BridgeError> SyntheticAudioHardware::start() {
    if (!opened_.load()) {
        return std::unexpected(BridgeError::NotInitialized);
    }
    if (started_.exchange(true)) {
        return {};
    }

    if (clock_.clockDriven) {
        shouldExit_.store(false);
        try {
            clockThread_ = std::thread(&SyntheticAudioHardware::clockLoop, this);
        } catch (const std::exception& e) {
            started_.store(false);
            if (logger_) {
                logger_->error("SyntheticAudioHardware: failed to start clock thread: {}", e.what());
            }
            return std::unexpected(BridgeError::ThreadStartFailed);
        }
    }
    return {};
}

void SyntheticAudioHardware::stop() {
    if (!started_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(condMutex_);
        shouldExit_.store(true);
    }
    wakeCond_.notify_all();
    if (clockThread_.joinable()) {
        clockThread_.join();
    }
}

void SyntheticAudioHardware::close() {
    stop();
    if (!opened_.exchange(false)) {
        return;
    }
    source_ = nullptr;
    scratch_.release();
    renderBuffer_.clear();
    if (logger_) {
        logger_->debug("SyntheticAudioHardware: closed after {} render / {} capture pulls",
                       renderPulls_.load(), capturePulls_.load());
    }
}

std::expected<bool, BridgeError> SyntheticAudioHardware::isVoiceProcessingBypassed() const {
    if (!opened_.load()) {
        return std::unexpected(BridgeError::NotInitialized);
    }
    return bypassed_.load();
}

double SyntheticAudioHardware::inputSampleRate() const {
    return opened_.load() ? sampleRate_ : 0.0;
}

double SyntheticAudioHardware::outputSampleRate() const {
    return opened_.load() ? sampleRate_ : 0.0;
}

void SyntheticAudioHardware::renderInto(uint8_t* out, size_t bytes) {
    source_->onRenderNeeded(out, bytes);
    renderPulls_.fetch_add(1, std::memory_order_relaxed);

    size_t nonSilent = 0;
    for (size_t i = 0; i < bytes; ++i) {
        if (out[i] != 0) ++nonSilent;
    }
    renderedNonSilent_.fetch_add(nonSilent, std::memory_order_relaxed);
}

std::vector<uint8_t> SyntheticAudioHardware::driveRender(uint32_t frames) {
    if (!started_.load() || !source_ || frames == 0) {
        return {};
    }
    std::vector<uint8_t> out(static_cast<size_t>(frames) * kBytesPerFrame, 0xA5);
    renderInto(out.data(), out.size());
    return out;
}

void SyntheticAudioHardware::synthesize(int16_t* dst, uint32_t frames) {
    const double step = 2.0 * std::numbers::pi * clock_.toneHz / sampleRate_;
    for (uint32_t i = 0; i < frames; ++i) {
        dst[i] = static_cast<int16_t>(std::lround(clock_.amplitude * std::sin(phase_)));
        phase_ += step;
        if (phase_ >= 2.0 * std::numbers::pi) {
            phase_ -= 2.0 * std::numbers::pi;
        }
    }
}

size_t SyntheticAudioHardware::driveCapture(uint32_t frames) {
    if (!started_.load() || !source_ || frames == 0 || !source_->wantsCapture()) {
        return 0;
    }
    const size_t bytes = static_cast<size_t>(frames) * kBytesPerFrame;
    uint8_t* scratch = scratch_.acquire(bytes);
    if (!scratch) {
        return 0;
    }
    synthesize(reinterpret_cast<int16_t*>(scratch), frames);
    source_->onCaptureAvailable(scratch, bytes);
    capturePulls_.fetch_add(1, std::memory_order_relaxed);
    return bytes;
}

size_t SyntheticAudioHardware::injectCapture(const uint8_t* data, size_t bytes) {
    if (!started_.load() || !source_ || !data || bytes == 0 || !source_->wantsCapture()) {
        return 0;
    }
    uint8_t* scratch = scratch_.acquire(bytes);
    if (!scratch) {
        return 0;
    }
    std::memcpy(scratch, data, bytes);
    source_->onCaptureAvailable(scratch, bytes);
    capturePulls_.fetch_add(1, std::memory_order_relaxed);
    return bytes;
}

void SyntheticAudioHardware::clockLoop() {
    size_t pattern = 0;
    auto deadline = std::chrono::steady_clock::now();

    while (!shouldExit_.load()) {
        driveCapture(clock_.captureFrames);

        const uint32_t frames = clock_.renderPullFrames[pattern++ % clock_.renderPullFrames.size()];
        const size_t bytes = std::min(static_cast<size_t>(frames) * kBytesPerFrame, renderBuffer_.size());
        renderInto(renderBuffer_.data(), bytes);

        deadline += clock_.period;
        const auto now = std::chrono::steady_clock::now();
        if (deadline < now) {
            deadline = now;
        }
        std::unique_lock<std::mutex> lock(condMutex_);
        wakeCond_.wait_until(lock, deadline, [this] { return shouldExit_.load(); });
    }
}

} // namespace Stream
} // namespace VPB
