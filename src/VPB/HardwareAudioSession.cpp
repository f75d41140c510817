#include "VPB/HardwareAudioSession.hpp"
#include "Stream/core/Pacer.hpp"
#include "Stream/hardware/HardwareFactory.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

namespace VPB {

namespace {
    constexpr auto kBlockingPollInterval = std::chrono::milliseconds(10);
}

// Marks a hardware callback as in flight for teardown
class HardwareAudioSession::CallbackScope {
public:
    explicit CallbackScope(std::atomic<uint32_t>& counter) noexcept : counter_(counter) {
        counter_.fetch_add(1);
    }
    ~CallbackScope() { counter_.fetch_sub(1); }
    CallbackScope(const CallbackScope&) = delete;
    CallbackScope& operator=(const CallbackScope&) = delete;
private:
    std::atomic<uint32_t>& counter_;
};

HardwareAudioSession::HardwareAudioSession(BridgeConfig config, HardwareFactory factory)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , logger_(config_.logger ? config_.logger : spdlog::default_logger())
    , estimator_(config_)
    , pacingThread_(logger_) {
    if (!factory_) {
        factory_ = &Stream::createHardware;
    }
    if (config_.trace) {
        logger_->set_level(spdlog::level::trace);
    }
    logger_->debug("HardwareAudioSession created: {}", config_.configSummary());
}

HardwareAudioSession::~HardwareAudioSession() {
    shutdown();
}

void HardwareAudioSession::waitForCallbacks() const {
    while (callbacksInFlight_.load() != 0) {
        std::this_thread::yield();
    }
}

// ---- Lifecycle -------------------------------------------------------------

std::expected<void, BridgeError> HardwareAudioSession::init(double sampleRate, int channelCount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return initLocked(sampleRate, channelCount);
}

std::expected<void, BridgeError> HardwareAudioSession::initLocked(double sampleRate, int channelCount) {
    if (hardware_) {
        if (sampleRate != config_.sampleRate) {
            logger_->debug("init: already initialized at {} Hz, ignoring {} Hz", config_.sampleRate, sampleRate);
        }
        return {};
    }

    if (channelCount != static_cast<int>(kChannelCount)) {
        logger_->info("init: {} channels requested, using mono", channelCount);
    }
    config_.sampleRate = sampleRate;
    config_.channelCount = kChannelCount;
    if (!config_.isValid()) {
        logger_->error("init: invalid configuration ({})", config_.configSummary());
        return std::unexpected(BridgeError::BadArgument);
    }

    estimator_.configure(config_);
    mode_.store(Mode::Idle, std::memory_order_release);

    auto hw = factory_(config_, logger_);
    if (!hw) {
        logger_->error("init: no {} backend available", backendToString(config_.backend));
        return std::unexpected(BridgeError::ComponentNotFound);
    }

    if (auto result = hw->open(config_, *this); !result) {
        logger_->error("init: opening {} hardware failed: {}",
                       backendToString(config_.backend), make_error_code(result.error()).message());
        hw->close();
        return std::unexpected(result.error());
    }
    if (auto result = hw->start(); !result) {
        logger_->error("init: starting hardware failed: {}", make_error_code(result.error()).message());
        hw->close();
        return std::unexpected(result.error());
    }

    hardware_ = std::move(hw);
    logger_->info("HardwareAudioSession initialized: {}", config_.configSummary());
    return {};
}

std::expected<void, BridgeError> HardwareAudioSession::startStream(double sampleRate, int channelCount,
                                                                   size_t ringCapacityBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto result = initLocked(sampleRate, channelCount); !result) {
        return result;
    }
    if (captureRing_) {
        logger_->warn("startStream: stream already active");
        return std::unexpected(BridgeError::InvalidState);
    }
    if (mode_.load() == Mode::Playing || legacyCapture_.isActive()) {
        logger_->warn("startStream: blocking record/play in progress");
        return std::unexpected(BridgeError::InvalidState);
    }

    config_.ringCapacityBytes = ringCapacityBytes;
    const size_t capacity = config_.effectiveRingCapacity();

    auto capture = Stream::ByteRing::create(capacity);
    auto playback = Stream::ByteRing::create(capacity);
    if (!capture || !playback) {
        logger_->error("startStream: failed to allocate {} byte rings", capacity);
        return std::unexpected(BridgeError::NoMemory);
    }
    auto staging = std::make_unique<Stream::StagingRing>(capacity, logger_);
    if (staging->capacity() == 0) {
        return std::unexpected(BridgeError::NoMemory);
    }

    captureRing_ = std::move(*capture);
    playbackRing_ = std::move(*playback);
    stagingRing_ = std::move(staging);
    estimator_.resetStatistics();

    captureRt_.store(captureRing_.get());
    playbackRt_.store(playbackRing_.get());
    mode_.store(Mode::Recording, std::memory_order_release);

    logger_->info("Stream started: {} byte rings ({} ms)", capacity,
                  capacity * 1000 / config_.bytesPerSecond());
    return {};
}

void HardwareAudioSession::stopStream() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopStreamLocked();
}

void HardwareAudioSession::stopStreamLocked() {
    pacingThread_.stop();
    if (!captureRing_ && !playbackRing_ && !stagingRing_) {
        return;
    }

    mode_.store(Mode::Idle, std::memory_order_release);
    captureRt_.store(nullptr);
    playbackRt_.store(nullptr);
    waitForCallbacks();

    captureRing_.reset();
    playbackRing_.reset();
    stagingRing_.reset();
    logger_->info("Stream stopped (underflows: {})", estimator_.underflowCount());
}

void HardwareAudioSession::releaseHardwareLocked() {
    if (!hardware_) {
        return;
    }
    hardware_->stop();
    hardware_->close();
    hardware_.reset();
    logger_->info("HardwareAudioSession: hardware released");
}

void HardwareAudioSession::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopStreamLocked();
    mode_.store(Mode::Idle, std::memory_order_release);
    releaseHardwareLocked();
    legacyCapture_.release();
    legacyPlayback_.release();
}

bool HardwareAudioSession::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hardware_ != nullptr;
}

bool HardwareAudioSession::isStreaming() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captureRing_ != nullptr;
}

// ---- Streaming data path ---------------------------------------------------

size_t HardwareAudioSession::writeFrame(const void* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stagingRing_) {
        return 0;
    }
    return stagingRing_->write(data, len);
}

size_t HardwareAudioSession::readCapture(void* dst, size_t maxLen) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!captureRing_) {
        return 0;
    }
    return captureRing_->read(dst, maxLen);
}

size_t HardwareAudioSession::writePlayback(const void* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!playbackRing_) {
        return 0;
    }
    std::lock_guard<std::mutex> producerLock(playbackProducerMutex_);
    return playbackRing_->write(data, len);
}

void HardwareAudioSession::flushPlayback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (playbackRing_) {
        std::lock_guard<std::mutex> producerLock(playbackProducerMutex_);
        playbackRing_->flush();
    }
}

void HardwareAudioSession::flushInput() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stagingRing_) {
        stagingRing_->flush();
    }
}

// ---- Pacing ----------------------------------------------------------------

std::expected<void, BridgeError> HardwareAudioSession::startPacing(int sliceMs, int prerollMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stagingRing_ || !playbackRing_) {
        logger_->warn("startPacing: no active stream");
        return std::unexpected(BridgeError::InvalidState);
    }

    config_.sliceMs = sliceMs > 0 ? sliceMs : kDefaultSliceMs;
    config_.prerollMs = prerollMs < 0 ? 0 : prerollMs;

    if (pacingThread_.isRunning()) {
        logger_->debug("startPacing: already running");
        return {};
    }

    auto pacer = std::make_unique<Stream::Pacer>(*stagingRing_, *playbackRing_, estimator_,
                                                 playbackProducerMutex_, config_.bytesPerMs(),
                                                 config_.sliceMs, config_.prerollMs,
                                                 logger_, config_.trace);
    return pacingThread_.start(std::move(pacer));
}

void HardwareAudioSession::stopPacing() {
    std::lock_guard<std::mutex> lock(mutex_);
    pacingThread_.stop();
}

bool HardwareAudioSession::isPacing() const {
    return pacingThread_.isRunning();
}

void HardwareAudioSession::setTargetHeadroomMs(int ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    estimator_.setHeadroomMs(ms);
    config_.headroomMs = estimator_.headroomMs();
}

size_t HardwareAudioSession::underflowCount() const {
    return estimator_.underflowCount();
}

void HardwareAudioSession::resetUnderflowCount() {
    estimator_.resetUnderflowCount();
}

// ---- Blocking one-shot helpers ---------------------------------------------

std::expected<void, BridgeError> HardwareAudioSession::record(double seconds) {
    if (seconds < 0.0) {
        return std::unexpected(BridgeError::BadArgument);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!hardware_) {
            return std::unexpected(BridgeError::NotInitialized);
        }
        if (captureRing_ || mode_.load() != Mode::Idle) {
            return std::unexpected(BridgeError::InvalidState);
        }

        // Room for the requested duration plus polling jitter
        const size_t bps = config_.bytesPerSecond();
        const size_t reservation = static_cast<size_t>(seconds * static_cast<double>(bps))
                                   + bps / 10
                                   + 2 * static_cast<size_t>(config_.maxFramesPerSlice()) * kBytesPerFrame;
        if (!legacyCapture_.reserve(reservation)) {
            logger_->error("record: failed to reserve {} bytes", reservation);
            return std::unexpected(BridgeError::NoMemory);
        }
        legacyCapture_.begin();
        mode_.store(Mode::Recording, std::memory_order_release);
    }

    const auto deadline = std::chrono::steady_clock::now()
                          + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                std::chrono::duration<double>(seconds));
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kBlockingPollInterval);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!captureRing_) {
        mode_.store(Mode::Idle, std::memory_order_release);
    }
    legacyCapture_.end();
    waitForCallbacks();
    logger_->debug("record: {} bytes captured in {:.2f}s", legacyCapture_.size(), seconds);
    return {};
}

size_t HardwareAudioSession::captureSize() const {
    return legacyCapture_.size();
}

size_t HardwareAudioSession::copyCapture(void* dst, size_t maxLen) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return legacyCapture_.copy(dst, maxLen);
}

void HardwareAudioSession::resetCapture() {
    std::lock_guard<std::mutex> lock(mutex_);
    legacyCapture_.clear();
}

std::expected<void, BridgeError> HardwareAudioSession::play(const void* data, size_t len) {
    if (!data && len > 0) {
        return std::unexpected(BridgeError::BadArgument);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!hardware_) {
            return std::unexpected(BridgeError::NotInitialized);
        }
        if (captureRing_ || mode_.load() != Mode::Idle) {
            return std::unexpected(BridgeError::InvalidState);
        }
        if (!legacyPlayback_.load(data, len)) {
            logger_->error("play: failed to copy {} bytes", len);
            return std::unexpected(BridgeError::NoMemory);
        }
        mode_.store(Mode::Playing, std::memory_order_release);
    }

    const double seconds = static_cast<double>(len) / static_cast<double>(config_.bytesPerSecond());
    const auto deadline = std::chrono::steady_clock::now()
                          + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                std::chrono::duration<double>(seconds));
    while (std::chrono::steady_clock::now() < deadline && legacyPlayback_.hasPending()) {
        std::this_thread::sleep_for(kBlockingPollInterval);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    mode_.store(Mode::Idle, std::memory_order_release);
    waitForCallbacks();
    logger_->debug("play: {} of {} bytes rendered", legacyPlayback_.offset(), len);
    legacyPlayback_.release();
    return {};
}

// ---- Introspection ---------------------------------------------------------

std::expected<bool, BridgeError> HardwareAudioSession::voiceProcessingBypass() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hardware_) {
        return std::unexpected(BridgeError::NotInitialized);
    }
    return hardware_->isVoiceProcessingBypassed();
}

double HardwareAudioSession::inputSampleRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hardware_ ? hardware_->inputSampleRate() : 0.0;
}

double HardwareAudioSession::outputSampleRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hardware_ ? hardware_->outputSampleRate() : 0.0;
}

RingLevels HardwareAudioSession::ringLevels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RingLevels levels;
    if (captureRing_) levels.capture = captureRing_->availableToRead();
    if (playbackRing_) levels.playback = playbackRing_->availableToRead();
    return levels;
}

size_t HardwareAudioSession::stagingLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stagingRing_ ? stagingRing_->availableToRead() : 0;
}

size_t HardwareAudioSession::stagingCapacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stagingRing_ ? stagingRing_->capacity() : 0;
}

DebugSnapshot HardwareAudioSession::snapshotLocked() const {
    DebugSnapshot snap;
    snap.mode = mode_.load(std::memory_order_acquire);
    snap.backend = config_.backend;
    snap.initialized = hardware_ != nullptr;
    snap.streaming = captureRing_ != nullptr;
    snap.pacing = pacingThread_.isRunning();

    if (hardware_) {
        snap.backend = hardware_->backend();
        if (auto bypass = hardware_->isVoiceProcessingBypassed()) {
            snap.bypass = *bypass;
        } else {
            snap.bypassStatus = toStatus(bypass.error());
        }
        snap.inputSampleRate = hardware_->inputSampleRate();
        snap.outputSampleRate = hardware_->outputSampleRate();
        snap.lastPlatformStatus = hardware_->lastPlatformStatus();
    } else {
        snap.bypassStatus = toStatus(BridgeError::NotInitialized);
    }

    if (captureRing_) {
        snap.captureLevel = captureRing_->availableToRead();
        snap.captureCapacity = captureRing_->capacity();
    }
    if (playbackRing_) {
        snap.playbackLevel = playbackRing_->availableToRead();
        snap.playbackCapacity = playbackRing_->capacity();
    }
    if (stagingRing_) {
        snap.stagingLevel = stagingRing_->availableToRead();
        snap.stagingCapacity = stagingRing_->capacity();
    }

    snap.underflowCount = estimator_.underflowCount();
    snap.renderLastBytes = estimator_.renderLastBytes();
    snap.renderMaxBytes = estimator_.renderMaxBytes();
    snap.headroomMs = estimator_.headroomMs();
    snap.guardMultiplier = estimator_.guardMultiplier();
    return snap;
}

DebugSnapshot HardwareAudioSession::debugSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

void HardwareAudioSession::debugDump() const {
    const DebugSnapshot s = debugSnapshot();
    logger_->info("[VPIO] mode={} bypass={} (rc={}) inSR={:.0f} outSR={:.0f} capRing={}/{} playRing={}/{} "
                  "staging={}/{} underflows={} renderLast={} renderMax={}",
                  modeToString(s.mode), s.bypass ? (*s.bypass ? 1 : 0) : 0, s.bypassStatus,
                  s.inputSampleRate, s.outputSampleRate,
                  s.captureLevel, s.captureCapacity, s.playbackLevel, s.playbackCapacity,
                  s.stagingLevel, s.stagingCapacity, s.underflowCount,
                  s.renderLastBytes, s.renderMaxBytes);
}

// ---- Real-time callbacks ---------------------------------------------------

void HardwareAudioSession::onRenderNeeded(uint8_t* out, size_t bytes) noexcept {
    CallbackScope scope(callbacksInFlight_);
    if (!out || bytes == 0) {
        return;
    }

    estimator_.recordPull(bytes);

    if (mode_.load(std::memory_order_acquire) == Mode::Playing && legacyPlayback_.hasPending()) {
        legacyPlayback_.render(out, bytes);
        return;
    }

    Stream::ByteRing* ring = playbackRt_.load();
    const size_t got = ring ? ring->read(out, bytes) : 0;
    if (got < bytes) {
        std::memset(out + got, 0, bytes - got);
        if (ring) {
            estimator_.recordUnderflow();
        }
    }
}

bool HardwareAudioSession::wantsCapture() const noexcept {
    return mode_.load(std::memory_order_acquire) == Mode::Recording;
}

void HardwareAudioSession::onCaptureAvailable(const uint8_t* data, size_t bytes) noexcept {
    CallbackScope scope(callbacksInFlight_);
    if (!data || bytes == 0) {
        return;
    }
    // The mode may have changed since the binding asked wantsCapture()
    if (!wantsCapture()) {
        return;
    }
    if (Stream::ByteRing* ring = captureRt_.load()) {
        ring->write(data, bytes);
    }
    legacyCapture_.append(data, bytes);
}

} // namespace VPB
