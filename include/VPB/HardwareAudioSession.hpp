#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include "Stream/core/ByteRing.hpp"
#include "Stream/core/HeadroomEstimator.hpp"
#include "Stream/core/LegacyBuffers.hpp"
#include "Stream/core/PacingThread.hpp"
#include "Stream/core/StagingRing.hpp"
#include "Stream/interfaces/IAudioHardware.hpp"
#include "Stream/interfaces/IHardwareAudioSource.hpp"
#include "VPB/BridgeConfig.hpp"
#include "VPB/Enums.hpp"
#include "VPB/Error.h"

namespace spdlog {
    class logger;
}

namespace VPB {

/// Point-in-time view of the session used by debugDump() and the JSON helper.
struct DebugSnapshot {
    Mode mode{Mode::Idle};
    Backend backend{Backend::Synthetic};
    bool initialized{false};
    bool streaming{false};
    bool pacing{false};
    std::optional<bool> bypass;
    int32_t bypassStatus{0};
    double inputSampleRate{0.0};
    double outputSampleRate{0.0};
    size_t captureLevel{0};
    size_t captureCapacity{0};
    size_t playbackLevel{0};
    size_t playbackCapacity{0};
    size_t stagingLevel{0};
    size_t stagingCapacity{0};
    size_t underflowCount{0};
    size_t renderLastBytes{0};
    size_t renderMaxBytes{0};
    int headroomMs{0};
    double guardMultiplier{0.0};
    int32_t lastPlatformStatus{0};
};

struct RingLevels {
    size_t capture{0};
    size_t playback{0};
    size_t total() const { return capture + playback; }
};

/**
 * @class HardwareAudioSession
 * @brief Owns the audio unit, the stream rings and the pacing thread.
 *
 * Application-side calls are serialized by one lifecycle mutex. The hardware
 * callbacks never lock: they see the rings through atomically published
 * pointers, and teardown unpublishes them and waits until no callback is in
 * flight before freeing anything.
 *
 * Streaming (startStream..stopStream) and the blocking record()/play()
 * helpers are mutually exclusive.
 */
class HardwareAudioSession : public Stream::IHardwareAudioSource {
public:
    using HardwareFactory = std::function<std::unique_ptr<Stream::IAudioHardware>(
        const BridgeConfig&, std::shared_ptr<spdlog::logger>)>;

    /**
     * @param config Session defaults; config.logger is used when set
     * @param factory Hardware binding factory, Stream::createHardware when empty
     */
    explicit HardwareAudioSession(BridgeConfig config = {}, HardwareFactory factory = {});
    ~HardwareAudioSession() override;

    HardwareAudioSession(const HardwareAudioSession&) = delete;
    HardwareAudioSession& operator=(const HardwareAudioSession&) = delete;

    // Lifecycle

    /**
     * @brief Create, configure, initialize and start the audio unit. Idempotent.
     *
     * channelCount is accepted for compatibility; the format is always mono.
     * A failed init releases everything it acquired and may be retried.
     */
    std::expected<void, BridgeError> init(double sampleRate, int channelCount);

    /**
     * @brief init() if needed, then allocate the stream rings and enter Recording.
     *
     * Each ring holds max(ringCapacityBytes, one second of audio).
     * @return InvalidState if a stream is already active
     */
    std::expected<void, BridgeError> startStream(double sampleRate, int channelCount, size_t ringCapacityBytes);

    /// Stop pacing, enter Idle and free the rings. The unit keeps running.
    void stopStream();

    /// Stop the stream and release the audio unit. Safe to call repeatedly.
    void shutdown();

    bool isInitialized() const;
    bool isStreaming() const;

    // Streaming data path

    /// Stage outgoing audio. Returns len, or 0 when no stream is active.
    size_t writeFrame(const void* data, size_t len);

    /// Drain echo-cancelled capture audio. Returns 0 when no stream is active.
    size_t readCapture(void* dst, size_t maxLen);

    /// Write directly into the playback ring (drop-oldest). Returns len, or 0 when no stream is active.
    size_t writePlayback(const void* data, size_t len);

    /// Discard audio queued in the playback ring. Staged frames are kept.
    void flushPlayback();

    /// Discard frames staged by writeFrame() that the pacer has not moved yet.
    void flushInput();

    // Pacing

    /**
     * @brief Start the pacing thread. sliceMs <= 0 selects 5, prerollMs < 0 selects 0.
     * @return Success if already running, InvalidState without an active stream
     */
    std::expected<void, BridgeError> startPacing(int sliceMs, int prerollMs);
    void stopPacing();
    bool isPacing() const;

    /// Negative values are treated as 0. Takes effect on the next pacing step.
    void setTargetHeadroomMs(int ms);

    size_t underflowCount() const;
    void resetUnderflowCount();

    // Blocking one-shot helpers

    /// Capture for `seconds` into the legacy capture buffer, blocking the caller.
    std::expected<void, BridgeError> record(double seconds);
    size_t captureSize() const;
    size_t copyCapture(void* dst, size_t maxLen) const;
    void resetCapture();

    /// Play a buffer through the speaker, blocking until it finished or its duration elapsed.
    std::expected<void, BridgeError> play(const void* data, size_t len);

    // Introspection

    Mode mode() const { return mode_.load(std::memory_order_acquire); }
    std::expected<bool, BridgeError> voiceProcessingBypass() const;
    double inputSampleRate() const;
    double outputSampleRate() const;
    RingLevels ringLevels() const;
    size_t stagingLevel() const;
    size_t stagingCapacity() const;
    size_t renderLastBytes() const { return estimator_.renderLastBytes(); }
    size_t renderMaxBytes() const { return estimator_.renderMaxBytes(); }
    int headroomMs() const { return estimator_.headroomMs(); }

    DebugSnapshot debugSnapshot() const;

    /// Log a one-line summary of the session state at info level.
    void debugDump() const;

    const BridgeConfig& config() const { return config_; }
    std::shared_ptr<spdlog::logger> logger() const { return logger_; }

    // IHardwareAudioSource
    void onRenderNeeded(uint8_t* out, size_t bytes) noexcept override;
    void onCaptureAvailable(const uint8_t* data, size_t bytes) noexcept override;
    bool wantsCapture() const noexcept override;

private:
    class CallbackScope;

    std::expected<void, BridgeError> initLocked(double sampleRate, int channelCount);
    void stopStreamLocked();
    void releaseHardwareLocked();
    void waitForCallbacks() const;
    DebugSnapshot snapshotLocked() const;

    BridgeConfig config_;
    HardwareFactory factory_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::mutex playbackProducerMutex_;
    std::unique_ptr<Stream::IAudioHardware> hardware_;

    std::atomic<Mode> mode_{Mode::Idle};
    std::unique_ptr<Stream::ByteRing> captureRing_;
    std::unique_ptr<Stream::ByteRing> playbackRing_;
    std::unique_ptr<Stream::StagingRing> stagingRing_;

    // Seen by the real-time callbacks
    std::atomic<Stream::ByteRing*> captureRt_{nullptr};
    std::atomic<Stream::ByteRing*> playbackRt_{nullptr};
    mutable std::atomic<uint32_t> callbacksInFlight_{0};

    Stream::HeadroomEstimator estimator_;
    Stream::PacingThread pacingThread_;
    Stream::LegacyCaptureBuffer legacyCapture_;
    Stream::LegacyPlaybackBuffer legacyPlayback_;
};

} // namespace VPB
