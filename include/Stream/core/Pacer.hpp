#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace spdlog {
    class logger;
}

namespace VPB {
namespace Stream {

class ByteRing;
class StagingRing;
class HeadroomEstimator;

enum class PacerPhase : uint8_t {
    PrerollWaiting,   ///< Preroll not reached and nothing could be moved
    PrerollFilling,   ///< Preroll not reached, some bytes moved
    PrerollSatisfied, ///< Playback ring just reached the preroll level
    Steady            ///< Regular top-up and feed
};

/// Outcome of one pacing iteration.
struct PacerStep {
    PacerPhase phase{PacerPhase::PrerollWaiting};
    size_t moved{0};          ///< Bytes moved from staging to playback
    size_t playbackLevel{0};  ///< Playback ring level after the step
    uint32_t sleepSlices{0};  ///< Number of slices the caller should sleep
};

/**
 * @class Pacer
 * @brief Moves staged audio into the playback ring at the hardware rate.
 *
 * Preroll: fill the playback ring to prerollBytes before feeding steadily,
 * and re-enter preroll whenever the ring drains completely.
 * Steady: top up to target + one slice, then feed one more slice.
 *
 * step() does one iteration and never sleeps itself, so it can be driven
 * by PacingThread or directly from a test.
 */
class Pacer {
public:
    /**
     * @param producerMutex Serializes writes into the playback ring with writePlayback()
     */
    Pacer(StagingRing& staging,
          ByteRing& playback,
          HeadroomEstimator& estimator,
          std::mutex& producerMutex,
          size_t bytesPerMs,
          int sliceMs,
          int prerollMs,
          std::shared_ptr<spdlog::logger> logger,
          bool trace = false);

    PacerStep step();

    bool didPreroll() const noexcept { return didPreroll_; }
    size_t sliceBytes() const noexcept { return sliceBytes_; }
    size_t prerollBytes() const noexcept { return prerollBytes_; }
    int sliceMs() const noexcept { return sliceMs_; }
    uint64_t iterations() const noexcept { return iterations_; }

private:
    size_t transfer(size_t maxBytes);
    void traceSteady(size_t level, size_t target, size_t moved);

    StagingRing& staging_;
    ByteRing& playback_;
    HeadroomEstimator& estimator_;
    std::mutex& producerMutex_;
    std::shared_ptr<spdlog::logger> logger_;

    size_t bytesPerMs_;
    int sliceMs_;
    size_t sliceBytes_;
    size_t prerollBytes_;
    bool trace_;
    bool didPreroll_{false};
    uint64_t iterations_{0};
    uint32_t traceEvery_{1};
};

} // namespace Stream
} // namespace VPB
