#include "Stream/core/Pacer.hpp"
#include "Stream/core/ByteRing.hpp"
#include "Stream/core/HeadroomEstimator.hpp"
#include "Stream/core/StagingRing.hpp"
#include "VPB/Enums.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace VPB {
namespace Stream {

Pacer::Pacer(StagingRing& staging,
             ByteRing& playback,
             HeadroomEstimator& estimator,
             std::mutex& producerMutex,
             size_t bytesPerMs,
             int sliceMs,
             int prerollMs,
             std::shared_ptr<spdlog::logger> logger,
             bool trace)
    : staging_(staging)
    , playback_(playback)
    , estimator_(estimator)
    , producerMutex_(producerMutex)
    , logger_(std::move(logger))
    , bytesPerMs_(bytesPerMs)
    , sliceMs_(sliceMs > 0 ? sliceMs : kDefaultSliceMs)
    , trace_(trace) {
    const int preroll = prerollMs < 0 ? 0 : prerollMs;
    sliceBytes_ = bytesPerMs_ * static_cast<size_t>(sliceMs_);
    // A preroll larger than the ring could never be satisfied
    prerollBytes_ = std::min(bytesPerMs_ * static_cast<size_t>(preroll), playback_.capacity());
    traceEvery_ = static_cast<uint32_t>(std::max(1, 200 / sliceMs_));

    if (logger_) {
        logger_->debug("Pacer: slice {} bytes ({}ms), preroll {} bytes", sliceBytes_, sliceMs_, prerollBytes_);
    }
}

size_t Pacer::transfer(size_t maxBytes) {
    if (maxBytes == 0) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(producerMutex_);
    return staging_.drainInto(playback_, maxBytes);
}

PacerStep Pacer::step() {
    ++iterations_;
    PacerStep result;
    size_t level = playback_.availableToRead();

    if (level == 0 && didPreroll_) {
        didPreroll_ = false;
        if (trace_ && logger_) {
            logger_->trace("Pacer: playback ring drained, re-entering preroll");
        }
    }

    if (!didPreroll_) {
        if (level < prerollBytes_) {
            result.moved = transfer(prerollBytes_ - level);
            result.playbackLevel = playback_.availableToRead();
            if (result.moved == 0) {
                result.phase = PacerPhase::PrerollWaiting;
                result.sleepSlices = 1;
            } else {
                result.phase = PacerPhase::PrerollFilling;
            }
            if (trace_ && logger_) {
                logger_->trace("Pacer: preroll level={} need={} moved={}",
                               result.playbackLevel, prerollBytes_, result.moved);
            }
            return result;
        }
        didPreroll_ = true;
        result.phase = PacerPhase::PrerollSatisfied;
        result.playbackLevel = level;
        if (logger_) {
            logger_->debug("Pacer: preroll satisfied at {} bytes", level);
        }
        return result;
    }

    result.phase = PacerPhase::Steady;
    result.sleepSlices = 1;

    const size_t target = estimator_.targetBytes(bytesPerMs_);
    const size_t desired = target + sliceBytes_;
    if (level < desired) {
        const size_t got = transfer(desired - level);
        result.moved += got;
        if (got == 0) {
            ++result.sleepSlices;
        }
    }
    result.moved += transfer(sliceBytes_);
    result.playbackLevel = playback_.availableToRead();

    if (trace_ && iterations_ % traceEvery_ == 0) {
        traceSteady(result.playbackLevel, target, result.moved);
    }
    return result;
}

void Pacer::traceSteady(size_t level, size_t target, size_t moved) {
    if (!logger_) {
        return;
    }
    logger_->trace("Pacer: play={} target={} staged={} moved={} renderLast={} renderMax={} guard={} underflows={}",
                   level, target, staging_.availableToRead(), moved,
                   estimator_.renderLastBytes(), estimator_.renderMaxBytes(),
                   estimator_.renderGuardBytes(), estimator_.underflowCount());
}

} // namespace Stream
} // namespace VPB
