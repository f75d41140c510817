#pragma once

#include <cstddef>
#include <cstdint>

namespace VPB {
namespace Stream {

// Implemented by the session; invoked from the hardware's real-time threads.
// Implementations must not block, allocate or log.
class IHardwareAudioSource {
public:
    virtual ~IHardwareAudioSource() = default;

    // Fill exactly `bytes` bytes of speaker output; zero-fill what cannot be supplied
    virtual void onRenderNeeded(uint8_t* out, size_t bytes) noexcept = 0;

    // Echo-cancelled microphone data for one hardware slice
    virtual void onCaptureAvailable(const uint8_t* data, size_t bytes) noexcept = 0;

    // False while capture would be discarded; the binding then skips rendering input
    virtual bool wantsCapture() const noexcept = 0;
};

} // namespace Stream
} // namespace VPB
