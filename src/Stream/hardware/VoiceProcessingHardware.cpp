#include "Stream/hardware/VoiceProcessingHardware.hpp"
#include "Stream/interfaces/IHardwareAudioSource.hpp"
#include <spdlog/spdlog.h>

namespace VPB {
namespace Stream {

namespace {
    constexpr AudioUnitElement kSpeakerBus = 0;
    constexpr AudioUnitElement kMicrophoneBus = 1;
}

VoiceProcessingHardware::VoiceProcessingHardware(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
}

VoiceProcessingHardware::~VoiceProcessingHardware() {
    close();
}

std::unexpected<BridgeError> VoiceProcessingHardware::fail(const char* what, OSStatus status, BridgeError error) {
    lastStatus_.store(static_cast<int32_t>(status));
    if (logger_) {
        logger_->error("VoiceProcessingHardware: {} failed (OSStatus {})", what, static_cast<int32_t>(status));
    }
    return std::unexpected(error);
}

void VoiceProcessingHardware::setMaximumFramesPerSlice(uint32_t frames, const char* when) {
    UInt32 value = frames;
    OSStatus st = AudioUnitSetProperty(unit_, kAudioUnitProperty_MaximumFramesPerSlice,
                                       kAudioUnitScope_Global, 0, &value, sizeof(value));
    if (st != noErr) {
        lastStatus_.store(static_cast<int32_t>(st));
        if (logger_) {
            logger_->warn("VoiceProcessingHardware: MaximumFramesPerSlice={} {} rejected (OSStatus {})",
                          frames, when, static_cast<int32_t>(st));
        }
    } else if (logger_) {
        logger_->debug("VoiceProcessingHardware: MaximumFramesPerSlice={} {}", frames, when);
    }
}

std::expected<void, BridgeError> VoiceProcessingHardware::open(const BridgeConfig& config, IHardwareAudioSource& source) {
    if (unit_) {
        return std::unexpected(BridgeError::InvalidState);
    }

    AudioComponentDescription desc{};
    desc.componentType = kAudioUnitType_Output;
    desc.componentSubType = kAudioUnitSubType_VoiceProcessingIO;
    desc.componentManufacturer = kAudioUnitManufacturer_Apple;

    AudioComponent component = AudioComponentFindNext(nullptr, &desc);
    if (!component) {
        if (logger_) {
            logger_->error("VoiceProcessingHardware: VoiceProcessingIO component not found");
        }
        return std::unexpected(BridgeError::ComponentNotFound);
    }

    OSStatus st = AudioComponentInstanceNew(component, &unit_);
    if (st != noErr) {
        unit_ = nullptr;
        return fail("AudioComponentInstanceNew", st, BridgeError::ComponentNotFound);
    }
    source_ = &source;

    UInt32 one = 1;
    st = AudioUnitSetProperty(unit_, kAudioOutputUnitProperty_EnableIO,
                              kAudioUnitScope_Input, kMicrophoneBus, &one, sizeof(one));
    if (st != noErr) return fail("EnableIO (input)", st, BridgeError::PropertyRejected);

    st = AudioUnitSetProperty(unit_, kAudioOutputUnitProperty_EnableIO,
                              kAudioUnitScope_Output, kSpeakerBus, &one, sizeof(one));
    if (st != noErr) return fail("EnableIO (output)", st, BridgeError::PropertyRejected);

    // Keep echo cancellation active; some hosts refuse this and still process
    UInt32 bypass = 0;
    st = AudioUnitSetProperty(unit_, kAUVoiceIOProperty_BypassVoiceProcessing,
                              kAudioUnitScope_Global, 0, &bypass, sizeof(bypass));
    if (st != noErr) {
        lastStatus_.store(static_cast<int32_t>(st));
        if (logger_) {
            logger_->warn("VoiceProcessingHardware: failed to clear BypassVoiceProcessing (OSStatus {})",
                          static_cast<int32_t>(st));
        }
    }

    AudioStreamBasicDescription asbd{};
    asbd.mSampleRate = config.sampleRate;
    asbd.mFormatID = kAudioFormatLinearPCM;
    asbd.mFormatFlags = kAudioFormatFlagIsSignedInteger | kAudioFormatFlagIsPacked;
    asbd.mBitsPerChannel = kBytesPerSample * 8;
    asbd.mChannelsPerFrame = kChannelCount;
    asbd.mBytesPerFrame = kBytesPerFrame;
    asbd.mFramesPerPacket = 1;
    asbd.mBytesPerPacket = kBytesPerFrame;

    st = AudioUnitSetProperty(unit_, kAudioUnitProperty_StreamFormat,
                              kAudioUnitScope_Output, kMicrophoneBus, &asbd, sizeof(asbd));
    if (st != noErr) return fail("StreamFormat (microphone)", st, BridgeError::PropertyRejected);

    st = AudioUnitSetProperty(unit_, kAudioUnitProperty_StreamFormat,
                              kAudioUnitScope_Input, kSpeakerBus, &asbd, sizeof(asbd));
    if (st != noErr) return fail("StreamFormat (speaker)", st, BridgeError::PropertyRejected);

    AURenderCallbackStruct renderCb{};
    renderCb.inputProc = &VoiceProcessingHardware::renderProc;
    renderCb.inputProcRefCon = this;
    st = AudioUnitSetProperty(unit_, kAudioUnitProperty_SetRenderCallback,
                              kAudioUnitScope_Input, kSpeakerBus, &renderCb, sizeof(renderCb));
    if (st != noErr) return fail("SetRenderCallback", st, BridgeError::PropertyRejected);

    AURenderCallbackStruct inputCb{};
    inputCb.inputProc = &VoiceProcessingHardware::inputProc;
    inputCb.inputProcRefCon = this;
    st = AudioUnitSetProperty(unit_, kAudioOutputUnitProperty_SetInputCallback,
                              kAudioUnitScope_Global, 0, &inputCb, sizeof(inputCb));
    if (st != noErr) return fail("SetInputCallback", st, BridgeError::PropertyRejected);

    const uint32_t maxFrames = config.maxFramesPerSlice();
    setMaximumFramesPerSlice(maxFrames, "before initialize");

    st = AudioUnitInitialize(unit_);
    if (st != noErr) return fail("AudioUnitInitialize", st, BridgeError::PropertyRejected);
    initialized_ = true;

    // Some devices reset the slice size during initialization
    setMaximumFramesPerSlice(maxFrames, "after initialize");

    if (logger_) {
        logger_->info("VoiceProcessingHardware: opened ({} Hz in, {} Hz out)",
                      inputSampleRate(), outputSampleRate());
    }
    return {};
}

std::expected<void, BridgeError> VoiceProcessingHardware::start() {
    if (!unit_ || !initialized_) {
        return std::unexpected(BridgeError::NotInitialized);
    }
    OSStatus st = AudioOutputUnitStart(unit_);
    if (st != noErr) {
        return fail("AudioOutputUnitStart", st, BridgeError::PropertyRejected);
    }
    started_.store(true);
    return {};
}

void VoiceProcessingHardware::stop() {
    if (!unit_ || !started_.exchange(false)) {
        return;
    }
    OSStatus st = AudioOutputUnitStop(unit_);
    if (st != noErr) {
        lastStatus_.store(static_cast<int32_t>(st));
        if (logger_) {
            logger_->warn("VoiceProcessingHardware: AudioOutputUnitStop returned {}", static_cast<int32_t>(st));
        }
    }
}

void VoiceProcessingHardware::close() {
    if (!unit_) {
        return;
    }
    stop();
    if (initialized_) {
        AudioUnitUninitialize(unit_);
        initialized_ = false;
    }
    AudioComponentInstanceDispose(unit_);
    unit_ = nullptr;
    source_ = nullptr;
    scratch_.release();
    if (logger_) {
        logger_->debug("VoiceProcessingHardware: closed");
    }
}

std::expected<bool, BridgeError> VoiceProcessingHardware::isVoiceProcessingBypassed() const {
    if (!unit_) {
        return std::unexpected(BridgeError::NotInitialized);
    }
    UInt32 value = 0;
    UInt32 size = sizeof(value);
    OSStatus st = AudioUnitGetProperty(unit_, kAUVoiceIOProperty_BypassVoiceProcessing,
                                       kAudioUnitScope_Global, 0, &value, &size);
    if (st != noErr) {
        lastStatus_.store(static_cast<int32_t>(st));
        return std::unexpected(BridgeError::PropertyRejected);
    }
    return value != 0;
}

double VoiceProcessingHardware::streamSampleRate(AudioUnitScope scope, AudioUnitElement bus) const {
    if (!unit_) {
        return 0.0;
    }
    AudioStreamBasicDescription asbd{};
    UInt32 size = sizeof(asbd);
    OSStatus st = AudioUnitGetProperty(unit_, kAudioUnitProperty_StreamFormat, scope, bus, &asbd, &size);
    return st == noErr ? asbd.mSampleRate : 0.0;
}

double VoiceProcessingHardware::inputSampleRate() const {
    return streamSampleRate(kAudioUnitScope_Output, kMicrophoneBus);
}

double VoiceProcessingHardware::outputSampleRate() const {
    return streamSampleRate(kAudioUnitScope_Input, kSpeakerBus);
}

OSStatus VoiceProcessingHardware::renderProc(void* inRefCon,
                                             AudioUnitRenderActionFlags* /*ioActionFlags*/,
                                             const AudioTimeStamp* /*inTimeStamp*/,
                                             UInt32 /*inBusNumber*/,
                                             UInt32 inNumberFrames,
                                             AudioBufferList* ioData) {
    auto* self = static_cast<VoiceProcessingHardware*>(inRefCon);
    if (!self || !self->source_ || !ioData || ioData->mNumberBuffers < 1) {
        return noErr;
    }
    AudioBuffer& buffer = ioData->mBuffers[0];
    if (!buffer.mData) {
        return noErr;
    }
    const UInt32 bytes = inNumberFrames * kBytesPerFrame;
    self->source_->onRenderNeeded(static_cast<uint8_t*>(buffer.mData), bytes);
    buffer.mDataByteSize = bytes;
    return noErr;
}

OSStatus VoiceProcessingHardware::inputProc(void* inRefCon,
                                            AudioUnitRenderActionFlags* ioActionFlags,
                                            const AudioTimeStamp* inTimeStamp,
                                            UInt32 /*inBusNumber*/,
                                            UInt32 inNumberFrames,
                                            AudioBufferList* /*ioData*/) {
    auto* self = static_cast<VoiceProcessingHardware*>(inRefCon);
    if (!self || !self->source_ || !self->source_->wantsCapture()) {
        return noErr;
    }

    const UInt32 bytes = inNumberFrames * kBytesPerFrame;
    uint8_t* scratch = self->scratch_.acquire(bytes);
    if (!scratch) {
        // Frame dropped
        return noErr;
    }

    AudioBufferList list{};
    list.mNumberBuffers = 1;
    list.mBuffers[0].mNumberChannels = kChannelCount;
    list.mBuffers[0].mDataByteSize = bytes;
    list.mBuffers[0].mData = scratch;

    OSStatus st = AudioUnitRender(self->unit_, ioActionFlags, inTimeStamp, kMicrophoneBus, inNumberFrames, &list);
    if (st != noErr) {
        return st;
    }
    self->source_->onCaptureAvailable(scratch, list.mBuffers[0].mDataByteSize);
    return noErr;
}

} // namespace Stream
} // namespace VPB
