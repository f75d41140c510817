#include "vpb_capi.h"
#include "VPB/BridgeConfig.hpp"
#include "VPB/HardwareAudioSession.hpp"
#include "VPB/JsonHelpers.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace {

struct VPBContext {
    std::mutex mutex;
    std::shared_ptr<VPB::HardwareAudioSession> session;
    std::atomic<VPBLogCallback> log_callback{nullptr};
    std::atomic<void*> log_user_data{nullptr};
};

VPBContext& context() {
    static VPBContext ctx;
    return ctx;
}

template<typename Mutex>
class VPBCallbackSink : public spdlog::sinks::base_sink<Mutex> {
protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        VPBLogCallback callback = context().log_callback.load();
        if (!callback) {
            return;
        }
        spdlog::memory_buf_t formatted;
        spdlog::sinks::base_sink<Mutex>::formatter_->format(msg, formatted);
        VPBLogLevel level = VPB_LOG_LEVEL_INFO;
        switch (msg.level) {
            case spdlog::level::trace:    level = VPB_LOG_LEVEL_TRACE; break;
            case spdlog::level::debug:    level = VPB_LOG_LEVEL_DEBUG; break;
            case spdlog::level::info:     level = VPB_LOG_LEVEL_INFO; break;
            case spdlog::level::warn:     level = VPB_LOG_LEVEL_WARN; break;
            case spdlog::level::err:      level = VPB_LOG_LEVEL_ERROR; break;
            case spdlog::level::critical: level = VPB_LOG_LEVEL_CRITICAL; break;
            case spdlog::level::off:      level = VPB_LOG_LEVEL_OFF; break;
            default: break;
        }
        callback(context().log_user_data.load(), level, fmt::to_string(formatted).c_str());
    }
    void flush_() override {}
};

std::shared_ptr<spdlog::logger> get_global_logger() {
    auto logger = spdlog::get("vpb_global");
    if (!logger) {
        try {
            auto stderrSink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
            auto callbackSink = std::make_shared<VPBCallbackSink<std::mutex>>();
            logger = std::make_shared<spdlog::logger>("vpb_global", spdlog::sinks_init_list{stderrSink, callbackSink});
            spdlog::register_logger(logger);
            logger->set_level(spdlog::level::info);
            logger->flush_on(spdlog::level::warn);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Global logger init failed: " << ex.what() << std::endl;
            return nullptr;
        }
    }
    return logger;
}

std::shared_ptr<VPB::HardwareAudioSession> current_session() {
    std::lock_guard<std::mutex> lock(context().mutex);
    return context().session;
}

std::shared_ptr<VPB::HardwareAudioSession> ensure_session() {
    std::lock_guard<std::mutex> lock(context().mutex);
    if (!context().session) {
        VPB::BridgeConfig config;
        config.logger = get_global_logger();
        config.applyEnvironment();
        context().session = std::make_shared<VPB::HardwareAudioSession>(std::move(config));
    }
    return context().session;
}

void log_exception(const char* where, const char* what) {
    if (auto logger = spdlog::get("vpb_global")) {
        logger->critical("C++ exception in {}: {}", where, what);
    } else {
        std::cerr << "C++ exception in " << where << ": " << what << std::endl;
    }
}

// Runs an expected-returning session call and maps the outcome to a status code
template <typename Func>
int32_t safe_execute(const char* where, std::shared_ptr<VPB::HardwareAudioSession> session, Func&& func) {
    if (!session) {
        return VPB_ERR_NOT_INITIALIZED;
    }
    try {
        auto result = func(*session);
        if (result) {
            return VPB_OK;
        }
        return VPB::toStatus(result.error());
    } catch (const std::bad_alloc&) {
        return VPB_ERR_NO_MEMORY;
    } catch (const std::exception& e) {
        log_exception(where, e.what());
        return VPB_ERR_INTERNAL;
    } catch (...) {
        log_exception(where, "unknown exception");
        return VPB_ERR_INTERNAL;
    }
}

// Same for calls that return a value; `fallback` is returned without a session or on exception
template <typename T, typename Func>
T safe_query(const char* where, T fallback, Func&& func) {
    auto session = current_session();
    if (!session) {
        return fallback;
    }
    try {
        return func(*session);
    } catch (const std::exception& e) {
        log_exception(where, e.what());
        return fallback;
    } catch (...) {
        log_exception(where, "unknown exception");
        return fallback;
    }
}

template <typename Func>
void safe_command(const char* where, Func&& func) {
    safe_query<int>(where, 0, [&](VPB::HardwareAudioSession& s) { func(s); return 0; });
}

} // anonymous namespace

// --- Lifecycle ---

int32_t vpb_init(double sample_rate, int channels) {
    std::shared_ptr<VPB::HardwareAudioSession> session;
    try {
        session = ensure_session();
    } catch (const std::bad_alloc&) {
        return VPB_ERR_NO_MEMORY;
    }
    return safe_execute("vpb_init", session, [&](VPB::HardwareAudioSession& s) {
        return s.init(sample_rate, channels);
    });
}

int32_t vpb_start_stream(double sample_rate, int channels, size_t ring_capacity_bytes) {
    std::shared_ptr<VPB::HardwareAudioSession> session;
    try {
        session = ensure_session();
    } catch (const std::bad_alloc&) {
        return VPB_ERR_NO_MEMORY;
    }
    return safe_execute("vpb_start_stream", session, [&](VPB::HardwareAudioSession& s) {
        return s.startStream(sample_rate, channels, ring_capacity_bytes);
    });
}

void vpb_stop_stream(void) {
    safe_command("vpb_stop_stream", [](VPB::HardwareAudioSession& s) { s.stopStream(); });
}

void vpb_shutdown(void) {
    std::shared_ptr<VPB::HardwareAudioSession> session;
    {
        std::lock_guard<std::mutex> lock(context().mutex);
        session = std::move(context().session);
    }
    if (!session) {
        return;
    }
    try {
        session->shutdown();
    } catch (const std::exception& e) {
        log_exception("vpb_shutdown", e.what());
    }
}

// --- Streaming ---

size_t vpb_write_frame(const void* data, size_t len) {
    return safe_query<size_t>("vpb_write_frame", 0, [&](VPB::HardwareAudioSession& s) {
        return s.writeFrame(data, len);
    });
}

size_t vpb_read_capture(void* dst, size_t max_len) {
    return safe_query<size_t>("vpb_read_capture", 0, [&](VPB::HardwareAudioSession& s) {
        return s.readCapture(dst, max_len);
    });
}

size_t vpb_write_playback(const void* data, size_t len) {
    return safe_query<size_t>("vpb_write_playback", 0, [&](VPB::HardwareAudioSession& s) {
        return s.writePlayback(data, len);
    });
}

void vpb_flush_playback(void) {
    safe_command("vpb_flush_playback", [](VPB::HardwareAudioSession& s) { s.flushPlayback(); });
}

void vpb_flush_input(void) {
    safe_command("vpb_flush_input", [](VPB::HardwareAudioSession& s) { s.flushInput(); });
}

// --- Pacing ---

int32_t vpb_start_playback_thread(int slice_ms, int preroll_ms) {
    return safe_execute("vpb_start_playback_thread", current_session(), [&](VPB::HardwareAudioSession& s) {
        return s.startPacing(slice_ms, preroll_ms);
    });
}

void vpb_stop_playback_thread(void) {
    safe_command("vpb_stop_playback_thread", [](VPB::HardwareAudioSession& s) { s.stopPacing(); });
}

size_t vpb_get_underflow_count(void) {
    return safe_query<size_t>("vpb_get_underflow_count", 0, [](VPB::HardwareAudioSession& s) {
        return s.underflowCount();
    });
}

void vpb_reset_underflow_count(void) {
    safe_command("vpb_reset_underflow_count", [](VPB::HardwareAudioSession& s) { s.resetUnderflowCount(); });
}

void vpb_set_target_headroom_ms(int ms) {
    safe_command("vpb_set_target_headroom_ms", [&](VPB::HardwareAudioSession& s) { s.setTargetHeadroomMs(ms); });
}

// --- Blocking one-shot helpers ---

int32_t vpb_record(double seconds) {
    return safe_execute("vpb_record", current_session(), [&](VPB::HardwareAudioSession& s) {
        return s.record(seconds);
    });
}

size_t vpb_get_capture_size(void) {
    return safe_query<size_t>("vpb_get_capture_size", 0, [](VPB::HardwareAudioSession& s) {
        return s.captureSize();
    });
}

size_t vpb_copy_capture(void* dst, size_t max_len) {
    return safe_query<size_t>("vpb_copy_capture", 0, [&](VPB::HardwareAudioSession& s) {
        return s.copyCapture(dst, max_len);
    });
}

void vpb_reset_capture(void) {
    safe_command("vpb_reset_capture", [](VPB::HardwareAudioSession& s) { s.resetCapture(); });
}

int32_t vpb_play(const void* data, size_t len) {
    return safe_execute("vpb_play", current_session(), [&](VPB::HardwareAudioSession& s) {
        return s.play(data, len);
    });
}

// --- Introspection ---

int32_t vpb_get_bypass(unsigned int* out_bypass) {
    if (!out_bypass) {
        return VPB_ERR_BAD_ARGUMENT;
    }
    return safe_execute("vpb_get_bypass", current_session(), [&](VPB::HardwareAudioSession& s) {
        auto bypass = s.voiceProcessingBypass();
        if (bypass) {
            *out_bypass = *bypass ? 1u : 0u;
        }
        return bypass;
    });
}

double vpb_get_in_sample_rate(void) {
    return safe_query<double>("vpb_get_in_sample_rate", 0.0, [](VPB::HardwareAudioSession& s) {
        return s.inputSampleRate();
    });
}

double vpb_get_out_sample_rate(void) {
    return safe_query<double>("vpb_get_out_sample_rate", 0.0, [](VPB::HardwareAudioSession& s) {
        return s.outputSampleRate();
    });
}

size_t vpb_get_ring_levels(size_t* out_capture_level, size_t* out_playback_level) {
    const VPB::RingLevels levels = safe_query<VPB::RingLevels>("vpb_get_ring_levels", VPB::RingLevels{},
        [](VPB::HardwareAudioSession& s) { return s.ringLevels(); });
    if (out_capture_level) *out_capture_level = levels.capture;
    if (out_playback_level) *out_playback_level = levels.playback;
    return levels.total();
}

size_t vpb_get_staging_level(void) {
    return safe_query<size_t>("vpb_get_staging_level", 0, [](VPB::HardwareAudioSession& s) {
        return s.stagingLevel();
    });
}

size_t vpb_get_staging_capacity(void) {
    return safe_query<size_t>("vpb_get_staging_capacity", 0, [](VPB::HardwareAudioSession& s) {
        return s.stagingCapacity();
    });
}

void vpb_debug_dump(void) {
    auto session = current_session();
    if (!session) {
        if (auto logger = get_global_logger()) {
            logger->info("[VPIO] not initialized");
        }
        return;
    }
    safe_command("vpb_debug_dump", [](VPB::HardwareAudioSession& s) { s.debugDump(); });
}

char* vpb_get_debug_json(void) {
    try {
        nlohmann::json j;
        if (auto session = current_session()) {
            j = VPB::JsonHelpers::serializeSnapshot(session->debugSnapshot());
            j["config"] = VPB::JsonHelpers::serializeConfig(session->config());
        } else {
            j = VPB::JsonHelpers::serializeSnapshot(VPB::DebugSnapshot{});
        }
        std::string json_str = j.dump(2);
        char* c_json = strdup(json_str.c_str());
        if (!c_json) {
            if (auto logger = spdlog::get("vpb_global")) {
                logger->error("vpb_get_debug_json: failed to allocate memory for JSON string");
            }
        }
        return c_json;
    } catch (const std::exception& e) {
        log_exception("vpb_get_debug_json", e.what());
        return nullptr;
    }
}

void vpb_free_string(char* str) {
    std::free(str);
}

// --- Logging ---

int32_t vpb_set_log_callback(VPBLogCallback callback, void* user_data) {
    if (!get_global_logger()) {
        return VPB_ERR_INTERNAL;
    }
    context().log_user_data.store(user_data);
    context().log_callback.store(callback);
    return VPB_OK;
}

int32_t vpb_set_log_level(VPBLogLevel level) {
    auto logger = get_global_logger();
    if (!logger) {
        return VPB_ERR_INTERNAL;
    }
    spdlog::level::level_enum spd_level = spdlog::level::info;
    switch (level) {
        case VPB_LOG_LEVEL_TRACE:    spd_level = spdlog::level::trace; break;
        case VPB_LOG_LEVEL_DEBUG:    spd_level = spdlog::level::debug; break;
        case VPB_LOG_LEVEL_INFO:     spd_level = spdlog::level::info; break;
        case VPB_LOG_LEVEL_WARN:     spd_level = spdlog::level::warn; break;
        case VPB_LOG_LEVEL_ERROR:    spd_level = spdlog::level::err; break;
        case VPB_LOG_LEVEL_CRITICAL: spd_level = spdlog::level::critical; break;
        case VPB_LOG_LEVEL_OFF:      spd_level = spdlog::level::off; break;
        default: return VPB_ERR_BAD_ARGUMENT;
    }
    logger->set_level(spd_level);
    return VPB_OK;
}
