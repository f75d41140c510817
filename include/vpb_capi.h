#ifndef VPB_CAPI_H
#define VPB_CAPI_H

#include <stddef.h> // For size_t
#include <stdint.h> // For int32_t

#ifdef __cplusplus
extern "C" {
#endif

// --- Status codes ---
// 0 is success; negative values mirror VPB::BridgeError.
typedef enum {
    VPB_OK = 0,
    VPB_ERR_COMPONENT_NOT_FOUND = -1,
    VPB_ERR_PROPERTY_REJECTED = -2,
    VPB_ERR_NO_MEMORY = -3,
    VPB_ERR_NOT_INITIALIZED = -4,
    VPB_ERR_BAD_ARGUMENT = -5,
    VPB_ERR_INVALID_STATE = -6,
    VPB_ERR_THREAD_START_FAILED = -7,
    VPB_ERR_INTERNAL = -10
} VPBStatusCode;

typedef enum {
    VPB_LOG_LEVEL_TRACE = 0,
    VPB_LOG_LEVEL_DEBUG = 1,
    VPB_LOG_LEVEL_INFO = 2,
    VPB_LOG_LEVEL_WARN = 3,
    VPB_LOG_LEVEL_ERROR = 4,
    VPB_LOG_LEVEL_CRITICAL = 5,
    VPB_LOG_LEVEL_OFF = 6
} VPBLogLevel;

typedef void (*VPBLogCallback)(void* user_data, VPBLogLevel level, const char* message);

// --- Lifecycle ---
// The library manages a single process-wide session.
int32_t vpb_init(double sample_rate, int channels);
int32_t vpb_start_stream(double sample_rate, int channels, size_t ring_capacity_bytes);
void vpb_stop_stream(void);
void vpb_shutdown(void);

// --- Streaming ---
size_t vpb_write_frame(const void* data, size_t len);
size_t vpb_read_capture(void* dst, size_t max_len);
size_t vpb_write_playback(const void* data, size_t len);
void vpb_flush_playback(void);
void vpb_flush_input(void);

// --- Pacing ---
int32_t vpb_start_playback_thread(int slice_ms, int preroll_ms);
void vpb_stop_playback_thread(void);
size_t vpb_get_underflow_count(void);
void vpb_reset_underflow_count(void);
void vpb_set_target_headroom_ms(int ms);

// --- Blocking one-shot helpers ---
int32_t vpb_record(double seconds);
size_t vpb_get_capture_size(void);
size_t vpb_copy_capture(void* dst, size_t max_len);
void vpb_reset_capture(void);
int32_t vpb_play(const void* data, size_t len);

// --- Introspection ---
int32_t vpb_get_bypass(unsigned int* out_bypass);
double vpb_get_in_sample_rate(void);
double vpb_get_out_sample_rate(void);
/** Returns capture + playback levels; either out pointer may be NULL. */
size_t vpb_get_ring_levels(size_t* out_capture_level, size_t* out_playback_level);
size_t vpb_get_staging_level(void);
size_t vpb_get_staging_capacity(void);
void vpb_debug_dump(void);

/**
 * @brief Session state as a JSON string. Release with vpb_free_string.
 * @return NULL on allocation failure
 */
char* vpb_get_debug_json(void);
void vpb_free_string(char* str);

// --- Logging ---
int32_t vpb_set_log_callback(VPBLogCallback callback, void* user_data);
int32_t vpb_set_log_level(VPBLogLevel level);

#ifdef __cplusplus
} // extern "C"
#endif

#endif // VPB_CAPI_H
