#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include "VPB/Error.h"

namespace spdlog {
    class logger;
}

namespace VPB {

/// Entry points resolved from the bridge shared library.
struct BridgeApi {
    int32_t (*init)(double, int){nullptr};
    int32_t (*start_stream)(double, int, size_t){nullptr};
    void (*stop_stream)(){nullptr};
    size_t (*write_frame)(const void*, size_t){nullptr};
    size_t (*read_capture)(void*, size_t){nullptr};
    size_t (*write_playback)(const void*, size_t){nullptr};
    void (*flush_playback)(){nullptr};
    void (*flush_input)(){nullptr};
    int32_t (*start_playback_thread)(int, int){nullptr};
    void (*stop_playback_thread)(){nullptr};
    size_t (*get_underflow_count)(){nullptr};
    void (*reset_underflow_count)(){nullptr};
    void (*set_target_headroom_ms)(int){nullptr};
    void (*shutdown)(){nullptr};

    // Optional diagnostics, may be null
    size_t (*get_ring_levels)(size_t*, size_t*){nullptr};
    void (*debug_dump)(){nullptr};
};

/**
 * @class BridgeLibrary
 * @brief Loads the bridge as a shared library at runtime.
 *
 * Used by hosts that cannot link against the bridge directly. The library
 * stays loaded for the lifetime of this object.
 */
class BridgeLibrary {
public:
    /**
     * @brief dlopen `path` and resolve every required entry point.
     * @return LibraryNotFound or SymbolMissing on failure
     */
    static std::expected<BridgeLibrary, BridgeError> load(const std::string& path,
                                                          std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Load from $VPIO_LIB, falling back to defaultPath().
    static std::expected<BridgeLibrary, BridgeError> loadFromEnvironment(std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Platform file name of the bridge library in the working directory.
    static std::string defaultPath();

    BridgeLibrary(BridgeLibrary&& other) noexcept;
    BridgeLibrary& operator=(BridgeLibrary&& other) noexcept;
    BridgeLibrary(const BridgeLibrary&) = delete;
    BridgeLibrary& operator=(const BridgeLibrary&) = delete;
    ~BridgeLibrary();

    const BridgeApi& api() const { return api_; }
    const std::string& path() const { return path_; }

private:
    BridgeLibrary(void* handle, BridgeApi api, std::string path);

    void* handle_{nullptr};
    BridgeApi api_{};
    std::string path_;
};

} // namespace VPB
