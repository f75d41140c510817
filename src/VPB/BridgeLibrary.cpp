#include "VPB/BridgeLibrary.hpp"
#include "VPB/BridgeConfig.hpp"
#include <spdlog/spdlog.h>
#include <dlfcn.h>
#include <cstdlib>
#include <utility>

namespace VPB {

namespace {

template <typename Fn>
bool resolve(void* handle, const char* name, Fn& out, const std::shared_ptr<spdlog::logger>& logger, bool required) {
    dlerror();
    void* sym = dlsym(handle, name);
    if (!sym) {
        if (required && logger) {
            const char* err = dlerror();
            logger->error("BridgeLibrary: missing symbol '{}': {}", name, err ? err : "not found");
        }
        return !required;
    }
    out = reinterpret_cast<Fn>(sym);
    return true;
}

} // anonymous namespace

BridgeLibrary::BridgeLibrary(void* handle, BridgeApi api, std::string path)
    : handle_(handle)
    , api_(api)
    , path_(std::move(path)) {
}

BridgeLibrary::BridgeLibrary(BridgeLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr))
    , api_(std::exchange(other.api_, BridgeApi{}))
    , path_(std::move(other.path_)) {
}

BridgeLibrary& BridgeLibrary::operator=(BridgeLibrary&& other) noexcept {
    if (this != &other) {
        if (handle_) {
            dlclose(handle_);
        }
        handle_ = std::exchange(other.handle_, nullptr);
        api_ = std::exchange(other.api_, BridgeApi{});
        path_ = std::move(other.path_);
    }
    return *this;
}

BridgeLibrary::~BridgeLibrary() {
    if (handle_) {
        dlclose(handle_);
    }
}

std::string BridgeLibrary::defaultPath() {
#if defined(__APPLE__)
    return "./libvpiobridge.dylib";
#else
    return "./libvpiobridge.so";
#endif
}

std::expected<BridgeLibrary, BridgeError> BridgeLibrary::load(const std::string& path,
                                                              std::shared_ptr<spdlog::logger> logger) {
    if (path.empty()) {
        return std::unexpected(BridgeError::BadArgument);
    }

    // The bridge registers its logger and sinks with the process-wide spdlog
    // registry, so its code has to stay mapped after dlclose.
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL | RTLD_NODELETE);
    if (!handle) {
        if (logger) {
            const char* err = dlerror();
            logger->error("BridgeLibrary: cannot load '{}': {}", path, err ? err : "unknown error");
        }
        return std::unexpected(BridgeError::LibraryNotFound);
    }

    BridgeApi api;
    const bool ok =
        resolve(handle, "vpb_init", api.init, logger, true) &&
        resolve(handle, "vpb_start_stream", api.start_stream, logger, true) &&
        resolve(handle, "vpb_stop_stream", api.stop_stream, logger, true) &&
        resolve(handle, "vpb_write_frame", api.write_frame, logger, true) &&
        resolve(handle, "vpb_read_capture", api.read_capture, logger, true) &&
        resolve(handle, "vpb_write_playback", api.write_playback, logger, true) &&
        resolve(handle, "vpb_flush_playback", api.flush_playback, logger, true) &&
        resolve(handle, "vpb_flush_input", api.flush_input, logger, true) &&
        resolve(handle, "vpb_start_playback_thread", api.start_playback_thread, logger, true) &&
        resolve(handle, "vpb_stop_playback_thread", api.stop_playback_thread, logger, true) &&
        resolve(handle, "vpb_get_underflow_count", api.get_underflow_count, logger, true) &&
        resolve(handle, "vpb_reset_underflow_count", api.reset_underflow_count, logger, true) &&
        resolve(handle, "vpb_set_target_headroom_ms", api.set_target_headroom_ms, logger, true) &&
        resolve(handle, "vpb_shutdown", api.shutdown, logger, true) &&
        resolve(handle, "vpb_get_ring_levels", api.get_ring_levels, logger, false) &&
        resolve(handle, "vpb_debug_dump", api.debug_dump, logger, false);

    if (!ok) {
        dlclose(handle);
        return std::unexpected(BridgeError::SymbolMissing);
    }

    if (logger) {
        logger->info("BridgeLibrary: loaded '{}'", path);
    }
    return BridgeLibrary(handle, api, path);
}

std::expected<BridgeLibrary, BridgeError> BridgeLibrary::loadFromEnvironment(std::shared_ptr<spdlog::logger> logger) {
    const char* env = std::getenv(kEnvLibraryPath);
    const std::string path = (env && env[0] != '\0') ? std::string(env) : defaultPath();
    return load(path, std::move(logger));
}

} // namespace VPB
