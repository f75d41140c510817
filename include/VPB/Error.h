// include/VPB/Error.h
// Synopsis: Error codes for the bridge, usable with std::error_code and std::expected.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace VPB {

enum class BridgeError : int32_t {
    Success = 0,                 // Operation completed successfully
    ComponentNotFound = -1,      // Voice processing audio component is missing
    PropertyRejected = -2,       // Hardware refused a property or lifecycle call
    NoMemory = -3,               // Ring or buffer allocation failed
    NotInitialized = -4,         // Hardware unit has not been opened
    BadArgument = -5,            // Invalid argument
    InvalidState = -6,           // Call not allowed in the current mode
    ThreadStartFailed = -7,      // Pacing thread could not be created
    LibraryNotFound = -8,        // Bridge shared library could not be loaded
    SymbolMissing = -9,          // Bridge shared library lacks an entry point
    InternalError = -10          // Unexpected internal failure
};

namespace detail {
    struct BridgeErrorCategory : std::error_category {
        const char* name() const noexcept override { return "VPB"; }
        std::string message(int ev) const override {
            switch (static_cast<BridgeError>(ev)) {
                case BridgeError::Success: return "Success";
                case BridgeError::ComponentNotFound: return "Voice processing component not found";
                case BridgeError::PropertyRejected: return "Hardware property rejected";
                case BridgeError::NoMemory: return "Memory allocation failed";
                case BridgeError::NotInitialized: return "Hardware not initialized";
                case BridgeError::BadArgument: return "Invalid argument";
                case BridgeError::InvalidState: return "Invalid state";
                case BridgeError::ThreadStartFailed: return "Failed to start thread";
                case BridgeError::LibraryNotFound: return "Bridge library not found";
                case BridgeError::SymbolMissing: return "Bridge library symbol missing";
                case BridgeError::InternalError: return "Internal error";
                default: return "Unknown error";
            }
        }
    };
}

inline const std::error_category& bridge_error_category() noexcept {
    static detail::BridgeErrorCategory category;
    return category;
}

inline std::error_code make_error_code(BridgeError e) noexcept {
    return {static_cast<int>(e), bridge_error_category()};
}

inline int32_t toStatus(BridgeError e) noexcept {
    return static_cast<int32_t>(e);
}

} // namespace VPB

namespace std {
    template<>
    struct is_error_code_enum<VPB::BridgeError> : true_type {};
}
