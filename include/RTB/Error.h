// include/RTB/Error.h
// Synopsis: Error codes for stream startup, stream status, the handoff channel
// and the platform layer.

#pragma once

#include <string>
#include <system_error>

namespace RTB {

enum class StartStreamError {
    Initialization = 1,   // Audio context or buffer setup failed, no stream created
    WorkletCreation       // Asynchronous render node activation failed
};

enum class StreamError {
    UnexpectedDrop = 1    // Render side became unreachable
};

enum class HandoffError {
    ReceiverGone = 1,     // Receiving end destroyed before or during send
    AlreadySent           // Channel is single-use
};

enum class PlatformError {
    ContextCreationFailed = 1,
    UnsupportedSampleRate,
    ModuleNotFound,
    ModuleLoadFailed,
    NodeCreationFailed,
    NotConnected,
    AlreadyClosed,
    ClockStartFailed,
    Cancelled
};

namespace detail {
    struct StartStreamErrorCategory : std::error_category {
        const char* name() const noexcept override { return "StartStream"; }
        std::string message(int ev) const override {
            switch (static_cast<StartStreamError>(ev)) {
                case StartStreamError::Initialization: return "Failed to initialize audio context";
                case StartStreamError::WorkletCreation: return "Failed to create the backend render node";
                default: return "Unknown error";
            }
        }
    };

    struct StreamErrorCategory : std::error_category {
        const char* name() const noexcept override { return "Stream"; }
        std::string message(int ev) const override {
            switch (static_cast<StreamError>(ev)) {
                case StreamError::UnexpectedDrop: return "The render node was unexpectedly dropped";
                default: return "Unknown error";
            }
        }
    };

    struct HandoffErrorCategory : std::error_category {
        const char* name() const noexcept override { return "Handoff"; }
        std::string message(int ev) const override {
            switch (static_cast<HandoffError>(ev)) {
                case HandoffError::ReceiverGone: return "Receiver is gone";
                case HandoffError::AlreadySent: return "A value was already sent on this channel";
                default: return "Unknown error";
            }
        }
    };

    struct PlatformErrorCategory : std::error_category {
        const char* name() const noexcept override { return "Platform"; }
        std::string message(int ev) const override {
            switch (static_cast<PlatformError>(ev)) {
                case PlatformError::ContextCreationFailed: return "Audio context creation failed";
                case PlatformError::UnsupportedSampleRate: return "Unsupported sample rate";
                case PlatformError::ModuleNotFound: return "Render module not found";
                case PlatformError::ModuleLoadFailed: return "Render module failed to load";
                case PlatformError::NodeCreationFailed: return "Render node construction failed";
                case PlatformError::NotConnected: return "Render node is not connected";
                case PlatformError::AlreadyClosed: return "Audio context already closed";
                case PlatformError::ClockStartFailed: return "Device clock failed to start";
                case PlatformError::Cancelled: return "Operation cancelled";
                default: return "Unknown error";
            }
        }
    };
}

inline const std::error_category& start_stream_error_category() noexcept {
    static detail::StartStreamErrorCategory category;
    return category;
}

inline const std::error_category& stream_error_category() noexcept {
    static detail::StreamErrorCategory category;
    return category;
}

inline const std::error_category& handoff_error_category() noexcept {
    static detail::HandoffErrorCategory category;
    return category;
}

inline const std::error_category& platform_error_category() noexcept {
    static detail::PlatformErrorCategory category;
    return category;
}

inline std::error_code make_error_code(StartStreamError e) noexcept {
    return {static_cast<int>(e), start_stream_error_category()};
}

inline std::error_code make_error_code(StreamError e) noexcept {
    return {static_cast<int>(e), stream_error_category()};
}

inline std::error_code make_error_code(HandoffError e) noexcept {
    return {static_cast<int>(e), handoff_error_category()};
}

inline std::error_code make_error_code(PlatformError e) noexcept {
    return {static_cast<int>(e), platform_error_category()};
}

} // namespace RTB

namespace std {
    template<>
    struct is_error_code_enum<RTB::StartStreamError> : true_type {};
    template<>
    struct is_error_code_enum<RTB::StreamError> : true_type {};
    template<>
    struct is_error_code_enum<RTB::HandoffError> : true_type {};
    template<>
    struct is_error_code_enum<RTB::PlatformError> : true_type {};
}
