/**
 * @file types.h
 * @brief Shared value types for the usbkit core.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <nal/types.h>
#include <cstdint>
#include <functional>
#include <string>

namespace usbkit {

// ─────────────────────────────────────────────────────────────────────────────
// Context Identity
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Opaque identity issued to each context at construction.
 *
 * Monotonically assigned and never reused, unlike native context addresses.
 * Zero is reserved for the process-wide (global) log callback slot.
 */
using ContextId = uint64_t;

inline constexpr ContextId GlobalContextId = 0;

// ─────────────────────────────────────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Library logging levels.
 */
enum class LogLevel : int {
    None    = static_cast<int>(nal::LogLevel::None),     ///< No messages (default)
    Error   = static_cast<int>(nal::LogLevel::Error),    ///< Errors only
    Warning = static_cast<int>(nal::LogLevel::Warning),  ///< Warnings and errors
    Info    = static_cast<int>(nal::LogLevel::Info),     ///< Informational and above
    Debug   = static_cast<int>(nal::LogLevel::Debug)     ///< Everything
};

/**
 * @brief Which log lines a callback receives.
 */
enum class LogCallbackMode : int {
    Global  = static_cast<int>(nal::LogScope::Global),   ///< All lines, any context
    Context = static_cast<int>(nal::LogScope::Context)   ///< Lines from one context
};

/**
 * @brief User log callback.
 *
 * Invoked on whatever thread the native library logs from. Implementations
 * must synchronize any application state they touch.
 */
using LogCallback = std::function<void(LogLevel, std::string)>;

/**
 * @brief Decode a native log level; unknown values map to None.
 */
[[nodiscard]] constexpr LogLevel log_level_from_native(int raw) noexcept {
    switch (raw) {
        case static_cast<int>(nal::LogLevel::Error):   return LogLevel::Error;
        case static_cast<int>(nal::LogLevel::Warning): return LogLevel::Warning;
        case static_cast<int>(nal::LogLevel::Info):    return LogLevel::Info;
        case static_cast<int>(nal::LogLevel::Debug):   return LogLevel::Debug;
        default:                                       return LogLevel::None;
    }
}

[[nodiscard]] constexpr const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::None:    return "NONE";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Debug:   return "DEBUG";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr const char* to_string(LogCallbackMode mode) noexcept {
    switch (mode) {
        case LogCallbackMode::Global:  return "Global";
        case LogCallbackMode::Context: return "Context";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Device Speed
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Negotiated connection speed.
 */
enum class Speed : uint8_t {
    Unknown,
    Low,        ///< 1.5 Mbit/s
    Full,       ///< 12 Mbit/s
    High,       ///< 480 Mbit/s
    Super,      ///< 5 Gbit/s
    SuperPlus   ///< 10 Gbit/s
};

/**
 * @brief Decode a native speed code. Unrecognized codes are Unknown.
 */
[[nodiscard]] constexpr Speed speed_from_native(int raw) noexcept {
    switch (raw) {
        case static_cast<int>(nal::SpeedCode::Low):       return Speed::Low;
        case static_cast<int>(nal::SpeedCode::Full):      return Speed::Full;
        case static_cast<int>(nal::SpeedCode::High):      return Speed::High;
        case static_cast<int>(nal::SpeedCode::Super):     return Speed::Super;
        case static_cast<int>(nal::SpeedCode::SuperPlus): return Speed::SuperPlus;
        default:                                          return Speed::Unknown;
    }
}

[[nodiscard]] constexpr const char* to_string(Speed speed) noexcept {
    switch (speed) {
        case Speed::Unknown:   return "Unknown";
        case Speed::Low:       return "Low";
        case Speed::Full:      return "Full";
        case Speed::High:      return "High";
        case Speed::Super:     return "Super";
        case Speed::SuperPlus: return "SuperPlus";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Library Version
// ─────────────────────────────────────────────────────────────────────────────

struct LibraryVersion {
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t micro = 0;
    uint16_t nano = 0;
    std::string rc;
};

} // namespace usbkit
