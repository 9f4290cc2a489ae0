/**
 * @file logging.h
 * @brief Library-internal diagnostics logging for usbkit.
 *
 * This is separate from the native library's log lines (see log_registry.h):
 * it carries usbkit's own diagnostics, such as context lifecycle, enumeration
 * failures and exceptions escaping user log callbacks.
 *
 * - Output goes through a process-wide callback when one is installed
 * - Default handler writes to stderr unless USBKIT_LIBRARY_MODE is defined
 * - Fast path (log_raw) avoids formatting when the level is filtered
 *
 * Usage:
 *   usbkit::set_diagnostic_callback(my_logger, userdata);
 *   USBKIT_LOG_WARN("context", "enumeration failed: {}", rc);
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/types.h"
#include <format>
#include <string>
#include <string_view>

namespace usbkit {

/**
 * @brief Diagnostics callback function type.
 *
 * @param level     Severity level of the message
 * @param subsystem Subsystem identifier (e.g. "context", "device")
 * @param message   The log message (null-terminated)
 * @param userdata  User-provided context from registration
 */
using DiagnosticCallback = void (*)(
    LogLevel level,
    const char* subsystem,
    const char* message,
    void* userdata
);

/**
 * @brief Install the diagnostics callback (nullptr restores the default).
 */
void set_diagnostic_callback(DiagnosticCallback callback, void* userdata) noexcept;

/**
 * @brief Set maximum diagnostics verbosity (default: Warning).
 */
void set_diagnostic_level(LogLevel level) noexcept;

[[nodiscard]] LogLevel diagnostic_level() noexcept;

/**
 * @brief Check if a level passes the diagnostics filter.
 */
[[nodiscard]] inline bool diagnostic_enabled(LogLevel level) noexcept {
    return level != LogLevel::None &&
           static_cast<int>(level) <= static_cast<int>(diagnostic_level());
}

/**
 * @brief Log a pre-formatted message (fast path).
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with std::format formatting.
 */
template<typename... Args>
void log_fmt(LogLevel level, const char* subsystem,
             std::format_string<Args...> fmt, Args&&... args) {
    // Check level before formatting
    if (!diagnostic_enabled(level)) {
        return;
    }
    std::string msg = std::format(fmt, std::forward<Args>(args)...);
    log_raw(level, subsystem, msg);
}

namespace detail {

/**
 * @brief Default handler: "[LEVEL] subsystem: message" on stderr.
 */
void default_diagnostic_handler(
    LogLevel level,
    const char* subsystem,
    const char* message,
    void* userdata
) noexcept;

} // namespace detail

} // namespace usbkit

// ═══════════════════════════════════════════════════════════════════════════════
// Logging Macros
// ═══════════════════════════════════════════════════════════════════════════════

#define USBKIT_LOG_ERROR(subsys, fmt, ...) \
    ::usbkit::log_fmt(::usbkit::LogLevel::Error, subsys, fmt, ##__VA_ARGS__)

#define USBKIT_LOG_WARN(subsys, fmt, ...) \
    ::usbkit::log_fmt(::usbkit::LogLevel::Warning, subsys, fmt, ##__VA_ARGS__)

#define USBKIT_LOG_INFO(subsys, fmt, ...) \
    ::usbkit::log_fmt(::usbkit::LogLevel::Info, subsys, fmt, ##__VA_ARGS__)

#define USBKIT_LOG_DEBUG(subsys, fmt, ...) \
    ::usbkit::log_fmt(::usbkit::LogLevel::Debug, subsys, fmt, ##__VA_ARGS__)
