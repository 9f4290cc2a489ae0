/**
 * @file logging.cpp
 * @brief Implementation of usbkit diagnostics logging.
 *
 * Thread-safety: callback registration is protected by a mutex; the level
 * filter is an atomic so filtered calls never lock.
 *
 * @copyright GPL-2.0-or-later
 */

#include "usbkit/logging.h"

#include <atomic>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace usbkit {

namespace {

// Mutex for callback registration (not for logging itself)
std::mutex g_diag_mutex;

// Current callback and userdata
DiagnosticCallback g_diag_callback = nullptr;
void* g_diag_userdata = nullptr;

// Maximum level passed to the handler (atomic for lock-free reads)
std::atomic<LogLevel> g_diag_level{LogLevel::Warning};

// Buffer size for null-terminating string_view messages
constexpr size_t LOG_BUFFER_SIZE = 1024;

} // anonymous namespace

void set_diagnostic_callback(DiagnosticCallback callback, void* userdata) noexcept {
    std::lock_guard<std::mutex> lock(g_diag_mutex);
    g_diag_callback = callback;
    g_diag_userdata = userdata;
}

void set_diagnostic_level(LogLevel level) noexcept {
    g_diag_level.store(level, std::memory_order_relaxed);
}

LogLevel diagnostic_level() noexcept {
    return g_diag_level.load(std::memory_order_relaxed);
}

namespace detail {

void default_diagnostic_handler(
    LogLevel level,
    const char* subsystem,
    const char* message,
    void* /*userdata*/
) noexcept {
    std::fprintf(stderr, "[%s] usbkit.%s: %s\n", to_string(level), subsystem, message);
}

} // namespace detail

void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept {
    if (!diagnostic_enabled(level)) {
        return;
    }

    // Get callback (brief lock, copy out)
    DiagnosticCallback callback = nullptr;
    void* userdata = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_diag_mutex);
        callback = g_diag_callback;
        userdata = g_diag_userdata;
    }

    // Copy to a null-terminated buffer, truncating oversized messages
    char buffer[LOG_BUFFER_SIZE];
    size_t length = message.size() < LOG_BUFFER_SIZE ? message.size() : LOG_BUFFER_SIZE - 1;
    std::memcpy(buffer, message.data(), length);
    buffer[length] = '\0';

    if (callback) {
        callback(level, subsystem, buffer, userdata);
    }
#ifndef USBKIT_LIBRARY_MODE
    else {
        detail::default_diagnostic_handler(level, subsystem, buffer, nullptr);
    }
#endif
}

} // namespace usbkit
