// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Native Access Layer - Platform Factory

#pragma once

#include "nal/types.h"
#include "nal/library.h"
#include <memory>

namespace nal {

/// Available NAL backends
enum class Backend {
    None = 0,
    Libusb,     // libusb-1.0 host library
    Virtual     // In-process simulated bus - for testing
};

/// Platform initialization and library access
///
/// Initialize once at startup. The library instance is shared: contexts keep
/// their own reference, so shutdown() never pulls the library out from under
/// a live context.
class Platform {
public:
    // ═══════════════════════════════════════════════════════════════════════
    // Initialization
    // ═══════════════════════════════════════════════════════════════════════

    /// Initialize the platform with specified backend
    /// @return Success, NotSupported (backend not compiled in), AlreadyInitialized
    static Result initialize(Backend backend);

    /// Drop the platform's reference to the active library
    static void shutdown();

    /// Check if platform is initialized
    static bool isInitialized();

    /// Get the active backend
    static Backend getActiveBackend();

    /// Get the active backend name as string
    static const char* getBackendName();

    /// Check whether a backend was compiled in
    static bool isAvailable(Backend backend);

    // ═══════════════════════════════════════════════════════════════════════
    // Library Access
    // ═══════════════════════════════════════════════════════════════════════

    /// Get the active library
    /// @return Shared library instance, or nullptr if not initialized
    static std::shared_ptr<INativeLibrary> library();

    /// Create a standalone library instance for a backend, bypassing the
    /// platform's active selection
    /// @return New library, or nullptr if the backend is unavailable
    static std::shared_ptr<INativeLibrary> createLibrary(Backend backend);
};

/// Convert Backend to string for debugging
constexpr const char* toString(Backend backend) noexcept {
    switch (backend) {
        case Backend::None:    return "None";
        case Backend::Libusb:  return "Libusb";
        case Backend::Virtual: return "Virtual";
    }
    return "Unknown";
}

} // namespace nal
