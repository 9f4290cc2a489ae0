// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Native Access Layer - Platform Factory Implementation

#include "nal/platform.h"
#include "nal/virtual_library.h"
#include <atomic>
#include <mutex>

namespace nal {

// Forward declarations for libusb factory function (when available)
#if defined(NAL_HAS_LIBUSB)
std::shared_ptr<INativeLibrary> createLibraryLibusb();
#endif

namespace {

// Global platform state
std::mutex g_platform_mutex;
std::shared_ptr<INativeLibrary> g_library;
std::atomic<bool> g_initialized{false};
std::atomic<Backend> g_active_backend{Backend::None};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Platform Implementation
// ═══════════════════════════════════════════════════════════════════════════

Result Platform::initialize(Backend backend) {
    std::lock_guard<std::mutex> lock(g_platform_mutex);

    if (g_initialized.load()) {
        return Result::AlreadyInitialized;
    }
    if (backend == Backend::None) {
        return Result::InvalidParameter;
    }

    std::shared_ptr<INativeLibrary> library = createLibrary(backend);
    if (!library) {
        return Result::NotSupported;
    }

    g_library = std::move(library);
    g_active_backend.store(backend);
    g_initialized.store(true);
    return Result::Success;
}

void Platform::shutdown() {
    std::lock_guard<std::mutex> lock(g_platform_mutex);

    if (!g_initialized.load()) {
        return;
    }

    // Live contexts hold their own reference; the library goes away with them
    g_library.reset();
    g_active_backend.store(Backend::None);
    g_initialized.store(false);
}

bool Platform::isInitialized() {
    return g_initialized.load();
}

Backend Platform::getActiveBackend() {
    return g_active_backend.load();
}

const char* Platform::getBackendName() {
    return toString(g_active_backend.load());
}

bool Platform::isAvailable(Backend backend) {
    switch (backend) {
        case Backend::Virtual:
            return true;

        case Backend::Libusb:
#if defined(NAL_HAS_LIBUSB)
            return true;
#else
            return false;
#endif

        case Backend::None:
        default:
            return false;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Library Access
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<INativeLibrary> Platform::library() {
    std::lock_guard<std::mutex> lock(g_platform_mutex);
    return g_library;
}

std::shared_ptr<INativeLibrary> Platform::createLibrary(Backend backend) {
    switch (backend) {
        case Backend::Virtual:
            return std::make_shared<VirtualLibrary>();

#if defined(NAL_HAS_LIBUSB)
        case Backend::Libusb:
            return createLibraryLibusb();
#endif

        default:
            return nullptr;
    }
}

} // namespace nal
