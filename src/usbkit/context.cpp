/**
 * @file context.cpp
 * @brief Context and RawContextHandle implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "usbkit/context.h"
#include "usbkit/device_handle.h"
#include "usbkit/device_list.h"
#include "usbkit/gsl.hpp"
#include "usbkit/log_registry.h"
#include "usbkit/logging.h"

#include <nal/platform.h>

#include <atomic>
#include <mutex>

namespace usbkit {

namespace {

// Identities start at 1; 0 is the global callback slot
std::atomic<ContextId> g_next_context_id{1};

// Default context state
std::mutex g_default_mutex;
std::shared_ptr<nal::INativeLibrary> g_default_library;

nal::LogScope to_native(LogCallbackMode mode) noexcept {
    return static_cast<nal::LogScope>(static_cast<int>(mode));
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// RawContextHandle
// ─────────────────────────────────────────────────────────────────────────────

RawContextHandle::RawContextHandle(std::shared_ptr<nal::INativeLibrary> library,
                                   nal::RawContext* context)
    : library_(std::move(library))
    , context_(context)
    , id_(g_next_context_id.fetch_add(1, std::memory_order_relaxed))
{
    gsl_Expects(library_ != nullptr);
    gsl_Expects(context_ != nullptr);

    try {
        LogCallbackRegistry::instance().bind(context_, id_);
    } catch (...) {
        // The destructor will not run for a half-built object
        library_->exitContext(context_);
        throw;
    }
    USBKIT_LOG_DEBUG("context", "context {} created", id_);
}

RawContextHandle::~RawContextHandle() {
    // Forget the context before the native address can be handed out again
    LogCallbackRegistry::instance().release(id_);
    library_->exitContext(context_);
    USBKIT_LOG_DEBUG("context", "context {} released", id_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

Result<Context> Context::create() {
    return create(nal::Platform::library());
}

Result<Context> Context::create(std::shared_ptr<nal::INativeLibrary> library) {
    return create(std::move(library), nal::InitOptions{});
}

Result<Context> Context::create(std::shared_ptr<nal::INativeLibrary> library,
                                const nal::InitOptions& options) {
    if (!library) {
        return make_error(ErrorCode::InitError, "no native library backend is initialized");
    }

    nal::RawContext* raw = nullptr;
    int rc = library->initContext(&raw, options);
    if (rc < 0) {
        USBKIT_LOG_WARN("context", "native context initialization failed: {}", rc);
        return native_error(ErrorCode::InitError, rc, "init_context");
    }
    if (!raw) {
        return make_error(ErrorCode::InitError, "native library returned a null context");
    }

    return Context(std::make_shared<RawContextHandle>(std::move(library), raw));
}

// ─────────────────────────────────────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────────────────────────────────────

void Context::set_log_level(LogLevel level) const {
    int rc = library().setOption(native_handle(), nal::Option::LogLevel, static_cast<int>(level));
    if (rc < 0) {
        USBKIT_LOG_DEBUG("context", "context {}: set log level {} refused: {}",
                         id(), to_string(level), nal::toString(nal::statusFromCode(rc)));
    }
}

void Context::set_log_callback(LogCallback callback, LogCallbackMode mode) const {
    ContextId key = mode == LogCallbackMode::Global ? GlobalContextId : id();
    LogCallbackRegistry::instance().set(key, std::move(callback));
    library().setLogCallback(native_handle(), &LogCallbackRegistry::trampoline, to_native(mode));
}

void Context::clear_log_callback(LogCallbackMode mode) const {
    ContextId key = mode == LogCallbackMode::Global ? GlobalContextId : id();
    if (LogCallbackRegistry::instance().remove(key)) {
        library().setLogCallback(native_handle(), nullptr, to_native(mode));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Capabilities
// ─────────────────────────────────────────────────────────────────────────────

bool Context::has_capability() const {
    return library().hasCapability(nal::Capability::HasCapability);
}

bool Context::has_hotplug() const {
    return library().hasCapability(nal::Capability::HasHotplug);
}

bool Context::has_hid_access() const {
    return library().hasCapability(nal::Capability::HasHidAccess);
}

bool Context::supports_detach_kernel_driver() const {
    return library().hasCapability(nal::Capability::SupportsDetachKernelDriver);
}

LibraryVersion Context::library_version() const {
    nal::Version v = library().getVersion();
    return LibraryVersion{v.major, v.minor, v.micro, v.nano, std::move(v.rc)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Devices
// ─────────────────────────────────────────────────────────────────────────────

Result<DeviceList> Context::devices() const {
    nal::RawDevice** list = nullptr;
    std::ptrdiff_t count = library().getDeviceList(native_handle(), &list);
    if (count < 0) {
        USBKIT_LOG_WARN("context", "context {}: device enumeration failed: {}", id(), count);
        return native_error(ErrorCode::EnumerationError, static_cast<int>(count), "get_device_list");
    }
    return DeviceList(*this, list, static_cast<size_t>(count));
}

std::optional<DeviceHandle> Context::open_device_with_vid_pid(uint16_t vendor_id,
                                                              uint16_t product_id) const {
    nal::RawDeviceHandle* handle = library().openDeviceWithVidPid(native_handle(), vendor_id, product_id);
    if (!handle) {
        return std::nullopt;
    }
    return DeviceHandle(*this, handle);
}

// ─────────────────────────────────────────────────────────────────────────────
// Default Context
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Context::init_default_context() {
    return init_default_context(nal::Platform::library());
}

Result<void> Context::init_default_context(std::shared_ptr<nal::INativeLibrary> library) {
    std::lock_guard<std::mutex> lock(g_default_mutex);
    if (g_default_library) {
        return Ok();
    }
    if (!library) {
        return make_error(ErrorCode::InitError, "no native library backend is initialized");
    }

    int rc = library->initContext(nullptr);
    if (rc < 0) {
        USBKIT_LOG_WARN("context", "default context initialization failed: {}", rc);
        return native_error(ErrorCode::InitError, rc, "init_default_context");
    }
    g_default_library = std::move(library);
    return Ok();
}

void Context::release_default_context() {
    std::lock_guard<std::mutex> lock(g_default_mutex);
    if (!g_default_library) {
        return;
    }
    g_default_library->exitContext(nullptr);
    g_default_library.reset();
}

void Context::set_default_context_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_default_mutex);
    if (!g_default_library) {
        return;
    }
    int rc = g_default_library->setOption(nullptr, nal::Option::LogLevel, static_cast<int>(level));
    if (rc < 0) {
        USBKIT_LOG_DEBUG("context", "default context: set log level {} refused: {}",
                         to_string(level), nal::toString(nal::statusFromCode(rc)));
    }
}

bool Context::default_context_initialized() {
    std::lock_guard<std::mutex> lock(g_default_mutex);
    return g_default_library != nullptr;
}

} // namespace usbkit
