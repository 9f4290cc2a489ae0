/**
 * @file context.h
 * @brief Shared, reference-counted native library context.
 *
 * A Context owns one native context through a RawContextHandle. Copies of a
 * Context share that handle; the native context is released exactly once,
 * when the last copy and the last descendant (DeviceList, Device,
 * DeviceHandle) referring to it are gone.
 *
 * Example:
 * @code
 *   auto ctx = usbkit::Context::create();
 *   if (!ctx) {
 *       std::cerr << ctx.error().format() << "\n";
 *       return;
 *   }
 *   ctx->set_log_level(usbkit::LogLevel::Warning);
 *   ctx->set_log_callback([](usbkit::LogLevel level, std::string msg) {
 *       std::cerr << usbkit::to_string(level) << ": " << msg << "\n";
 *   }, usbkit::LogCallbackMode::Context);
 *
 *   auto list = ctx->devices();
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/error.h"
#include "usbkit/types.h"
#include <nal/library.h>
#include <cstdint>
#include <memory>
#include <optional>

namespace usbkit {

class DeviceList;
class DeviceHandle;

// ─────────────────────────────────────────────────────────────────────────────
// RawContextHandle
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Sole owner of one native context.
 *
 * Issues the context its ContextId and binds the native address to it in the
 * log callback registry. The destructor first forgets the context in the
 * registry, then releases the native context.
 */
class RawContextHandle {
public:
    /**
     * @brief Adopt an initialized native context.
     * @param library Library that created @p context (must be non-null)
     * @param context Native context (must be non-null)
     */
    RawContextHandle(std::shared_ptr<nal::INativeLibrary> library, nal::RawContext* context);

    ~RawContextHandle();

    // Non-copyable, non-movable (shared through std::shared_ptr only)
    RawContextHandle(const RawContextHandle&) = delete;
    RawContextHandle& operator=(const RawContextHandle&) = delete;
    RawContextHandle(RawContextHandle&&) = delete;
    RawContextHandle& operator=(RawContextHandle&&) = delete;

    [[nodiscard]] nal::RawContext* get() const noexcept { return context_; }
    [[nodiscard]] ContextId id() const noexcept { return id_; }
    [[nodiscard]] nal::INativeLibrary& library() const noexcept { return *library_; }
    [[nodiscard]] const std::shared_ptr<nal::INativeLibrary>& library_ptr() const noexcept { return library_; }

private:
    std::shared_ptr<nal::INativeLibrary> library_;
    nal::RawContext* context_;
    ContextId id_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Context
// ─────────────────────────────────────────────────────────────────────────────

class Context {
public:
    /**
     * @brief Create a context on the active nal::Platform backend.
     * @return The context, or InitError (also when no backend is initialized)
     */
    [[nodiscard]] static Result<Context> create();

    /**
     * @brief Create a context on an explicit native library.
     */
    [[nodiscard]] static Result<Context> create(std::shared_ptr<nal::INativeLibrary> library);

    /**
     * @brief Create a context with init-time options.
     *
     * Device discovery can only be turned off here; the native library
     * enumerates during initialization.
     */
    [[nodiscard]] static Result<Context> create(std::shared_ptr<nal::INativeLibrary> library,
                                                const nal::InitOptions& options);

    // ─────────────────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Set the native library's verbosity for this context.
     *
     * Never fails from the caller's point of view; a native refusal is only
     * reported through diagnostics logging.
     */
    void set_log_level(LogLevel level) const;

    /**
     * @brief Register a callback for native log lines.
     *
     * Context mode receives lines from this context only; Global mode
     * receives lines from every context. Replaces the previous callback for
     * the same key (this context, or the global slot).
     *
     * The callback runs on whatever thread the native library logs from.
     */
    void set_log_callback(LogCallback callback, LogCallbackMode mode) const;

    /**
     * @brief Remove the callback registered for this context or the global slot.
     */
    void clear_log_callback(LogCallbackMode mode) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Capabilities
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool has_capability() const;
    [[nodiscard]] bool has_hotplug() const;
    [[nodiscard]] bool has_hid_access() const;
    [[nodiscard]] bool supports_detach_kernel_driver() const;

    [[nodiscard]] LibraryVersion library_version() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Devices
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Enumerate attached devices.
     * @return The device list, or EnumerationError carrying the native code
     */
    [[nodiscard]] Result<DeviceList> devices() const;

    /**
     * @brief Open the first device matching a vendor and product id.
     *
     * Convenience for prototyping: every failure, "not found" included,
     * collapses to std::nullopt. Use devices() and Device::open() when the
     * reason matters.
     */
    [[nodiscard]] std::optional<DeviceHandle> open_device_with_vid_pid(uint16_t vendor_id,
                                                                     uint16_t product_id) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Identity
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ContextId id() const noexcept { return handle_->id(); }

    /// Raw native context, for diagnostics and interop
    [[nodiscard]] nal::RawContext* native_handle() const noexcept { return handle_->get(); }

    [[nodiscard]] nal::INativeLibrary& library() const noexcept { return handle_->library(); }

    /// Contexts compare equal when they share the same native context
    friend bool operator==(const Context& a, const Context& b) noexcept {
        return a.handle_ == b.handle_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Default Context
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Initialize the library's process-wide default context.
     *
     * Idempotent: later calls succeed without touching the native library
     * until release_default_context() is called.
     */
    [[nodiscard]] static Result<void> init_default_context();

    [[nodiscard]] static Result<void> init_default_context(std::shared_ptr<nal::INativeLibrary> library);

    /**
     * @brief Release the default context if it was initialized.
     */
    static void release_default_context();

    /**
     * @brief Set the default context's verbosity. No effect if uninitialized.
     */
    static void set_default_context_log_level(LogLevel level);

    [[nodiscard]] static bool default_context_initialized();

private:
    explicit Context(std::shared_ptr<RawContextHandle> handle) noexcept
        : handle_(std::move(handle)) {}

    std::shared_ptr<RawContextHandle> handle_;
};

} // namespace usbkit
