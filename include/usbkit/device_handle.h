/**
 * @file device_handle.h
 * @brief Open session on a USB device.
 *
 * A DeviceHandle closes its native handle exactly once, on destruction, and
 * keeps the originating Context alive until then. Interfaces claimed through
 * the handle are released before it closes.
 *
 * Not synchronized: callers sharing one handle across threads must serialize
 * access themselves.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/context.h"
#include "usbkit/device.h"
#include "usbkit/error.h"
#include <bitset>
#include <cstdint>
#include <string>

namespace usbkit {

class DeviceHandle {
public:
    /**
     * @brief Adopt an open native handle.
     */
    DeviceHandle(Context context, nal::RawDeviceHandle* handle) noexcept;

    ~DeviceHandle();

    // Move-only (owns the native handle)
    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;
    DeviceHandle(DeviceHandle&& other) noexcept;
    DeviceHandle& operator=(DeviceHandle&& other) noexcept;

    /**
     * @brief The device this handle was opened on (takes a new reference).
     */
    [[nodiscard]] Device device() const;

    [[nodiscard]] const Context& context() const noexcept { return context_; }

    [[nodiscard]] nal::RawDeviceHandle* native_handle() const noexcept { return handle_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief bConfigurationValue of the active configuration (0 = unconfigured).
     */
    [[nodiscard]] Result<uint8_t> active_configuration() const;

    /**
     * @brief Select a configuration by bConfigurationValue.
     *
     * Fails with NativeError (Busy) while interfaces are claimed.
     */
    [[nodiscard]] Result<void> set_active_configuration(uint8_t config);

    /**
     * @brief Put the device in the unconfigured state.
     */
    [[nodiscard]] Result<void> unconfigure();

    [[nodiscard]] Result<void> reset();

    // ─────────────────────────────────────────────────────────────────────────
    // Interfaces
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Result<void> claim_interface(uint8_t iface);
    [[nodiscard]] Result<void> release_interface(uint8_t iface);

    /**
     * @brief Select an alternate setting of a claimed interface.
     */
    [[nodiscard]] Result<void> set_alternate_setting(uint8_t iface, uint8_t setting);

    [[nodiscard]] bool is_claimed(uint8_t iface) const noexcept { return claimed_.test(iface); }

    // ─────────────────────────────────────────────────────────────────────────
    // Kernel Drivers
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Result<bool> kernel_driver_active(uint8_t iface) const;
    [[nodiscard]] Result<void> detach_kernel_driver(uint8_t iface);
    [[nodiscard]] Result<void> attach_kernel_driver(uint8_t iface);

    /**
     * @brief Detach kernel drivers automatically on claim_interface().
     */
    [[nodiscard]] Result<void> set_auto_detach_kernel_driver(bool enable);

    // ─────────────────────────────────────────────────────────────────────────
    // Strings
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Read a string descriptor in the device's first language, as ASCII.
     * @param index String index from a descriptor (0 is not a string)
     */
    [[nodiscard]] Result<std::string> read_string_descriptor_ascii(uint8_t index) const;

private:
    void close() noexcept;

    Context context_;
    nal::RawDeviceHandle* handle_;
    std::bitset<256> claimed_;
};

} // namespace usbkit
