/**
 * @file device.h
 * @brief Reference to one native USB device.
 *
 * A Device holds exactly one native reference on its device and a strong
 * reference to the Context it was enumerated from. Copying takes another
 * native reference; moving transfers it.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/context.h"
#include "usbkit/descriptors.h"
#include "usbkit/error.h"
#include "usbkit/types.h"
#include <cstdint>

namespace usbkit {

class DeviceHandle;

class Device {
public:
    /**
     * @brief Take a new reference on a native device.
     *
     * The caller keeps whatever reference it already held on @p device.
     */
    Device(Context context, nal::RawDevice* device);

    ~Device();

    Device(const Device& other);
    Device& operator=(const Device& other);
    Device(Device&& other) noexcept;
    Device& operator=(Device&& other) noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Descriptors
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Read the device descriptor.
     * @return Descriptor, or DescriptorReadError
     */
    [[nodiscard]] Result<DeviceDescriptor> device_descriptor() const;

    /**
     * @brief Read a configuration descriptor by index (0-based, not
     * bConfigurationValue).
     * @return Descriptor, or NotFound / AccessError / NativeError
     */
    [[nodiscard]] Result<ConfigDescriptor> config_descriptor(uint8_t index) const;

    /**
     * @brief Read the descriptor of the active configuration.
     * @return Descriptor, or NotFound if the device is unconfigured
     */
    [[nodiscard]] Result<ConfigDescriptor> active_config_descriptor() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Topology
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] uint8_t bus_number() const;
    [[nodiscard]] uint8_t port_number() const;
    [[nodiscard]] uint8_t address() const;
    [[nodiscard]] Speed speed() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Session
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Open the device.
     * @return Handle, or AccessError / NotFound / NativeError
     */
    [[nodiscard]] Result<DeviceHandle> open() const;

    [[nodiscard]] const Context& context() const noexcept { return context_; }

    [[nodiscard]] nal::RawDevice* native_handle() const noexcept { return device_; }

    /// Devices compare equal when they refer to the same native device
    friend bool operator==(const Device& a, const Device& b) noexcept {
        return a.device_ == b.device_;
    }

private:
    void release() noexcept;

    Context context_;
    nal::RawDevice* device_;
};

} // namespace usbkit
