/**
 * @file device.cpp
 * @brief Device implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "usbkit/device.h"
#include "usbkit/device_handle.h"
#include "usbkit/gsl.hpp"
#include "usbkit/logging.h"

#include <utility>

namespace usbkit {

Device::Device(Context context, nal::RawDevice* device)
    : context_(std::move(context))
    , device_(device)
{
    gsl_Expects(device_ != nullptr);
    context_.library().refDevice(device_);
}

Device::~Device() {
    release();
}

Device::Device(const Device& other)
    : context_(other.context_)
    , device_(other.device_)
{
    if (device_) {
        context_.library().refDevice(device_);
    }
}

Device& Device::operator=(const Device& other) {
    if (this != &other) {
        Device copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Device::Device(Device&& other) noexcept
    : context_(other.context_)
    , device_(std::exchange(other.device_, nullptr))
{}

Device& Device::operator=(Device&& other) noexcept {
    if (this != &other) {
        release();
        context_ = other.context_;
        device_ = std::exchange(other.device_, nullptr);
    }
    return *this;
}

void Device::release() noexcept {
    if (device_) {
        context_.library().unrefDevice(device_);
        device_ = nullptr;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Descriptors
// ─────────────────────────────────────────────────────────────────────────────

Result<DeviceDescriptor> Device::device_descriptor() const {
    nal::DeviceDescriptorData data{};
    int rc = context_.library().getDeviceDescriptor(device_, data);
    if (rc < 0) {
        return native_error(ErrorCode::DescriptorReadError, rc, "get_device_descriptor");
    }
    return DeviceDescriptor(data);
}

Result<ConfigDescriptor> Device::config_descriptor(uint8_t index) const {
    nal::ConfigDescriptorData data{};
    int rc = context_.library().getConfigDescriptor(device_, index, data);
    if (rc < 0) {
        return native_error(rc, "get_config_descriptor");
    }
    return ConfigDescriptor(data);
}

Result<ConfigDescriptor> Device::active_config_descriptor() const {
    nal::ConfigDescriptorData data{};
    int rc = context_.library().getActiveConfigDescriptor(device_, data);
    if (rc < 0) {
        return native_error(rc, "get_active_config_descriptor");
    }
    return ConfigDescriptor(data);
}

// ─────────────────────────────────────────────────────────────────────────────
// Topology
// ─────────────────────────────────────────────────────────────────────────────

uint8_t Device::bus_number() const {
    return context_.library().getBusNumber(device_);
}

uint8_t Device::port_number() const {
    return context_.library().getPortNumber(device_);
}

uint8_t Device::address() const {
    return context_.library().getDeviceAddress(device_);
}

Speed Device::speed() const {
    return speed_from_native(context_.library().getDeviceSpeed(device_));
}

// ─────────────────────────────────────────────────────────────────────────────
// Session
// ─────────────────────────────────────────────────────────────────────────────

Result<DeviceHandle> Device::open() const {
    nal::RawDeviceHandle* handle = nullptr;
    int rc = context_.library().open(device_, &handle);
    if (rc < 0) {
        USBKIT_LOG_INFO("device", "open of {:03}:{:03} failed: {}",
                        bus_number(), address(), nal::toString(nal::statusFromCode(rc)));
        return native_error(rc, "open");
    }
    return DeviceHandle(context_, handle);
}

} // namespace usbkit
