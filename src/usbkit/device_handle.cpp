/**
 * @file device_handle.cpp
 * @brief DeviceHandle implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "usbkit/device_handle.h"
#include "usbkit/gsl.hpp"
#include "usbkit/logging.h"

#include <algorithm>
#include <array>
#include <utility>

namespace usbkit {

namespace {

// Largest string descriptor payload (bLength is one byte)
constexpr int STRING_BUFFER_SIZE = 255;

} // anonymous namespace

DeviceHandle::DeviceHandle(Context context, nal::RawDeviceHandle* handle) noexcept
    : context_(std::move(context))
    , handle_(handle)
{}

DeviceHandle::~DeviceHandle() {
    close();
}

DeviceHandle::DeviceHandle(DeviceHandle&& other) noexcept
    : context_(other.context_)
    , handle_(std::exchange(other.handle_, nullptr))
    , claimed_(std::exchange(other.claimed_, {}))
{}

DeviceHandle& DeviceHandle::operator=(DeviceHandle&& other) noexcept {
    if (this != &other) {
        close();
        context_ = other.context_;
        handle_ = std::exchange(other.handle_, nullptr);
        claimed_ = std::exchange(other.claimed_, {});
    }
    return *this;
}

void DeviceHandle::close() noexcept {
    if (!handle_) {
        return;
    }
    nal::INativeLibrary& lib = context_.library();
    for (int iface = 0; iface < static_cast<int>(claimed_.size()); ++iface) {
        if (!claimed_.test(static_cast<size_t>(iface))) {
            continue;
        }
        int rc = lib.releaseInterface(handle_, iface);
        if (rc < 0) {
            log_raw(LogLevel::Debug, "handle", "release of a claimed interface failed on close");
        }
    }
    claimed_.reset();
    lib.close(handle_);
    handle_ = nullptr;
}

Device DeviceHandle::device() const {
    return Device(context_, context_.library().getDevice(handle_));
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

Result<uint8_t> DeviceHandle::active_configuration() const {
    int config = 0;
    USBKIT_CHECK_NATIVE(context_.library().getConfiguration(handle_, config), "get_configuration");
    return gsl::narrow_cast<uint8_t>(config);
}

Result<void> DeviceHandle::set_active_configuration(uint8_t config) {
    USBKIT_CHECK_NATIVE(context_.library().setConfiguration(handle_, config), "set_configuration");
    return Ok();
}

Result<void> DeviceHandle::unconfigure() {
    USBKIT_CHECK_NATIVE(context_.library().setConfiguration(handle_, -1), "set_configuration");
    return Ok();
}

Result<void> DeviceHandle::reset() {
    USBKIT_CHECK_NATIVE(context_.library().resetDevice(handle_), "reset_device");
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Interfaces
// ─────────────────────────────────────────────────────────────────────────────

Result<void> DeviceHandle::claim_interface(uint8_t iface) {
    USBKIT_CHECK_NATIVE(context_.library().claimInterface(handle_, iface), "claim_interface");
    claimed_.set(iface);
    return Ok();
}

Result<void> DeviceHandle::release_interface(uint8_t iface) {
    USBKIT_CHECK_NATIVE(context_.library().releaseInterface(handle_, iface), "release_interface");
    claimed_.reset(iface);
    return Ok();
}

Result<void> DeviceHandle::set_alternate_setting(uint8_t iface, uint8_t setting) {
    USBKIT_CHECK_NATIVE(context_.library().setInterfaceAltSetting(handle_, iface, setting),
                        "set_interface_alt_setting");
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Kernel Drivers
// ─────────────────────────────────────────────────────────────────────────────

Result<bool> DeviceHandle::kernel_driver_active(uint8_t iface) const {
    int rc = context_.library().kernelDriverActive(handle_, iface);
    if (rc < 0) {
        return native_error(rc, "kernel_driver_active");
    }
    return rc == 1;
}

Result<void> DeviceHandle::detach_kernel_driver(uint8_t iface) {
    USBKIT_CHECK_NATIVE(context_.library().detachKernelDriver(handle_, iface), "detach_kernel_driver");
    return Ok();
}

Result<void> DeviceHandle::attach_kernel_driver(uint8_t iface) {
    USBKIT_CHECK_NATIVE(context_.library().attachKernelDriver(handle_, iface), "attach_kernel_driver");
    return Ok();
}

Result<void> DeviceHandle::set_auto_detach_kernel_driver(bool enable) {
    USBKIT_CHECK_NATIVE(context_.library().setAutoDetachKernelDriver(handle_, enable),
                        "set_auto_detach_kernel_driver");
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Strings
// ─────────────────────────────────────────────────────────────────────────────

Result<std::string> DeviceHandle::read_string_descriptor_ascii(uint8_t index) const {
    if (index == 0) {
        return make_error(ErrorCode::InvalidArgument, "string index 0 is the language table");
    }

    std::array<unsigned char, STRING_BUFFER_SIZE + 1> buffer{};
    int rc = context_.library().getStringDescriptorAscii(handle_, index, buffer.data(),
                                                         static_cast<int>(buffer.size()));
    if (rc < 0) {
        return native_error(rc, "get_string_descriptor_ascii");
    }
    // Never trust the reported length past the buffer
    size_t length = std::min(static_cast<size_t>(rc), buffer.size());
    return std::string(reinterpret_cast<const char*>(buffer.data()), length);
}

} // namespace usbkit
