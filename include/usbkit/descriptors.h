/**
 * @file descriptors.h
 * @brief Read-only views of USB device, configuration, interface and
 * endpoint descriptors.
 *
 * Descriptors are plain data copied out of the native library; they hold no
 * native resources and may outlive the device they came from.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <nal/types.h>
#include <cstdint>
#include <span>
#include <vector>

namespace usbkit {

// ─────────────────────────────────────────────────────────────────────────────
// Field Types
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Version number decoded from a binary-coded-decimal field
 * (bcdUSB, bcdDevice): 0xJJMN is version JJ.M.N.
 */
struct UsbVersion {
    uint8_t major = 0;
    uint8_t minor = 0;
    uint8_t sub_minor = 0;

    [[nodiscard]] static constexpr UsbVersion from_bcd(uint16_t bcd) noexcept {
        return UsbVersion{
            static_cast<uint8_t>(((bcd >> 12) & 0x0F) * 10 + ((bcd >> 8) & 0x0F)),
            static_cast<uint8_t>((bcd >> 4) & 0x0F),
            static_cast<uint8_t>(bcd & 0x0F)
        };
    }

    friend constexpr bool operator==(const UsbVersion&, const UsbVersion&) = default;
};

enum class Direction : uint8_t {
    Out,    ///< Host to device
    In      ///< Device to host
};

enum class TransferType : uint8_t {
    Control,
    Isochronous,
    Bulk,
    Interrupt
};

enum class SyncType : uint8_t {
    NoSync,
    Asynchronous,
    Adaptive,
    Synchronous
};

enum class UsageType : uint8_t {
    Data,
    Feedback,
    FeedbackData,
    Reserved
};

// ─────────────────────────────────────────────────────────────────────────────
// Device Descriptor
// ─────────────────────────────────────────────────────────────────────────────

class DeviceDescriptor {
public:
    explicit DeviceDescriptor(const nal::DeviceDescriptorData& data) noexcept
        : data_(data) {}

    [[nodiscard]] UsbVersion usb_version() const noexcept { return UsbVersion::from_bcd(data_.bcdUSB); }
    [[nodiscard]] UsbVersion device_version() const noexcept { return UsbVersion::from_bcd(data_.bcdDevice); }

    [[nodiscard]] uint16_t vendor_id() const noexcept { return data_.idVendor; }
    [[nodiscard]] uint16_t product_id() const noexcept { return data_.idProduct; }

    [[nodiscard]] uint8_t class_code() const noexcept { return data_.bDeviceClass; }
    [[nodiscard]] uint8_t sub_class_code() const noexcept { return data_.bDeviceSubClass; }
    [[nodiscard]] uint8_t protocol_code() const noexcept { return data_.bDeviceProtocol; }
    [[nodiscard]] uint8_t max_packet_size() const noexcept { return data_.bMaxPacketSize0; }

    /// String descriptor indexes; 0 means the device has none
    [[nodiscard]] uint8_t manufacturer_string_index() const noexcept { return data_.iManufacturer; }
    [[nodiscard]] uint8_t product_string_index() const noexcept { return data_.iProduct; }
    [[nodiscard]] uint8_t serial_number_string_index() const noexcept { return data_.iSerialNumber; }

    [[nodiscard]] uint8_t num_configurations() const noexcept { return data_.bNumConfigurations; }

    [[nodiscard]] const nal::DeviceDescriptorData& raw() const noexcept { return data_; }

private:
    nal::DeviceDescriptorData data_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Endpoint Descriptor
// ─────────────────────────────────────────────────────────────────────────────

class EndpointDescriptor {
public:
    explicit EndpointDescriptor(nal::EndpointDescriptorData data)
        : data_(std::move(data)) {}

    /// Full bEndpointAddress, direction bit included
    [[nodiscard]] uint8_t address() const noexcept { return data_.bEndpointAddress; }
    [[nodiscard]] uint8_t number() const noexcept { return data_.bEndpointAddress & 0x0F; }
    [[nodiscard]] Direction direction() const noexcept;
    [[nodiscard]] TransferType transfer_type() const noexcept;

    /// Only meaningful for isochronous endpoints
    [[nodiscard]] SyncType sync_type() const noexcept;
    [[nodiscard]] UsageType usage_type() const noexcept;

    [[nodiscard]] uint16_t max_packet_size() const noexcept { return data_.wMaxPacketSize; }
    [[nodiscard]] uint8_t interval() const noexcept { return data_.bInterval; }
    [[nodiscard]] uint8_t refresh() const noexcept { return data_.bRefresh; }
    [[nodiscard]] uint8_t synch_address() const noexcept { return data_.bSynchAddress; }

    [[nodiscard]] std::span<const uint8_t> extra() const noexcept { return data_.extra; }

private:
    nal::EndpointDescriptorData data_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Interface Descriptors
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief One alternate setting of an interface.
 */
class InterfaceDescriptor {
public:
    explicit InterfaceDescriptor(const nal::InterfaceDescriptorData& data);

    [[nodiscard]] uint8_t interface_number() const noexcept { return number_; }
    [[nodiscard]] uint8_t setting_number() const noexcept { return alt_setting_; }
    [[nodiscard]] uint8_t class_code() const noexcept { return class_; }
    [[nodiscard]] uint8_t sub_class_code() const noexcept { return sub_class_; }
    [[nodiscard]] uint8_t protocol_code() const noexcept { return protocol_; }
    [[nodiscard]] uint8_t description_string_index() const noexcept { return string_index_; }

    [[nodiscard]] size_t num_endpoints() const noexcept { return endpoints_.size(); }
    [[nodiscard]] const std::vector<EndpointDescriptor>& endpoints() const noexcept { return endpoints_; }
    [[nodiscard]] std::span<const uint8_t> extra() const noexcept { return extra_; }

private:
    uint8_t number_;
    uint8_t alt_setting_;
    uint8_t class_;
    uint8_t sub_class_;
    uint8_t protocol_;
    uint8_t string_index_;
    std::vector<EndpointDescriptor> endpoints_;
    std::vector<uint8_t> extra_;
};

/**
 * @brief An interface and all of its alternate settings.
 */
class Interface {
public:
    explicit Interface(const nal::InterfaceData& data);

    /// Interface number, taken from the first alternate setting
    [[nodiscard]] uint8_t number() const noexcept;
    [[nodiscard]] const std::vector<InterfaceDescriptor>& descriptors() const noexcept { return descriptors_; }

private:
    std::vector<InterfaceDescriptor> descriptors_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Configuration Descriptor
// ─────────────────────────────────────────────────────────────────────────────

class ConfigDescriptor {
public:
    explicit ConfigDescriptor(const nal::ConfigDescriptorData& data);

    [[nodiscard]] uint8_t number() const noexcept { return number_; }
    [[nodiscard]] uint16_t total_length() const noexcept { return total_length_; }

    /// Maximum bus power in milliamps (bMaxPower is in 2 mA units)
    [[nodiscard]] uint16_t max_power() const noexcept { return static_cast<uint16_t>(max_power_) * 2; }
    [[nodiscard]] bool self_powered() const noexcept { return (attributes_ & 0x40) != 0; }
    [[nodiscard]] bool remote_wakeup() const noexcept { return (attributes_ & 0x20) != 0; }
    [[nodiscard]] uint8_t description_string_index() const noexcept { return string_index_; }

    [[nodiscard]] size_t num_interfaces() const noexcept { return interfaces_.size(); }
    [[nodiscard]] const std::vector<Interface>& interfaces() const noexcept { return interfaces_; }
    [[nodiscard]] std::span<const uint8_t> extra() const noexcept { return extra_; }

private:
    uint8_t number_;
    uint16_t total_length_;
    uint8_t attributes_;
    uint8_t max_power_;
    uint8_t string_index_;
    std::vector<Interface> interfaces_;
    std::vector<uint8_t> extra_;
};

} // namespace usbkit
