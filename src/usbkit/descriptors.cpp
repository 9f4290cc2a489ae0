/**
 * @file descriptors.cpp
 * @brief Descriptor decoding.
 *
 * @copyright GPL-2.0-or-later
 */

#include "usbkit/descriptors.h"

namespace usbkit {

// ─────────────────────────────────────────────────────────────────────────────
// EndpointDescriptor
// ─────────────────────────────────────────────────────────────────────────────

Direction EndpointDescriptor::direction() const noexcept {
    return (data_.bEndpointAddress & 0x80) != 0 ? Direction::In : Direction::Out;
}

TransferType EndpointDescriptor::transfer_type() const noexcept {
    switch (data_.bmAttributes & 0x03) {
        case 0: return TransferType::Control;
        case 1: return TransferType::Isochronous;
        case 2: return TransferType::Bulk;
        default: return TransferType::Interrupt;
    }
}

SyncType EndpointDescriptor::sync_type() const noexcept {
    switch ((data_.bmAttributes >> 2) & 0x03) {
        case 0: return SyncType::NoSync;
        case 1: return SyncType::Asynchronous;
        case 2: return SyncType::Adaptive;
        default: return SyncType::Synchronous;
    }
}

UsageType EndpointDescriptor::usage_type() const noexcept {
    switch ((data_.bmAttributes >> 4) & 0x03) {
        case 0: return UsageType::Data;
        case 1: return UsageType::Feedback;
        case 2: return UsageType::FeedbackData;
        default: return UsageType::Reserved;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Interfaces
// ─────────────────────────────────────────────────────────────────────────────

InterfaceDescriptor::InterfaceDescriptor(const nal::InterfaceDescriptorData& data)
    : number_(data.bInterfaceNumber)
    , alt_setting_(data.bAlternateSetting)
    , class_(data.bInterfaceClass)
    , sub_class_(data.bInterfaceSubClass)
    , protocol_(data.bInterfaceProtocol)
    , string_index_(data.iInterface)
    , extra_(data.extra)
{
    endpoints_.reserve(data.endpoints.size());
    for (const auto& ep : data.endpoints) {
        endpoints_.emplace_back(ep);
    }
}

Interface::Interface(const nal::InterfaceData& data) {
    descriptors_.reserve(data.altsettings.size());
    for (const auto& alt : data.altsettings) {
        descriptors_.emplace_back(alt);
    }
}

uint8_t Interface::number() const noexcept {
    return descriptors_.empty() ? 0 : descriptors_.front().interface_number();
}

// ─────────────────────────────────────────────────────────────────────────────
// ConfigDescriptor
// ─────────────────────────────────────────────────────────────────────────────

ConfigDescriptor::ConfigDescriptor(const nal::ConfigDescriptorData& data)
    : number_(data.bConfigurationValue)
    , total_length_(data.wTotalLength)
    , attributes_(data.bmAttributes)
    , max_power_(data.MaxPower)
    , string_index_(data.iConfiguration)
    , extra_(data.extra)
{
    interfaces_.reserve(data.interfaces.size());
    for (const auto& iface : data.interfaces) {
        interfaces_.emplace_back(iface);
    }
}

} // namespace usbkit
