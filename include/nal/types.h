// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Native Access Layer - Common Types

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nal {

/// Opaque native objects. Backends reinterpret these as their own types.
struct RawContext;
struct RawDevice;
struct RawDeviceHandle;

/// Result codes for NAL platform operations
enum class Result {
    Success = 0,
    NotInitialized,
    AlreadyInitialized,
    InvalidParameter,
    NotSupported,
    Unknown = -1
};

/// Native status codes reported by the USB library.
/// Zero or positive is success; negative values are errors.
enum class Status : int {
    Success = 0,
    IoError = -1,
    InvalidParam = -2,
    Access = -3,
    NoDevice = -4,
    NotFound = -5,
    Busy = -6,
    Timeout = -7,
    Overflow = -8,
    Pipe = -9,
    Interrupted = -10,
    NoMem = -11,
    NotSupported = -12,
    Other = -99
};

/// Capability flags queried against the running library
enum class Capability {
    HasCapability,
    HasHotplug,
    HasHidAccess,
    SupportsDetachKernelDriver
};

/// Library options settable per context (or on the default context)
enum class Option {
    LogLevel,
    NoDeviceDiscovery
};

/// Options that only take effect when passed at context creation
struct InitOptions {
    bool noDeviceDiscovery = false;
};

/// Native log verbosity values
enum class LogLevel : int {
    None = 0,
    Error = 1,
    Warning = 2,
    Info = 3,
    Debug = 4
};

/// Scope a log handler is installed with
enum class LogScope : int {
    Global = 1,
    Context = 2
};

/// Native device speed codes
enum class SpeedCode : int {
    Unknown = 0,
    Low = 1,
    Full = 2,
    High = 3,
    Super = 4,
    SuperPlus = 5
};

/// Log handler installed with the library. Called on library-owned threads.
using LogFunction = void (*)(RawContext* ctx, int level, const char* text);

// ═══════════════════════════════════════════════════════════════════════════
// Descriptor Records (fixed layout as defined by USB 2.0 chapter 9)
// ═══════════════════════════════════════════════════════════════════════════

struct DeviceDescriptorData {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint16_t bcdUSB = 0;
    uint8_t bDeviceClass = 0;
    uint8_t bDeviceSubClass = 0;
    uint8_t bDeviceProtocol = 0;
    uint8_t bMaxPacketSize0 = 0;
    uint16_t idVendor = 0;
    uint16_t idProduct = 0;
    uint16_t bcdDevice = 0;
    uint8_t iManufacturer = 0;
    uint8_t iProduct = 0;
    uint8_t iSerialNumber = 0;
    uint8_t bNumConfigurations = 0;
};

struct EndpointDescriptorData {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint8_t bEndpointAddress = 0;
    uint8_t bmAttributes = 0;
    uint16_t wMaxPacketSize = 0;
    uint8_t bInterval = 0;
    uint8_t bRefresh = 0;
    uint8_t bSynchAddress = 0;
    std::vector<uint8_t> extra;
};

struct InterfaceDescriptorData {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint8_t bInterfaceNumber = 0;
    uint8_t bAlternateSetting = 0;
    uint8_t bInterfaceClass = 0;
    uint8_t bInterfaceSubClass = 0;
    uint8_t bInterfaceProtocol = 0;
    uint8_t iInterface = 0;
    std::vector<EndpointDescriptorData> endpoints;
    std::vector<uint8_t> extra;
};

/// One interface with all of its alternate settings
struct InterfaceData {
    std::vector<InterfaceDescriptorData> altsettings;
};

struct ConfigDescriptorData {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint16_t wTotalLength = 0;
    uint8_t bConfigurationValue = 0;
    uint8_t iConfiguration = 0;
    uint8_t bmAttributes = 0;
    uint8_t MaxPower = 0;
    std::vector<InterfaceData> interfaces;
    std::vector<uint8_t> extra;
};

struct Version {
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t micro = 0;
    uint16_t nano = 0;
    std::string rc;
};

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

/// Map a raw status integer onto Status. Unrecognized negatives become Other.
constexpr Status statusFromCode(int code) noexcept {
    if (code >= 0) {
        return Status::Success;
    }
    switch (code) {
        case -1:  return Status::IoError;
        case -2:  return Status::InvalidParam;
        case -3:  return Status::Access;
        case -4:  return Status::NoDevice;
        case -5:  return Status::NotFound;
        case -6:  return Status::Busy;
        case -7:  return Status::Timeout;
        case -8:  return Status::Overflow;
        case -9:  return Status::Pipe;
        case -10: return Status::Interrupted;
        case -11: return Status::NoMem;
        case -12: return Status::NotSupported;
        default:  return Status::Other;
    }
}

constexpr int toCode(Status status) noexcept {
    return static_cast<int>(status);
}

/// Check if a raw status code indicates success
constexpr bool succeeded(int code) noexcept {
    return code >= 0;
}

/// Check if a raw status code indicates failure
constexpr bool failed(int code) noexcept {
    return code < 0;
}

/// Convert Result to string for debugging
constexpr const char* toString(Result r) noexcept {
    switch (r) {
        case Result::Success:            return "Success";
        case Result::NotInitialized:     return "NotInitialized";
        case Result::AlreadyInitialized: return "AlreadyInitialized";
        case Result::InvalidParameter:   return "InvalidParameter";
        case Result::NotSupported:       return "NotSupported";
        case Result::Unknown:            return "Unknown";
    }
    return "Unknown";
}

/// Convert Status to string for debugging
constexpr const char* toString(Status s) noexcept {
    switch (s) {
        case Status::Success:      return "Success";
        case Status::IoError:      return "IoError";
        case Status::InvalidParam: return "InvalidParam";
        case Status::Access:       return "Access";
        case Status::NoDevice:     return "NoDevice";
        case Status::NotFound:     return "NotFound";
        case Status::Busy:         return "Busy";
        case Status::Timeout:      return "Timeout";
        case Status::Overflow:     return "Overflow";
        case Status::Pipe:         return "Pipe";
        case Status::Interrupted:  return "Interrupted";
        case Status::NoMem:        return "NoMem";
        case Status::NotSupported: return "NotSupported";
        case Status::Other:        return "Other";
    }
    return "Other";
}

} // namespace nal
