// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Native Access Layer - USB Library Interface

#pragma once

#include "nal/types.h"
#include <cstddef>
#include <cstdint>

namespace nal {

/// Native USB host library interface
///
/// The sole collaborator of the core. Each method is one native call; return
/// values follow the library's convention (negative = Status error code).
/// Objects handed out are reference counted by the library itself and must be
/// released through the matching call (exitContext, freeDeviceList,
/// unrefDevice, close).
class INativeLibrary {
public:
    virtual ~INativeLibrary() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Context Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /// Initialize a context. Passing nullptr initializes the default context.
    /// Discovery is decided here; setting NoDeviceDiscovery on a live context
    /// does not change what it enumerates.
    /// @return 0 on success, negative Status on failure
    virtual int initContext(RawContext** out, const InitOptions& options) = 0;

    int initContext(RawContext** out) {
        return initContext(out, InitOptions{});
    }

    /// Release a context (nullptr = default context)
    virtual void exitContext(RawContext* ctx) = 0;

    /// Set a library option on a context (nullptr = default context)
    virtual int setOption(RawContext* ctx, Option option, int value) = 0;

    /// Install the log handler for a context or process-wide.
    /// With LogScope::Global the context argument is ignored.
    virtual void setLogCallback(RawContext* ctx, LogFunction fn, LogScope scope) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Library Queries
    // ═══════════════════════════════════════════════════════════════════════

    virtual bool hasCapability(Capability cap) const = 0;

    virtual Version getVersion() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Enumeration
    // ═══════════════════════════════════════════════════════════════════════

    /// Get a null-terminated array of devices. Each entry holds one reference.
    /// @return Number of devices, or negative Status on failure
    virtual std::ptrdiff_t getDeviceList(RawContext* ctx, RawDevice*** out) = 0;

    /// Free an array returned by getDeviceList
    /// @param unrefDevices Drop the reference each entry holds
    virtual void freeDeviceList(RawDevice** list, bool unrefDevices) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Per-Device Calls
    // ═══════════════════════════════════════════════════════════════════════

    virtual RawDevice* refDevice(RawDevice* dev) = 0;
    virtual void unrefDevice(RawDevice* dev) = 0;

    virtual int getDeviceDescriptor(RawDevice* dev, DeviceDescriptorData& out) = 0;
    virtual int getConfigDescriptor(RawDevice* dev, uint8_t index, ConfigDescriptorData& out) = 0;
    virtual int getActiveConfigDescriptor(RawDevice* dev, ConfigDescriptorData& out) = 0;

    virtual uint8_t getBusNumber(RawDevice* dev) = 0;
    virtual uint8_t getPortNumber(RawDevice* dev) = 0;
    virtual uint8_t getDeviceAddress(RawDevice* dev) = 0;

    /// @return Raw SpeedCode value; may be outside the known range
    virtual int getDeviceSpeed(RawDevice* dev) = 0;

    /// Open a device. The handle holds its own device reference.
    virtual int open(RawDevice* dev, RawDeviceHandle** out) = 0;

    /// Open the first device matching vendor/product
    /// @return Handle, or nullptr on no match or failure
    virtual RawDeviceHandle* openDeviceWithVidPid(RawContext* ctx, uint16_t vendorId, uint16_t productId) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Per-Handle Calls
    // ═══════════════════════════════════════════════════════════════════════

    virtual void close(RawDeviceHandle* handle) = 0;

    /// Device behind an open handle. Does not add a reference.
    virtual RawDevice* getDevice(RawDeviceHandle* handle) = 0;

    virtual int getConfiguration(RawDeviceHandle* handle, int& config) = 0;
    virtual int setConfiguration(RawDeviceHandle* handle, int config) = 0;
    virtual int claimInterface(RawDeviceHandle* handle, int iface) = 0;
    virtual int releaseInterface(RawDeviceHandle* handle, int iface) = 0;
    virtual int setInterfaceAltSetting(RawDeviceHandle* handle, int iface, int altSetting) = 0;
    virtual int resetDevice(RawDeviceHandle* handle) = 0;

    /// @return 1 if a kernel driver is bound, 0 if not, negative Status on failure
    virtual int kernelDriverActive(RawDeviceHandle* handle, int iface) = 0;
    virtual int detachKernelDriver(RawDeviceHandle* handle, int iface) = 0;
    virtual int attachKernelDriver(RawDeviceHandle* handle, int iface) = 0;
    virtual int setAutoDetachKernelDriver(RawDeviceHandle* handle, bool enable) = 0;

    /// @return Number of bytes written to data, or negative Status
    virtual int getStringDescriptorAscii(RawDeviceHandle* handle, uint8_t index,
                                         unsigned char* data, int length) = 0;
};

} // namespace nal
