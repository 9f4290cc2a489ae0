// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Native Access Layer - Virtual Bus Backend

#pragma once

#include "nal/library.h"
#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace nal {

/// Description of a simulated device plugged into the virtual bus
struct VirtualDeviceSpec {
    DeviceDescriptorData descriptor;
    std::vector<ConfigDescriptorData> configs;
    uint8_t busNumber = 1;
    uint8_t portNumber = 1;
    uint8_t address = 1;
    int speed = static_cast<int>(SpeedCode::High);
    uint8_t activeConfig = 1;           // bConfigurationValue, 0 = unconfigured
    std::vector<std::string> strings;   // string descriptor N is strings[N - 1]
    std::set<int> kernelDriverInterfaces;
};

/// In-process simulated USB library
///
/// Behaves like libusb for everything the core touches, and additionally
/// exposes counters and failure injection for tests. Thread-safe: log lines
/// may be emitted from any thread.
class VirtualLibrary : public INativeLibrary {
public:
    VirtualLibrary();
    ~VirtualLibrary() override;

    VirtualLibrary(const VirtualLibrary&) = delete;
    VirtualLibrary& operator=(const VirtualLibrary&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // INativeLibrary
    // ═══════════════════════════════════════════════════════════════════════

    using INativeLibrary::initContext;
    int initContext(RawContext** out, const InitOptions& options) override;
    void exitContext(RawContext* ctx) override;
    int setOption(RawContext* ctx, Option option, int value) override;
    void setLogCallback(RawContext* ctx, LogFunction fn, LogScope scope) override;

    bool hasCapability(Capability cap) const override;
    Version getVersion() const override;

    std::ptrdiff_t getDeviceList(RawContext* ctx, RawDevice*** out) override;
    void freeDeviceList(RawDevice** list, bool unrefDevices) override;

    RawDevice* refDevice(RawDevice* dev) override;
    void unrefDevice(RawDevice* dev) override;

    int getDeviceDescriptor(RawDevice* dev, DeviceDescriptorData& out) override;
    int getConfigDescriptor(RawDevice* dev, uint8_t index, ConfigDescriptorData& out) override;
    int getActiveConfigDescriptor(RawDevice* dev, ConfigDescriptorData& out) override;

    uint8_t getBusNumber(RawDevice* dev) override;
    uint8_t getPortNumber(RawDevice* dev) override;
    uint8_t getDeviceAddress(RawDevice* dev) override;
    int getDeviceSpeed(RawDevice* dev) override;

    int open(RawDevice* dev, RawDeviceHandle** out) override;
    RawDeviceHandle* openDeviceWithVidPid(RawContext* ctx, uint16_t vendorId, uint16_t productId) override;

    void close(RawDeviceHandle* handle) override;
    RawDevice* getDevice(RawDeviceHandle* handle) override;

    int getConfiguration(RawDeviceHandle* handle, int& config) override;
    int setConfiguration(RawDeviceHandle* handle, int config) override;
    int claimInterface(RawDeviceHandle* handle, int iface) override;
    int releaseInterface(RawDeviceHandle* handle, int iface) override;
    int setInterfaceAltSetting(RawDeviceHandle* handle, int iface, int altSetting) override;
    int resetDevice(RawDeviceHandle* handle) override;

    int kernelDriverActive(RawDeviceHandle* handle, int iface) override;
    int detachKernelDriver(RawDeviceHandle* handle, int iface) override;
    int attachKernelDriver(RawDeviceHandle* handle, int iface) override;
    int setAutoDetachKernelDriver(RawDeviceHandle* handle, bool enable) override;

    int getStringDescriptorAscii(RawDeviceHandle* handle, uint8_t index,
                                 unsigned char* data, int length) override;

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Bus Setup
    // ═══════════════════════════════════════════════════════════════════════

    /// Plug a device into the bus
    /// @return Index used by the other test calls
    size_t addDevice(const VirtualDeviceSpec& spec);

    /// Unplug a device. Existing references stay valid; it is no longer
    /// enumerated and cannot be opened.
    void removeDevice(size_t index);

    /// Get the raw device object for an index
    RawDevice* rawDevice(size_t index) const;

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Failure Injection
    // ═══════════════════════════════════════════════════════════════════════

    void setInitStatus(Status status);
    void setEnumerationStatus(Status status);
    void setOpenStatus(size_t index, Status status);
    void setDescriptorStatus(size_t index, Status status);
    void setCapability(Capability cap, bool supported);

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Logging
    // ═══════════════════════════════════════════════════════════════════════

    /// Emit a log line the way the library does: filtered by the context's
    /// log level, then delivered to the global handler and the context's
    /// handler (if installed). Handlers run on the calling thread.
    void emitLog(RawContext* ctx, LogLevel level, const char* text);

    int logLevel(RawContext* ctx) const;
    bool hasGlobalLogHandler() const;
    bool hasContextLogHandler(RawContext* ctx) const;

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Counters
    // ═══════════════════════════════════════════════════════════════════════

    int initCount() const;
    int exitCount() const;
    int doubleExitCount() const;
    int liveContextCount() const;
    bool isContextLive(RawContext* ctx) const;
    bool isDefaultContextInitialized() const;
    int openCount() const;
    int closeCount() const;
    int openHandleCount() const;
    int outstandingListCount() const;
    int deviceRefCount(size_t index) const;
    bool isInterfaceClaimed(RawDeviceHandle* handle, int iface) const;

private:
    bool isLiveLocked(const RawContext* ctx) const;
    const ConfigDescriptorData* activeConfigLocked(const RawDevice* dev) const;

    mutable std::mutex mutex_;

    std::vector<std::unique_ptr<RawContext>> contexts_;
    std::vector<std::unique_ptr<RawDevice>> devices_;
    std::unordered_map<RawDeviceHandle*, std::unique_ptr<RawDeviceHandle>> handles_;

    Status initStatus_ = Status::Success;
    Status enumerationStatus_ = Status::Success;
    std::array<bool, 4> capabilities_{true, false, false, true};

    bool defaultInitialized_ = false;
    int defaultLogLevel_ = 0;
    LogFunction defaultLogHandler_ = nullptr;
    LogFunction globalLogHandler_ = nullptr;
    bool discoveryForNewContexts_ = true;

    int initCount_ = 0;
    int exitCount_ = 0;
    int doubleExitCount_ = 0;
    int openCount_ = 0;
    int closeCount_ = 0;
    int outstandingLists_ = 0;
};

} // namespace nal
