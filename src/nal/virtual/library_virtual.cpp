// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Native Access Layer - Virtual Bus Backend Implementation

#include "nal/virtual_library.h"
#include <algorithm>
#include <cstring>

namespace nal {

// Backend-private definitions of the opaque native objects

struct RawContext {
    bool live = false;
    int logLevel = 0;
    LogFunction logHandler = nullptr;
    bool discovery = true;
};

struct RawDevice {
    VirtualDeviceSpec spec;
    int refs = 0;
    bool attached = true;
    Status openStatus = Status::Success;
    Status descriptorStatus = Status::Success;
};

struct RawDeviceHandle {
    RawDevice* device = nullptr;
    std::set<int> claimed;
    std::unordered_map<int, int> altSettings;
    bool autoDetach = false;
};

namespace {

size_t capabilityIndex(Capability cap) {
    switch (cap) {
        case Capability::HasCapability:              return 0;
        case Capability::HasHotplug:                 return 1;
        case Capability::HasHidAccess:               return 2;
        case Capability::SupportsDetachKernelDriver: return 3;
    }
    return 0;
}

bool hasInterface(const ConfigDescriptorData& config, int iface) {
    return std::any_of(config.interfaces.begin(), config.interfaces.end(),
        [iface](const InterfaceData& data) {
            return !data.altsettings.empty() &&
                   data.altsettings.front().bInterfaceNumber == iface;
        });
}

bool hasAltSetting(const ConfigDescriptorData& config, int iface, int alt) {
    for (const auto& data : config.interfaces) {
        for (const auto& setting : data.altsettings) {
            if (setting.bInterfaceNumber == iface && setting.bAlternateSetting == alt) {
                return true;
            }
        }
    }
    return false;
}

} // anonymous namespace

VirtualLibrary::VirtualLibrary() = default;

VirtualLibrary::~VirtualLibrary() = default;

// ═══════════════════════════════════════════════════════════════════════════
// Context Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

int VirtualLibrary::initContext(RawContext** out, const InitOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initStatus_ != Status::Success) {
        return toCode(initStatus_);
    }

    if (!out) {
        defaultInitialized_ = true;
        return 0;
    }

    // Recycle a freed slot first, so a new context can land on a stale address
    auto it = std::find_if(contexts_.begin(), contexts_.end(),
        [](const std::unique_ptr<RawContext>& ctx) { return !ctx->live; });
    RawContext* ctx = nullptr;
    if (it != contexts_.end()) {
        ctx = it->get();
    } else {
        contexts_.push_back(std::make_unique<RawContext>());
        ctx = contexts_.back().get();
    }

    ctx->live = true;
    ctx->logLevel = 0;
    ctx->logHandler = nullptr;
    ctx->discovery = discoveryForNewContexts_ && !options.noDeviceDiscovery;
    ++initCount_;

    *out = ctx;
    return 0;
}

void VirtualLibrary::exitContext(RawContext* ctx) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ctx) {
        defaultInitialized_ = false;
        defaultLogHandler_ = nullptr;
        return;
    }

    if (!isLiveLocked(ctx)) {
        ++doubleExitCount_;
        return;
    }

    ctx->live = false;
    ctx->logHandler = nullptr;
    ++exitCount_;
}

int VirtualLibrary::setOption(RawContext* ctx, Option option, int value) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx && !isLiveLocked(ctx)) {
        return toCode(Status::InvalidParam);
    }

    switch (option) {
        case Option::LogLevel:
            if (value < 0 || value > static_cast<int>(LogLevel::Debug)) {
                return toCode(Status::InvalidParam);
            }
            if (ctx) {
                ctx->logLevel = value;
            } else {
                defaultLogLevel_ = value;
            }
            return 0;

        case Option::NoDeviceDiscovery:
            // Accepted on a live context, but discovery already ran at init
            if (!ctx) {
                discoveryForNewContexts_ = (value == 0);
            }
            return 0;
    }
    return toCode(Status::InvalidParam);
}

void VirtualLibrary::setLogCallback(RawContext* ctx, LogFunction fn, LogScope scope) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (scope == LogScope::Global) {
        globalLogHandler_ = fn;
        return;
    }

    if (!ctx) {
        defaultLogHandler_ = fn;
    } else if (isLiveLocked(ctx)) {
        ctx->logHandler = fn;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Library Queries
// ═══════════════════════════════════════════════════════════════════════════

bool VirtualLibrary::hasCapability(Capability cap) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_[capabilityIndex(cap)];
}

Version VirtualLibrary::getVersion() const {
    return Version{1, 0, 27, 0, "-virtual"};
}

// ═══════════════════════════════════════════════════════════════════════════
// Enumeration
// ═══════════════════════════════════════════════════════════════════════════

std::ptrdiff_t VirtualLibrary::getDeviceList(RawContext* ctx, RawDevice*** out) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!out) {
        return toCode(Status::InvalidParam);
    }
    if (enumerationStatus_ != Status::Success) {
        return toCode(enumerationStatus_);
    }
    if (ctx ? !isLiveLocked(ctx) : !defaultInitialized_) {
        return toCode(Status::InvalidParam);
    }

    std::vector<RawDevice*> attached;
    if (!ctx || ctx->discovery) {
        for (const auto& dev : devices_) {
            if (dev->attached) {
                attached.push_back(dev.get());
            }
        }
    }

    auto* list = new RawDevice*[attached.size() + 1];
    for (size_t i = 0; i < attached.size(); ++i) {
        ++attached[i]->refs;
        list[i] = attached[i];
    }
    list[attached.size()] = nullptr;

    ++outstandingLists_;
    *out = list;
    return static_cast<std::ptrdiff_t>(attached.size());
}

void VirtualLibrary::freeDeviceList(RawDevice** list, bool unrefDevices) {
    if (!list) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (unrefDevices) {
        for (RawDevice** it = list; *it; ++it) {
            --(*it)->refs;
        }
    }
    delete[] list;
    --outstandingLists_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Per-Device Calls
// ═══════════════════════════════════════════════════════════════════════════

RawDevice* VirtualLibrary::refDevice(RawDevice* dev) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++dev->refs;
    return dev;
}

void VirtualLibrary::unrefDevice(RawDevice* dev) {
    if (!dev) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    --dev->refs;
}

int VirtualLibrary::getDeviceDescriptor(RawDevice* dev, DeviceDescriptorData& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dev->descriptorStatus != Status::Success) {
        return toCode(dev->descriptorStatus);
    }
    out = dev->spec.descriptor;
    return 0;
}

int VirtualLibrary::getConfigDescriptor(RawDevice* dev, uint8_t index, ConfigDescriptorData& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dev->descriptorStatus != Status::Success) {
        return toCode(dev->descriptorStatus);
    }
    if (index >= dev->spec.configs.size()) {
        return toCode(Status::NotFound);
    }
    out = dev->spec.configs[index];
    return 0;
}

int VirtualLibrary::getActiveConfigDescriptor(RawDevice* dev, ConfigDescriptorData& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dev->descriptorStatus != Status::Success) {
        return toCode(dev->descriptorStatus);
    }
    const ConfigDescriptorData* config = activeConfigLocked(dev);
    if (!config) {
        return toCode(Status::NotFound);
    }
    out = *config;
    return 0;
}

uint8_t VirtualLibrary::getBusNumber(RawDevice* dev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return dev->spec.busNumber;
}

uint8_t VirtualLibrary::getPortNumber(RawDevice* dev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return dev->spec.portNumber;
}

uint8_t VirtualLibrary::getDeviceAddress(RawDevice* dev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return dev->spec.address;
}

int VirtualLibrary::getDeviceSpeed(RawDevice* dev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return dev->spec.speed;
}

int VirtualLibrary::open(RawDevice* dev, RawDeviceHandle** out) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!out) {
        return toCode(Status::InvalidParam);
    }
    if (dev->openStatus != Status::Success) {
        return toCode(dev->openStatus);
    }
    if (!dev->attached) {
        return toCode(Status::NoDevice);
    }

    auto handle = std::make_unique<RawDeviceHandle>();
    handle->device = dev;
    ++dev->refs;
    ++openCount_;

    RawDeviceHandle* raw = handle.get();
    handles_.emplace(raw, std::move(handle));
    *out = raw;
    return 0;
}

RawDeviceHandle* VirtualLibrary::openDeviceWithVidPid(RawContext* ctx, uint16_t vendorId, uint16_t productId) {
    RawDevice* match = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx ? !isLiveLocked(ctx) : !defaultInitialized_) {
            return nullptr;
        }
        if (enumerationStatus_ != Status::Success) {
            return nullptr;
        }
        if (ctx && !ctx->discovery) {
            return nullptr;
        }
        for (const auto& dev : devices_) {
            if (dev->attached &&
                dev->spec.descriptor.idVendor == vendorId &&
                dev->spec.descriptor.idProduct == productId) {
                match = dev.get();
                break;
            }
        }
    }

    if (!match) {
        return nullptr;
    }

    RawDeviceHandle* handle = nullptr;
    if (open(match, &handle) < 0) {
        return nullptr;
    }
    return handle;
}

// ═══════════════════════════════════════════════════════════════════════════
// Per-Handle Calls
// ═══════════════════════════════════════════════════════════════════════════

void VirtualLibrary::close(RawDeviceHandle* handle) {
    if (!handle) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return;
    }
    --it->second->device->refs;
    ++closeCount_;
    handles_.erase(it);
}

RawDevice* VirtualLibrary::getDevice(RawDeviceHandle* handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle->device;
}

int VirtualLibrary::getConfiguration(RawDeviceHandle* handle, int& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle->device->attached) {
        return toCode(Status::NoDevice);
    }
    config = handle->device->spec.activeConfig;
    return 0;
}

int VirtualLibrary::setConfiguration(RawDeviceHandle* handle, int config) {
    std::lock_guard<std::mutex> lock(mutex_);
    RawDevice* dev = handle->device;

    if (!dev->attached) {
        return toCode(Status::NoDevice);
    }
    if (!handle->claimed.empty()) {
        return toCode(Status::Busy);
    }
    if (config == -1 || config == 0) {
        dev->spec.activeConfig = 0;
        return 0;
    }

    bool known = std::any_of(dev->spec.configs.begin(), dev->spec.configs.end(),
        [config](const ConfigDescriptorData& c) { return c.bConfigurationValue == config; });
    if (!known) {
        return toCode(Status::NotFound);
    }
    dev->spec.activeConfig = static_cast<uint8_t>(config);
    return 0;
}

int VirtualLibrary::claimInterface(RawDeviceHandle* handle, int iface) {
    std::lock_guard<std::mutex> lock(mutex_);
    RawDevice* dev = handle->device;

    if (!dev->attached) {
        return toCode(Status::NoDevice);
    }
    const ConfigDescriptorData* config = activeConfigLocked(dev);
    if (!config || !hasInterface(*config, iface)) {
        return toCode(Status::NotFound);
    }
    if (dev->spec.kernelDriverInterfaces.count(iface) != 0) {
        if (!handle->autoDetach) {
            return toCode(Status::Busy);
        }
        dev->spec.kernelDriverInterfaces.erase(iface);
    }
    handle->claimed.insert(iface);
    return 0;
}

int VirtualLibrary::releaseInterface(RawDeviceHandle* handle, int iface) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle->claimed.erase(iface) == 0) {
        return toCode(Status::NotFound);
    }
    handle->altSettings.erase(iface);
    return 0;
}

int VirtualLibrary::setInterfaceAltSetting(RawDeviceHandle* handle, int iface, int altSetting) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle->claimed.count(iface) == 0) {
        return toCode(Status::NotFound);
    }
    const ConfigDescriptorData* config = activeConfigLocked(handle->device);
    if (!config || !hasAltSetting(*config, iface, altSetting)) {
        return toCode(Status::NotFound);
    }
    handle->altSettings[iface] = altSetting;
    return 0;
}

int VirtualLibrary::resetDevice(RawDeviceHandle* handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle->device->attached) {
        return toCode(Status::NotFound);
    }
    handle->altSettings.clear();
    return 0;
}

int VirtualLibrary::kernelDriverActive(RawDeviceHandle* handle, int iface) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!capabilities_[capabilityIndex(Capability::SupportsDetachKernelDriver)]) {
        return toCode(Status::NotSupported);
    }
    return handle->device->spec.kernelDriverInterfaces.count(iface) != 0 ? 1 : 0;
}

int VirtualLibrary::detachKernelDriver(RawDeviceHandle* handle, int iface) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!capabilities_[capabilityIndex(Capability::SupportsDetachKernelDriver)]) {
        return toCode(Status::NotSupported);
    }
    if (handle->device->spec.kernelDriverInterfaces.erase(iface) == 0) {
        return toCode(Status::NotFound);
    }
    return 0;
}

int VirtualLibrary::attachKernelDriver(RawDeviceHandle* handle, int iface) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!capabilities_[capabilityIndex(Capability::SupportsDetachKernelDriver)]) {
        return toCode(Status::NotSupported);
    }
    if (handle->claimed.count(iface) != 0) {
        return toCode(Status::Busy);
    }
    if (!handle->device->spec.kernelDriverInterfaces.insert(iface).second) {
        return toCode(Status::Busy);
    }
    return 0;
}

int VirtualLibrary::setAutoDetachKernelDriver(RawDeviceHandle* handle, bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!capabilities_[capabilityIndex(Capability::SupportsDetachKernelDriver)]) {
        return toCode(Status::NotSupported);
    }
    handle->autoDetach = enable;
    return 0;
}

int VirtualLibrary::getStringDescriptorAscii(RawDeviceHandle* handle, uint8_t index,
                                             unsigned char* data, int length) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (index == 0 || !data || length <= 0) {
        return toCode(Status::InvalidParam);
    }
    if (!handle->device->attached) {
        return toCode(Status::NoDevice);
    }
    const auto& strings = handle->device->spec.strings;
    if (index > strings.size()) {
        return toCode(Status::Pipe);
    }

    const std::string& text = strings[index - 1];
    size_t count = std::min(text.size(), static_cast<size_t>(length - 1));
    std::memcpy(data, text.data(), count);
    data[count] = '\0';
    return static_cast<int>(count);
}

// ═══════════════════════════════════════════════════════════════════════════
// Test API
// ═══════════════════════════════════════════════════════════════════════════

size_t VirtualLibrary::addDevice(const VirtualDeviceSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dev = std::make_unique<RawDevice>();
    dev->spec = spec;
    devices_.push_back(std::move(dev));
    return devices_.size() - 1;
}

void VirtualLibrary::removeDevice(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.at(index)->attached = false;
}

RawDevice* VirtualLibrary::rawDevice(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.at(index).get();
}

void VirtualLibrary::setInitStatus(Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    initStatus_ = status;
}

void VirtualLibrary::setEnumerationStatus(Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    enumerationStatus_ = status;
}

void VirtualLibrary::setOpenStatus(size_t index, Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.at(index)->openStatus = status;
}

void VirtualLibrary::setDescriptorStatus(size_t index, Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.at(index)->descriptorStatus = status;
}

void VirtualLibrary::setCapability(Capability cap, bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    capabilities_[capabilityIndex(cap)] = supported;
}

void VirtualLibrary::emitLog(RawContext* ctx, LogLevel level, const char* text) {
    LogFunction global = nullptr;
    LogFunction local = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int threshold = ctx ? ctx->logLevel : defaultLogLevel_;
        if (level == LogLevel::None || static_cast<int>(level) > threshold) {
            return;
        }
        global = globalLogHandler_;
        local = ctx ? ctx->logHandler : defaultLogHandler_;
    }

    // Handlers run unlocked, as the library's own logging thread would.
    // The global handler is never told which context emitted the line.
    if (global) {
        global(nullptr, static_cast<int>(level), text);
    }
    if (local) {
        local(ctx, static_cast<int>(level), text);
    }
}

int VirtualLibrary::logLevel(RawContext* ctx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx ? ctx->logLevel : defaultLogLevel_;
}

bool VirtualLibrary::hasGlobalLogHandler() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return globalLogHandler_ != nullptr;
}

bool VirtualLibrary::hasContextLogHandler(RawContext* ctx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx ? ctx->logHandler != nullptr : defaultLogHandler_ != nullptr;
}

int VirtualLibrary::initCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initCount_;
}

int VirtualLibrary::exitCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitCount_;
}

int VirtualLibrary::doubleExitCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return doubleExitCount_;
}

int VirtualLibrary::liveContextCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(contexts_.begin(), contexts_.end(),
        [](const std::unique_ptr<RawContext>& ctx) { return ctx->live; }));
}

bool VirtualLibrary::isContextLive(RawContext* ctx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isLiveLocked(ctx);
}

bool VirtualLibrary::isDefaultContextInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultInitialized_;
}

int VirtualLibrary::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return openCount_;
}

int VirtualLibrary::closeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeCount_;
}

int VirtualLibrary::openHandleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(handles_.size());
}

int VirtualLibrary::outstandingListCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstandingLists_;
}

int VirtualLibrary::deviceRefCount(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.at(index)->refs;
}

bool VirtualLibrary::isInterfaceClaimed(RawDeviceHandle* handle, int iface) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle);
    return it != handles_.end() && it->second->claimed.count(iface) != 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Private Helpers
// ═══════════════════════════════════════════════════════════════════════════

bool VirtualLibrary::isLiveLocked(const RawContext* ctx) const {
    return std::any_of(contexts_.begin(), contexts_.end(),
        [ctx](const std::unique_ptr<RawContext>& c) { return c.get() == ctx && c->live; });
}

const ConfigDescriptorData* VirtualLibrary::activeConfigLocked(const RawDevice* dev) const {
    for (const auto& config : dev->spec.configs) {
        if (dev->spec.activeConfig != 0 && config.bConfigurationValue == dev->spec.activeConfig) {
            return &config;
        }
    }
    return nullptr;
}

} // namespace nal
