// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Native Access Layer - libusb-1.0 Backend

#include "nal/library.h"
#include <libusb.h>
#include <atomic>
#include <memory>

namespace nal {
namespace libusb {

namespace {

// libusb calls one fixed function pointer; the installed LogFunction is
// forwarded from here.
std::atomic<LogFunction> g_log_forward{nullptr};

void logShim(libusb_context* ctx, enum libusb_log_level level, const char* str) {
    LogFunction fn = g_log_forward.load(std::memory_order_acquire);
    if (fn) {
        fn(reinterpret_cast<RawContext*>(ctx), static_cast<int>(level), str);
    }
}

libusb_context* native(RawContext* ctx) {
    return reinterpret_cast<libusb_context*>(ctx);
}

libusb_device* native(RawDevice* dev) {
    return reinterpret_cast<libusb_device*>(dev);
}

libusb_device_handle* native(RawDeviceHandle* handle) {
    return reinterpret_cast<libusb_device_handle*>(handle);
}

std::vector<uint8_t> copyExtra(const unsigned char* extra, int length) {
    if (!extra || length <= 0) {
        return {};
    }
    return std::vector<uint8_t>(extra, extra + length);
}

void copyConfig(const libusb_config_descriptor& src, ConfigDescriptorData& out) {
    out.bLength = src.bLength;
    out.bDescriptorType = src.bDescriptorType;
    out.wTotalLength = src.wTotalLength;
    out.bConfigurationValue = src.bConfigurationValue;
    out.iConfiguration = src.iConfiguration;
    out.bmAttributes = src.bmAttributes;
    out.MaxPower = src.MaxPower;
    out.extra = copyExtra(src.extra, src.extra_length);
    out.interfaces.clear();
    out.interfaces.reserve(src.bNumInterfaces);

    for (uint8_t i = 0; i < src.bNumInterfaces; ++i) {
        const libusb_interface& iface = src.interface[i];
        InterfaceData data;
        data.altsettings.reserve(static_cast<size_t>(iface.num_altsetting));

        for (int a = 0; a < iface.num_altsetting; ++a) {
            const libusb_interface_descriptor& alt = iface.altsetting[a];
            InterfaceDescriptorData setting;
            setting.bLength = alt.bLength;
            setting.bDescriptorType = alt.bDescriptorType;
            setting.bInterfaceNumber = alt.bInterfaceNumber;
            setting.bAlternateSetting = alt.bAlternateSetting;
            setting.bInterfaceClass = alt.bInterfaceClass;
            setting.bInterfaceSubClass = alt.bInterfaceSubClass;
            setting.bInterfaceProtocol = alt.bInterfaceProtocol;
            setting.iInterface = alt.iInterface;
            setting.extra = copyExtra(alt.extra, alt.extra_length);

            for (uint8_t e = 0; e < alt.bNumEndpoints; ++e) {
                const libusb_endpoint_descriptor& ep = alt.endpoint[e];
                EndpointDescriptorData endpoint;
                endpoint.bLength = ep.bLength;
                endpoint.bDescriptorType = ep.bDescriptorType;
                endpoint.bEndpointAddress = ep.bEndpointAddress;
                endpoint.bmAttributes = ep.bmAttributes;
                endpoint.wMaxPacketSize = ep.wMaxPacketSize;
                endpoint.bInterval = ep.bInterval;
                endpoint.bRefresh = ep.bRefresh;
                endpoint.bSynchAddress = ep.bSynchAddress;
                endpoint.extra = copyExtra(ep.extra, ep.extra_length);
                setting.endpoints.push_back(std::move(endpoint));
            }
            data.altsettings.push_back(std::move(setting));
        }
        out.interfaces.push_back(std::move(data));
    }
}

} // anonymous namespace

/// libusb-1.0 host library
class LibraryLibusb : public INativeLibrary {
public:
    LibraryLibusb() = default;
    ~LibraryLibusb() override = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Context Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    using INativeLibrary::initContext;

    int initContext(RawContext** out, const InitOptions& options) override {
        libusb_init_option opts[1] = {};
        int numOptions = 0;
        if (options.noDeviceDiscovery) {
            opts[numOptions++].option = LIBUSB_OPTION_NO_DEVICE_DISCOVERY;
        }

        if (!out) {
            return libusb_init_context(nullptr, opts, numOptions);
        }
        libusb_context* ctx = nullptr;
        int rc = libusb_init_context(&ctx, opts, numOptions);
        if (rc < 0) {
            return rc;
        }
        *out = reinterpret_cast<RawContext*>(ctx);
        return rc;
    }

    void exitContext(RawContext* ctx) override {
        libusb_exit(native(ctx));
    }

    int setOption(RawContext* ctx, Option option, int value) override {
        switch (option) {
            case Option::LogLevel:
                return libusb_set_option(native(ctx), LIBUSB_OPTION_LOG_LEVEL, value);
            case Option::NoDeviceDiscovery:
                if (value == 0) {
                    return 0;
                }
                return libusb_set_option(native(ctx), LIBUSB_OPTION_NO_DEVICE_DISCOVERY);
        }
        return LIBUSB_ERROR_INVALID_PARAM;
    }

    void setLogCallback(RawContext* ctx, LogFunction fn, LogScope scope) override {
        if (fn) {
            g_log_forward.store(fn, std::memory_order_release);
        }
        int mode = scope == LogScope::Global ? LIBUSB_LOG_CB_GLOBAL : LIBUSB_LOG_CB_CONTEXT;
        libusb_set_log_cb(native(ctx), fn ? logShim : nullptr, mode);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Library Queries
    // ═══════════════════════════════════════════════════════════════════════

    bool hasCapability(Capability cap) const override {
        switch (cap) {
            case Capability::HasCapability:
                return libusb_has_capability(LIBUSB_CAP_HAS_CAPABILITY) != 0;
            case Capability::HasHotplug:
                return libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG) != 0;
            case Capability::HasHidAccess:
                return libusb_has_capability(LIBUSB_CAP_HAS_HID_ACCESS) != 0;
            case Capability::SupportsDetachKernelDriver:
                return libusb_has_capability(LIBUSB_CAP_SUPPORTS_DETACH_KERNEL_DRIVER) != 0;
        }
        return false;
    }

    Version getVersion() const override {
        const libusb_version* v = libusb_get_version();
        return Version{v->major, v->minor, v->micro, v->nano, v->rc ? v->rc : ""};
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Enumeration
    // ═══════════════════════════════════════════════════════════════════════

    std::ptrdiff_t getDeviceList(RawContext* ctx, RawDevice*** out) override {
        libusb_device** list = nullptr;
        ssize_t n = libusb_get_device_list(native(ctx), &list);
        if (n < 0) {
            return static_cast<std::ptrdiff_t>(n);
        }
        *out = reinterpret_cast<RawDevice**>(list);
        return static_cast<std::ptrdiff_t>(n);
    }

    void freeDeviceList(RawDevice** list, bool unrefDevices) override {
        libusb_free_device_list(reinterpret_cast<libusb_device**>(list), unrefDevices ? 1 : 0);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Per-Device Calls
    // ═══════════════════════════════════════════════════════════════════════

    RawDevice* refDevice(RawDevice* dev) override {
        return reinterpret_cast<RawDevice*>(libusb_ref_device(native(dev)));
    }

    void unrefDevice(RawDevice* dev) override {
        libusb_unref_device(native(dev));
    }

    int getDeviceDescriptor(RawDevice* dev, DeviceDescriptorData& out) override {
        libusb_device_descriptor desc{};
        int rc = libusb_get_device_descriptor(native(dev), &desc);
        if (rc < 0) {
            return rc;
        }
        out.bLength = desc.bLength;
        out.bDescriptorType = desc.bDescriptorType;
        out.bcdUSB = desc.bcdUSB;
        out.bDeviceClass = desc.bDeviceClass;
        out.bDeviceSubClass = desc.bDeviceSubClass;
        out.bDeviceProtocol = desc.bDeviceProtocol;
        out.bMaxPacketSize0 = desc.bMaxPacketSize0;
        out.idVendor = desc.idVendor;
        out.idProduct = desc.idProduct;
        out.bcdDevice = desc.bcdDevice;
        out.iManufacturer = desc.iManufacturer;
        out.iProduct = desc.iProduct;
        out.iSerialNumber = desc.iSerialNumber;
        out.bNumConfigurations = desc.bNumConfigurations;
        return rc;
    }

    int getConfigDescriptor(RawDevice* dev, uint8_t index, ConfigDescriptorData& out) override {
        libusb_config_descriptor* config = nullptr;
        int rc = libusb_get_config_descriptor(native(dev), index, &config);
        if (rc < 0) {
            return rc;
        }
        std::unique_ptr<libusb_config_descriptor, decltype(&libusb_free_config_descriptor)>
            guard(config, &libusb_free_config_descriptor);
        copyConfig(*config, out);
        return rc;
    }

    int getActiveConfigDescriptor(RawDevice* dev, ConfigDescriptorData& out) override {
        libusb_config_descriptor* config = nullptr;
        int rc = libusb_get_active_config_descriptor(native(dev), &config);
        if (rc < 0) {
            return rc;
        }
        std::unique_ptr<libusb_config_descriptor, decltype(&libusb_free_config_descriptor)>
            guard(config, &libusb_free_config_descriptor);
        copyConfig(*config, out);
        return rc;
    }

    uint8_t getBusNumber(RawDevice* dev) override {
        return libusb_get_bus_number(native(dev));
    }

    uint8_t getPortNumber(RawDevice* dev) override {
        return libusb_get_port_number(native(dev));
    }

    uint8_t getDeviceAddress(RawDevice* dev) override {
        return libusb_get_device_address(native(dev));
    }

    int getDeviceSpeed(RawDevice* dev) override {
        return libusb_get_device_speed(native(dev));
    }

    int open(RawDevice* dev, RawDeviceHandle** out) override {
        libusb_device_handle* handle = nullptr;
        int rc = libusb_open(native(dev), &handle);
        if (rc < 0) {
            return rc;
        }
        *out = reinterpret_cast<RawDeviceHandle*>(handle);
        return rc;
    }

    RawDeviceHandle* openDeviceWithVidPid(RawContext* ctx, uint16_t vendorId, uint16_t productId) override {
        return reinterpret_cast<RawDeviceHandle*>(
            libusb_open_device_with_vid_pid(native(ctx), vendorId, productId));
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Per-Handle Calls
    // ═══════════════════════════════════════════════════════════════════════

    void close(RawDeviceHandle* handle) override {
        libusb_close(native(handle));
    }

    RawDevice* getDevice(RawDeviceHandle* handle) override {
        return reinterpret_cast<RawDevice*>(libusb_get_device(native(handle)));
    }

    int getConfiguration(RawDeviceHandle* handle, int& config) override {
        return libusb_get_configuration(native(handle), &config);
    }

    int setConfiguration(RawDeviceHandle* handle, int config) override {
        return libusb_set_configuration(native(handle), config);
    }

    int claimInterface(RawDeviceHandle* handle, int iface) override {
        return libusb_claim_interface(native(handle), iface);
    }

    int releaseInterface(RawDeviceHandle* handle, int iface) override {
        return libusb_release_interface(native(handle), iface);
    }

    int setInterfaceAltSetting(RawDeviceHandle* handle, int iface, int altSetting) override {
        return libusb_set_interface_alt_setting(native(handle), iface, altSetting);
    }

    int resetDevice(RawDeviceHandle* handle) override {
        return libusb_reset_device(native(handle));
    }

    int kernelDriverActive(RawDeviceHandle* handle, int iface) override {
        return libusb_kernel_driver_active(native(handle), iface);
    }

    int detachKernelDriver(RawDeviceHandle* handle, int iface) override {
        return libusb_detach_kernel_driver(native(handle), iface);
    }

    int attachKernelDriver(RawDeviceHandle* handle, int iface) override {
        return libusb_attach_kernel_driver(native(handle), iface);
    }

    int setAutoDetachKernelDriver(RawDeviceHandle* handle, bool enable) override {
        return libusb_set_auto_detach_kernel_driver(native(handle), enable ? 1 : 0);
    }

    int getStringDescriptorAscii(RawDeviceHandle* handle, uint8_t index,
                                 unsigned char* data, int length) override {
        return libusb_get_string_descriptor_ascii(native(handle), index, data, length);
    }
};

} // namespace libusb

// Factory function (called by platform.cpp)
std::shared_ptr<INativeLibrary> createLibraryLibusb() {
    return std::make_shared<libusb::LibraryLibusb>();
}

} // namespace nal
