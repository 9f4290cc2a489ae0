// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors
//
// Log Dispatch and Ownership Benchmarks

#include <benchmark/benchmark.h>
#include "nal/platform.h"
#include "nal/virtual_library.h"
#include "usbkit/usbkit.h"
#include <memory>
#include <string>
#include <vector>

// ═══════════════════════════════════════════════════════════════════════════
// Benchmark Fixtures
// ═══════════════════════════════════════════════════════════════════════════

class VirtualBusBenchmark : public benchmark::Fixture {
public:
    void SetUp(const benchmark::State&) override {
        nal::Platform::shutdown();
        nal::Platform::initialize(nal::Backend::Virtual);
        bus = std::dynamic_pointer_cast<nal::VirtualLibrary>(nal::Platform::library());
        usbkit::LogCallbackRegistry::instance().clear();
    }

    void TearDown(const benchmark::State&) override {
        usbkit::LogCallbackRegistry::instance().clear();
        bus.reset();
        nal::Platform::shutdown();
    }

    std::shared_ptr<nal::VirtualLibrary> bus;
};

namespace {

nal::VirtualDeviceSpec makeSpec(uint16_t productId) {
    nal::VirtualDeviceSpec spec;
    spec.descriptor.idVendor = 0x1234;
    spec.descriptor.idProduct = productId;
    spec.descriptor.bNumConfigurations = 1;
    nal::ConfigDescriptorData config;
    config.bConfigurationValue = 1;
    spec.configs = {config};
    return spec;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Registry Dispatch Benchmarks
// ═══════════════════════════════════════════════════════════════════════════

BENCHMARK_F(VirtualBusBenchmark, BM_DispatchContextCallback)(benchmark::State& state) {
    auto ctx = usbkit::Context::create().value();
    size_t bytes = 0;
    ctx.set_log_callback([&](usbkit::LogLevel, std::string text) { bytes += text.size(); },
                         usbkit::LogCallbackMode::Context);

    for (auto _ : state) {
        usbkit::LogCallbackRegistry::trampoline(ctx.native_handle(),
                                                static_cast<int>(nal::LogLevel::Info),
                                                "libusb: debug [handle_events] poll() returned 0");
    }
    benchmark::DoNotOptimize(bytes);
}

BENCHMARK_F(VirtualBusBenchmark, BM_DispatchGlobalFallback)(benchmark::State& state) {
    auto ctx = usbkit::Context::create().value();
    size_t calls = 0;
    ctx.set_log_callback([&](usbkit::LogLevel, std::string) { ++calls; },
                         usbkit::LogCallbackMode::Global);

    for (auto _ : state) {
        usbkit::LogCallbackRegistry::trampoline(ctx.native_handle(),
                                                static_cast<int>(nal::LogLevel::Warning),
                                                "libusb: warning [op] unmatched line");
    }
    benchmark::DoNotOptimize(calls);
}

BENCHMARK_F(VirtualBusBenchmark, BM_DispatchUnregistered)(benchmark::State& state) {
    auto ctx = usbkit::Context::create().value();

    for (auto _ : state) {
        usbkit::LogCallbackRegistry::trampoline(ctx.native_handle(),
                                                static_cast<int>(nal::LogLevel::Debug),
                                                "dropped");
    }
}

BENCHMARK_F(VirtualBusBenchmark, BM_EmitThroughVirtualBus)(benchmark::State& state) {
    auto ctx = usbkit::Context::create().value();
    ctx.set_log_level(usbkit::LogLevel::Debug);
    size_t calls = 0;
    ctx.set_log_callback([&](usbkit::LogLevel, std::string) { ++calls; },
                         usbkit::LogCallbackMode::Context);

    for (auto _ : state) {
        bus->emitLog(ctx.native_handle(), nal::LogLevel::Debug, "libusb: debug [op] line");
    }
    benchmark::DoNotOptimize(calls);
}

// ═══════════════════════════════════════════════════════════════════════════
// Ownership Benchmarks
// ═══════════════════════════════════════════════════════════════════════════

BENCHMARK_F(VirtualBusBenchmark, BM_ContextCreateDestroy)(benchmark::State& state) {
    for (auto _ : state) {
        auto ctx = usbkit::Context::create();
        benchmark::DoNotOptimize(ctx);
    }
}

BENCHMARK_F(VirtualBusBenchmark, BM_ContextClone)(benchmark::State& state) {
    auto ctx = usbkit::Context::create().value();

    for (auto _ : state) {
        usbkit::Context clone = ctx;
        benchmark::DoNotOptimize(clone);
    }
}

BENCHMARK_F(VirtualBusBenchmark, BM_EnumerateSixteenDevices)(benchmark::State& state) {
    for (uint16_t i = 0; i < 16; ++i) {
        bus->addDevice(makeSpec(i));
    }
    auto ctx = usbkit::Context::create().value();

    for (auto _ : state) {
        auto list = ctx.devices();
        benchmark::DoNotOptimize(list->size());
    }
}

BENCHMARK_F(VirtualBusBenchmark, BM_EnumerateAndCollectDevices)(benchmark::State& state) {
    for (uint16_t i = 0; i < 16; ++i) {
        bus->addDevice(makeSpec(i));
    }
    auto ctx = usbkit::Context::create().value();

    for (auto _ : state) {
        std::vector<usbkit::Device> devices;
        auto list = ctx.devices();
        for (const usbkit::Device& device : *list) {
            devices.push_back(device);
        }
        benchmark::DoNotOptimize(devices.data());
    }
}

BENCHMARK_F(VirtualBusBenchmark, BM_OpenClose)(benchmark::State& state) {
    bus->addDevice(makeSpec(1));
    auto ctx = usbkit::Context::create().value();
    auto list = ctx.devices();
    usbkit::Device device = (*list)[0];

    for (auto _ : state) {
        auto handle = device.open();
        benchmark::DoNotOptimize(handle);
    }
}

BENCHMARK_MAIN();
