/**
 * @file test_device.cpp
 * @brief Unit tests for Device references, metadata and descriptor reads.
 */

#include <gtest/gtest.h>
#include <usbkit/usbkit.h>
#include "virtual_bus.h"

#include <optional>
#include <utility>

using namespace usbkit;

class DeviceTest : public test::VirtualBusTest {
protected:
    void SetUp() override {
        test::VirtualBusTest::SetUp();
        auto spec = test::makeDeviceSpec(0x1234, 0xABCD, 3, 17);
        spec.speed = static_cast<int>(nal::SpeedCode::Super);
        index_ = bus_->addDevice(spec);
    }

    Device firstDevice(const Context& ctx) {
        auto list = ctx.devices();
        return (*list)[0];
    }

    size_t index_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// References
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DeviceTest, HoldsExactlyOneReference) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    {
        Device device = firstDevice(*ctx);
        EXPECT_EQ(bus_->deviceRefCount(index_), 1);
    }
    EXPECT_EQ(bus_->deviceRefCount(index_), 0);
}

TEST_F(DeviceTest, CopyTakesAnotherReference) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    Device device = firstDevice(*ctx);
    {
        Device copy = device;
        EXPECT_EQ(copy, device);
        EXPECT_EQ(bus_->deviceRefCount(index_), 2);
    }
    EXPECT_EQ(bus_->deviceRefCount(index_), 1);
}

TEST_F(DeviceTest, MoveTransfersReference) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    Device device = firstDevice(*ctx);
    Device moved = std::move(device);
    EXPECT_EQ(bus_->deviceRefCount(index_), 1);
    EXPECT_EQ(moved.native_handle(), bus_->rawDevice(index_));
}

TEST_F(DeviceTest, AssignmentReleasesPreviousReference) {
    size_t other = bus_->addDevice(test::makeDeviceSpec(0x1234, 0x0002, 3, 18));
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());

    Device a = (*list)[0];
    Device b = (*list)[1];
    a = b;
    EXPECT_EQ(bus_->deviceRefCount(index_), 1);   // list only
    EXPECT_EQ(bus_->deviceRefCount(other), 3);    // list, a, b

    a = std::move(b);
    EXPECT_EQ(bus_->deviceRefCount(other), 2);    // list, a
}

TEST_F(DeviceTest, KeepsContextAlive) {
    std::optional<Device> device;
    {
        auto ctx = Context::create();
        ASSERT_TRUE(ctx.has_value());
        device = firstDevice(*ctx);
    }
    EXPECT_EQ(bus_->exitCount(), 0);
    EXPECT_TRUE(bus_->isContextLive(device->context().native_handle()));

    device.reset();
    EXPECT_EQ(bus_->exitCount(), 1);
}

TEST_F(DeviceTest, ContextIsTheEnumeratingContext) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    Device device = firstDevice(*ctx);
    EXPECT_EQ(device.context(), *ctx);
}

// ─────────────────────────────────────────────────────────────────────────────
// Metadata
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DeviceTest, Topology) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    Device device = firstDevice(*ctx);
    EXPECT_EQ(device.bus_number(), 3);
    EXPECT_EQ(device.address(), 17);
    EXPECT_EQ(device.port_number(), 2);
    EXPECT_EQ(device.speed(), Speed::Super);
}

TEST(SpeedTest, UnknownCodesDecodeToUnknown) {
    EXPECT_EQ(speed_from_native(0), Speed::Unknown);
    EXPECT_EQ(speed_from_native(2), Speed::Full);
    EXPECT_EQ(speed_from_native(5), Speed::SuperPlus);
    EXPECT_EQ(speed_from_native(6), Speed::Unknown);
    EXPECT_EQ(speed_from_native(-1), Speed::Unknown);
    EXPECT_STREQ(to_string(Speed::High), "High");
}

TEST_F(DeviceTest, UnrecognizedSpeedIsUnknown) {
    auto spec = test::makeDeviceSpec(0x1234, 0x0003);
    spec.speed = 42;
    size_t odd = bus_->addDevice(spec);
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ((*list)[odd].speed(), Speed::Unknown);
}

// ─────────────────────────────────────────────────────────────────────────────
// Descriptors
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DeviceTest, DeviceDescriptor) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto desc = firstDevice(*ctx).device_descriptor();
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->vendor_id(), 0x1234);
    EXPECT_EQ(desc->product_id(), 0xABCD);
}

TEST_F(DeviceTest, DeviceDescriptorFailureIsDescriptorReadError) {
    bus_->setDescriptorStatus(index_, nal::Status::IoError);
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto desc = firstDevice(*ctx).device_descriptor();
    ASSERT_FALSE(desc.has_value());
    EXPECT_EQ(desc.error().code(), ErrorCode::DescriptorReadError);
    EXPECT_EQ(desc.error().status(), nal::Status::IoError);
}

TEST_F(DeviceTest, ConfigDescriptorByIndex) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto config = firstDevice(*ctx).config_descriptor(0);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->number(), 1);
    EXPECT_EQ(config->num_interfaces(), 2u);
}

TEST_F(DeviceTest, ConfigDescriptorBadIndexIsNotFound) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto config = firstDevice(*ctx).config_descriptor(4);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::NotFound);
}

TEST_F(DeviceTest, ConfigDescriptorNativeFailureIsNativeError) {
    bus_->setDescriptorStatus(index_, nal::Status::NoMem);
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto config = firstDevice(*ctx).config_descriptor(0);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::NativeError);
    EXPECT_EQ(config.error().native_code(), -11);
}

TEST_F(DeviceTest, ActiveConfigDescriptor) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto config = firstDevice(*ctx).active_config_descriptor();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->number(), 1);
}

TEST_F(DeviceTest, UnconfiguredDeviceHasNoActiveConfig) {
    auto spec = test::makeDeviceSpec(0x1234, 0x0004);
    spec.activeConfig = 0;
    size_t idx = bus_->addDevice(spec);
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    auto config = (*list)[idx].active_config_descriptor();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::NotFound);
}

// ─────────────────────────────────────────────────────────────────────────────
// Open
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DeviceTest, OpenSucceeds) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto handle = firstDevice(*ctx).open();
    ASSERT_TRUE(handle.has_value()) << handle.error().format();
    EXPECT_EQ(bus_->openHandleCount(), 1);
}

TEST_F(DeviceTest, OpenAccessDeniedIsAccessError) {
    bus_->setOpenStatus(index_, nal::Status::Access);
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto handle = firstDevice(*ctx).open();
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code(), ErrorCode::AccessError);
    EXPECT_EQ(bus_->openHandleCount(), 0);
}

TEST_F(DeviceTest, OpenRemovedDeviceIsNativeError) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    Device device = firstDevice(*ctx);
    bus_->removeDevice(index_);
    auto handle = device.open();
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code(), ErrorCode::NativeError);
    EXPECT_EQ(handle.error().status(), nal::Status::NoDevice);
}
