/**
 * @file test_device_list.cpp
 * @brief Unit tests for DeviceList ownership and access.
 */

#include <gtest/gtest.h>
#include <usbkit/usbkit.h>
#include "virtual_bus.h"

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace usbkit;

class DeviceListTest : public test::VirtualBusTest {
protected:
    void SetUp() override {
        test::VirtualBusTest::SetUp();
        first_ = bus_->addDevice(test::makeDeviceSpec(0x1111, 0x0001, 1, 4));
        second_ = bus_->addDevice(test::makeDeviceSpec(0x2222, 0x0002, 1, 5));
    }

    size_t first_ = 0;
    size_t second_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Enumeration
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DeviceListTest, SizeMatchesAttachedDevices) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list->size(), 2u);
    EXPECT_FALSE(list->empty());
}

TEST_F(DeviceListTest, EmptyBus) {
    auto lib = std::make_shared<nal::VirtualLibrary>();
    auto ctx = Context::create(lib);
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(list->empty());
    EXPECT_EQ(list->begin(), list->end());
}

TEST_F(DeviceListTest, NegativeCountIsEnumerationError) {
    bus_->setEnumerationStatus(nal::Status::NoMem);
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_FALSE(list.has_value());
    EXPECT_EQ(list.error().code(), ErrorCode::EnumerationError);
    EXPECT_EQ(list.error().native_code(), -11);
    EXPECT_EQ(bus_->outstandingListCount(), 0);
}

TEST_F(DeviceListTest, EveryStatusKeepsItsCode) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    for (nal::Status s : {nal::Status::IoError, nal::Status::Access, nal::Status::Busy,
                          nal::Status::Other}) {
        bus_->setEnumerationStatus(s);
        auto list = ctx->devices();
        ASSERT_FALSE(list.has_value());
        EXPECT_EQ(list.error().code(), ErrorCode::EnumerationError);
        EXPECT_EQ(list.error().status(), s);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Ownership
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DeviceListTest, ArrayIsFreedOnceWithUnref) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    {
        auto list = ctx->devices();
        ASSERT_TRUE(list.has_value());
        EXPECT_EQ(bus_->outstandingListCount(), 1);
        EXPECT_EQ(bus_->deviceRefCount(first_), 1);
    }
    EXPECT_EQ(bus_->outstandingListCount(), 0);
    EXPECT_EQ(bus_->deviceRefCount(first_), 0);
    EXPECT_EQ(bus_->deviceRefCount(second_), 0);
}

TEST_F(DeviceListTest, MovedListFreesOnce) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    {
        auto list = ctx->devices();
        ASSERT_TRUE(list.has_value());
        DeviceList moved = std::move(*list);
        EXPECT_EQ(moved.size(), 2u);
        EXPECT_EQ(list->size(), 0u);
    }
    EXPECT_EQ(bus_->outstandingListCount(), 0);
    EXPECT_EQ(bus_->deviceRefCount(first_), 0);
}

TEST_F(DeviceListTest, MoveAssignmentFreesPreviousArray) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto a = ctx->devices();
    auto b = ctx->devices();
    ASSERT_TRUE(a && b);
    EXPECT_EQ(bus_->outstandingListCount(), 2);
    *a = std::move(*b);
    EXPECT_EQ(bus_->outstandingListCount(), 1);
    EXPECT_EQ(bus_->deviceRefCount(first_), 1);
}

TEST_F(DeviceListTest, DevicesOutliveTheList) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    std::vector<Device> kept;
    {
        auto list = ctx->devices();
        ASSERT_TRUE(list.has_value());
        for (const Device& device : *list) {
            kept.push_back(device);
        }
    }
    EXPECT_EQ(bus_->outstandingListCount(), 0);
    EXPECT_EQ(bus_->deviceRefCount(first_), 1);
    EXPECT_EQ(bus_->deviceRefCount(second_), 1);
    EXPECT_EQ(kept[1].address(), 5);
}

TEST_F(DeviceListTest, DevicesKeepContextAliveAfterListDropped) {
    std::vector<Device> kept;
    {
        auto ctx = Context::create();
        ASSERT_TRUE(ctx.has_value());
        auto list = ctx->devices();
        ASSERT_TRUE(list.has_value());
        kept.push_back((*list)[0]);
        kept.push_back((*list)[1]);
    }
    EXPECT_EQ(bus_->exitCount(), 0);

    kept.pop_back();
    EXPECT_EQ(bus_->exitCount(), 0);
    kept.clear();
    EXPECT_EQ(bus_->exitCount(), 1);
    EXPECT_EQ(bus_->doubleExitCount(), 0);
}

TEST_F(DeviceListTest, ListKeepsContextAlive) {
    std::optional<DeviceList> list;
    {
        auto ctx = Context::create();
        ASSERT_TRUE(ctx.has_value());
        list.emplace(std::move(ctx->devices().value()));
    }
    EXPECT_EQ(bus_->exitCount(), 0);
    EXPECT_EQ(list->size(), 2u);
    list.reset();
    EXPECT_EQ(bus_->exitCount(), 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Access
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DeviceListTest, IndexedAccess) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ((*list)[0].native_handle(), bus_->rawDevice(first_));
    EXPECT_EQ((*list)[1].native_handle(), bus_->rawDevice(second_));
}

TEST_F(DeviceListTest, OutOfRangeIndexViolatesContract) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    EXPECT_THROW((void)(*list)[2], std::logic_error);
}

TEST_F(DeviceListTest, GetReturnsNulloptOutOfRange) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(list->get(1).has_value());
    EXPECT_FALSE(list->get(2).has_value());
    EXPECT_FALSE(list->get(100).has_value());
}

TEST_F(DeviceListTest, IterationVisitsEveryDeviceInOrder) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());

    std::vector<uint16_t> vendors;
    for (const Device& device : *list) {
        auto desc = device.device_descriptor();
        ASSERT_TRUE(desc.has_value());
        vendors.push_back(desc->vendor_id());
    }
    EXPECT_EQ(vendors, (std::vector<uint16_t>{0x1111, 0x2222}));
    // Temporaries produced by iteration released their references
    EXPECT_EQ(bus_->deviceRefCount(first_), 1);
}

TEST_F(DeviceListTest, ContextAccessor) {
    auto ctx = Context::create();
    ASSERT_TRUE(ctx.has_value());
    auto list = ctx->devices();
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list->context(), *ctx);
}
