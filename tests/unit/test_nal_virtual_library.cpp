// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 usbkit Contributors

#include <gtest/gtest.h>
#include "nal/virtual_library.h"
#include "virtual_bus.h"

#include <string>
#include <vector>

namespace nal {
namespace {

class VirtualLibraryTest : public ::testing::Test {
protected:
    VirtualLibrary lib_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Context Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(VirtualLibraryTest, InitAndExitAreCounted) {
    RawContext* ctx = nullptr;
    ASSERT_EQ(lib_.initContext(&ctx), 0);
    ASSERT_NE(ctx, nullptr);
    EXPECT_TRUE(lib_.isContextLive(ctx));
    EXPECT_EQ(lib_.initCount(), 1);
    EXPECT_EQ(lib_.liveContextCount(), 1);

    lib_.exitContext(ctx);
    EXPECT_FALSE(lib_.isContextLive(ctx));
    EXPECT_EQ(lib_.exitCount(), 1);
    EXPECT_EQ(lib_.liveContextCount(), 0);
}

TEST_F(VirtualLibraryTest, SecondExitIsRecordedAsDoubleExit) {
    RawContext* ctx = nullptr;
    ASSERT_EQ(lib_.initContext(&ctx), 0);
    lib_.exitContext(ctx);
    lib_.exitContext(ctx);
    EXPECT_EQ(lib_.exitCount(), 1);
    EXPECT_EQ(lib_.doubleExitCount(), 1);
}

TEST_F(VirtualLibraryTest, FreedSlotIsReused) {
    RawContext* first = nullptr;
    ASSERT_EQ(lib_.initContext(&first), 0);
    lib_.exitContext(first);

    RawContext* second = nullptr;
    ASSERT_EQ(lib_.initContext(&second), 0);
    EXPECT_EQ(first, second);
    lib_.exitContext(second);
}

TEST_F(VirtualLibraryTest, InjectedInitFailure) {
    lib_.setInitStatus(Status::NoMem);
    RawContext* ctx = nullptr;
    EXPECT_EQ(lib_.initContext(&ctx), toCode(Status::NoMem));
    EXPECT_EQ(ctx, nullptr);
    EXPECT_EQ(lib_.initCount(), 0);
}

TEST_F(VirtualLibraryTest, DefaultContext) {
    EXPECT_FALSE(lib_.isDefaultContextInitialized());
    EXPECT_EQ(lib_.initContext(nullptr), 0);
    EXPECT_TRUE(lib_.isDefaultContextInitialized());
    lib_.exitContext(nullptr);
    EXPECT_FALSE(lib_.isDefaultContextInitialized());
}

TEST_F(VirtualLibraryTest, LogLevelOptionIsValidated) {
    RawContext* ctx = nullptr;
    ASSERT_EQ(lib_.initContext(&ctx), 0);
    EXPECT_EQ(lib_.setOption(ctx, Option::LogLevel, 3), 0);
    EXPECT_EQ(lib_.logLevel(ctx), 3);
    EXPECT_EQ(lib_.setOption(ctx, Option::LogLevel, 9), toCode(Status::InvalidParam));
    EXPECT_EQ(lib_.logLevel(ctx), 3);
    lib_.exitContext(ctx);
}

TEST_F(VirtualLibraryTest, DiscoveryOnlyChangesAtInit) {
    lib_.addDevice(usbkit::test::makeDeviceSpec(0x1234, 0x0001));

    RawContext* late = nullptr;
    ASSERT_EQ(lib_.initContext(&late), 0);
    EXPECT_EQ(lib_.setOption(late, Option::NoDeviceDiscovery, 1), 0);
    RawDevice** list = nullptr;
    EXPECT_EQ(lib_.getDeviceList(late, &list), 1);
    lib_.freeDeviceList(list, true);

    InitOptions options;
    options.noDeviceDiscovery = true;
    RawContext* quiet = nullptr;
    ASSERT_EQ(lib_.initContext(&quiet, options), 0);
    EXPECT_EQ(lib_.getDeviceList(quiet, &list), 0);
    lib_.freeDeviceList(list, true);
    EXPECT_EQ(lib_.openDeviceWithVidPid(quiet, 0x1234, 0x0001), nullptr);

    lib_.exitContext(quiet);
    lib_.exitContext(late);
}

// ═══════════════════════════════════════════════════════════════════════════
// Enumeration and References
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(VirtualLibraryTest, DeviceListHoldsOneReferencePerEntry) {
    size_t a = lib_.addDevice(usbkit::test::makeDeviceSpec(0x1234, 0x0001));
    size_t b = lib_.addDevice(usbkit::test::makeDeviceSpec(0x1234, 0x0002));

    RawContext* ctx = nullptr;
    ASSERT_EQ(lib_.initContext(&ctx), 0);

    RawDevice** list = nullptr;
    ASSERT_EQ(lib_.getDeviceList(ctx, &list), 2);
    EXPECT_EQ(list[2], nullptr);
    EXPECT_EQ(lib_.deviceRefCount(a), 1);
    EXPECT_EQ(lib_.deviceRefCount(b), 1);
    EXPECT_EQ(lib_.outstandingListCount(), 1);

    lib_.freeDeviceList(list, true);
    EXPECT_EQ(lib_.deviceRefCount(a), 0);
    EXPECT_EQ(lib_.outstandingListCount(), 0);
    lib_.exitContext(ctx);
}

TEST_F(VirtualLibraryTest, RemovedDeviceIsNotEnumerated) {
    lib_.addDevice(usbkit::test::makeDeviceSpec(0x1234, 0x0001));
    size_t b = lib_.addDevice(usbkit::test::makeDeviceSpec(0x1234, 0x0002));
    lib_.removeDevice(b);

    RawContext* ctx = nullptr;
    ASSERT_EQ(lib_.initContext(&ctx), 0);
    RawDevice** list = nullptr;
    EXPECT_EQ(lib_.getDeviceList(ctx, &list), 1);
    lib_.freeDeviceList(list, true);
    lib_.exitContext(ctx);
}

TEST_F(VirtualLibraryTest, OpenAndCloseTrackReferences) {
    size_t idx = lib_.addDevice(usbkit::test::makeDeviceSpec(0x1234, 0x0001));
    RawDeviceHandle* handle = nullptr;
    ASSERT_EQ(lib_.open(lib_.rawDevice(idx), &handle), 0);
    EXPECT_EQ(lib_.deviceRefCount(idx), 1);
    EXPECT_EQ(lib_.openHandleCount(), 1);

    lib_.close(handle);
    EXPECT_EQ(lib_.deviceRefCount(idx), 0);
    EXPECT_EQ(lib_.openCount(), 1);
    EXPECT_EQ(lib_.closeCount(), 1);
    EXPECT_EQ(lib_.openHandleCount(), 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Log Delivery
// ═══════════════════════════════════════════════════════════════════════════

std::vector<std::string> g_lines;
std::vector<RawContext*> g_contexts;

void recordLine(RawContext* ctx, int, const char* text) {
    g_contexts.push_back(ctx);
    g_lines.emplace_back(text ? text : "");
}

TEST_F(VirtualLibraryTest, EmitLogHonoursContextLevel) {
    g_lines.clear();
    RawContext* ctx = nullptr;
    ASSERT_EQ(lib_.initContext(&ctx), 0);
    lib_.setLogCallback(ctx, &recordLine, LogScope::Context);

    // Level None by default: nothing is delivered
    lib_.emitLog(ctx, LogLevel::Error, "dropped");
    EXPECT_TRUE(g_lines.empty());

    ASSERT_EQ(lib_.setOption(ctx, Option::LogLevel, static_cast<int>(LogLevel::Warning)), 0);
    lib_.emitLog(ctx, LogLevel::Warning, "kept");
    lib_.emitLog(ctx, LogLevel::Debug, "too verbose");
    ASSERT_EQ(g_lines.size(), 1u);
    EXPECT_EQ(g_lines[0], "kept");

    lib_.exitContext(ctx);
    EXPECT_FALSE(lib_.hasContextLogHandler(ctx));
}

TEST_F(VirtualLibraryTest, GlobalAndContextHandlersBothRun) {
    g_lines.clear();
    g_contexts.clear();
    RawContext* ctx = nullptr;
    ASSERT_EQ(lib_.initContext(&ctx), 0);
    ASSERT_EQ(lib_.setOption(ctx, Option::LogLevel, static_cast<int>(LogLevel::Debug)), 0);
    lib_.setLogCallback(ctx, &recordLine, LogScope::Context);
    lib_.setLogCallback(nullptr, &recordLine, LogScope::Global);
    EXPECT_TRUE(lib_.hasGlobalLogHandler());

    lib_.emitLog(ctx, LogLevel::Info, "twice");
    EXPECT_EQ(g_lines.size(), 2u);
    ASSERT_EQ(g_contexts.size(), 2u);
    EXPECT_EQ(g_contexts[0], nullptr);
    EXPECT_EQ(g_contexts[1], ctx);

    lib_.setLogCallback(nullptr, nullptr, LogScope::Global);
    lib_.exitContext(ctx);
}

} // namespace
} // namespace nal
