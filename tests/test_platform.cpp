#include <gtest/gtest.h>
#include "platform/platform.h"
#include "infrastructure/error_handling.h"

using namespace testbox;
using namespace testbox::platform;

TEST(PlatformTest, LinuxX86) {
    PlatformInfo info = resolvePlatform("Linux", "x86_64");
    EXPECT_EQ(info.os, "linux");
    EXPECT_EQ(info.arch, "x86_64");
    EXPECT_EQ(info.format, "tar.gz");
    EXPECT_EQ(info.forRuntime("node").platform, "linux");
    EXPECT_EQ(info.forRuntime("node").arch, "x64");
    EXPECT_EQ(info.forRuntime("bun").arch, "x64");
    EXPECT_EQ(info.forRuntime("bun").format, "zip");
    EXPECT_EQ(info.forRuntime("uv").platform, "x86_64-unknown-linux-gnu");
}

TEST(PlatformTest, DarwinArmAliases) {
    PlatformInfo info = resolvePlatform("Darwin", "arm64");
    EXPECT_EQ(info.arch, "aarch64");
    EXPECT_EQ(info.forRuntime("node").arch, "arm64");
    EXPECT_EQ(info.forRuntime("bun").arch, "aarch64");
    EXPECT_EQ(info.forRuntime("uv").platform, "aarch64-apple-darwin");
}

TEST(PlatformTest, WindowsUsesZip) {
    PlatformInfo info = resolvePlatform("Windows", "AMD64");
    EXPECT_EQ(info.format, "zip");
    EXPECT_EQ(info.forRuntime("node").platform, "win");
    EXPECT_EQ(info.forRuntime("uv").platform, "x86_64-pc-windows-msvc");
}

TEST(PlatformTest, UnknownHostsAreRejected) {
    try {
        resolvePlatform("Plan9", "x86_64");
        FAIL() << "expected UnsupportedPlatformError";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_PLATFORM);
    }
    EXPECT_THROW(resolvePlatform("Linux", "riscv64"), Exception);
    EXPECT_THROW(resolvePlatform("Linux", "x86_64").forRuntime("deno"), Exception);
}

TEST(PlatformTest, CurrentPlatformIsStable) {
    if (!isPlatformSupported()) GTEST_SKIP() << "host platform not in the table";
    const PlatformInfo& a = currentPlatform();
    const PlatformInfo& b = currentPlatform();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.runtimes.size(), 3u);
}
