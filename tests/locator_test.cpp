/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "kmod/locator.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace kmp;
using namespace kmp::test;

static constexpr const char *kRelease = "6.1.0-test";

class FsLocatorTest : public ::testing::Test {
protected:
    TempDir root;

    void SetUp() override {
        write_file(root / "proc/sys/kernel/osrelease", std::string(kRelease) + "\n");
        auto kdir = root / "lib/modules" / kRelease / "updates/dkms";
        write_file(kdir / "nvidia.ko", make_module());
        write_file(kdir / "nvidia-drm.ko", make_module());
        write_file(kdir / "unrelated.ko", make_module());
        write_file(root / "usr/lib64/nvidia-1.2.3/nvidia-uvm.ko", make_module());
    }
};

TEST_F(FsLocatorTest, ReadsReleaseFromRoot) {
    EXPECT_EQ(kmod::kernel_release(root.path()), kRelease);

    kmod::FsModuleLocator locator(root.path());
    EXPECT_EQ(locator.release(), kRelease);
}

TEST_F(FsLocatorTest, FindsKnownModules) {
    kmod::FsModuleLocator locator(root.path());
    auto found = locator.locate("1.2.3");
    ASSERT_TRUE(found.ok()) << found.error().message;

    const auto &map = found.unwrap();
    EXPECT_EQ(map.size(), 3u);
    EXPECT_EQ(map.at("nvidia"), root / "lib/modules" / kRelease / "updates/dkms/nvidia.ko");
    EXPECT_EQ(map.at("nvidia-drm").filename(), "nvidia-drm.ko");
    EXPECT_EQ(map.at("nvidia-uvm"), root / "usr/lib64/nvidia-1.2.3/nvidia-uvm.ko");
    EXPECT_EQ(map.count("nvidia-modeset"), 0u);
}

TEST_F(FsLocatorTest, UpdatesDirectoryWinsOverDuplicates) {
    auto kdir = root / "lib/modules" / kRelease;
    write_file(kdir / "extra/nvidia.ko", make_module());
    write_file(kdir / "kernel/drivers/video/nvidia.ko", make_module());
    write_file(kdir / "extra/nvidia-modeset.ko", make_module());
    write_file(kdir / "kernel/nvidia-modeset.ko", make_module());

    kmod::FsModuleLocator locator(root.path());
    for (int i = 0; i < 3; ++i) {
        auto found = locator.locate("1.2.3");
        ASSERT_TRUE(found.ok());
        EXPECT_EQ(found.unwrap().at("nvidia"), kdir / "updates/dkms/nvidia.ko");
        // No updates/ copy: lexical order decides
        EXPECT_EQ(found.unwrap().at("nvidia-modeset"), kdir / "extra/nvidia-modeset.ko");
    }
}

TEST_F(FsLocatorTest, VendorDirectoryIsPerVersion) {
    kmod::FsModuleLocator locator(root.path());
    auto found = locator.locate("9.9.9");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.unwrap().count("nvidia-uvm"), 0u);
}

TEST(FsLocator, NothingFound) {
    TempDir root;
    kmod::FsModuleLocator locator(root.path(), "6.1.0-empty");
    auto found = locator.locate("1.2.3");
    ASSERT_FALSE(found.ok());
    EXPECT_EQ(found.error().code, ErrorCode::ModuleNotFound);
}

TEST(StaticLocator, ServesEntries) {
    kmod::ModuleMap entries{{"nvidia", "/tmp/nvidia.ko"}};
    kmod::StaticModuleLocator locator(entries);
    auto found = locator.locate("1.2.3");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.unwrap().at("nvidia"), "/tmp/nvidia.ko");

    kmod::StaticModuleLocator empty(kmod::ModuleMap{});
    EXPECT_EQ(empty.locate("1.2.3").error().code, ErrorCode::ModuleNotFound);
}

TEST(ResolveModule, RequiresRegularFile) {
    TempDir tmp;
    write_file(tmp / "nvidia.ko", make_module());

    auto ok = kmod::resolve_module("nvidia", tmp / "nvidia.ko");
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.unwrap().size, MODULE_SIZE);

    auto missing = kmod::resolve_module("nvidia", tmp / "absent.ko");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::ModuleNotFound);

    auto dir = kmod::resolve_module("nvidia", tmp.path());
    ASSERT_FALSE(dir.ok());
    EXPECT_EQ(dir.error().code, ErrorCode::ModuleNotFound);
}

TEST(UnderRoot, JoinsAbsolutePaths) {
    EXPECT_EQ(kmod::under_root("/", "/proc/version"), "/proc/version");
    EXPECT_EQ(kmod::under_root("/mnt/sys", "/proc/version"), "/mnt/sys/proc/version");
}
