/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "driver/detector.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace kmp;
using namespace kmp::test;

static const char *kProcVersion =
    "NVRM version: NVIDIA UNIX x86_64 Kernel Module  535.274.02  Thu Sep 12 10:25:14 UTC 2024\n"
    "GCC version:  gcc version 12.2.0 (Debian 12.2.0-14)\n";

TEST(ExtractVersion, FirstDottedNumber) {
    EXPECT_EQ(driver::extract_version("abc 1.2.3 def").value_or(""), "1.2.3");
    EXPECT_EQ(driver::extract_version("version 550.54.14.").value_or(""), "550.54.14");
    EXPECT_EQ(driver::extract_version("1..2 3.4").value_or(""), "3.4");
    EXPECT_FALSE(driver::extract_version("v12 only").has_value());
    EXPECT_FALSE(driver::extract_version("").has_value());
}

TEST(Detector, ProcVersion) {
    TempDir root;
    write_file(root / "proc/driver/nvidia/version", std::string(kProcVersion));

    driver::ProcVersionDetector d;
    auto found = d.detect(root.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, "535.274.02");
    EXPECT_EQ(found->source, "proc");
}

TEST(Detector, SysModule) {
    TempDir root;
    write_file(root / "sys/module/nvidia/version", std::string("550.54.14\n"));

    auto found = driver::SysModuleDetector().detect(root.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, "550.54.14");
}

TEST(Detector, Modinfo) {
    TempDir root;
    write_file(root / "proc/sys/kernel/osrelease", std::string("6.1.0-test\n"));
    write_file(root / "lib/modules/6.1.0-test/kernel/drivers/video/nvidia.ko",
               make_elf_module(std::string("version=545.29.06\0name=nvidia\0", 30)));

    auto found = driver::ModinfoDetector().detect(root.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, "545.29.06");
    EXPECT_EQ(found->source, "modinfo");
}

TEST(Detector, LibraryIgnoresSoname) {
    TempDir root;
    write_file(root / "usr/lib64/libnvidia-ml.so.1", std::string("link"));
    EXPECT_FALSE(driver::LibraryDetector().detect(root.path()).has_value());

    write_file(root / "usr/lib64/libnvidia-ml.so.535.274.02", std::string("lib"));
    auto found = driver::LibraryDetector().detect(root.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, "535.274.02");
}

TEST(Detector, FirstStrategyWins) {
    TempDir root;
    write_file(root / "proc/driver/nvidia/version", std::string(kProcVersion));
    write_file(root / "sys/module/nvidia/version", std::string("550.54.14\n"));

    auto detectors = driver::default_detectors();
    ASSERT_EQ(detectors.size(), 4u);

    auto found = driver::detect_driver(detectors, root.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, "535.274.02");

    auto all = driver::detect_all(detectors, root.path());
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].source, "sysfs");
}

TEST(Detector, FallsThroughToLaterStrategy) {
    TempDir root;
    write_file(root / "usr/lib/x86_64-linux-gnu/libnvidia-ml.so.550.54.14", std::string("lib"));

    auto found = driver::detect_driver(driver::default_detectors(), root.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->source, "library");
}

TEST(Detector, NothingInstalled) {
    TempDir root;
    EXPECT_FALSE(driver::detect_driver(driver::default_detectors(), root.path()).has_value());
}
