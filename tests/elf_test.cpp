/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "kmod/elf.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace kmp;
using namespace kmp::test;

static const std::string kModinfo = std::string("version=535.274.02\0", 19) +
                                    std::string("license=NVIDIA\0", 15) +
                                    std::string("name=nvidia\0", 12) +
                                    std::string("vermagic=6.1.0-18-amd64 SMP mod_unload\0", 39);

TEST(ModuleImage, ReadsModinfo) {
    auto mod = kmod::ModuleImage::from_buffer(make_elf_module(kModinfo));
    ASSERT_TRUE(mod.ok()) << mod.error().message;

    const auto &info = mod.unwrap().info();
    EXPECT_EQ(info.name, "nvidia");
    EXPECT_EQ(info.version, "535.274.02");
    EXPECT_EQ(info.license, "NVIDIA");
    EXPECT_EQ(info.vermagic, "6.1.0-18-amd64 SMP mod_unload");
    EXPECT_TRUE(info.srcversion.empty());
    EXPECT_EQ(info.machine, kmod::EM_X86_64);
    EXPECT_STREQ(kmod::machine_str(info.machine), "x86_64");

    auto raw = mod.unwrap().modinfo("license");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(*raw, "NVIDIA");
    EXPECT_FALSE(mod.unwrap().modinfo("lic").has_value());
}

TEST(ModuleImage, FromFile) {
    TempDir tmp;
    write_file(tmp / "nvidia.ko", make_elf_module(kModinfo));

    auto mod = kmod::ModuleImage::from_file(tmp / "nvidia.ko");
    ASSERT_TRUE(mod.ok());
    EXPECT_EQ(mod.unwrap().info().version, "535.274.02");
}

TEST(ModuleImage, RejectsMissingMagic) {
    auto buf = make_elf_module(kModinfo);
    buf[1] = 'X';
    EXPECT_FALSE(kmod::has_elf_magic(buf));

    auto mod = kmod::ModuleImage::from_buffer(buf);
    ASSERT_FALSE(mod.ok());
    EXPECT_EQ(mod.error().code, ErrorCode::OffsetMismatch);
}

TEST(ModuleImage, Rejects32Bit) {
    auto mod = kmod::ModuleImage::from_buffer(make_elf_module(kModinfo, 1));
    ASSERT_FALSE(mod.ok());
    EXPECT_EQ(mod.error().code, ErrorCode::NotSupported);
}

TEST(ModuleImage, RejectsTruncatedSectionTable) {
    auto buf = make_elf_module(kModinfo);
    buf.resize(buf.size() - 10);

    auto mod = kmod::ModuleImage::from_buffer(buf);
    ASSERT_FALSE(mod.ok());
    EXPECT_EQ(mod.error().code, ErrorCode::NotSupported);
}

TEST(ModuleImage, ModinfoSectionRequired) {
    // Rename .modinfo so the lookup fails
    auto buf = make_elf_module(kModinfo);
    auto pos = buf.find(".modinfo");
    ASSERT_TRUE(pos.has_value());
    buf[*pos + 1] = 'x';

    auto mod = kmod::ModuleImage::from_buffer(buf);
    ASSERT_FALSE(mod.ok());
    EXPECT_EQ(mod.error().code, ErrorCode::NotFound);
}

TEST(ModuleImage, NobitsModinfoIsNotRead) {
    // Section headers sit at the end of the synthetic image; [1] is .modinfo
    auto buf = make_elf_module(kModinfo);
    size_t shdr_off = buf.size() - 2 * sizeof(kmod::Elf64_Shdr);

    kmod::Elf64_Shdr shdr {};
    std::memcpy(&shdr, buf.data() + shdr_off, sizeof(shdr));
    shdr.sh_type = kmod::SHT_NOBITS;
    shdr.sh_size = 1 << 20;
    buf.overwrite_at(shdr_off, Buffer(&shdr, sizeof(shdr)).span());

    auto mod = kmod::ModuleImage::from_buffer(buf);
    ASSERT_FALSE(mod.ok());
    EXPECT_EQ(mod.error().code, ErrorCode::NotFound);
}
