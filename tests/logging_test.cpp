/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "core/logging.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace kmp;
using namespace kmp::test;

TEST(Logging, FileSinkGetsEveryLevel) {
    TempDir tmp;
    auto path = tmp / "kmodpatch.log";
    ASSERT_TRUE(log::open_file(path).ok());

    int saved = log::verbosity();
    log::set_verbosity(0);
    kmp_log_debug("debug line %d\n", 1);
    kmp_log_warn("warn line %s\n", "two");
    log::close_file();
    log::set_verbosity(saved);

    auto buf = read_file(path);
    std::string text(buf.char_data(), buf.size());
    EXPECT_NE(text.find("DEBUG debug line 1"), std::string::npos);
    EXPECT_NE(text.find("WARN warn line two"), std::string::npos);
    EXPECT_NE(text.find("Z "), std::string::npos);
}

TEST(Logging, HexString) {
    const uint8_t bytes[] = {0x00, 0xca, 0xfe, 0x7f};
    EXPECT_EQ(log::hex_string(bytes, sizeof(bytes)), "00cafe7f");
}

TEST(Logging, QuietConsoleStillWritesFile) {
    TempDir tmp;
    auto path = tmp / "quiet.log";
    ASSERT_TRUE(log::open_file(path).ok());

    int saved = log::verbosity();
    log::set_verbosity(0);
    kmp_log_info("info line\n");
    log::close_file();
    log::set_verbosity(saved);

    auto buf = read_file(path);
    std::string text(buf.char_data(), buf.size());
    EXPECT_NE(text.find("INFO info line"), std::string::npos);
}
