/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "types.hpp"

#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>

namespace kmp::log {

enum class Level { Debug, Info, Warn, Error };

// 0: warnings and errors only, 1: +info, 2: +debug
void set_verbosity(int level);
int verbosity();

// Mirror every message, timestamped, into `path` (appending)
Result<void> open_file(const std::filesystem::path &path);
void close_file();

void write(Level level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

#define kmp_log_debug(fmt, ...) ::kmp::log::write(::kmp::log::Level::Debug, fmt, ##__VA_ARGS__)
#define kmp_log_info(fmt, ...) ::kmp::log::write(::kmp::log::Level::Info, fmt, ##__VA_ARGS__)
#define kmp_log_warn(fmt, ...) ::kmp::log::write(::kmp::log::Level::Warn, fmt, ##__VA_ARGS__)
#define kmp_log_error(fmt, ...) ::kmp::log::write(::kmp::log::Level::Error, fmt, ##__VA_ARGS__)

inline std::string hex_string(const uint8_t *data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", data[i]);
        result += buf;
    }
    return result;
}

inline std::string hex_string(std::span<const uint8_t> bytes) {
    return hex_string(bytes.data(), bytes.size());
}

} // namespace kmp::log
