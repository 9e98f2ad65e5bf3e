/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "logging.hpp"

#include <atomic>
#include <cerrno>
#include <ctime>
#include <mutex>

namespace kmp::log {

namespace {

std::atomic<int> g_verbosity{0};
std::mutex g_mutex;
std::FILE *g_file = nullptr;

const char *prefix(Level level) {
    switch (level) {
    case Level::Debug: return "[.] ";
    case Level::Info: return "[+] ";
    case Level::Warn: return "[?] ";
    case Level::Error: return "[-] ";
    }
    return "";
}

const char *level_name(Level level) {
    switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    }
    return "";
}

bool console_enabled(Level level) {
    switch (level) {
    case Level::Debug: return g_verbosity.load() >= 2;
    case Level::Info: return g_verbosity.load() >= 1;
    default: return true;
    }
}

} // anonymous namespace

void set_verbosity(int level) { g_verbosity.store(level); }
int verbosity() { return g_verbosity.load(); }

Result<void> open_file(const std::filesystem::path &path) {
    std::FILE *f = std::fopen(path.c_str(), "a");
    if (!f) {
        return Result<void>::Err(ErrorCode::IoError,
                                 "Failed to open log file " + path.string() + ": " + std::strerror(errno));
    }
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file) std::fclose(g_file);
    g_file = f;
    return Result<void>::Ok();
}

void close_file() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
}

void write(Level level, const char *fmt, ...) {
    bool to_console = console_enabled(level);

    std::lock_guard<std::mutex> lock(g_mutex);
    if (!to_console && !g_file) return;

    char msg[2048];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    if (to_console) {
        std::FILE *out = level >= Level::Warn ? stderr : stdout;
        std::fprintf(out, "%s%s", prefix(level), msg);
    }

    if (g_file) {
        char stamp[32];
        std::time_t now = std::time(nullptr);
        std::tm tm {};
        gmtime_r(&now, &tm);
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);
        std::fprintf(g_file, "%s %s %s", stamp, level_name(level), msg);
        std::fflush(g_file);
    }
}

} // namespace kmp::log
