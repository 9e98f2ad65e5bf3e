/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "buffer.hpp"
#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace kmp {
namespace file {

Result<Buffer> read(const std::filesystem::path &path);

// Write to a sibling temp file, fsync it, rename it over `path`, then fsync
// the directory. Readers observe either the old or the new content.
// An existing destination keeps its permission bits.
Result<void> write_atomic(const std::filesystem::path &path, const void *data, size_t len);

inline Result<void> write_atomic(const std::filesystem::path &path, const Buffer &buf) {
    return write_atomic(path, buf.data(), buf.size());
}

// Fails with ModuleNotFound unless `path` exists and is a regular file
Result<uint64_t> regular_file_size(const std::filesystem::path &path);

Result<void> ensure_directory(const std::filesystem::path &dir);

// Free bytes available to unprivileged writers on the filesystem holding `dir`
Result<uint64_t> available_space(const std::filesystem::path &dir);

// Sibling temp path used by write_atomic, unique per process and call
std::filesystem::path temp_sibling(const std::filesystem::path &path);

inline bool exists(const std::filesystem::path &path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

inline std::string basename(const std::filesystem::path &path) { return path.filename().string(); }

// I/O seam used by the patch engine. Tests override it to inject faults.

class FileIo {
public:
    virtual ~FileIo() = default;

    virtual Result<Buffer> read(const std::filesystem::path &path) const {
        return file::read(path);
    }

    virtual Result<void> write_atomic(const std::filesystem::path &path, const Buffer &buf) {
        return file::write_atomic(path, buf);
    }

    virtual Result<uint64_t> available_space(const std::filesystem::path &dir) const {
        return file::available_space(dir);
    }
};

// Process-wide default used when no seam is supplied
FileIo &default_io();

} // namespace file
} // namespace kmp
