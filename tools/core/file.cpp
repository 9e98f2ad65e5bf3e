/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "file.hpp"
#include "logging.hpp"

#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace kmp {
namespace file {

namespace fs = std::filesystem;

static std::string errno_str(const char *what, const fs::path &path) {
    return std::string(what) + " " + path.string() + ": " + std::strerror(errno);
}

Result<Buffer> read(const fs::path &path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return Result<Buffer>::Err(ErrorCode::IoError, "File not found: " + path.string());

    auto file_size = fs::file_size(path, ec);
    if (ec) return Result<Buffer>::Err(ErrorCode::IoError, "Failed to get file size: " + path.string());

    std::ifstream file(path, std::ios::binary);
    if (!file) return Result<Buffer>::Err(ErrorCode::IoError, "Failed to open file: " + path.string());

    Buffer buf(static_cast<size_t>(file_size), 0);
    file.read(buf.char_data(), static_cast<std::streamsize>(file_size));
    if (file.gcount() != static_cast<std::streamsize>(file_size))
        return Result<Buffer>::Err(ErrorCode::IoError, "Short read: " + path.string());

    return Result<Buffer>::Ok(std::move(buf));
}

fs::path temp_sibling(const fs::path &path) {
    static std::atomic<uint64_t> counter{0};
    std::string name = "." + path.filename().string() + ".kmp-" +
                       std::to_string(::getpid()) + "-" +
                       std::to_string(counter.fetch_add(1)) + ".tmp";
    return path.parent_path() / name;
}

static Result<void> fsync_dir(const fs::path &dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return Result<void>::Err(ErrorCode::IoError, errno_str("Failed to open directory", dir));
    int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) return Result<void>::Err(ErrorCode::IoError, errno_str("Failed to sync directory", dir));
    return Result<void>::Ok();
}

Result<void> write_atomic(const fs::path &path, const void *data, size_t len) {
    mode_t mode = 0644;
    struct stat st {};
    if (::stat(path.c_str(), &st) == 0) mode = st.st_mode & 07777;

    fs::path tmp = temp_sibling(path);
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) return Result<void>::Err(ErrorCode::IoError, errno_str("Failed to create", tmp));

    auto fail = [&](const char *what) {
        auto err = errno_str(what, tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        return Result<void>::Err(ErrorCode::IoError, err);
    };

    const auto *p = static_cast<const uint8_t *>(data);
    size_t left = len;
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("Failed to write");
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fchmod(fd, mode) != 0) return fail("Failed to set mode on");
    if (::fsync(fd) != 0) return fail("Failed to sync");
    if (::close(fd) != 0) {
        auto err = errno_str("Failed to close", tmp);
        ::unlink(tmp.c_str());
        return Result<void>::Err(ErrorCode::IoError, err);
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        auto err = errno_str("Failed to rename onto", path);
        ::unlink(tmp.c_str());
        return Result<void>::Err(ErrorCode::IoError, err);
    }

    kmp_log_debug("atomic write: %s (%zu bytes)\n", path.c_str(), len);
    return fsync_dir(path.parent_path());
}

Result<uint64_t> regular_file_size(const fs::path &path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        return Result<uint64_t>::Err(ErrorCode::ModuleNotFound, "No such file: " + path.string());
    if (!fs::is_regular_file(status))
        return Result<uint64_t>::Err(ErrorCode::ModuleNotFound, "Not a regular file: " + path.string());

    auto size = fs::file_size(path, ec);
    if (ec) return Result<uint64_t>::Err(ErrorCode::IoError, "Failed to get file size: " + path.string());
    return Result<uint64_t>::Ok(static_cast<uint64_t>(size));
}

Result<void> ensure_directory(const fs::path &dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Result<void>::Err(ErrorCode::IoError, "Failed to create directory " + dir.string() + ": " + ec.message());
    if (!fs::is_directory(dir, ec))
        return Result<void>::Err(ErrorCode::IoError, "Not a directory: " + dir.string());
    return Result<void>::Ok();
}

Result<uint64_t> available_space(const fs::path &dir) {
    std::error_code ec;
    auto info = fs::space(dir, ec);
    if (ec) return Result<uint64_t>::Err(ErrorCode::IoError, "Failed to query free space on " + dir.string() + ": " + ec.message());
    return Result<uint64_t>::Ok(static_cast<uint64_t>(info.available));
}

FileIo &default_io() {
    static FileIo io;
    return io;
}

} // namespace file

Result<Buffer> Buffer::from_file(const std::filesystem::path &path) {
    return file::read(path);
}

} // namespace kmp
