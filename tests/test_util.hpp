/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "core/buffer.hpp"
#include "core/file.hpp"
#include "kmod/elf.hpp"
#include "patch/descriptor.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace kmp::test {

namespace fs = std::filesystem;

// Scratch directory removed when the test ends
class TempDir {
    fs::path path_;

public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "kmp-test-XXXXXX").string();
        char *made = ::mkdtemp(pattern.data());
        if (!made) throw std::runtime_error("mkdtemp failed");
        path_ = made;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const { return path_; }
    fs::path operator/(const fs::path &rel) const { return path_ / rel; }
};

inline void write_file(const fs::path &path, const void *data, size_t len) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(static_cast<const char *>(data), static_cast<std::streamsize>(len));
}

inline void write_file(const fs::path &path, const Buffer &buf) { write_file(path, buf.data(), buf.size()); }

inline void write_file(const fs::path &path, const std::string &text) { write_file(path, text.data(), text.size()); }

inline Buffer read_file(const fs::path &path) {
    auto buf = file::read(path);
    EXPECT_TRUE(buf.ok()) << (buf.ok() ? "" : buf.error().message);
    return buf.ok() ? buf.unwrap() : Buffer();
}

inline constexpr size_t MODULE_SIZE = 1000;
inline constexpr uint64_t EDIT_OFFSET = 100;
inline constexpr uint64_t MARKER_OFFSET = 500;
inline constexpr const char *TEST_VERSION = "1.0.0-test";

// 1000-byte image: ELF magic, AA AA at 100, zeroes elsewhere
inline Buffer make_module() {
    Buffer buf(MODULE_SIZE, 0);
    buf.overwrite_at(0, Buffer{0x7f, 'E', 'L', 'F'}.span());
    buf.overwrite_at(EDIT_OFFSET, Buffer{0xaa, 0xaa}.span());
    return buf;
}

// {100: AAAA -> BBBB}, marker CAFE at 500
inline patch::PatchDescriptor make_descriptor(const std::string &module = "nvidia",
                                              const std::string &version = TEST_VERSION) {
    patch::PatchDescriptor desc;
    desc.version = version;
    desc.module = module;
    desc.edits.push_back({EDIT_OFFSET, {0xaa, 0xaa}, {0xbb, 0xbb}});
    desc.marker_offset = MARKER_OFFSET;
    desc.marker = {0xca, 0xfe};
    return desc;
}

// Minimal relocatable ELF64 with a .modinfo section holding `modinfo`
// (NUL separated tag=value strings)
inline Buffer make_elf_module(const std::string &modinfo, uint8_t elf_class = kmod::ELFCLASS64) {
    static const char shstrtab[] = "\0.modinfo\0.shstrtab";

    Buffer out(sizeof(kmod::Elf64_Ehdr), 0);
    size_t modinfo_off = out.size();
    out.append(modinfo.data(), modinfo.size());
    size_t strtab_off = out.size();
    out.append(shstrtab, sizeof(shstrtab));
    while (out.size() % 8) {
        uint8_t zero = 0;
        out.append(&zero, 1);
    }

    kmod::Elf64_Shdr sh[3] {};
    sh[1].sh_name = 1;
    sh[1].sh_type = 1;
    sh[1].sh_offset = modinfo_off;
    sh[1].sh_size = modinfo.size();
    sh[2].sh_name = 10;
    sh[2].sh_type = 3;
    sh[2].sh_offset = strtab_off;
    sh[2].sh_size = sizeof(shstrtab);

    size_t shoff = out.size();
    out.append(sh, sizeof(sh));

    kmod::Elf64_Ehdr eh {};
    std::memcpy(eh.e_ident, ELF_MAGIC, ELF_MAGIC_LEN);
    eh.e_ident[kmod::EI_CLASS] = elf_class;
    eh.e_ident[5] = 1;
    eh.e_type = kmod::ET_REL;
    eh.e_machine = kmod::EM_X86_64;
    eh.e_version = 1;
    eh.e_shoff = shoff;
    eh.e_ehsize = sizeof(kmod::Elf64_Ehdr);
    eh.e_shentsize = sizeof(kmod::Elf64_Shdr);
    eh.e_shnum = 3;
    eh.e_shstrndx = 2;
    out.overwrite_at(0, Buffer(&eh, sizeof(eh)).span());
    return out;
}

// Fault injection on writes to one path and on free-space queries;
// everything else passes through
class FaultIo : public file::FileIo {
public:
    enum class Fault { None, FailWrite, CorruptMarker, LowSpace };

    fs::path target;
    Fault fault = Fault::None;
    std::atomic<int> target_writes{0};

    FaultIo(fs::path t, Fault f) : target(std::move(t)), fault(f) {}

    Result<void> write_atomic(const fs::path &path, const Buffer &buf) override {
        if (path != target) return FileIo::write_atomic(path, buf);

        int n = ++target_writes;
        if (n == 1 && fault == Fault::FailWrite) {
            // A crash mid-write leaves a partial temp file behind
            auto tmp = file::temp_sibling(path);
            write_file(tmp, buf.data(), buf.size() / 2);
            return Result<void>::Err(ErrorCode::IoError, "injected write failure");
        }
        if (n == 1 && fault == Fault::CorruptMarker) {
            Buffer damaged = buf;
            damaged.overwrite_at(MARKER_OFFSET, Buffer{0x00, 0x00}.span());
            return FileIo::write_atomic(path, damaged);
        }
        return FileIo::write_atomic(path, buf);
    }

    // LowSpace reports 4 KiB free on every filesystem
    Result<uint64_t> available_space(const fs::path &dir) const override {
        if (fault == Fault::LowSpace) return Result<uint64_t>::Ok(4096);
        return FileIo::available_space(dir);
    }
};

} // namespace kmp::test
