/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/buffer.hpp"
#include "../core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kmp {
namespace kmod {

// ELF64 structures (minimal definitions for .modinfo parsing)

#pragma pack(push, 1)

inline constexpr size_t EI_CLASS = 4;
inline constexpr uint8_t ELFCLASS64 = 2;
inline constexpr uint16_t ET_REL = 1;
inline constexpr uint16_t EM_X86_64 = 62;
inline constexpr uint16_t EM_AARCH64 = 183;
inline constexpr uint32_t SHT_NOBITS = 8;

struct Elf64_Ehdr {
    uint8_t e_ident[16];
    uint16_t e_type;
    uint16_t e_machine;
    uint32_t e_version;
    uint64_t e_entry;
    uint64_t e_phoff;
    uint64_t e_shoff;
    uint32_t e_flags;
    uint16_t e_ehsize;
    uint16_t e_phentsize;
    uint16_t e_phnum;
    uint16_t e_shentsize;
    uint16_t e_shnum;
    uint16_t e_shstrndx;
};

struct Elf64_Shdr {
    uint32_t sh_name;
    uint32_t sh_type;
    uint64_t sh_flags;
    uint64_t sh_addr;
    uint64_t sh_offset;
    uint64_t sh_size;
    uint32_t sh_link;
    uint32_t sh_info;
    uint64_t sh_addralign;
    uint64_t sh_entsize;
};

#pragma pack(pop)

// Patch code only needs the magic; everything else here is for reporting.
inline bool has_elf_magic(const uint8_t *data, size_t len) {
    return len >= ELF_MAGIC_LEN && std::memcmp(data, ELF_MAGIC, ELF_MAGIC_LEN) == 0;
}

inline bool has_elf_magic(const Buffer &buf) { return has_elf_magic(buf.data(), buf.size()); }

inline const char *machine_str(uint16_t machine) {
    switch (machine) {
    case EM_X86_64: return "x86_64";
    case EM_AARCH64: return "aarch64";
    default: return "unknown";
    }
}

// Metadata from a kernel module's .modinfo section

struct ModuleInfo {
    std::string name;
    std::string version;
    std::string vermagic;
    std::string license;
    std::string srcversion;
    uint16_t machine = 0;

    void print() const;
};

class ModuleImage {
    Buffer data_;
    ModuleInfo info_;

public:
    ModuleImage() = default;

    static Result<ModuleImage> from_file(const std::filesystem::path &path);
    static Result<ModuleImage> from_buffer(Buffer buf);

    const ModuleInfo &info() const { return info_; }
    const Buffer &data() const { return data_; }

    // Raw `tag=value` lookup inside .modinfo
    std::optional<std::string_view> modinfo(std::string_view tag) const;

private:
    Result<void> parse();

    const Elf64_Ehdr *elf_header() const { return data_.ptr_at<Elf64_Ehdr>(0); }
    const Elf64_Shdr *section_headers() const;
    std::optional<size_t> find_section(std::string_view name) const;

    size_t modinfo_offset_ = 0;
    size_t modinfo_size_ = 0;
};

inline constexpr const char *MODINFO_SECTION = ".modinfo";

} // namespace kmod
} // namespace kmp
