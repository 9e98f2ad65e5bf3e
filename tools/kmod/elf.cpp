/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "elf.hpp"
#include "../core/file.hpp"
#include "../core/logging.hpp"

#include <cstring>

namespace kmp {
namespace kmod {

void ModuleInfo::print() const {
    std::fprintf(stdout, "name=%s\n", name.c_str());
    std::fprintf(stdout, "version=%s\n", version.c_str());
    std::fprintf(stdout, "vermagic=%s\n", vermagic.c_str());
    std::fprintf(stdout, "license=%s\n", license.c_str());
    std::fprintf(stdout, "srcversion=%s\n", srcversion.c_str());
    std::fprintf(stdout, "machine=%s\n", machine_str(machine));
}

Result<ModuleImage> ModuleImage::from_file(const std::filesystem::path &path) {
    auto buf_result = Buffer::from_file(path);
    if (!buf_result) {
        return Result<ModuleImage>::Err(buf_result.error());
    }
    return from_buffer(std::move(buf_result).unwrap());
}

Result<ModuleImage> ModuleImage::from_buffer(Buffer buf) {
    ModuleImage mod;
    mod.data_ = std::move(buf);

    auto parse_result = mod.parse();
    if (!parse_result) {
        return Result<ModuleImage>::Err(parse_result.error());
    }

    return Result<ModuleImage>::Ok(std::move(mod));
}

const Elf64_Shdr *ModuleImage::section_headers() const {
    return data_.ptr_at<Elf64_Shdr>(elf_header()->e_shoff);
}

std::optional<size_t> ModuleImage::find_section(std::string_view name) const {
    const auto *ehdr = elf_header();
    const auto *shdrs = section_headers();
    if (ehdr->e_shstrndx >= ehdr->e_shnum) return std::nullopt;

    const auto &strtab = shdrs[ehdr->e_shstrndx];
    for (uint16_t i = 1; i < ehdr->e_shnum; ++i) {
        uint64_t name_off = strtab.sh_offset + shdrs[i].sh_name;
        if (name_off >= data_.size()) continue;

        const char *sec_name = data_.ptr_at<char>(name_off);
        size_t max_len = data_.size() - name_off;
        if (std::string_view(sec_name, strnlen(sec_name, max_len)) == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::string_view> ModuleImage::modinfo(std::string_view tag) const {
    if (modinfo_size_ == 0) return std::nullopt;

    const char *p = data_.ptr_at<char>(modinfo_offset_);
    const char *end = p + modinfo_size_;

    while (p < end) {
        while (p < end && *p == '\0') ++p;
        if (p >= end) break;

        const char *str_end = p;
        while (str_end < end && *str_end != '\0') ++str_end;

        std::string_view entry(p, str_end - p);
        if (entry.size() > tag.size() && entry[tag.size()] == '=' &&
            entry.substr(0, tag.size()) == tag) {
            return entry.substr(tag.size() + 1);
        }

        p = str_end;
    }

    return std::nullopt;
}

Result<void> ModuleImage::parse() {
    if (!has_elf_magic(data_)) {
        return Result<void>::Err(ErrorCode::OffsetMismatch, "Invalid ELF magic");
    }
    if (data_.size() <= sizeof(Elf64_Ehdr) || data_[EI_CLASS] != ELFCLASS64) {
        return Result<void>::Err(ErrorCode::NotSupported, "Only 64-bit ELF modules carry parsable modinfo");
    }

    const auto *ehdr = elf_header();
    info_.machine = ehdr->e_machine;

    if (ehdr->e_type != ET_REL) {
        return Result<void>::Err(ErrorCode::NotSupported, "Kernel module must be relocatable (ET_REL)");
    }
    if (ehdr->e_shentsize != sizeof(Elf64_Shdr)) {
        return Result<void>::Err(ErrorCode::NotSupported, "Invalid section header size");
    }
    if (ehdr->e_shoff >= data_.size() ||
        ehdr->e_shnum * sizeof(Elf64_Shdr) > data_.size() - ehdr->e_shoff) {
        return Result<void>::Err(ErrorCode::NotSupported, "Section header table out of bounds");
    }

    const auto *shdrs = section_headers();
    for (uint16_t i = 1; i < ehdr->e_shnum; ++i) {
        const auto &shdr = shdrs[i];
        if (shdr.sh_type != SHT_NOBITS && !range_fits(shdr.sh_offset, shdr.sh_size, data_.size())) {
            return Result<void>::Err(ErrorCode::NotSupported, "Section data out of bounds");
        }
    }

    auto idx = find_section(MODINFO_SECTION);
    if (!idx) {
        return Result<void>::Err(ErrorCode::NotFound, "No .modinfo section found");
    }
    const auto &modinfo_shdr = shdrs[*idx];
    if (modinfo_shdr.sh_type == SHT_NOBITS ||
        !range_fits(modinfo_shdr.sh_offset, modinfo_shdr.sh_size, data_.size())) {
        return Result<void>::Err(ErrorCode::NotFound, ".modinfo section has no data in the file");
    }
    modinfo_offset_ = static_cast<size_t>(modinfo_shdr.sh_offset);
    modinfo_size_ = static_cast<size_t>(modinfo_shdr.sh_size);

    auto get_or_empty = [this](std::string_view tag) -> std::string {
        auto val = modinfo(tag);
        return val ? std::string(*val) : std::string();
    };

    info_.name = get_or_empty("name");
    info_.version = get_or_empty("version");
    info_.vermagic = get_or_empty("vermagic");
    info_.license = get_or_empty("license");
    info_.srcversion = get_or_empty("srcversion");

    kmp_log_debug("modinfo: %s %s (%s)\n", info_.name.c_str(), info_.version.c_str(),
                  machine_str(info_.machine));

    return Result<void>::Ok();
}

} // namespace kmod
} // namespace kmp
