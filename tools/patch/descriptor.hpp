/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kmp {
namespace patch {

using Bytes = std::vector<uint8_t>;

// One same-length substitution at a fixed file offset
struct PatchEdit {
    uint64_t offset = 0;
    Bytes original;
    Bytes replacement;
};

// Edits for one (driver version, kernel module) pair.
// The marker is written last and only signals "already patched".
struct PatchDescriptor {
    std::string version;
    std::string module;
    std::optional<uint64_t> expected_size;
    std::vector<PatchEdit> edits;
    uint64_t marker_offset = 0;
    Bytes marker;

    // Largest end offset touched by any edit or the marker
    uint64_t extent() const;
};

// Rejects unequal edit lengths, empty sequences, overlapping ranges,
// a marker that touches an edit, and ranges past expected_size.
Result<void> validate(const PatchDescriptor &desc);

// Descriptors of one driver version, keyed by canonical module name
using DescriptorSet = std::map<std::string, PatchDescriptor>;

// Immutable version -> DescriptorSet registry, built once at startup

class DescriptorTable {
    std::map<std::string, DescriptorSet> sets_;

public:
    DescriptorTable() = default;

    // Validates every descriptor; duplicate (version, module) pairs are rejected
    static Result<DescriptorTable> build(const std::vector<PatchDescriptor> &descriptors);

    // Built-in entries plus any descriptor files given
    static Result<DescriptorTable> load(const std::vector<std::filesystem::path> &extra_files);

    Result<const DescriptorSet *> lookup(const std::string &version) const;

    // nullptr when the version or module is not covered
    const PatchDescriptor *find(const std::string &version, const std::string &module) const;

    std::vector<std::string> versions() const;
    size_t size() const { return sets_.size(); }
};

using DescriptorTablePtr = std::shared_ptr<const DescriptorTable>;

std::vector<PatchDescriptor> builtin_descriptors();

// Section/key=value descriptor file:
//   [descriptor]
//   version=535.274.02
//   module=nvidia
//   size=...            (optional)
//   edit=0xOFF:ORIGHEX:NEWHEX
//   marker=0xOFF:HEX
Result<std::vector<PatchDescriptor>> parse_descriptors(std::string_view text, std::string_view origin = "<text>");
Result<std::vector<PatchDescriptor>> load_descriptor_file(const std::filesystem::path &path);

std::optional<Bytes> parse_hex_bytes(std::string_view hex);
std::optional<uint64_t> parse_offset(std::string_view text);

} // namespace patch
} // namespace kmp
