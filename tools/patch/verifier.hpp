/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/buffer.hpp"
#include "../core/file.hpp"
#include "../core/types.hpp"
#include "descriptor.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace kmp {
namespace patch {

// Independent post-write check. Re-reads the file from disk and never
// modifies it.

class Verifier {
    const file::FileIo &io_;

public:
    explicit Verifier(const file::FileIo &io = file::default_io()) : io_(io) {}

    // VerificationFailed unless every edit holds its replacement, the marker
    // is present and the length equals `original_size`
    Result<void> verify(const std::filesystem::path &path, const PatchDescriptor &desc,
                        uint64_t original_size) const;

    // Problems found in `content`, empty when it is fully patched
    static std::vector<std::string> check(const Buffer &content, const PatchDescriptor &desc,
                                          uint64_t original_size);
};

} // namespace patch
} // namespace kmp
