/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/buffer.hpp"
#include "../core/types.hpp"
#include "sha256.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kmp {
namespace crypto {

// 256-bit content digest. Its hex form names backup objects.

struct Digest {
    Sha256Bytes bytes{};

    std::string hex() const;
    static std::optional<Digest> from_hex(std::string_view hex);

    // Short form for log lines
    std::string short_hex() const { return hex().substr(0, 16); }

    bool operator==(const Digest &other) const { return bytes == other.bytes; }
    bool operator!=(const Digest &other) const { return bytes != other.bytes; }
    bool operator<(const Digest &other) const { return bytes < other.bytes; }
};

Digest digest_bytes(std::span<const uint8_t> data);

inline Digest digest_bytes(const Buffer &buf) { return digest_bytes(buf.span()); }

// Streams the file; IoError if it cannot be read completely
Result<Digest> digest_file(const std::filesystem::path &path);

} // namespace crypto
} // namespace kmp
