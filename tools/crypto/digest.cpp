/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "digest.hpp"
#include "../core/logging.hpp"

#include <fstream>
#include <vector>

namespace kmp {
namespace crypto {

std::string Digest::hex() const {
    return log::hex_string(bytes.data(), bytes.size());
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Digest> Digest::from_hex(std::string_view hex) {
    if (hex.size() != SHA256_DIGEST_SIZE * 2) return std::nullopt;

    Digest d;
    for (size_t i = 0; i < SHA256_DIGEST_SIZE; ++i) {
        int hi = hex_nibble(hex[i * 2]);
        int lo = hex_nibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        d.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return d;
}

Digest digest_bytes(std::span<const uint8_t> data) {
    return Digest{Sha256::of(data)};
}

Result<Digest> digest_file(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return Result<Digest>::Err(ErrorCode::IoError, "Failed to open file: " + path.string());

    Sha256 ctx;
    std::vector<char> chunk(IO_CHUNK_SIZE);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto got = file.gcount();
        if (got > 0) ctx.feed(chunk.data(), static_cast<size_t>(got));
    }

    if (file.bad() || !file.eof())
        return Result<Digest>::Err(ErrorCode::IoError, "Failed to read file: " + path.string());

    return Result<Digest>::Ok(Digest{ctx.finish()});
}

} // namespace crypto
} // namespace kmp
