/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 * Based on Brad Conte's implementation (public domain)
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace kmp {
namespace crypto {

inline constexpr size_t SHA256_DIGEST_SIZE = 32;
inline constexpr size_t SHA256_BLOCK_SIZE = 64;

using Sha256Bytes = std::array<uint8_t, SHA256_DIGEST_SIZE>;

// Streaming SHA-256. feed() may be called any number of times before finish().

class Sha256 {
public:
    Sha256() { reset(); }

    void reset();
    void feed(const void *data, size_t len);
    void feed(std::span<const uint8_t> data) { feed(data.data(), data.size()); }
    Sha256Bytes finish();

    static Sha256Bytes of(std::span<const uint8_t> data) {
        Sha256 ctx;
        ctx.feed(data);
        return ctx.finish();
    }

private:
    void compress(const uint8_t *block);

    std::array<uint32_t, 8> state_{};
    std::array<uint8_t, SHA256_BLOCK_SIZE> pending_{};
    size_t pending_len_ = 0;
    uint64_t total_len_ = 0;
};

} // namespace crypto
} // namespace kmp
