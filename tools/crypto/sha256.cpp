/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 * Based on Brad Conte's implementation (public domain)
 */

#include "sha256.hpp"

#include <algorithm>
#include <cstring>

namespace kmp {
namespace crypto {

static constexpr uint32_t round_k[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

static constexpr std::array<uint32_t, 8> initial_state = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

static inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }

static inline uint32_t load_be32(const uint8_t *p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

static inline void store_be32(uint8_t *p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

void Sha256::reset() {
    state_ = initial_state;
    pending_len_ = 0;
    total_len_ = 0;
}

void Sha256::compress(const uint8_t *block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) w[i] = load_be32(block + i * 4);
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    // v = {a, b, c, d, e, f, g, h}
    std::array<uint32_t, 8> v = state_;
    for (int i = 0; i < 64; ++i) {
        uint32_t big_s1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
        uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
        uint32_t t1 = v[7] + big_s1 + choose + round_k[i] + w[i];
        uint32_t big_s0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
        uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = big_s0 + majority;

        for (int j = 7; j > 0; --j) v[j] = v[j - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (size_t j = 0; j < state_.size(); ++j) state_[j] += v[j];
}

void Sha256::feed(const void *data, size_t len) {
    const auto *bytes = static_cast<const uint8_t *>(data);
    total_len_ += len;

    if (pending_len_ > 0) {
        size_t take = std::min(len, SHA256_BLOCK_SIZE - pending_len_);
        std::memcpy(pending_.data() + pending_len_, bytes, take);
        pending_len_ += take;
        bytes += take;
        len -= take;
        if (pending_len_ < SHA256_BLOCK_SIZE) return;
        compress(pending_.data());
        pending_len_ = 0;
    }

    // Whole blocks straight from the caller's memory
    while (len >= SHA256_BLOCK_SIZE) {
        compress(bytes);
        bytes += SHA256_BLOCK_SIZE;
        len -= SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(pending_.data(), bytes, len);
        pending_len_ = len;
    }
}

Sha256Bytes Sha256::finish() {
    uint64_t bit_len = total_len_ * 8;

    pending_[pending_len_++] = 0x80;
    if (pending_len_ > SHA256_BLOCK_SIZE - 8) {
        std::memset(pending_.data() + pending_len_, 0, SHA256_BLOCK_SIZE - pending_len_);
        compress(pending_.data());
        pending_len_ = 0;
    }
    std::memset(pending_.data() + pending_len_, 0, SHA256_BLOCK_SIZE - 8 - pending_len_);
    store_be32(pending_.data() + 56, static_cast<uint32_t>(bit_len >> 32));
    store_be32(pending_.data() + 60, static_cast<uint32_t>(bit_len));
    compress(pending_.data());

    Sha256Bytes out;
    for (size_t j = 0; j < state_.size(); ++j) store_be32(out.data() + j * 4, state_[j]);

    reset();
    return out;
}

} // namespace crypto
} // namespace kmp
