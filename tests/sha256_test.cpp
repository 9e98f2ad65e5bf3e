/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "crypto/digest.hpp"
#include "crypto/sha256.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace kmp;
using namespace kmp::test;

static std::span<const uint8_t> bytes_of(std::string_view s) {
    return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
}

TEST(Sha256, KnownVectors) {
    crypto::Digest empty{crypto::Sha256::of(bytes_of(""))};
    EXPECT_EQ(empty.hex(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    crypto::Digest abc{crypto::Sha256::of(bytes_of("abc"))};
    EXPECT_EQ(abc.hex(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    crypto::Digest two_blocks{crypto::Sha256::of(bytes_of("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"))};
    EXPECT_EQ(two_blocks.hex(), "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, StreamingMatchesOneShot) {
    Buffer data(10000, 0);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i * 31 + 7);

    crypto::Sha256 ctx;
    size_t pos = 0;
    for (size_t step : {1, 63, 64, 65, 1000, 4096}) {
        ctx.feed(data.data() + pos, step);
        pos += step;
    }
    ctx.feed(data.data() + pos, data.size() - pos);

    EXPECT_EQ(ctx.finish(), crypto::Sha256::of(data.span()));
}

TEST(Sha256, FinishResetsState) {
    crypto::Sha256 ctx;
    ctx.feed(bytes_of("abc"));
    ctx.finish();
    ctx.feed(bytes_of("abc"));
    EXPECT_EQ(ctx.finish(), crypto::Sha256::of(bytes_of("abc")));
}

TEST(Digest, HexParsing) {
    auto d = crypto::digest_bytes(make_module());
    auto parsed = crypto::Digest::from_hex(d.hex());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, d);
    EXPECT_EQ(d.short_hex().size(), 16u);

    EXPECT_FALSE(crypto::Digest::from_hex("abc").has_value());
    EXPECT_FALSE(crypto::Digest::from_hex(std::string(64, 'g')).has_value());
    EXPECT_FALSE(crypto::Digest::from_hex(d.hex() + "00").has_value());
}

TEST(Digest, FileMatchesBytes) {
    TempDir tmp;
    Buffer big(3 * IO_CHUNK_SIZE + 17, 0x5a);
    write_file(tmp / "big.bin", big);

    auto d = crypto::digest_file(tmp / "big.bin");
    ASSERT_TRUE(d.ok());
    EXPECT_EQ(d.unwrap(), crypto::digest_bytes(big));
}

TEST(Digest, MissingFileIsIoError) {
    TempDir tmp;
    auto d = crypto::digest_file(tmp / "absent.ko");
    ASSERT_FALSE(d.ok());
    EXPECT_EQ(d.error().code, ErrorCode::IoError);
}
