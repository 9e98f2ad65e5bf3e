/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "crypto/digest.hpp"
#include "patch/applier.hpp"
#include "patch/verifier.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace kmp;
using namespace kmp::patch;
using namespace kmp::test;

class ApplierTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path module_path;
    Buffer original;
    crypto::Digest original_digest;
    PatchDescriptor desc = make_descriptor();

    void SetUp() override {
        module_path = tmp / "nvidia.ko";
        original = make_module();
        write_file(module_path, original);
        original_digest = crypto::digest_bytes(original);
    }

    crypto::Digest current_digest() const { return crypto::digest_file(module_path).unwrap(); }
};

TEST_F(ApplierTest, PatchesEditsAndMarker) {
    BackupStore store(tmp / "store");
    Applier applier(store);

    auto result = applier.apply(module_path, desc);
    EXPECT_EQ(result.status, PatchStatus::Success) << result.message;
    EXPECT_EQ(result.module, "nvidia");

    auto patched = read_file(module_path);
    ASSERT_EQ(patched.size(), MODULE_SIZE);
    EXPECT_TRUE(patched.matches_at(EDIT_OFFSET, Buffer{0xbb, 0xbb}.span()));
    EXPECT_TRUE(patched.matches_at(MARKER_OFFSET, Buffer{0xca, 0xfe}.span()));
    EXPECT_NE(current_digest(), original_digest);

    auto record = store.lookup(original_digest);
    ASSERT_TRUE(record.ok());
    EXPECT_EQ(read_file(record.unwrap().location), original);
}

TEST_F(ApplierTest, UnexpectedBytesAreOffsetMismatch) {
    Buffer corrupted = original;
    corrupted[EDIT_OFFSET] = 0xff;
    write_file(module_path, corrupted);
    auto before = current_digest();

    BackupStore store(tmp / "store");
    Applier applier(store);
    auto result = applier.apply(module_path, desc);

    EXPECT_EQ(result.status, PatchStatus::OffsetMismatch);
    EXPECT_EQ(current_digest(), before);
    EXPECT_EQ(store.lookup(before).error().code, ErrorCode::NotFound);
    EXPECT_FALSE(file::exists(tmp / "store"));
}

TEST_F(ApplierTest, SecondApplyIsAlreadyPatched) {
    BackupStore store(tmp / "store");
    Applier applier(store);

    ASSERT_EQ(applier.apply(module_path, desc).status, PatchStatus::Success);
    auto after_first = current_digest();

    auto second = applier.apply(module_path, desc);
    EXPECT_EQ(second.status, PatchStatus::AlreadyPatched);
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(current_digest(), after_first);
}

TEST_F(ApplierTest, EditsPresentWithoutMarkerStillGetPatched) {
    Buffer partial = original;
    partial.overwrite_at(EDIT_OFFSET, Buffer{0xbb, 0xbb}.span());
    write_file(module_path, partial);

    std::string detail;
    EXPECT_EQ(classify(partial, desc, &detail), ImageState::Unpatched);
    EXPECT_NE(detail.find("marker absent"), std::string::npos);

    BackupStore store(tmp / "store");
    Applier applier(store);
    EXPECT_EQ(applier.apply(module_path, desc).status, PatchStatus::Success);
    EXPECT_EQ(classify(read_file(module_path), desc), ImageState::Patched);
}

TEST_F(ApplierTest, RefusesNonElfFile) {
    Buffer not_elf = original;
    not_elf[0] = 0x00;
    write_file(module_path, not_elf);

    BackupStore store(tmp / "store");
    Applier applier(store);
    auto result = applier.apply(module_path, desc);
    EXPECT_EQ(result.status, PatchStatus::OffsetMismatch);
    EXPECT_NE(result.message.find("ELF"), std::string::npos);
}

TEST_F(ApplierTest, ExpectedSizeIsEnforced) {
    desc.expected_size = MODULE_SIZE + 8;

    BackupStore store(tmp / "store");
    Applier applier(store);
    EXPECT_EQ(applier.apply(module_path, desc).status, PatchStatus::OffsetMismatch);
    EXPECT_EQ(current_digest(), original_digest);
}

TEST_F(ApplierTest, ShortFileIsOffsetMismatch) {
    Buffer short_file = original.sub(0, 400);
    write_file(module_path, short_file);

    EXPECT_EQ(classify(short_file, desc), ImageState::Mismatch);
}

TEST_F(ApplierTest, FailedWriteLeavesOriginalOrPatched) {
    FaultIo io(module_path, FaultIo::Fault::FailWrite);
    BackupStore store(tmp / "store", io);
    Applier applier(store, io);

    auto result = applier.apply(module_path, desc);
    EXPECT_EQ(result.status, PatchStatus::IoError);

    auto now = current_digest();
    auto patched_digest = crypto::digest_bytes(build_patched(original, desc));
    EXPECT_TRUE(now == original_digest || now == patched_digest);
    EXPECT_EQ(now, original_digest);

    // The backup was taken before the failed write
    EXPECT_TRUE(store.lookup(original_digest).ok());
}

TEST_F(ApplierTest, VerificationFailureRollsBack) {
    FaultIo io(module_path, FaultIo::Fault::CorruptMarker);
    BackupStore store(tmp / "store", io);
    Applier applier(store, io);

    auto result = applier.apply(module_path, desc);
    EXPECT_EQ(result.status, PatchStatus::RolledBack);
    EXPECT_NE(result.message.find("marker missing"), std::string::npos);
    EXPECT_EQ(current_digest(), original_digest);
    EXPECT_EQ(io.target_writes.load(), 2);
}

TEST_F(ApplierTest, CommitRequiresMatchingBackup) {
    BackupStore store(tmp / "store");
    Applier applier(store);

    auto ins = applier.inspect(module_path, desc);
    ASSERT_TRUE(ins.ok());
    EXPECT_EQ(ins.unwrap().state, ImageState::Unpatched);
    EXPECT_EQ(ins.unwrap().digest, original_digest);

    BackupRecord wrong;
    wrong.digest = crypto::digest_bytes(Buffer{0x01});
    auto result = applier.commit("nvidia", module_path, desc, ins.unwrap(), wrong);
    EXPECT_EQ(result.status, PatchStatus::NotBackedUp);
    EXPECT_EQ(current_digest(), original_digest);
}

TEST_F(ApplierTest, InspectMissingFileIsIoError) {
    BackupStore store(tmp / "store");
    Applier applier(store);
    auto ins = applier.inspect(tmp / "absent.ko", desc);
    ASSERT_FALSE(ins.ok());
    EXPECT_EQ(ins.error().code, ErrorCode::IoError);
}

TEST(BuildPatched, LeavesInputUntouched) {
    auto original = make_module();
    auto desc = make_descriptor();
    auto patched = build_patched(original, desc);

    EXPECT_EQ(original, make_module());
    EXPECT_EQ(patched.size(), original.size());
    EXPECT_EQ(classify(patched, desc), ImageState::Patched);
}

TEST(Verifier, ReportsEveryProblem) {
    auto desc = make_descriptor();
    auto patched = build_patched(make_module(), desc);
    EXPECT_TRUE(Verifier::check(patched, desc, MODULE_SIZE).empty());

    auto problems = Verifier::check(make_module(), desc, MODULE_SIZE);
    EXPECT_EQ(problems.size(), 2u);

    auto grown = patched;
    uint8_t extra = 0;
    grown.append(&extra, 1);
    problems = Verifier::check(grown, desc, MODULE_SIZE);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("length"), std::string::npos);
}

TEST(Verifier, RereadsFromDisk) {
    TempDir tmp;
    auto desc = make_descriptor();
    write_file(tmp / "nvidia.ko", build_patched(make_module(), desc));

    Verifier verifier;
    EXPECT_TRUE(verifier.verify(tmp / "nvidia.ko", desc, MODULE_SIZE).ok());

    write_file(tmp / "nvidia.ko", make_module());
    auto failed = verifier.verify(tmp / "nvidia.ko", desc, MODULE_SIZE);
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, ErrorCode::VerificationFailed);

    auto missing = verifier.verify(tmp / "absent.ko", desc, MODULE_SIZE);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::VerificationFailed);
}
