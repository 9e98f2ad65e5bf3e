/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/buffer.hpp"
#include "../core/file.hpp"
#include "../core/types.hpp"
#include "../crypto/digest.hpp"
#include "backup.hpp"
#include "descriptor.hpp"
#include "result.hpp"
#include "verifier.hpp"

#include <filesystem>
#include <string>

namespace kmp {
namespace patch {

enum class ImageState {
    Unpatched, // every edit holds original or replacement bytes, not all patched
    Patched,   // every edit holds replacement bytes and the marker is present
    Mismatch,  // not the build the descriptor was written for
};

inline const char *image_state_str(ImageState state) {
    switch (state) {
    case ImageState::Unpatched: return "unpatched";
    case ImageState::Patched: return "patched";
    case ImageState::Mismatch: return "mismatch";
    }
    return "unknown";
}

// Snapshot of a module taken before any write
struct Inspection {
    ImageState state = ImageState::Mismatch;
    Buffer content;
    crypto::Digest digest;
    std::string detail;
};

ImageState classify(const Buffer &content, const PatchDescriptor &desc, std::string *detail = nullptr);

// Copy of `original` with every edit and then the marker applied
Buffer build_patched(const Buffer &original, const PatchDescriptor &desc);

// Transactional byte substitution on one module file.
//
// apply() = inspect() + BackupStore::save() + commit(). The orchestrator
// runs the three steps itself so it can record the run manifest between
// the backup and the first write.

class Applier {
    BackupStore &store_;
    file::FileIo &io_;
    Verifier verifier_;

public:
    explicit Applier(BackupStore &store, file::FileIo &io = file::default_io())
        : store_(store), io_(io), verifier_(io) {}

    // Reads and classifies; IoError when the file cannot be read
    Result<Inspection> inspect(const std::filesystem::path &path, const PatchDescriptor &desc) const;

    // Writes the patched image atomically, verifies it and restores `backup`
    // if anything is wrong afterwards. `before` must be an Unpatched inspection.
    PatchResult commit(const std::string &module, const std::filesystem::path &path,
                       const PatchDescriptor &desc, const Inspection &before,
                       const BackupRecord &backup);

    PatchResult apply(const std::filesystem::path &path, const PatchDescriptor &desc);

    // Puts `backup` back over `path` and confirms the digest; RolledBack on
    // success, IoError when the module could not be recovered
    PatchResult roll_back(const std::string &module, const std::filesystem::path &path,
                          const BackupRecord &backup, const std::string &cause);
};

} // namespace patch
} // namespace kmp
