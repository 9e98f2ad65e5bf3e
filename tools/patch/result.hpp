/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/types.hpp"

#include <string>

namespace kmp {
namespace patch {

enum class PatchStatus {
    Success,
    AlreadyPatched,
    Unsupported,
    ModuleNotFound,
    OffsetMismatch,
    IoError,
    InsufficientStorage,
    VerificationFailed,
    RolledBack,
    NotBackedUp,
};

inline const char *status_str(PatchStatus status) {
    switch (status) {
    case PatchStatus::Success: return "Success";
    case PatchStatus::AlreadyPatched: return "AlreadyPatched";
    case PatchStatus::Unsupported: return "Unsupported";
    case PatchStatus::ModuleNotFound: return "ModuleNotFound";
    case PatchStatus::OffsetMismatch: return "OffsetMismatch";
    case PatchStatus::IoError: return "IoError";
    case PatchStatus::InsufficientStorage: return "InsufficientStorage";
    case PatchStatus::VerificationFailed: return "VerificationFailed";
    case PatchStatus::RolledBack: return "RolledBack";
    case PatchStatus::NotBackedUp: return "NotBackedUp";
    }
    return "Unknown";
}

inline PatchStatus status_from_error(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotSupported: return PatchStatus::Unsupported;
    case ErrorCode::ModuleNotFound: return PatchStatus::ModuleNotFound;
    case ErrorCode::OffsetMismatch: return PatchStatus::OffsetMismatch;
    case ErrorCode::VerificationFailed: return PatchStatus::VerificationFailed;
    case ErrorCode::InsufficientStorage: return PatchStatus::InsufficientStorage;
    case ErrorCode::NotBackedUp: return PatchStatus::NotBackedUp;
    default: return PatchStatus::IoError;
    }
}

inline bool status_ok(PatchStatus status) {
    return status == PatchStatus::Success || status == PatchStatus::AlreadyPatched;
}

// Process exit code for one status (0 on success)
inline int status_exit_code(PatchStatus status) {
    switch (status) {
    case PatchStatus::Success:
    case PatchStatus::AlreadyPatched: return 0;
    case PatchStatus::Unsupported: return 2;
    case PatchStatus::VerificationFailed:
    case PatchStatus::RolledBack: return 3;
    case PatchStatus::IoError:
    case PatchStatus::InsufficientStorage: return 4;
    case PatchStatus::NotBackedUp: return 5;
    case PatchStatus::OffsetMismatch: return 6;
    case PatchStatus::ModuleNotFound: return 7;
    }
    return 1;
}

// Higher is worse; decides the exit code of a multi-module run
inline int status_severity(PatchStatus status) {
    switch (status) {
    case PatchStatus::Success:
    case PatchStatus::AlreadyPatched: return 0;
    case PatchStatus::Unsupported: return 1;
    case PatchStatus::ModuleNotFound: return 2;
    case PatchStatus::NotBackedUp: return 3;
    case PatchStatus::OffsetMismatch: return 4;
    case PatchStatus::VerificationFailed:
    case PatchStatus::RolledBack: return 5;
    case PatchStatus::InsufficientStorage:
    case PatchStatus::IoError: return 6;
    }
    return 6;
}

// Outcome of one patch or rollback attempt on one module
struct PatchResult {
    PatchStatus status = PatchStatus::Success;
    std::string module;
    std::string message;

    bool ok() const { return status_ok(status); }

    static PatchResult from_error(const std::string &module, const Error &err) {
        return {status_from_error(err.code), module, err.message};
    }
};

} // namespace patch
} // namespace kmp
