/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/file.hpp"
#include "../core/types.hpp"
#include "../kmod/locator.hpp"
#include "applier.hpp"
#include "backup.hpp"
#include "descriptor.hpp"
#include "result.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kmp {
namespace patch {

// Per-module lifecycle inside one run
enum class ModuleState { Unpatched, BackedUp, Patched, RolledBack };

const char *module_state_str(ModuleState state);

struct OrchestratorOptions {
    size_t jobs = 1;
    bool dry_run = false;
};

// One mutex per module path, created on first use and never removed
class PathLocks {
    std::mutex mutex_;
    std::map<std::filesystem::path, std::unique_ptr<std::mutex>> locks_;

public:
    std::mutex &get(const std::filesystem::path &path);
};

struct RunReport {
    std::string version;
    std::optional<Error> error; // failure that stopped the run before any module
    std::vector<PatchResult> results;
    std::filesystem::path manifest;

    bool ok() const;
    int exit_code() const;
};

enum class ModuleCheck { Patched, Unpatched, Mismatch, Missing };

const char *module_check_str(ModuleCheck check);

struct ModuleVerdict {
    std::string module;
    std::filesystem::path path;
    ModuleCheck state = ModuleCheck::Missing;
    std::string detail;
};

struct VerifyReport {
    std::string version;
    std::optional<Error> error;
    std::vector<ModuleVerdict> modules;

    // fully_patched, partially_patched, not_patched or not_found
    const char *overall() const;
    int exit_code() const;
};

// Runs fn(0..count-1) on at most `jobs` threads and waits for all of them
void run_parallel(size_t jobs, size_t count, const std::function<void(size_t)> &fn);

// Sequences hashing, backup, patching, verification and rollback for every
// module of one driver version.
//
// Per module: Unpatched -> BackedUp -> Patched, or BackedUp -> RolledBack
// on any failure after the backup exists. The run manifest is written after
// every backup and before the first module write.

class Orchestrator {
    DescriptorTablePtr table_;
    const kmod::ModuleLocator &locator_;
    BackupStore &store_;
    file::FileIo &io_;
    OrchestratorOptions opts_;
    PathLocks locks_;

public:
    Orchestrator(DescriptorTablePtr table, const kmod::ModuleLocator &locator, BackupStore &store,
                 OrchestratorOptions opts = {}, file::FileIo &io = file::default_io());

    RunReport patch(const std::string &version);

    // Restores the module's last pre-patch content recorded for driver
    // `version`. Only a file holding that backup or its patched form is
    // overwritten. Success, NotBackedUp or IoError.
    PatchResult rollback(const std::string &version, const std::string &module);

    // Empty `modules` means every module of the newest run of `version`
    RunReport rollback_all(const std::string &version, const std::vector<std::string> &modules);

    VerifyReport verify(const std::string &version);

    const OrchestratorOptions &options() const { return opts_; }

private:
    struct Target {
        std::string module;
        const PatchDescriptor *desc = nullptr;
        kmod::KernelModule file;
    };

    std::vector<Target> resolve_targets(const std::string &version, const DescriptorSet &set,
                                        std::vector<PatchResult> &missing) const;

    PatchResult rollback_locked(const std::string &version, const std::string &module);
};

} // namespace patch
} // namespace kmp
