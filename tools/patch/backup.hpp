/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/buffer.hpp"
#include "../core/file.hpp"
#include "../core/types.hpp"
#include "../crypto/digest.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kmp {
namespace patch {

inline constexpr const char *DEFAULT_BACKUP_ROOT = "/var/lib/kmodpatch/backups";
inline constexpr const char *RUNS_DIR = "runs";
inline constexpr const char *MANIFEST_EXT = ".info";
inline constexpr const char *INFO_RUN_SESSION = "[run]";

// Headroom required beyond the object size before a backup is written
inline constexpr uint64_t BACKUP_SPACE_SLACK = 1 << 20;

// Stored original bytes of one module, addressed by their digest
struct BackupRecord {
    crypto::Digest digest;
    std::filesystem::path location;
    uint64_t size = 0;
    int64_t created = 0; // unix seconds

    bool operator==(const BackupRecord &other) const {
        return digest == other.digest && location == other.location &&
               size == other.size && created == other.created;
    }
};

// One module entry in a run manifest
struct ManifestEntry {
    std::string name;
    std::filesystem::path path;
    uint64_t size = 0;
    crypto::Digest digest;
    std::filesystem::path backup;
};

// Sidecar written once per patch run, before any module is modified
struct RunManifest {
    std::string version;
    std::string created;
    std::filesystem::path file;
    std::vector<ManifestEntry> modules;

    std::string serialize() const;
    static Result<RunManifest> parse(std::string_view text, const std::filesystem::path &origin);

    const ManifestEntry *find(std::string_view name) const;
};

// Content-addressed store: <root>/<hex digest> per unique original,
// <root>/runs/<timestamp>-<version>.info per patch run.

class BackupStore {
    std::filesystem::path root_;
    file::FileIo &io_;
    mutable std::mutex mutex_;

public:
    explicit BackupStore(std::filesystem::path root, file::FileIo &io = file::default_io());

    const std::filesystem::path &root() const { return root_; }
    std::filesystem::path object_path(const crypto::Digest &digest) const;
    std::filesystem::path runs_dir() const { return root_ / RUNS_DIR; }

    Result<void> init();

    // Idempotent per digest. The file must still hash to `digest`.
    Result<BackupRecord> save(const std::filesystem::path &module_path, const crypto::Digest &digest);

    // Atomic overwrite of `target` with the stored bytes, after re-checking them
    Result<void> restore(const BackupRecord &record, const std::filesystem::path &target);

    // NotFound when no object exists for `digest`
    Result<BackupRecord> lookup(const crypto::Digest &digest) const;

    Result<std::filesystem::path> write_manifest(RunManifest manifest);

    // Newest first
    Result<std::vector<RunManifest>> manifests() const;

    // Entry from the newest run of driver `version` naming `module`;
    // NotBackedUp if none
    Result<ManifestEntry> last_entry(std::string_view module, std::string_view version) const;

    // Keeps the newest `keep` manifests and the objects they reference.
    // Returns the number of files removed. Fails without removing anything
    // while any manifest cannot be parsed.
    Result<size_t> prune(size_t keep);

private:
    Result<BackupRecord> lookup_locked(const crypto::Digest &digest) const;
    Result<std::vector<RunManifest>> load_manifests(bool strict) const;
};

// Exclusive advisory lock on <root>/.lock, held for one patch or rollback run

class StoreLock {
    int fd_ = -1;

public:
    StoreLock() = default;
    StoreLock(const StoreLock &) = delete;
    StoreLock &operator=(const StoreLock &) = delete;
    StoreLock(StoreLock &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    ~StoreLock();

    static Result<StoreLock> acquire(const std::filesystem::path &root);
};

// Sortable UTC stamp with sub-second precision, e.g. 20261019T101502.123456789Z
std::string run_timestamp();

} // namespace patch
} // namespace kmp
