/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "backup.hpp"
#include "../core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <fcntl.h>
#include <set>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kmp {
namespace patch {

namespace fs = std::filesystem;

// RunManifest

std::string RunManifest::serialize() const {
    std::string out;
    out += std::string(INFO_RUN_SESSION) + "\n";
    out += "version=" + version + "\n";
    out += "created=" + created + "\n";
    for (const auto &m : modules) {
        out += "[module " + m.name + "]\n";
        out += "path=" + m.path.string() + "\n";
        out += "file=" + m.path.filename().string() + "\n";
        out += "size=" + std::to_string(m.size) + "\n";
        out += "digest=" + m.digest.hex() + "\n";
        out += "backup=" + m.backup.string() + "\n";
    }
    return out;
}

Result<RunManifest> RunManifest::parse(std::string_view text, const fs::path &origin) {
    RunManifest run;
    run.file = origin;
    ManifestEntry *current = nullptr;
    bool in_run = false;

    auto bad = [&](const std::string &what) {
        return Result<RunManifest>::Err(ErrorCode::IoError, origin.string() + ": " + what);
    };

    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = nl == std::string_view::npos ? text.size() : nl + 1;
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.remove_suffix(1);
        if (line.empty()) continue;

        if (line == INFO_RUN_SESSION) {
            in_run = true;
            current = nullptr;
            continue;
        }
        if (line.size() > 9 && line.substr(0, 8) == "[module " && line.back() == ']') {
            in_run = false;
            run.modules.emplace_back();
            current = &run.modules.back();
            current->name = std::string(line.substr(8, line.size() - 9));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string_view::npos) return bad("expected key=value");
        std::string_view key = line.substr(0, eq);
        std::string value(line.substr(eq + 1));

        if (in_run) {
            if (key == "version") run.version = value;
            else if (key == "created") run.created = value;
        } else if (current) {
            if (key == "path") {
                current->path = value;
            } else if (key == "size") {
                current->size = std::strtoull(value.c_str(), nullptr, 10);
            } else if (key == "digest") {
                auto d = crypto::Digest::from_hex(value);
                if (!d) return bad("bad digest for module " + current->name);
                current->digest = *d;
            } else if (key == "backup") {
                current->backup = value;
            }
        } else {
            return bad("key outside a section");
        }
    }

    if (run.version.empty()) return bad("missing version");
    return Result<RunManifest>::Ok(std::move(run));
}

const ManifestEntry *RunManifest::find(std::string_view name) const {
    for (const auto &m : modules) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

std::string run_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(now);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now - secs).count();

    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm {};
    gmtime_r(&t, &tm);

    char stamp[40];
    size_t n = std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &tm);
    std::snprintf(stamp + n, sizeof(stamp) - n, ".%09lldZ", static_cast<long long>(nanos));
    return stamp;
}

// BackupStore

BackupStore::BackupStore(fs::path root, file::FileIo &io) : root_(std::move(root)), io_(io) {}

fs::path BackupStore::object_path(const crypto::Digest &digest) const {
    return root_ / digest.hex();
}

Result<void> BackupStore::init() {
    auto made = file::ensure_directory(root_);
    if (!made) return made;
    return file::ensure_directory(runs_dir());
}

Result<BackupRecord> BackupStore::lookup_locked(const crypto::Digest &digest) const {
    auto path = object_path(digest);
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return Result<BackupRecord>::Err(ErrorCode::NotFound, "No backup for " + digest.short_hex());
        }
        return Result<BackupRecord>::Err(ErrorCode::IoError,
                                         "Failed to stat " + path.string() + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return Result<BackupRecord>::Err(ErrorCode::IoError, "Backup object is not a file: " + path.string());
    }
    return Result<BackupRecord>::Ok(BackupRecord{digest, path, static_cast<uint64_t>(st.st_size),
                                                 static_cast<int64_t>(st.st_mtime)});
}

Result<BackupRecord> BackupStore::lookup(const crypto::Digest &digest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked(digest);
}

Result<BackupRecord> BackupStore::save(const fs::path &module_path, const crypto::Digest &digest) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = lookup_locked(digest);
    if (existing) {
        kmp_log_info("backup %s already stored\n", digest.short_hex().c_str());
        return existing;
    }
    if (existing.error().code != ErrorCode::NotFound) return existing;

    auto content = io_.read(module_path);
    if (!content) return Result<BackupRecord>::Err(content.error());
    const auto &buf = content.unwrap();

    if (crypto::digest_bytes(buf) != digest) {
        return Result<BackupRecord>::Err(ErrorCode::IoError,
                                         module_path.string() + " changed since it was hashed");
    }

    auto made = init();
    if (!made) return Result<BackupRecord>::Err(made.error());

    auto space = io_.available_space(root_);
    if (!space) return Result<BackupRecord>::Err(space.error());
    if (space.unwrap() < buf.size() + BACKUP_SPACE_SLACK) {
        return Result<BackupRecord>::Err(ErrorCode::InsufficientStorage,
                                         "Not enough space in " + root_.string() + " for " +
                                         std::to_string(buf.size()) + " byte backup");
    }

    auto written = io_.write_atomic(object_path(digest), buf);
    if (!written) return Result<BackupRecord>::Err(written.error());

    kmp_log_info("backup %s saved (%zu bytes) from %s\n",
                 digest.short_hex().c_str(), buf.size(), module_path.c_str());
    return lookup_locked(digest);
}

Result<void> BackupStore::restore(const BackupRecord &record, const fs::path &target) {
    auto content = io_.read(record.location);
    if (!content) return Result<void>::Err(content.error().as(ErrorCode::IoError));

    const auto &buf = content.unwrap();
    if (crypto::digest_bytes(buf) != record.digest) {
        return Result<void>::Err(ErrorCode::IoError,
                                 "Backup " + record.location.string() + " no longer matches its digest");
    }

    auto written = io_.write_atomic(target, buf);
    if (!written) return Result<void>::Err(written.error().as(ErrorCode::IoError));

    kmp_log_info("restored %s from backup %s\n", target.c_str(), record.digest.short_hex().c_str());
    return Result<void>::Ok();
}

Result<fs::path> BackupStore::write_manifest(RunManifest manifest) {
    auto made = init();
    if (!made) return Result<fs::path>::Err(made.error());

    if (manifest.created.empty()) manifest.created = run_timestamp();

    std::string safe_version = manifest.version;
    for (auto &c : safe_version) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') c = '_';
    }

    fs::path path = runs_dir() / (manifest.created + "-" + safe_version + MANIFEST_EXT);
    std::string text = manifest.serialize();
    auto written = io_.write_atomic(path, Buffer(text.data(), text.size()));
    if (!written) return Result<fs::path>::Err(written.error());

    kmp_log_info("run manifest: %s\n", path.c_str());
    return Result<fs::path>::Ok(path);
}

Result<std::vector<RunManifest>> BackupStore::manifests() const {
    return load_manifests(false);
}

Result<std::vector<RunManifest>> BackupStore::load_manifests(bool strict) const {
    using R = Result<std::vector<RunManifest>>;
    std::vector<RunManifest> out;

    std::error_code ec;
    if (!fs::is_directory(runs_dir(), ec)) return R::Ok(std::move(out));

    std::vector<fs::path> files;
    for (auto it = fs::directory_iterator(runs_dir(), ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (it->path().extension() == MANIFEST_EXT) files.push_back(it->path());
    }
    if (ec) return R::Err(ErrorCode::IoError, "Failed to list " + runs_dir().string() + ": " + ec.message());

    // File names start with the run timestamp
    std::sort(files.begin(), files.end(), [](const fs::path &a, const fs::path &b) {
        return a.filename().string() > b.filename().string();
    });

    for (const auto &path : files) {
        auto content = io_.read(path);
        if (!content) return R::Err(content.error());
        const auto &buf = content.unwrap();
        auto run = RunManifest::parse(std::string_view(buf.char_data(), buf.size()), path);
        if (!run) {
            if (strict) return R::Err(run.error().as(ErrorCode::IoError));
            kmp_log_warn("Skipping unreadable manifest: %s\n", run.error().c_str());
            continue;
        }
        out.push_back(std::move(run).unwrap());
    }
    return R::Ok(std::move(out));
}

Result<ManifestEntry> BackupStore::last_entry(std::string_view module, std::string_view version) const {
    auto runs = manifests();
    if (!runs) return Result<ManifestEntry>::Err(runs.error());

    for (const auto &run : runs.unwrap()) {
        if (run.version != version) continue;
        if (const auto *entry = run.find(module)) return Result<ManifestEntry>::Ok(*entry);
    }
    return Result<ManifestEntry>::Err(ErrorCode::NotBackedUp, "No backup recorded for module " +
                                      std::string(module) + " of driver " + std::string(version));
}

Result<size_t> BackupStore::prune(size_t keep) {
    // An unreadable manifest may still reference objects
    auto runs = load_manifests(true);
    if (!runs) {
        return Result<size_t>::Err(ErrorCode::IoError, "Refusing to prune: " + runs.error().message);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> referenced;
    size_t removed = 0;
    const auto &all = runs.unwrap();

    for (size_t i = 0; i < all.size(); ++i) {
        if (i < keep) {
            for (const auto &m : all[i].modules) referenced.insert(m.digest.hex());
            continue;
        }
        std::error_code ec;
        if (fs::remove(all[i].file, ec)) {
            ++removed;
            kmp_log_info("pruned manifest %s\n", all[i].file.c_str());
        } else if (ec) {
            return Result<size_t>::Err(ErrorCode::IoError, "Failed to remove " + all[i].file.string() + ": " + ec.message());
        }
    }

    std::error_code ec;
    for (auto it = fs::directory_iterator(root_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!crypto::Digest::from_hex(name) || referenced.count(name)) continue;

        std::error_code rm_ec;
        if (fs::remove(it->path(), rm_ec)) {
            ++removed;
            kmp_log_info("pruned backup %s\n", name.c_str());
        } else if (rm_ec) {
            return Result<size_t>::Err(ErrorCode::IoError, "Failed to remove " + it->path().string() + ": " + rm_ec.message());
        }
    }
    if (ec) return Result<size_t>::Err(ErrorCode::IoError, "Failed to list " + root_.string() + ": " + ec.message());

    return Result<size_t>::Ok(removed);
}

// StoreLock

StoreLock::~StoreLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

Result<StoreLock> StoreLock::acquire(const fs::path &root) {
    auto made = file::ensure_directory(root);
    if (!made) return Result<StoreLock>::Err(made.error());

    fs::path path = root / ".lock";
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Result<StoreLock>::Err(ErrorCode::IoError,
                                      "Failed to open " + path.string() + ": " + std::strerror(errno));
    }
    int rc = ::flock(fd, LOCK_EX | LOCK_NB);
    if (rc != 0 && errno == EWOULDBLOCK) {
        kmp_log_info("waiting for another run to release %s\n", path.c_str());
        do {
            rc = ::flock(fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
    }
    if (rc != 0) {
        int err = errno;
        ::close(fd);
        return Result<StoreLock>::Err(ErrorCode::IoError,
                                      "Failed to lock " + path.string() + ": " + std::strerror(err));
    }

    StoreLock lock;
    lock.fd_ = fd;
    return Result<StoreLock>::Ok(std::move(lock));
}

} // namespace patch
} // namespace kmp
