/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "orchestrator.hpp"
#include "../core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <set>
#include <thread>

namespace kmp {
namespace patch {

namespace fs = std::filesystem;

const char *module_state_str(ModuleState state) {
    switch (state) {
    case ModuleState::Unpatched: return "Unpatched";
    case ModuleState::BackedUp: return "BackedUp";
    case ModuleState::Patched: return "Patched";
    case ModuleState::RolledBack: return "RolledBack";
    }
    return "Unknown";
}

const char *module_check_str(ModuleCheck check) {
    switch (check) {
    case ModuleCheck::Patched: return "patched";
    case ModuleCheck::Unpatched: return "unpatched";
    case ModuleCheck::Mismatch: return "mismatch";
    case ModuleCheck::Missing: return "missing";
    }
    return "unknown";
}

static void transition(const std::string &module, ModuleState from, ModuleState to) {
    kmp_log_debug("%s: %s -> %s\n", module.c_str(), module_state_str(from), module_state_str(to));
}

std::mutex &PathLocks::get(const fs::path &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &slot = locks_[path];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

// Reports

bool RunReport::ok() const {
    return exit_code() == 0;
}

int RunReport::exit_code() const {
    if (error) return status_exit_code(status_from_error(error->code));

    PatchStatus worst = PatchStatus::Success;
    for (const auto &r : results) {
        if (status_severity(r.status) > status_severity(worst)) worst = r.status;
    }
    return status_exit_code(worst);
}

const char *VerifyReport::overall() const {
    size_t present = 0, patched = 0;
    for (const auto &m : modules) {
        if (m.state == ModuleCheck::Missing) continue;
        ++present;
        if (m.state == ModuleCheck::Patched) ++patched;
    }
    if (present == 0) return "not_found";
    if (patched == modules.size()) return "fully_patched";
    if (patched > 0) return "partially_patched";
    return "not_patched";
}

int VerifyReport::exit_code() const {
    if (error) return status_exit_code(status_from_error(error->code));

    std::string_view state = overall();
    if (state == "fully_patched") return 0;
    if (state == "not_found") return status_exit_code(PatchStatus::ModuleNotFound);
    for (const auto &m : modules) {
        if (m.state == ModuleCheck::Mismatch) return status_exit_code(PatchStatus::OffsetMismatch);
    }
    return status_exit_code(PatchStatus::VerificationFailed);
}

void run_parallel(size_t jobs, size_t count, const std::function<void(size_t)> &fn) {
    if (count == 0) return;
    size_t workers = std::min(std::max<size_t>(jobs, 1), count);
    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&]() {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) fn(i);
        });
    }
    for (auto &t : pool) t.join();
}

// Orchestrator

Orchestrator::Orchestrator(DescriptorTablePtr table, const kmod::ModuleLocator &locator,
                           BackupStore &store, OrchestratorOptions opts, file::FileIo &io)
    : table_(std::move(table)), locator_(locator), store_(store), io_(io), opts_(opts) {}

std::vector<Orchestrator::Target> Orchestrator::resolve_targets(const std::string &version,
                                                                const DescriptorSet &set,
                                                                std::vector<PatchResult> &missing) const {
    std::vector<Target> targets;

    auto located = locator_.locate(version);
    if (!located) kmp_log_warn("module lookup for %s failed: %s\n", version.c_str(), located.error().c_str());

    for (const auto &[name, desc] : set) {
        if (!located) {
            missing.push_back(PatchResult::from_error(name, located.error()));
            continue;
        }
        const auto &paths = located.unwrap();
        auto it = paths.find(name);
        if (it == paths.end()) {
            missing.push_back({PatchStatus::ModuleNotFound, name, "no " + name + " module for driver " + version});
            continue;
        }

        auto mod = kmod::resolve_module(name, it->second);
        if (!mod) {
            missing.push_back(PatchResult::from_error(name, mod.error()));
            continue;
        }
        targets.push_back({name, &desc, std::move(mod).unwrap()});
    }
    return targets;
}

RunReport Orchestrator::patch(const std::string &version) {
    RunReport report;
    report.version = version;

    auto set = table_->lookup(version);
    if (!set) {
        kmp_log_error("%s\n", set.error().c_str());
        report.error = set.error();
        return report;
    }

    auto targets = resolve_targets(version, *set.unwrap(), report.results);

    std::optional<StoreLock> store_lock;
    if (!opts_.dry_run && !targets.empty()) {
        auto acquired = StoreLock::acquire(store_.root());
        if (!acquired) {
            report.error = acquired.error();
            return report;
        }
        store_lock.emplace(std::move(acquired).unwrap());
    }

    // Held by this thread for the whole run, in path order
    std::set<fs::path> paths;
    for (const auto &t : targets) paths.insert(t.file.path);
    std::vector<std::unique_lock<std::mutex>> held;
    for (const auto &p : paths) held.emplace_back(locks_.get(p));

    struct Slot {
        ModuleState state = ModuleState::Unpatched;
        std::optional<Inspection> before;
        std::optional<BackupRecord> backup;
        std::optional<PatchResult> result;
    };
    std::vector<Slot> slots(targets.size());
    Applier applier(store_, io_);

    // Hash, classify and back up
    run_parallel(opts_.jobs, targets.size(), [&](size_t i) {
        const auto &t = targets[i];
        auto &slot = slots[i];
        try {
            auto ins = applier.inspect(t.file.path, *t.desc);
            if (!ins) {
                slot.result = PatchResult::from_error(t.module, ins.error());
                return;
            }
            switch (ins.unwrap().state) {
            case ImageState::Patched:
                slot.result = PatchResult{PatchStatus::AlreadyPatched, t.module, ins.unwrap().detail};
                return;
            case ImageState::Mismatch:
                slot.result = PatchResult{PatchStatus::OffsetMismatch, t.module, ins.unwrap().detail};
                return;
            case ImageState::Unpatched:
                break;
            }

            if (opts_.dry_run) {
                slot.result = PatchResult{PatchStatus::Success, t.module,
                                          "would patch (dry run), digest " + ins.unwrap().digest.hex()};
                return;
            }

            auto saved = store_.save(t.file.path, ins.unwrap().digest);
            if (!saved) {
                slot.result = PatchResult::from_error(t.module, saved.error());
                return;
            }
            slot.backup = saved.unwrap();
            slot.before = std::move(ins).unwrap();
            transition(t.module, slot.state, ModuleState::BackedUp);
            slot.state = ModuleState::BackedUp;
        } catch (const std::exception &e) {
            slot.result = PatchResult{PatchStatus::IoError, t.module, std::string("backup aborted: ") + e.what()};
        }
    });

    RunManifest manifest;
    manifest.version = version;
    for (size_t i = 0; i < targets.size(); ++i) {
        if (!slots[i].backup) continue;
        manifest.modules.push_back({targets[i].module, targets[i].file.path, slots[i].backup->size,
                                    slots[i].backup->digest, slots[i].backup->location});
    }

    if (!manifest.modules.empty()) {
        auto written = store_.write_manifest(manifest);
        if (!written) {
            // Nothing has been modified yet
            for (size_t i = 0; i < targets.size(); ++i) {
                if (slots[i].backup) {
                    slots[i].result = PatchResult{PatchStatus::IoError, targets[i].module,
                                                  "run manifest not written: " + written.error().message};
                }
            }
        } else {
            report.manifest = written.unwrap();
        }
    }

    // Write and verify
    run_parallel(opts_.jobs, targets.size(), [&](size_t i) {
        const auto &t = targets[i];
        auto &slot = slots[i];
        if (slot.result || !slot.backup) return;

        PatchResult result;
        try {
            result = applier.commit(t.module, t.file.path, *t.desc, *slot.before, *slot.backup);
        } catch (const std::exception &e) {
            result = applier.roll_back(t.module, t.file.path, *slot.backup, std::string("patch aborted: ") + e.what());
        }

        ModuleState next = result.ok() ? ModuleState::Patched : ModuleState::RolledBack;
        transition(t.module, slot.state, next);
        if (next == ModuleState::RolledBack && result.status == PatchStatus::RolledBack) {
            transition(t.module, next, ModuleState::Unpatched);
        }
        slot.state = next;
        slot.before.reset();
        slot.result = std::move(result);
    });

    for (auto &slot : slots) report.results.push_back(std::move(*slot.result));
    std::sort(report.results.begin(), report.results.end(),
              [](const PatchResult &a, const PatchResult &b) { return a.module < b.module; });

    for (const auto &r : report.results) {
        if (r.ok()) kmp_log_info("%s: %s\n", r.module.c_str(), status_str(r.status));
        else kmp_log_warn("%s: %s: %s\n", r.module.c_str(), status_str(r.status), r.message.c_str());
    }
    return report;
}

PatchResult Orchestrator::rollback_locked(const std::string &version, const std::string &module) {
    auto entry = store_.last_entry(module, version);
    if (!entry) return PatchResult::from_error(module, entry.error());
    const auto &e = entry.unwrap();

    auto record = store_.lookup(e.digest);
    if (!record) {
        if (record.error().code == ErrorCode::NotFound) {
            return {PatchStatus::NotBackedUp, module, "backup object " + e.digest.short_hex() + " is missing"};
        }
        return PatchResult::from_error(module, record.error());
    }

    std::lock_guard<std::mutex> lock(locks_.get(e.path));

    auto current = io_.read(e.path);
    if (!current) return {PatchStatus::IoError, module, current.error().message};
    auto current_digest = crypto::digest_bytes(current.unwrap());
    if (current_digest == e.digest) {
        return {PatchStatus::Success, module, "already matches backup " + e.digest.short_hex()};
    }

    // Only undo our own patch; anything else was replaced since the run
    const auto *desc = table_->find(version, module);
    if (!desc) {
        return {PatchStatus::NotBackedUp, module, "no descriptor for " + module + " of driver " + version +
                                                  ", cannot confirm " + e.path.string() + " was patched from its backup"};
    }
    auto original = io_.read(record.unwrap().location);
    if (!original) return {PatchStatus::IoError, module, original.error().message};
    if (crypto::digest_bytes(build_patched(original.unwrap(), *desc)) != current_digest) {
        return {PatchStatus::NotBackedUp, module, e.path.string() + " (" + current_digest.short_hex() +
                                                  ") is neither backup " + e.digest.short_hex() +
                                                  " nor its patched form, refusing to restore"};
    }

    if (opts_.dry_run) {
        return {PatchStatus::Success, module, "would restore " + e.path.string() + " (dry run)"};
    }

    auto restored = store_.restore(record.unwrap(), e.path);
    if (!restored) return {PatchStatus::IoError, module, restored.error().message};

    auto after = io_.read(e.path);
    if (!after || crypto::digest_bytes(after.unwrap()) != e.digest) {
        return {PatchStatus::IoError, module, "restored " + e.path.string() + " does not match its backup"};
    }
    return {PatchStatus::Success, module, "restored " + e.path.string() + " to " + e.digest.short_hex()};
}

PatchResult Orchestrator::rollback(const std::string &version, const std::string &module) {
    std::optional<StoreLock> store_lock;
    if (!opts_.dry_run) {
        auto acquired = StoreLock::acquire(store_.root());
        if (!acquired) return PatchResult::from_error(module, acquired.error());
        store_lock.emplace(std::move(acquired).unwrap());
    }
    return rollback_locked(version, module);
}

RunReport Orchestrator::rollback_all(const std::string &version, const std::vector<std::string> &modules) {
    RunReport report;
    report.version = version;
    std::vector<std::string> names = modules;

    if (names.empty()) {
        auto runs = store_.manifests();
        if (!runs) {
            report.error = runs.error();
            return report;
        }
        const RunManifest *newest = nullptr;
        for (const auto &run : runs.unwrap()) {
            if (run.version == version) {
                newest = &run;
                break;
            }
        }
        if (!newest) {
            report.error = Error(ErrorCode::NotBackedUp, "No patch runs of driver " + version + " recorded in " +
                                                         store_.root().string());
            return report;
        }
        report.manifest = newest->file;
        for (const auto &m : newest->modules) names.push_back(m.name);
    }

    std::optional<StoreLock> store_lock;
    if (!opts_.dry_run) {
        auto acquired = StoreLock::acquire(store_.root());
        if (!acquired) {
            report.error = acquired.error();
            return report;
        }
        store_lock.emplace(std::move(acquired).unwrap());
    }

    report.results.resize(names.size());
    run_parallel(opts_.jobs, names.size(), [&](size_t i) {
        report.results[i] = rollback_locked(version, names[i]);
    });

    for (const auto &r : report.results) {
        if (r.ok()) kmp_log_info("%s: %s\n", r.module.c_str(), r.message.c_str());
        else kmp_log_warn("%s: %s: %s\n", r.module.c_str(), status_str(r.status), r.message.c_str());
    }
    return report;
}

VerifyReport Orchestrator::verify(const std::string &version) {
    VerifyReport report;
    report.version = version;

    auto set = table_->lookup(version);
    if (!set) {
        report.error = set.error();
        return report;
    }

    std::vector<PatchResult> missing;
    auto targets = resolve_targets(version, *set.unwrap(), missing);
    for (const auto &m : missing) {
        report.modules.push_back({m.module, {}, ModuleCheck::Missing, m.message});
    }

    for (const auto &t : targets) {
        ModuleVerdict verdict{t.module, t.file.path, ModuleCheck::Missing, {}};

        std::lock_guard<std::mutex> lock(locks_.get(t.file.path));
        auto content = io_.read(t.file.path);
        if (!content) {
            verdict.detail = content.error().message;
            report.modules.push_back(std::move(verdict));
            continue;
        }

        switch (classify(content.unwrap(), *t.desc, &verdict.detail)) {
        case ImageState::Patched: verdict.state = ModuleCheck::Patched; break;
        case ImageState::Unpatched: verdict.state = ModuleCheck::Unpatched; break;
        case ImageState::Mismatch: verdict.state = ModuleCheck::Mismatch; break;
        }
        report.modules.push_back(std::move(verdict));
    }

    std::sort(report.modules.begin(), report.modules.end(),
              [](const ModuleVerdict &a, const ModuleVerdict &b) { return a.module < b.module; });
    return report;
}

} // namespace patch
} // namespace kmp
