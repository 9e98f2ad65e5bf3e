/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "applier.hpp"
#include "../core/logging.hpp"
#include "../kmod/elf.hpp"

#include <cinttypes>

namespace kmp {
namespace patch {

static void set_detail(std::string *detail, const std::string &text) {
    if (detail) *detail = text;
}

ImageState classify(const Buffer &content, const PatchDescriptor &desc, std::string *detail) {
    if (!kmod::has_elf_magic(content)) {
        set_detail(detail, "missing ELF magic");
        return ImageState::Mismatch;
    }
    if (desc.expected_size && content.size() != *desc.expected_size) {
        set_detail(detail, "size " + std::to_string(content.size()) + " != expected " +
                           std::to_string(*desc.expected_size));
        return ImageState::Mismatch;
    }
    if (desc.extent() > content.size()) {
        set_detail(detail, "file too short for descriptor");
        return ImageState::Mismatch;
    }

    size_t applied = 0;
    for (const auto &e : desc.edits) {
        if (content.matches_at(e.offset, e.replacement)) {
            ++applied;
            continue;
        }
        if (content.matches_at(e.offset, e.original)) continue;

        char where[32];
        std::snprintf(where, sizeof(where), "0x%" PRIx64, e.offset);
        set_detail(detail, std::string("unexpected bytes at ") + where + ": " +
                           log::hex_string(content.span(e.offset, e.original.size())));
        return ImageState::Mismatch;
    }

    bool marked = content.matches_at(desc.marker_offset, desc.marker);
    if (applied == desc.edits.size() && marked) {
        set_detail(detail, "all edits and marker present");
        return ImageState::Patched;
    }

    set_detail(detail, std::to_string(applied) + "/" + std::to_string(desc.edits.size()) +
                       " edit(s) applied, marker " + (marked ? "present" : "absent"));
    return ImageState::Unpatched;
}

Buffer build_patched(const Buffer &original, const PatchDescriptor &desc) {
    Buffer out = original;
    for (const auto &e : desc.edits) out.overwrite_at(e.offset, e.replacement);
    // Marker goes in last
    out.overwrite_at(desc.marker_offset, desc.marker);
    return out;
}

Result<Inspection> Applier::inspect(const std::filesystem::path &path, const PatchDescriptor &desc) const {
    auto content = io_.read(path);
    if (!content) return Result<Inspection>::Err(content.error().as(ErrorCode::IoError));

    Inspection ins;
    ins.content = std::move(content).unwrap();
    ins.digest = crypto::digest_bytes(ins.content);
    ins.state = classify(ins.content, desc, &ins.detail);

    kmp_log_debug("%s: %s (%s), digest %s\n", path.c_str(), image_state_str(ins.state),
                  ins.detail.c_str(), ins.digest.short_hex().c_str());
    return Result<Inspection>::Ok(std::move(ins));
}

PatchResult Applier::roll_back(const std::string &module, const std::filesystem::path &path,
                               const BackupRecord &backup, const std::string &cause) {
    auto restored = store_.restore(backup, path);
    if (!restored) {
        kmp_log_error("%s: rollback failed, manual intervention required: %s\n",
                      module.c_str(), restored.error().c_str());
        return {PatchStatus::IoError, module,
                cause + "; rollback failed: " + restored.error().message};
    }

    auto after = io_.read(path);
    if (!after) {
        return {PatchStatus::IoError, module, cause + "; rollback unconfirmed: " + after.error().message};
    }
    if (crypto::digest_bytes(after.unwrap()) != backup.digest) {
        kmp_log_error("%s: restored file does not match backup %s\n", module.c_str(),
                      backup.digest.short_hex().c_str());
        return {PatchStatus::IoError, module, cause + "; restored file does not match its backup"};
    }

    kmp_log_warn("%s: rolled back to %s\n", module.c_str(), backup.digest.short_hex().c_str());
    return {PatchStatus::RolledBack, module, cause};
}

PatchResult Applier::commit(const std::string &module, const std::filesystem::path &path,
                            const PatchDescriptor &desc, const Inspection &before,
                            const BackupRecord &backup) {
    if (before.state != ImageState::Unpatched) {
        return {PatchStatus::OffsetMismatch, module, "module is not in a patchable state: " + before.detail};
    }
    if (backup.digest != before.digest) {
        return {PatchStatus::NotBackedUp, module, "backup does not match the inspected module"};
    }

    Buffer patched = build_patched(before.content, desc);

    auto written = io_.write_atomic(path, patched);
    if (!written) {
        // Atomic replace failed, the module should still hold the original
        auto now = io_.read(path);
        if (now && crypto::digest_bytes(now.unwrap()) == before.digest) {
            return {PatchStatus::IoError, module, "write failed, module unchanged: " + written.error().message};
        }
        return roll_back(module, path, backup, "write failed: " + written.error().message);
    }

    auto verified = verifier_.verify(path, desc, before.content.size());
    if (!verified) return roll_back(module, path, backup, "verification failed: " + verified.error().message);

    auto after = crypto::digest_bytes(patched);
    kmp_log_info("%s: patched %s (%s -> %s)\n", module.c_str(), path.c_str(),
                 before.digest.short_hex().c_str(), after.short_hex().c_str());
    return {PatchStatus::Success, module, "patched, digest " + after.hex()};
}

PatchResult Applier::apply(const std::filesystem::path &path, const PatchDescriptor &desc) {
    const std::string &module = desc.module;

    auto ins = inspect(path, desc);
    if (!ins) return PatchResult::from_error(module, ins.error());
    const auto &before = ins.unwrap();

    switch (before.state) {
    case ImageState::Patched:
        return {PatchStatus::AlreadyPatched, module, before.detail};
    case ImageState::Mismatch:
        return {PatchStatus::OffsetMismatch, module, before.detail};
    case ImageState::Unpatched:
        break;
    }

    auto saved = store_.save(path, before.digest);
    if (!saved) return PatchResult::from_error(module, saved.error());

    return commit(module, path, desc, before, saved.unwrap());
}

} // namespace patch
} // namespace kmp
