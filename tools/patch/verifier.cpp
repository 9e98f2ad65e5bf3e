/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "verifier.hpp"
#include "../core/logging.hpp"

#include <cinttypes>

namespace kmp {
namespace patch {

static std::string offset_str(uint64_t offset) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "0x%" PRIx64, offset);
    return buf;
}

std::vector<std::string> Verifier::check(const Buffer &content, const PatchDescriptor &desc,
                                         uint64_t original_size) {
    std::vector<std::string> problems;

    if (content.size() != original_size) {
        problems.push_back("length changed from " + std::to_string(original_size) + " to " +
                           std::to_string(content.size()));
    }

    for (const auto &e : desc.edits) {
        if (!content.matches_at(e.offset, e.replacement)) {
            problems.push_back("edit at " + offset_str(e.offset) + " not applied");
        }
    }

    if (!content.matches_at(desc.marker_offset, desc.marker)) {
        problems.push_back("marker missing at " + offset_str(desc.marker_offset));
    }
    return problems;
}

Result<void> Verifier::verify(const std::filesystem::path &path, const PatchDescriptor &desc,
                              uint64_t original_size) const {
    auto content = io_.read(path);
    if (!content) {
        return Result<void>::Err(ErrorCode::VerificationFailed,
                                 "re-read failed: " + content.error().message);
    }

    auto problems = check(content.unwrap(), desc, original_size);
    if (problems.empty()) {
        kmp_log_debug("verified %s (%zu edit(s) and marker)\n", path.c_str(), desc.edits.size());
        return Result<void>::Ok();
    }

    std::string msg;
    for (const auto &p : problems) {
        if (!msg.empty()) msg += "; ";
        msg += p;
    }
    kmp_log_warn("verification of %s failed: %s\n", path.c_str(), msg.c_str());
    return Result<void>::Err(ErrorCode::VerificationFailed, msg);
}

} // namespace patch
} // namespace kmp
