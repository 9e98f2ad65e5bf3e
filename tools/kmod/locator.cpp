/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "locator.hpp"
#include "../core/file.hpp"
#include "../core/logging.hpp"

#include <algorithm>
#include <fstream>
#include <sys/utsname.h>

namespace kmp {
namespace kmod {

namespace fs = std::filesystem;

Result<KernelModule> resolve_module(const std::string &name, const fs::path &path) {
    auto size = file::regular_file_size(path);
    if (!size) {
        return Result<KernelModule>::Err(ErrorCode::ModuleNotFound, name + ": " + size.error().message);
    }
    return Result<KernelModule>::Ok(KernelModule{name, path, size.unwrap()});
}

fs::path under_root(const fs::path &root, const fs::path &abs) {
    if (root.empty() || root == "/") return abs;
    return root / abs.relative_path();
}

std::string kernel_release(const fs::path &root) {
    std::ifstream in(under_root(root, "/proc/sys/kernel/osrelease"));
    std::string release;
    if (in && std::getline(in, release) && !release.empty()) return release;

    if (root.empty() || root == "/") {
        struct utsname uts {};
        if (::uname(&uts) == 0) return uts.release;
    }
    return {};
}

// StaticModuleLocator

Result<ModuleMap> StaticModuleLocator::locate(const std::string &version) const {
    if (entries_.empty()) {
        return Result<ModuleMap>::Err(ErrorCode::ModuleNotFound, "No module paths given for " + version);
    }
    return Result<ModuleMap>::Ok(entries_);
}

// FsModuleLocator

FsModuleLocator::FsModuleLocator(fs::path root, std::string release)
    : root_(std::move(root)), release_(std::move(release)) {
    if (release_.empty()) release_ = kernel_release(root_);
}

std::vector<fs::path> FsModuleLocator::search_dirs(const std::string &version) const {
    std::vector<fs::path> dirs;
    if (!release_.empty()) dirs.push_back(under_root(root_, "/lib/modules/" + release_));
    for (const char *base : {"/usr/lib/x86_64-linux-gnu", "/usr/lib64", "/usr/lib", "/opt/nvidia"}) {
        dirs.push_back(under_root(root_, fs::path(base) / ("nvidia-" + version)));
    }
    return dirs;
}

static const char *canonical_name(const std::string &file_name) {
    for (const auto &m : KNOWN_MODULES) {
        if (file_name == m.file) return m.name;
    }
    return nullptr;
}

// modprobe order: updates/ overrides the rest of the tree
static bool preferred(const fs::path &dir, const fs::path &a, const fs::path &b) {
    auto in_updates = [&](const fs::path &p) {
        auto rel = p.lexically_relative(dir);
        return !rel.empty() && *rel.begin() == "updates";
    };
    bool ua = in_updates(a), ub = in_updates(b);
    if (ua != ub) return ua;
    return a < b;
}

Result<ModuleMap> FsModuleLocator::locate(const std::string &version) const {
    ModuleMap found;

    for (const auto &dir : search_dirs(version)) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        kmp_log_debug("scanning %s\n", dir.c_str());
        std::map<std::string, std::vector<fs::path>> candidates;
        auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
        for (auto end = fs::recursive_directory_iterator(); !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;

            const char *name = canonical_name(it->path().filename().string());
            if (!name || found.count(name)) continue;
            candidates[name].push_back(it->path());
        }
        if (ec) kmp_log_warn("Scan of %s stopped early: %s\n", dir.c_str(), ec.message().c_str());

        for (auto &[name, paths] : candidates) {
            std::sort(paths.begin(), paths.end(),
                      [&](const fs::path &a, const fs::path &b) { return preferred(dir, a, b); });
            found.emplace(name, paths.front());
            kmp_log_info("found module %s: %s\n", name.c_str(), paths.front().c_str());
            for (size_t i = 1; i < paths.size(); ++i) {
                kmp_log_warn("ignoring duplicate %s: %s\n", name.c_str(), paths[i].c_str());
            }
        }
    }

    if (found.empty()) {
        return Result<ModuleMap>::Err(ErrorCode::ModuleNotFound,
                                      "No kernel modules found for driver " + version);
    }
    return Result<ModuleMap>::Ok(std::move(found));
}

} // namespace kmod
} // namespace kmp
