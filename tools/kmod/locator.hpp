/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace kmp {
namespace kmod {

// Canonical module name -> on-disk file name
struct ModuleFileName {
    const char *name;
    const char *file;
};

inline constexpr ModuleFileName KNOWN_MODULES[] = {
    {"nvidia", "nvidia.ko"},
    {"nvidia-modeset", "nvidia-modeset.ko"},
    {"nvidia-drm", "nvidia-drm.ko"},
    {"nvidia-uvm", "nvidia-uvm.ko"},
};

using ModuleMap = std::map<std::string, std::filesystem::path>;

struct KernelModule {
    std::string name;
    std::filesystem::path path;
    uint64_t size = 0;
};

// Confirms `path` is an existing regular file (ModuleNotFound otherwise)
Result<KernelModule> resolve_module(const std::string &name, const std::filesystem::path &path);

// Resolves a driver version to module files

class ModuleLocator {
public:
    virtual ~ModuleLocator() = default;
    virtual Result<ModuleMap> locate(const std::string &version) const = 0;
};

// Explicit name=path entries supplied by the caller
class StaticModuleLocator : public ModuleLocator {
    ModuleMap entries_;

public:
    explicit StaticModuleLocator(ModuleMap entries) : entries_(std::move(entries)) {}
    Result<ModuleMap> locate(const std::string &version) const override;
};

// Scans the module tree of the running kernel and versioned vendor directories
class FsModuleLocator : public ModuleLocator {
    std::filesystem::path root_;
    std::string release_;

public:
    explicit FsModuleLocator(std::filesystem::path root = "/", std::string release = {});

    Result<ModuleMap> locate(const std::string &version) const override;

    const std::string &release() const { return release_; }

    std::vector<std::filesystem::path> search_dirs(const std::string &version) const;
};

// Kernel release of the system under `root` (osrelease, then uname)
std::string kernel_release(const std::filesystem::path &root);

// `root` joined with an absolute system path
std::filesystem::path under_root(const std::filesystem::path &root, const std::filesystem::path &abs);

} // namespace kmod
} // namespace kmp
