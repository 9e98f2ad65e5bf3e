/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kmp {
namespace driver {

inline constexpr const char *INFO_DRIVER_SESSION = "[driver]";

struct Detection {
    std::string version;
    std::string source;
    std::string detail;
};

// One way of finding the installed driver version. Implementations only
// read the system tree under `root` and never modify it.

class Detector {
public:
    virtual ~Detector() = default;
    virtual const char *name() const = 0;
    virtual std::optional<Detection> detect(const std::filesystem::path &root) const = 0;
};

// /proc/driver/nvidia/version, present while the module is loaded
class ProcVersionDetector : public Detector {
public:
    const char *name() const override { return "proc"; }
    std::optional<Detection> detect(const std::filesystem::path &root) const override;
};

// /sys/module/nvidia/version
class SysModuleDetector : public Detector {
public:
    const char *name() const override { return "sysfs"; }
    std::optional<Detection> detect(const std::filesystem::path &root) const override;
};

// version= from the .modinfo section of the installed nvidia.ko
class ModinfoDetector : public Detector {
public:
    const char *name() const override { return "modinfo"; }
    std::optional<Detection> detect(const std::filesystem::path &root) const override;
};

// libnvidia-ml.so.<version> in the usual library directories
class LibraryDetector : public Detector {
public:
    const char *name() const override { return "library"; }
    std::optional<Detection> detect(const std::filesystem::path &root) const override;
};

using DetectorList = std::vector<std::unique_ptr<Detector>>;

// proc, sysfs, modinfo, library
DetectorList default_detectors();

// First strategy that yields a version wins
std::optional<Detection> detect_driver(const DetectorList &detectors, const std::filesystem::path &root);

// Every strategy's finding, for reporting
std::vector<Detection> detect_all(const DetectorList &detectors, const std::filesystem::path &root);

// First dotted numeric token ("535.274.02") in `text`
std::optional<std::string> extract_version(std::string_view text);

} // namespace driver
} // namespace kmp
