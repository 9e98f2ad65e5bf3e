/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "detector.hpp"
#include "../core/logging.hpp"
#include "../kmod/elf.hpp"
#include "../kmod/locator.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace kmp {
namespace driver {

namespace fs = std::filesystem;

std::optional<std::string> extract_version(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        size_t start = i;
        int dots = 0;
        while (i < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
            if (text[i] == '.') ++dots;
            ++i;
        }

        std::string_view token = text.substr(start, i - start);
        while (!token.empty() && token.back() == '.') {
            token.remove_suffix(1);
            --dots;
        }
        if (dots >= 1 && token.find("..") == std::string_view::npos) return std::string(token);
    }
    return std::nullopt;
}

static std::optional<std::string> read_text(const fs::path &path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::optional<Detection> ProcVersionDetector::detect(const fs::path &root) const {
    auto path = kmod::under_root(root, "/proc/driver/nvidia/version");
    auto text = read_text(path);
    if (!text) return std::nullopt;

    std::string_view view(*text);
    size_t pos = view.find("Kernel Module");
    auto version = extract_version(pos == std::string_view::npos ? view : view.substr(pos));
    if (!version) return std::nullopt;
    return Detection{*version, name(), path.string()};
}

std::optional<Detection> SysModuleDetector::detect(const fs::path &root) const {
    auto path = kmod::under_root(root, "/sys/module/nvidia/version");
    auto text = read_text(path);
    if (!text) return std::nullopt;

    auto version = extract_version(*text);
    if (!version) return std::nullopt;
    return Detection{*version, name(), path.string()};
}

std::optional<Detection> ModinfoDetector::detect(const fs::path &root) const {
    auto release = kmod::kernel_release(root);
    if (release.empty()) return std::nullopt;

    auto dir = kmod::under_root(root, "/lib/modules/" + release);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return std::nullopt;

    auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
    for (auto end = fs::recursive_directory_iterator(); !ec && it != end; it.increment(ec)) {
        if (it->path().filename() != "nvidia.ko" || !it->is_regular_file(ec)) continue;

        auto mod = kmod::ModuleImage::from_file(it->path());
        if (!mod) {
            kmp_log_debug("modinfo: %s: %s\n", it->path().c_str(), mod.error().c_str());
            continue;
        }
        auto version = extract_version(mod.unwrap().info().version);
        if (version) return Detection{*version, name(), it->path().string()};
    }
    return std::nullopt;
}

std::optional<Detection> LibraryDetector::detect(const fs::path &root) const {
    static constexpr std::string_view prefix = "libnvidia-ml.so.";

    for (const char *base : {"/usr/lib/x86_64-linux-gnu", "/usr/lib64", "/lib/x86_64-linux-gnu", "/lib64", "/usr/lib"}) {
        auto dir = kmod::under_root(root, base);
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::string file = it->path().filename().string();
            if (file.compare(0, prefix.size(), prefix) != 0) continue;

            // libnvidia-ml.so.1 is the soname link; only the full version counts
            auto version = extract_version(std::string_view(file).substr(prefix.size()));
            if (version) {
                return Detection{*version, name(), it->path().string()};
            }
        }
    }
    return std::nullopt;
}

DetectorList default_detectors() {
    DetectorList list;
    list.push_back(std::make_unique<ProcVersionDetector>());
    list.push_back(std::make_unique<SysModuleDetector>());
    list.push_back(std::make_unique<ModinfoDetector>());
    list.push_back(std::make_unique<LibraryDetector>());
    return list;
}

std::optional<Detection> detect_driver(const DetectorList &detectors, const fs::path &root) {
    for (const auto &d : detectors) {
        auto found = d->detect(root);
        if (found) {
            kmp_log_info("driver %s detected via %s (%s)\n",
                         found->version.c_str(), found->source.c_str(), found->detail.c_str());
            return found;
        }
        kmp_log_debug("detector %s: nothing found\n", d->name());
    }
    return std::nullopt;
}

std::vector<Detection> detect_all(const DetectorList &detectors, const fs::path &root) {
    std::vector<Detection> all;
    for (const auto &d : detectors) {
        if (auto found = d->detect(root)) all.push_back(std::move(*found));
    }
    return all;
}

} // namespace driver
} // namespace kmp
