/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "core/types.hpp"
#include "core/logging.hpp"
#include "crypto/digest.hpp"
#include "driver/detector.hpp"
#include "kmod/elf.hpp"
#include "kmod/locator.hpp"
#include "patch/backup.hpp"
#include "patch/descriptor.hpp"
#include "patch/orchestrator.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// Version from version file (set by CMake)
#ifndef KMP_VERSION_MAJOR
#define KMP_VERSION_MAJOR 0
#endif
#ifndef KMP_VERSION_MINOR
#define KMP_VERSION_MINOR 1
#endif
#ifndef KMP_VERSION_PATCH
#define KMP_VERSION_PATCH 0
#endif

namespace fs = std::filesystem;
using namespace kmp;

static const char *program_name = nullptr;

enum class Cmd { None, Help, Version, Detect, Patch, Rollback, Verify, List, Prune };

struct Args {
    Cmd cmd = Cmd::None;
    fs::path backup_dir = patch::DEFAULT_BACKUP_ROOT;
    std::vector<fs::path> descriptor_files;
    std::string driver_version;
    kmod::ModuleMap modules;
    fs::path root = "/";
    size_t jobs = 0;
    bool dry_run = false;
    fs::path log_file;
    int verbose = 0;
    size_t keep = 5;
    std::vector<std::string> positional;
};

static std::string version_str() {
    return std::to_string(KMP_VERSION_MAJOR) + "." + std::to_string(KMP_VERSION_MINOR) + "." +
           std::to_string(KMP_VERSION_PATCH);
}

static void print_usage() {
    std::fprintf(stdout,
        "kmodpatch - NVIDIA kernel module patcher v%s\n"
        "\n"
        "Usage: %s COMMAND [Options...] [MODULE...]\n"
        "\n"
        "COMMAND:\n"
        "  detect                           Print the installed driver version and its modules.\n"
        "  patch                            Back up and patch every module of the detected driver.\n"
        "  rollback [MODULE...]             Restore modules from their last backup for the driver\n"
        "                                   version (default: every module of its last run).\n"
        "  verify                           Report the patch state of every module.\n"
        "  list                             List recorded patch runs, newest first.\n"
        "  prune                            Delete old runs and unreferenced backups.\n"
        "  help                             Print this message.\n"
        "  version                          Print version number.\n"
        "\n"
        "Options:\n"
        "  -b, --backup-dir PATH            Backup store (default %s).\n"
        "  -d, --descriptors PATH           Load extra patch descriptors (can repeat).\n"
        "  -D, --driver-version VER         Skip detection and use this driver version.\n"
        "  -m, --module NAME=PATH           Use PATH for module NAME instead of scanning (can repeat).\n"
        "  -r, --root PATH                  System root used for detection and scanning (default /).\n"
        "  -j, --jobs N                     Modules processed in parallel.\n"
        "  -n, --dry-run                    Inspect and report only, never write.\n"
        "  -k, --keep N                     Runs kept by prune (default 5).\n"
        "  -l, --log-file PATH              Append a timestamped log to PATH.\n"
        "  -v, --verbose                    More output (repeat for debug).\n"
        "  -h, --help                       Print this message.\n"
        "\n"
        "Exit codes: 0 ok, 1 usage, 2 unsupported, 3 verification failed or rolled back,\n"
        "            4 I/O error, 5 not backed up, 6 offset mismatch, 7 module not found.\n"
        "\n",
        version_str().c_str(), program_name, patch::DEFAULT_BACKUP_ROOT);
}

static Cmd parse_cmd(std::string_view s) {
    if (s == "detect") return Cmd::Detect;
    if (s == "patch") return Cmd::Patch;
    if (s == "rollback") return Cmd::Rollback;
    if (s == "verify") return Cmd::Verify;
    if (s == "list") return Cmd::List;
    if (s == "prune") return Cmd::Prune;
    if (s == "help" || s == "-h" || s == "--help") return Cmd::Help;
    if (s == "version" || s == "--version") return Cmd::Version;
    return Cmd::None;
}

static bool parse_count(const char *text, size_t &out) {
    char *end = nullptr;
    unsigned long v = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || text[0] == '-') return false;
    out = v;
    return true;
}

static std::optional<Args> parse_args(int argc, char *argv[]) {
    if (argc < 2) return std::nullopt;

    Args a;
    a.cmd = parse_cmd(argv[1]);
    if (a.cmd == Cmd::None) {
        std::fprintf(stderr, "Unknown command: %s\n", argv[1]);
        return std::nullopt;
    }

    static struct option longopts[] = {
        {"backup-dir",     required_argument, nullptr, 'b'},
        {"descriptors",    required_argument, nullptr, 'd'},
        {"driver-version", required_argument, nullptr, 'D'},
        {"module",         required_argument, nullptr, 'm'},
        {"root",           required_argument, nullptr, 'r'},
        {"jobs",           required_argument, nullptr, 'j'},
        {"dry-run",        no_argument,       nullptr, 'n'},
        {"keep",           required_argument, nullptr, 'k'},
        {"log-file",       required_argument, nullptr, 'l'},
        {"verbose",        no_argument,       nullptr, 'v'},
        {"help",           no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    const char *optstr = "b:d:D:m:r:j:nk:l:vh";

    // The command word takes the place of argv[0]
    int sub_argc = argc - 1;
    char **sub_argv = argv + 1;
    optind = 1;

    int opt;
    while ((opt = getopt_long(sub_argc, sub_argv, optstr, longopts, nullptr)) != -1) {
        switch (opt) {
        case 'b':
            a.backup_dir = optarg;
            break;

        case 'd':
            a.descriptor_files.emplace_back(optarg);
            break;

        case 'D':
            a.driver_version = optarg;
            break;

        case 'm': {
            std::string_view spec = optarg;
            size_t eq = spec.find('=');
            if (eq == std::string_view::npos || eq == 0 || eq + 1 == spec.size()) {
                std::fprintf(stderr, "Invalid --module, expected NAME=PATH: %s\n", optarg);
                return std::nullopt;
            }
            a.modules[std::string(spec.substr(0, eq))] = fs::path(spec.substr(eq + 1));
            break;
        }

        case 'r':
            a.root = optarg;
            break;

        case 'j':
            if (!parse_count(optarg, a.jobs) || a.jobs == 0) {
                std::fprintf(stderr, "Invalid --jobs: %s\n", optarg);
                return std::nullopt;
            }
            break;

        case 'n':
            a.dry_run = true;
            break;

        case 'k':
            if (!parse_count(optarg, a.keep)) {
                std::fprintf(stderr, "Invalid --keep: %s\n", optarg);
                return std::nullopt;
            }
            break;

        case 'l':
            a.log_file = optarg;
            break;

        case 'v':
            ++a.verbose;
            break;

        case 'h':
            a.cmd = Cmd::Help;
            break;

        default:
            return std::nullopt;
        }
    }

    for (int i = optind; i < sub_argc; ++i) a.positional.emplace_back(sub_argv[i]);

    if (a.jobs == 0) {
        unsigned hw = std::thread::hardware_concurrency();
        a.jobs = std::clamp<size_t>(hw, 1, 4);
    }
    return a;
}

static void print_detection(const driver::Detection &d) {
    std::fprintf(stdout, "%s\n", driver::INFO_DRIVER_SESSION);
    std::fprintf(stdout, "version=%s\n", d.version.c_str());
    std::fprintf(stdout, "source=%s\n", d.source.c_str());
    std::fprintf(stdout, "detail=%s\n", d.detail.c_str());
}

static void print_result(const patch::PatchResult &r) {
    std::fprintf(stdout, "%-16s %-20s %s\n", r.module.c_str(), patch::status_str(r.status), r.message.c_str());
}

static std::unique_ptr<kmod::ModuleLocator> make_locator(const Args &a) {
    if (!a.modules.empty()) return std::make_unique<kmod::StaticModuleLocator>(a.modules);
    return std::make_unique<kmod::FsModuleLocator>(a.root);
}

// --driver-version, otherwise the first detector that finds one
static Result<std::string> resolve_version(const Args &a) {
    if (!a.driver_version.empty()) return Result<std::string>::Ok(a.driver_version);

    auto found = driver::detect_driver(driver::default_detectors(), a.root);
    if (!found) {
        return Result<std::string>::Err(ErrorCode::ModuleNotFound,
                                        "No NVIDIA driver detected under " + a.root.string());
    }
    return Result<std::string>::Ok(found->version);
}

static int report_error(const Error &err) {
    std::fprintf(stderr, "Error: %s\n", err.c_str());
    return patch::status_exit_code(patch::status_from_error(err.code));
}

static int cmd_detect(const Args &a) {
    auto detectors = driver::default_detectors();
    auto all = driver::detect_all(detectors, a.root);
    for (const auto &d : all) print_detection(d);

    auto version = resolve_version(a);
    if (!version) return report_error(version.error());

    std::fprintf(stdout, "[kernel]\nrelease=%s\n", kmod::kernel_release(a.root).c_str());

    auto locator = make_locator(a);
    auto located = locator->locate(version.unwrap());
    if (!located) return report_error(located.error());

    for (const auto &[name, path] : located.unwrap()) {
        std::fprintf(stdout, "[module %s]\npath=%s\n", name.c_str(), path.c_str());
        auto mod = kmod::resolve_module(name, path);
        if (!mod) {
            std::fprintf(stdout, "error=%s\n", mod.error().c_str());
            continue;
        }
        std::fprintf(stdout, "size=%llu\n", static_cast<unsigned long long>(mod.unwrap().size));

        auto image = kmod::ModuleImage::from_file(path);
        if (image) {
            image.unwrap().info().print();
        } else {
            kmp_log_warn("%s: %s\n", path.c_str(), image.error().c_str());
        }
    }
    return 0;
}

static int cmd_list(const patch::BackupStore &store) {
    auto runs = store.manifests();
    if (!runs) return report_error(runs.error());

    if (runs.unwrap().empty()) {
        std::fprintf(stdout, "No patch runs recorded in %s\n", store.root().c_str());
        return 0;
    }
    for (const auto &run : runs.unwrap()) {
        std::fprintf(stdout, "%s  version=%s  modules=%zu  %s\n", run.created.c_str(), run.version.c_str(),
                     run.modules.size(), run.file.filename().c_str());
        for (const auto &m : run.modules) {
            std::fprintf(stdout, "    %-16s %s  %s\n", m.name.c_str(), m.digest.short_hex().c_str(), m.path.c_str());
        }
    }
    return 0;
}

static int run(const Args &a) {
    switch (a.cmd) {
    case Cmd::Help:
        print_usage();
        return 0;
    case Cmd::Version:
        std::fprintf(stdout, "%s\n", version_str().c_str());
        return 0;
    case Cmd::Detect:
        return cmd_detect(a);
    default:
        break;
    }

    patch::BackupStore store(a.backup_dir);

    if (a.cmd == Cmd::List) return cmd_list(store);

    if (a.cmd == Cmd::Prune) {
        if (a.dry_run) {
            std::fprintf(stderr, "prune does not support --dry-run\n");
            return 1;
        }
        auto lock = patch::StoreLock::acquire(store.root());
        if (!lock) return report_error(lock.error());
        auto removed = store.prune(a.keep);
        if (!removed) return report_error(removed.error());
        std::fprintf(stdout, "Removed %zu file(s), kept %zu run(s)\n", removed.unwrap(), a.keep);
        return 0;
    }

    auto table = patch::DescriptorTable::load(a.descriptor_files);
    if (!table) {
        std::fprintf(stderr, "Error: %s\n", table.error().c_str());
        return 1;
    }
    auto shared_table = std::make_shared<patch::DescriptorTable>(std::move(table).unwrap());
    auto locator = make_locator(a);

    patch::OrchestratorOptions opts;
    opts.jobs = a.jobs;
    opts.dry_run = a.dry_run;
    patch::Orchestrator orchestrator(shared_table, *locator, store, opts);

    auto version = resolve_version(a);
    if (!version) return report_error(version.error());

    if (a.cmd == Cmd::Rollback) {
        auto report = orchestrator.rollback_all(version.unwrap(), a.positional);
        if (report.error) return report_error(*report.error);
        for (const auto &r : report.results) print_result(r);
        return report.exit_code();
    }

    if (a.cmd == Cmd::Verify) {
        auto report = orchestrator.verify(version.unwrap());
        if (report.error) return report_error(*report.error);
        std::fprintf(stdout, "[verify]\nversion=%s\nstatus=%s\n", report.version.c_str(), report.overall());
        for (const auto &m : report.modules) {
            std::fprintf(stdout, "%-16s %-10s %s\n", m.module.c_str(), patch::module_check_str(m.state),
                         m.detail.c_str());
        }
        return report.exit_code();
    }

    auto report = orchestrator.patch(version.unwrap());
    if (report.error) return report_error(*report.error);
    for (const auto &r : report.results) print_result(r);
    if (!report.manifest.empty()) std::fprintf(stdout, "manifest=%s\n", report.manifest.c_str());
    return report.exit_code();
}

int main(int argc, char *argv[]) {
    program_name = argv[0];

    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    log::set_verbosity(args->verbose);
    if (!args->log_file.empty()) {
        auto opened = log::open_file(args->log_file);
        if (!opened) {
            std::fprintf(stderr, "Error: %s\n", opened.error().c_str());
            return 1;
        }
    }

    int ret = run(*args);
    log::close_file();
    return ret;
}
