/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#include "descriptor.hpp"
#include "../core/file.hpp"
#include "../core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace kmp {
namespace patch {

uint64_t PatchDescriptor::extent() const {
    uint64_t end = marker_offset + marker.size();
    for (const auto &e : edits) end = std::max<uint64_t>(end, e.offset + e.original.size());
    return end;
}

static Result<void> invalid(const PatchDescriptor &desc, const std::string &what) {
    return Result<void>::Err(ErrorCode::InvalidDescriptor,
                             desc.version + "/" + desc.module + ": " + what);
}

Result<void> validate(const PatchDescriptor &desc) {
    if (desc.version.empty() || desc.module.empty())
        return invalid(desc, "missing version or module");
    if (desc.edits.empty())
        return invalid(desc, "no edits");
    if (desc.marker.empty())
        return invalid(desc, "empty marker");

    for (size_t i = 0; i < desc.edits.size(); ++i) {
        const auto &e = desc.edits[i];
        if (e.original.empty())
            return invalid(desc, "edit " + std::to_string(i) + " is empty");
        if (e.original.size() != e.replacement.size())
            return invalid(desc, "edit " + std::to_string(i) + " changes length");
        if (e.original == e.replacement)
            return invalid(desc, "edit " + std::to_string(i) + " replaces bytes with themselves");

        for (size_t j = i + 1; j < desc.edits.size(); ++j) {
            const auto &o = desc.edits[j];
            if (ranges_overlap(e.offset, e.original.size(), o.offset, o.original.size()))
                return invalid(desc, "edits " + std::to_string(i) + " and " + std::to_string(j) + " overlap");
        }

        if (ranges_overlap(e.offset, e.original.size(), desc.marker_offset, desc.marker.size()))
            return invalid(desc, "marker overlaps edit " + std::to_string(i));
    }

    if (desc.expected_size && desc.extent() > *desc.expected_size)
        return invalid(desc, "edits extend past the expected module size");

    return Result<void>::Ok();
}

// DescriptorTable

Result<DescriptorTable> DescriptorTable::build(const std::vector<PatchDescriptor> &descriptors) {
    DescriptorTable table;
    for (const auto &desc : descriptors) {
        auto valid = validate(desc);
        if (!valid) return Result<DescriptorTable>::Err(valid.error());

        auto &set = table.sets_[desc.version];
        if (!set.emplace(desc.module, desc).second) {
            return Result<DescriptorTable>::Err(ErrorCode::InvalidDescriptor,
                                                "duplicate descriptor for " + desc.version + "/" + desc.module);
        }
    }
    return Result<DescriptorTable>::Ok(std::move(table));
}

Result<DescriptorTable> DescriptorTable::load(const std::vector<std::filesystem::path> &extra_files) {
    auto all = builtin_descriptors();
    for (const auto &path : extra_files) {
        auto parsed = load_descriptor_file(path);
        if (!parsed) return Result<DescriptorTable>::Err(parsed.error());
        kmp_log_info("loaded %zu descriptor(s) from %s\n", parsed.unwrap().size(), path.c_str());
        for (auto &d : parsed.unwrap()) all.push_back(std::move(d));
    }
    return build(all);
}

Result<const DescriptorSet *> DescriptorTable::lookup(const std::string &version) const {
    auto it = sets_.find(version);
    if (it == sets_.end()) {
        return Result<const DescriptorSet *>::Err(ErrorCode::NotSupported,
                                                  "No patch descriptors for driver " + version);
    }
    return Result<const DescriptorSet *>::Ok(&it->second);
}

const PatchDescriptor *DescriptorTable::find(const std::string &version, const std::string &module) const {
    auto it = sets_.find(version);
    if (it == sets_.end()) return nullptr;
    auto mit = it->second.find(module);
    return mit == it->second.end() ? nullptr : &mit->second;
}

std::vector<std::string> DescriptorTable::versions() const {
    std::vector<std::string> out;
    for (const auto &[version, set] : sets_) out.push_back(version);
    return out;
}

// Built-in entries

std::vector<PatchDescriptor> builtin_descriptors() {
    std::vector<PatchDescriptor> out;

    PatchDescriptor nv535;
    nv535.version = "535.274.02";
    nv535.module = "nvidia";
    nv535.edits.push_back({0x00123456, {0x85, 0xc0}, {0x90, 0x90}});
    nv535.marker_offset = 0x00123def;
    nv535.marker = {'N', 'V', 'P', 'T', 0x01, 0x00, 0x00, 0x00};
    out.push_back(std::move(nv535));

    return out;
}

// Descriptor file parsing

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<Bytes> parse_hex_bytes(std::string_view hex) {
    std::string digits;
    for (char c : hex) {
        if (c == ' ' || c == '_') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        digits += c;
    }
    if (digits.empty() || digits.size() % 2 != 0) return std::nullopt;

    Bytes out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::strtoul(digits.substr(i, 2).c_str(), nullptr, 16)));
    }
    return out;
}

std::optional<uint64_t> parse_offset(std::string_view text) {
    std::string s(trim(text));
    if (s.empty()) return std::nullopt;

    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s.c_str(), &end, 0);
    if (errno != 0 || end == s.c_str() || *end != '\0' || s[0] == '-') return std::nullopt;
    return static_cast<uint64_t>(v);
}

// "0xOFF:HEX[:HEX]" -> offset plus one or two byte sequences
static bool split_fields(std::string_view value, std::vector<std::string_view> &fields) {
    fields.clear();
    size_t start = 0;
    while (true) {
        size_t colon = value.find(':', start);
        fields.push_back(trim(value.substr(start, colon - start)));
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    return !fields.empty();
}

Result<std::vector<PatchDescriptor>> parse_descriptors(std::string_view text, std::string_view origin) {
    using R = Result<std::vector<PatchDescriptor>>;

    std::vector<PatchDescriptor> out;
    PatchDescriptor *current = nullptr;
    bool have_marker = false;
    std::vector<std::string_view> fields;

    auto fail = [&](size_t line_no, const std::string &what) {
        return R::Err(ErrorCode::InvalidDescriptor,
                      std::string(origin) + ":" + std::to_string(line_no) + ": " + what);
    };

    auto finish = [&](size_t line_no) -> Result<void> {
        if (!current) return Result<void>::Ok();
        if (!have_marker)
            return Result<void>::Err(ErrorCode::InvalidDescriptor,
                                     std::string(origin) + ":" + std::to_string(line_no) + ": descriptor without marker");
        return validate(*current);
    };

    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        std::string_view raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = nl == std::string_view::npos ? text.size() + 1 : nl + 1;
        ++line_no;

        // Strip trailing "; comment" and full-line "#" comments
        size_t semi = raw.find(';');
        std::string_view line = trim(semi == std::string_view::npos ? raw : raw.substr(0, semi));
        if (line.empty() || line[0] == '#') continue;

        if (line == "[descriptor]") {
            auto done = finish(line_no);
            if (!done) return R::Err(done.error());
            out.emplace_back();
            current = &out.back();
            have_marker = false;
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string_view::npos) return fail(line_no, "expected key=value");
        if (!current) return fail(line_no, "key outside a [descriptor] section");

        std::string_view key = trim(line.substr(0, eq));
        std::string_view value = trim(line.substr(eq + 1));

        if (key == "version") {
            current->version = std::string(value);
        } else if (key == "module") {
            current->module = std::string(value);
        } else if (key == "size") {
            auto size = parse_offset(value);
            if (!size) return fail(line_no, "bad size");
            current->expected_size = *size;
        } else if (key == "edit") {
            split_fields(value, fields);
            if (fields.size() != 3) return fail(line_no, "edit needs offset:original:replacement");
            auto off = parse_offset(fields[0]);
            auto orig = parse_hex_bytes(fields[1]);
            auto repl = parse_hex_bytes(fields[2]);
            if (!off || !orig || !repl) return fail(line_no, "bad edit");
            current->edits.push_back({*off, std::move(*orig), std::move(*repl)});
        } else if (key == "marker") {
            split_fields(value, fields);
            if (fields.size() != 2) return fail(line_no, "marker needs offset:bytes");
            auto off = parse_offset(fields[0]);
            auto bytes = parse_hex_bytes(fields[1]);
            if (!off || !bytes) return fail(line_no, "bad marker");
            current->marker_offset = *off;
            current->marker = std::move(*bytes);
            have_marker = true;
        } else {
            return fail(line_no, "unknown key '" + std::string(key) + "'");
        }
    }

    auto done = finish(line_no);
    if (!done) return R::Err(done.error());
    return R::Ok(std::move(out));
}

Result<std::vector<PatchDescriptor>> load_descriptor_file(const std::filesystem::path &path) {
    auto buf = file::read(path);
    if (!buf) return Result<std::vector<PatchDescriptor>>::Err(buf.error());
    const auto &data = buf.unwrap();
    return parse_descriptors(std::string_view(data.char_data(), data.size()), path.string());
}

} // namespace patch
} // namespace kmp
