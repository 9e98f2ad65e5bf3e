/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace kmp {

// Owned byte image of a file. Never resized by patch code.

class Buffer {
    std::vector<uint8_t> data_;

public:
    Buffer() = default;
    explicit Buffer(size_t size) : data_(size, 0) {}
    Buffer(size_t size, uint8_t fill) : data_(size, fill) {}
    Buffer(const void *data, size_t size) : data_(size) {
        if (data && size > 0) std::memcpy(data_.data(), data, size);
    }
    Buffer(std::span<const uint8_t> span) : data_(span.begin(), span.end()) {}
    Buffer(std::initializer_list<uint8_t> bytes) : data_(bytes) {}

    uint8_t *data() { return data_.data(); }
    const uint8_t *data() const { return data_.data(); }
    char *char_data() { return reinterpret_cast<char *>(data_.data()); }
    const char *char_data() const { return reinterpret_cast<const char *>(data_.data()); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    std::span<uint8_t> span() { return data_; }
    std::span<const uint8_t> span() const { return data_; }
    std::span<const uint8_t> span(size_t offset, size_t len) const { return {data_.data() + offset, len}; }

    uint8_t &operator[](size_t index) { return data_[index]; }
    const uint8_t &operator[](size_t index) const { return data_[index]; }

    template<typename T = void>
    const T *ptr_at(size_t offset = 0) const { return reinterpret_cast<const T *>(data_.data() + offset); }

    // True when `bytes` lies entirely inside the buffer at `offset` and matches
    bool matches_at(size_t offset, std::span<const uint8_t> bytes) const {
        if (!range_fits(offset, bytes.size(), data_.size())) return false;
        return std::equal(bytes.begin(), bytes.end(), data_.begin() + offset);
    }

    // In-bounds overwrite; returns false instead of growing the buffer
    bool overwrite_at(size_t offset, std::span<const uint8_t> bytes) {
        if (!range_fits(offset, bytes.size(), data_.size())) return false;
        std::copy(bytes.begin(), bytes.end(), data_.begin() + offset);
        return true;
    }

    void resize(size_t new_size) { data_.resize(new_size); }

    void append(const void *src, size_t len) {
        size_t old_size = data_.size();
        data_.resize(old_size + len);
        std::memcpy(data_.data() + old_size, src, len);
    }

    // First occurrence of `needle` at or after `start`
    std::optional<size_t> find(std::string_view needle, size_t start = 0) const {
        if (needle.empty() || start > data_.size()) return std::nullopt;
        auto it = std::search(data_.begin() + start, data_.end(), needle.begin(), needle.end(),
                              [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); });
        if (it == data_.end()) return std::nullopt;
        return static_cast<size_t>(it - data_.begin());
    }

    Buffer sub(size_t offset, size_t len) const { return {data_.data() + offset, len}; }

    bool operator==(const Buffer &other) const { return data_ == other.data_; }

    auto begin() { return data_.begin(); }
    auto end() { return data_.end(); }
    auto begin() const { return data_.begin(); }
    auto end() const { return data_.end(); }

    static Result<Buffer> from_file(const std::filesystem::path &path);
};

} // namespace kmp
