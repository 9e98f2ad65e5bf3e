/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2024 bmax121. All Rights Reserved.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kmp {

// Error taxonomy shared by every component

enum class ErrorCode {
    NotSupported,
    ModuleNotFound,
    OffsetMismatch,
    IoError,
    VerificationFailed,
    InsufficientStorage,
    NotBackedUp,
    NotFound,
    InvalidDescriptor,
    InvalidArgument,
};

inline const char *error_code_str(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotSupported: return "NotSupported";
    case ErrorCode::ModuleNotFound: return "ModuleNotFound";
    case ErrorCode::OffsetMismatch: return "OffsetMismatch";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::VerificationFailed: return "VerificationFailed";
    case ErrorCode::InsufficientStorage: return "InsufficientStorage";
    case ErrorCode::NotBackedUp: return "NotBackedUp";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::InvalidDescriptor: return "InvalidDescriptor";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::IoError;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    const char *c_str() const { return message.c_str(); }

    // Same message, different classification
    Error as(ErrorCode c) const { return {c, message}; }
};

// Result<T, E> - Error handling without exceptions
struct OkTag {};
struct ErrTag {};

template<typename T, typename E = Error>
class Result {
    union Storage {
        T ok_val;
        E err_val;
        Storage() {}
        ~Storage() {}
    } storage_;
    bool is_ok_;

    Result(OkTag, T val) : is_ok_(true) { new (&storage_.ok_val) T(std::move(val)); }
    Result(ErrTag, E err) : is_ok_(false) { new (&storage_.err_val) E(std::move(err)); }

    void destroy() {
        if (is_ok_) storage_.ok_val.~T();
        else storage_.err_val.~E();
    }

public:
    ~Result() { destroy(); }

    Result(const Result &other) : is_ok_(other.is_ok_) {
        if (is_ok_) new (&storage_.ok_val) T(other.storage_.ok_val);
        else new (&storage_.err_val) E(other.storage_.err_val);
    }

    Result(Result &&other) noexcept : is_ok_(other.is_ok_) {
        if (is_ok_) new (&storage_.ok_val) T(std::move(other.storage_.ok_val));
        else new (&storage_.err_val) E(std::move(other.storage_.err_val));
    }

    Result &operator=(const Result &other) {
        if (this != &other) { destroy(); new (this) Result(other); }
        return *this;
    }

    Result &operator=(Result &&other) noexcept {
        if (this != &other) { destroy(); new (this) Result(std::move(other)); }
        return *this;
    }

    static Result Ok(T val) { return Result(OkTag{}, std::move(val)); }
    static Result Err(E err) { return Result(ErrTag{}, std::move(err)); }
    static Result Err(ErrorCode code, std::string msg) { return Err(E{code, std::move(msg)}); }

    bool ok() const { return is_ok_; }
    explicit operator bool() const { return is_ok_; }

    T &unwrap() & { return storage_.ok_val; }
    const T &unwrap() const & { return storage_.ok_val; }
    T &&unwrap() && { return std::move(storage_.ok_val); }

    const E &error() const & { return storage_.err_val; }
    E &&error() && { return std::move(storage_.err_val); }
};

template<typename E>
class Result<void, E> {
    std::optional<E> error_;

public:
    Result() : error_(std::nullopt) {}
    Result(E err, bool) : error_(std::move(err)) {}

    static Result Ok() { return Result(); }
    static Result Err(E err) { return Result(std::move(err), false); }
    static Result Err(ErrorCode code, std::string msg) { return Err(E{code, std::move(msg)}); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return !error_.has_value(); }

    const E &error() const & { return *error_; }
    E &&error() && { return std::move(*error_); }
};

// Byte ranges [offset, offset + len)
constexpr bool ranges_overlap(uint64_t a_off, uint64_t a_len, uint64_t b_off, uint64_t b_len) noexcept {
    if (a_len == 0 || b_len == 0) return false;
    return a_off < b_off + b_len && b_off < a_off + a_len;
}

constexpr bool range_fits(uint64_t offset, uint64_t len, uint64_t total) noexcept {
    return offset <= total && len <= total - offset;
}

// Common constants
inline constexpr size_t IO_CHUNK_SIZE = 64 * 1024;
inline constexpr const char *ELF_MAGIC = "\x7f" "ELF";
inline constexpr size_t ELF_MAGIC_LEN = 4;

} // namespace kmp
