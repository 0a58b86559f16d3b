/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace TransitEngine::Core::IO {

/**
 * Public error taxonomy surfaced by entry and transfer operations.
 * Mapping guidelines:
 * - InvalidArgument: empty/whitespace path, invalid characters, reserved names,
 *   source and destination naming the same entry
 * - NotFound: source missing, destination parent missing, replace target missing
 * - AlreadyExists: destination present under the Fail overwrite policy
 * - AccessDenied: EACCES/EPERM/EROFS, or deleting a read-only entry without override
 * - NotAFile: the entry is a directory where a plain file is required
 * - Unsupported: the platform or filesystem cannot perform the request
 * - StaleHandle: the handle's entry was moved or deleted through another handle
 * - Failed: any other native failure; systemError carries the native code
 *
 * Cancellation is not an error. See TransferStatus.
 */
enum class FileError {
    None = 0,
    InvalidArgument,
    NotFound,
    AlreadyExists,
    AccessDenied,
    NotAFile,
    Unsupported,
    StaleHandle,
    Failed
};

const char* toString(FileError error) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;

    bool ok() const noexcept { return code == FileError::None; }

    static FileErrorInfo make(FileError code, std::string message, std::string path = {},
                              std::optional<std::error_code> ec = std::nullopt) {
        FileErrorInfo info;
        info.code = code;
        info.message = std::move(message);
        info.path = std::move(path);
        info.systemError = ec;
        return info;
    }
};

/**
 * @brief Value-or-error result for synchronous operations
 *
 * Exactly one of value / error is meaningful: value is engaged iff error.code is None.
 */
template <typename T>
struct FileResult {
    std::optional<T> value;
    FileErrorInfo error;

    static FileResult success(T v) {
        FileResult r;
        r.value.emplace(std::move(v));
        return r;
    }
    static FileResult failure(FileErrorInfo e) {
        FileResult r;
        r.error = std::move(e);
        return r;
    }

    bool ok() const noexcept { return value.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const T& operator*() const& { return *value; }
    T& operator*() & { return *value; }
    const T* operator->() const { return &*value; }
    T* operator->() { return &*value; }
};

// Map errno to FileError
FileError mapErrnoToFileError(int err) noexcept;

// Builds an error from errno with the mapped code and native error_code attached.
FileErrorInfo errorFromErrno(int err, std::string message, std::string path = {});

/**
 * @brief Whether a Failed error is worth retrying by the caller
 *
 * True for transient native conditions (EBUSY, EAGAIN/EWOULDBLOCK, EINTR, ETXTBSY).
 * The engine itself never retries.
 */
bool isRetryable(const FileErrorInfo& info) noexcept;

} // namespace TransitEngine::Core::IO
