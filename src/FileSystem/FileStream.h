/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once
#include <span>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <optional>
#include <string>
#include "FileError.h"

namespace TransitEngine::Core::IO {

// Result structure for I/O operations
struct IoResult {
    size_t bytesTransferred = 0;
    bool complete = false;
    std::optional<FileErrorInfo> error;

    bool success() const { return !error.has_value(); }
};

/**
 * @brief Options for opening a stream on a canonical path
 *
 * Share modes describe what other openers may still do and map onto advisory
 * flock() locks: None takes an exclusive lock, Read a shared lock, ReadWrite
 * takes no lock. A conflicting lock fails immediately with a retryable Failed.
 */
struct StreamOptions {
    enum Mode { Read, Write, ReadWrite };
    enum CreateMode { OpenExisting, OpenAlways, CreateNew, CreateAlways };
    enum ShareMode { ShareNone, ShareRead, ShareReadWrite };

    Mode mode = Read;
    CreateMode createMode = OpenExisting;
    ShareMode shareMode = ShareReadWrite;
    unsigned permissions = 0644;    // applied when the file is created (before umask)
    bool noBuffering = false;       // flush() pushes data to storage and drops it from the page cache
};

// Pure interface for file streaming
class FileStream {
public:
    virtual ~FileStream() = default;

    // Read into buffer, returns actual bytes read. Zero bytes with success means end of file.
    virtual IoResult read(std::span<std::byte> buffer) = 0;

    // Write all of data, returns actual bytes written
    virtual IoResult write(std::span<const std::byte> data) = 0;

    // Positioning
    virtual bool seek(int64_t offset, std::ios_base::seekdir dir = std::ios_base::beg) = 0;
    virtual int64_t tell() const = 0;

    // Stream state
    virtual bool good() const = 0;
    virtual bool eof() const = 0;
    virtual bool fail() const = 0;

    // Last error recorded by a failing call, if any
    virtual std::optional<FileErrorInfo> lastError() const = 0;

    // Flush any buffered data
    virtual void flush() = 0;

    // Close the stream (called automatically by destructor). Failure sets fail().
    virtual void close() = 0;

    // Size of the open file, if it can be determined
    virtual std::optional<uint64_t> size() const = 0;

    // Get underlying file path if applicable
    virtual std::string path() const { return ""; }
};

} // namespace TransitEngine::Core::IO
