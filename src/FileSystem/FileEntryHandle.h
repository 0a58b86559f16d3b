/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file FileEntryHandle.h
 * @brief Copyable handle to one filesystem entry
 *
 * FileEntryHandle names an entry by its resolved path and exposes cached metadata and
 * the transfer operations. Creating a handle performs no I/O; the first metadata read
 * queries the OS and later reads are served from the cache until something invalidates it.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "FileError.h"
#include "FileMetadata.h"
#include "FileStream.h"
#include "MetadataCache.h"
#include "ProgressChannel.h"
#include "TransferOptions.h"

namespace TransitEngine::Core::IO {

class FileEntrySystem; // fwd
class TransactionContext; // fwd

/**
 * @brief Value handle to a file entry bound to a FileEntrySystem
 *
 * Construct via FileEntrySystem::createEntryHandle(). Copies share state: a move
 * through one copy retargets all of them. Independently created handles for the
 * same path do not; they become Stale when the entry is moved or deleted elsewhere,
 * and metadata reads on a Stale handle fail with StaleHandle.
 *
 * The owning FileEntrySystem must outlive the handle.
 *
 * @code
 * FileEntrySystem fs;
 * auto entry = fs.createEntryHandle("data/report.csv");
 * if (entry && entry->exists()) {
 *     TransferOptions opts;
 *     opts.overwritePolicy = OverwritePolicy::Overwrite;
 *     auto r = entry->moveTo("archive/report.csv", opts);
 *     // entry->canonicalPath() now names the archive copy
 * }
 * @endcode
 */
class FileEntryHandle {
private:
    FileEntryHandle(FileEntrySystem* system, std::shared_ptr<EntryRecord> record);

public:
    // Identity
    const std::string& originalInput() const noexcept { return _record->originalInput; }
    const std::string& canonicalPath() const noexcept { return _record->path.canonical; }
    // Canonical path, long-path-escaped when over the threshold
    const std::string& extendedPath() const noexcept { return _record->path.extended; }
    HandleState state() const noexcept { return _record->state; }
    bool isStale() const noexcept { return _record->state == HandleState::Stale; }

    // Final path component, e.g. "report.csv"
    std::string name() const;
    // Parent directory of the canonical path
    std::string directoryName() const;
    // Extension including the leading dot, empty if none
    std::string extension() const;
    // The path as the caller supplied it (or the destination path after a move)
    std::string toString() const;

    // Metadata (cached)
    bool exists() const;
    /**
     * @brief Size in bytes
     * @return Size, or NotAFile for a directory, StaleHandle, or the query error
     */
    FileResult<uint64_t> length() const;
    FileResult<FileAttributes> attributes() const;
    // False when the entry cannot be queried
    bool isReadOnly() const;
    /**
     * @brief Sets or clears the read-only attribute (owner write permission)
     *
     * Invalidates every handle naming this path.
     */
    FileErrorInfo setReadOnly(bool readOnly);
    FileResult<FileTime> creationTime() const;
    FileResult<FileTime> lastWriteTime() const;
    FileResult<FileTime> lastAccessTime() const;
    FileResult<MetadataSnapshot> metadata() const;

    // Forces a re-query now
    void refresh();
    // Drops the cached metadata; the next read re-queries
    void invalidate();

    // Streams
    /**
     * @brief Opens a stream on the entry
     *
     * A stream opened for writing invalidates every handle naming this path. Data written
     * through it later is seen after the next invalidate() or refresh().
     * @return The stream, or StaleHandle, NotFound, AlreadyExists, AccessDenied, NotAFile, Failed
     */
    FileResult<std::unique_ptr<FileStream>> open(const StreamOptions& options) const;
    // Existing entry, read-only, other readers allowed
    FileResult<std::unique_ptr<FileStream>> openRead() const;
    // Created if missing and not truncated, write-only, no sharing
    FileResult<std::unique_ptr<FileStream>> openWrite() const;
    // Created or truncated, read-write, no sharing
    FileResult<std::unique_ptr<FileStream>> create() const;

    // Transfers
    /**
     * @brief Copies this entry to destination
     *
     * options.mode is ignored. On success the returned destinationPath is canonical;
     * this handle keeps naming the source.
     */
    TransferResult copyTo(std::string_view destination,
                          TransferOptions options = {},
                          ProgressCallback progress = {},
                          TransactionContext* tx = nullptr) const;
    /**
     * @brief Moves this entry to destination
     *
     * On success this handle (and its copies) name the destination. Other handles
     * on the old path become Stale.
     */
    TransferResult moveTo(std::string_view destination,
                          TransferOptions options = {},
                          ProgressCallback progress = {},
                          TransactionContext* tx = nullptr);
    /**
     * @brief Replaces destination with this entry
     *
     * The destination must exist. Set options.backupPath to archive it first, and
     * options.ignoreMetadataErrors to proceed when its permissions or owner cannot be
     * carried over. On success this handle names the destination.
     */
    TransferResult replace(std::string_view destination,
                           TransferOptions options = {},
                           ProgressCallback progress = {},
                           TransactionContext* tx = nullptr);
    /**
     * @brief Deletes the entry
     *
     * A missing entry is a no-op. A read-only entry fails with AccessDenied unless
     * ignoreReadOnly is set.
     */
    FileErrorInfo remove(bool ignoreReadOnly = false, TransactionContext* tx = nullptr);

    friend bool operator==(const FileEntryHandle& a, const FileEntryHandle& b) noexcept {
        return a._system == b._system && a.canonicalPath() == b.canonicalPath();
    }
    friend bool operator!=(const FileEntryHandle& a, const FileEntryHandle& b) noexcept { return !(a == b); }

private:
    TransferResult relocate(TransferMode mode, std::string_view destination, TransferOptions options,
                            ProgressCallback progress, TransactionContext* tx);
    FileErrorInfo staleError() const;

    FileEntrySystem* _system = nullptr;
    std::shared_ptr<EntryRecord> _record;

    friend class FileEntrySystem;
};

} // namespace TransitEngine::Core::IO
