/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file MetadataCache.h
 * @brief Lazily fetched, explicitly invalidated per-entry metadata
 *
 * Each FileEntryHandle owns one EntryRecord. The record holds the resolved path, the
 * handle state and a cache slot that is Empty, Cached or FetchFailed. A failed fetch is
 * kept in the slot and only turned into an error when a field is read.
 *
 * The cache also keeps a registry of live records per canonical path (weak references)
 * so the transfer engine can reach every handle that names a path it has just mutated.
 */
#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "FileError.h"
#include "FileMetadata.h"
#include "PathResolver.h"

namespace TransitEngine::Core::IO {

class IAttributeProvider; // fwd
class TransactionContext; // fwd

enum class HandleState { Valid, Stale };

enum class CacheState { Empty, Cached, FetchFailed };

struct CachedMetadata {
    CacheState state = CacheState::Empty;
    MetadataSnapshot snapshot;
    FileErrorInfo error;    // set when state == FetchFailed

    void reset() {
        state = CacheState::Empty;
        snapshot = MetadataSnapshot{};
        error = FileErrorInfo{};
    }
};

// Shared state behind a FileEntryHandle and its copies
struct EntryRecord {
    std::string originalInput;
    ResolvedPath path;
    HandleState state = HandleState::Valid;
    CachedMetadata cache;
};

class MetadataCache {
public:
    explicit MetadataCache(std::shared_ptr<IAttributeProvider> provider);

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    /**
     * @brief Fetches metadata into the record if its slot is not populated
     *
     * Fetch failures are stored, not returned. A Stale record is left untouched.
     */
    void ensureFresh(EntryRecord& record);
    // Clears the slot unconditionally; the next read re-queries
    void invalidate(EntryRecord& record);
    // invalidate + ensureFresh
    void refresh(EntryRecord& record);

    /**
     * @brief Size in bytes
     * @return Size, StaleHandle, the stored fetch error, or NotAFile for a directory
     */
    FileResult<uint64_t> size(EntryRecord& record);
    FileResult<FileAttributes> attributes(EntryRecord& record);
    FileResult<FileTime> createdAt(EntryRecord& record);
    FileResult<FileTime> modifiedAt(EntryRecord& record);
    FileResult<FileTime> accessedAt(EntryRecord& record);
    FileResult<MetadataSnapshot> snapshot(EntryRecord& record);

    // True only if the entry could be queried. Never fails.
    bool exists(EntryRecord& record);

    // Registry
    void track(const std::shared_ptr<EntryRecord>& record);
    // Invalidates every live record naming canonicalPath
    void invalidatePath(const std::string& canonicalPath);
    /**
     * @brief Marks every live record naming canonicalPath Stale and clears its slot
     * @param except Record left untouched (the handle performing the operation), may be null
     * @return The records that were marked
     */
    std::vector<std::weak_ptr<EntryRecord>> markStale(const std::string& canonicalPath,
                                                      const EntryRecord* except = nullptr);
    // Points record at newPath, moves it in the registry, revalidates it and clears its slot
    void retarget(const std::shared_ptr<EntryRecord>& record, const ResolvedPath& newPath);

    /**
     * @brief Undoes a mutation's cache effects if tx rolls back
     *
     * On rollback every live record naming one of paths is invalidated, and the records
     * in staled are made Valid again. Nothing happens if the cache is gone by then.
     */
    void restoreOnRollback(TransactionContext& tx, std::vector<std::string> paths,
                           std::vector<std::weak_ptr<EntryRecord>> staled = {});
    // On rollback, points record back at previousPath and restores its original input
    void retargetOnRollback(TransactionContext& tx, const std::shared_ptr<EntryRecord>& record,
                            ResolvedPath previousPath, std::string previousInput);
    // Number of live records naming canonicalPath
    size_t liveHandleCount(const std::string& canonicalPath) const;

    IAttributeProvider& provider() { return *_provider; }

private:
    // Calls fn on each live record for path and prunes expired ones. Caller holds _registryMutex.
    template <typename Fn>
    void forEachLiveLocked(const std::string& canonicalPath, Fn&& fn);

    FileErrorInfo readable(EntryRecord& record);

    std::shared_ptr<IAttributeProvider> _provider;
    // Expires with the cache; rollback hooks check it before touching the registry
    std::shared_ptr<bool> _alive = std::make_shared<bool>(true);

    mutable std::mutex _registryMutex;
    std::unordered_map<std::string, std::vector<std::weak_ptr<EntryRecord>>> _registry;
};

} // namespace TransitEngine::Core::IO
