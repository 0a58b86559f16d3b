/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "MetadataCache.h"
#include "IAttributeProvider.h"
#include "TransactionContext.h"
#include "../Logging/Logger.h"
#include <algorithm>

namespace TransitEngine::Core::IO {

MetadataCache::MetadataCache(std::shared_ptr<IAttributeProvider> provider)
    : _provider(std::move(provider)) {
}

void MetadataCache::ensureFresh(EntryRecord& record) {
    if (record.state == HandleState::Stale) return;
    if (record.cache.state != CacheState::Empty) return;

    auto result = _provider->queryMetadata(record.path.extended);
    if (result) {
        record.cache.snapshot = *result;
        record.cache.state = CacheState::Cached;
    } else {
        record.cache.error = result.error;
        record.cache.state = CacheState::FetchFailed;
    }
}

void MetadataCache::invalidate(EntryRecord& record) {
    record.cache.reset();
}

void MetadataCache::refresh(EntryRecord& record) {
    invalidate(record);
    ensureFresh(record);
}

FileErrorInfo MetadataCache::readable(EntryRecord& record) {
    if (record.state == HandleState::Stale) {
        return FileErrorInfo::make(FileError::StaleHandle,
                                   "Entry was moved or deleted through another handle",
                                   record.path.canonical);
    }
    ensureFresh(record);
    if (record.cache.state == CacheState::FetchFailed) return record.cache.error;
    return {};
}

FileResult<uint64_t> MetadataCache::size(EntryRecord& record) {
    if (auto err = readable(record); !err.ok()) return FileResult<uint64_t>::failure(std::move(err));
    if (record.cache.snapshot.isDirectory()) {
        return FileResult<uint64_t>::failure(FileErrorInfo::make(FileError::NotAFile,
                                                                 "Entry is a directory", record.path.canonical));
    }
    return FileResult<uint64_t>::success(record.cache.snapshot.sizeBytes);
}

FileResult<FileAttributes> MetadataCache::attributes(EntryRecord& record) {
    if (auto err = readable(record); !err.ok()) return FileResult<FileAttributes>::failure(std::move(err));
    return FileResult<FileAttributes>::success(record.cache.snapshot.attributes);
}

FileResult<FileTime> MetadataCache::createdAt(EntryRecord& record) {
    if (auto err = readable(record); !err.ok()) return FileResult<FileTime>::failure(std::move(err));
    if (!record.cache.snapshot.createdAt) {
        return FileResult<FileTime>::failure(FileErrorInfo::make(FileError::Unsupported,
                                                                 "Filesystem does not record creation time",
                                                                 record.path.canonical));
    }
    return FileResult<FileTime>::success(*record.cache.snapshot.createdAt);
}

FileResult<FileTime> MetadataCache::modifiedAt(EntryRecord& record) {
    if (auto err = readable(record); !err.ok()) return FileResult<FileTime>::failure(std::move(err));
    return FileResult<FileTime>::success(record.cache.snapshot.modifiedAt);
}

FileResult<FileTime> MetadataCache::accessedAt(EntryRecord& record) {
    if (auto err = readable(record); !err.ok()) return FileResult<FileTime>::failure(std::move(err));
    return FileResult<FileTime>::success(record.cache.snapshot.accessedAt);
}

FileResult<MetadataSnapshot> MetadataCache::snapshot(EntryRecord& record) {
    if (auto err = readable(record); !err.ok()) return FileResult<MetadataSnapshot>::failure(std::move(err));
    return FileResult<MetadataSnapshot>::success(record.cache.snapshot);
}

bool MetadataCache::exists(EntryRecord& record) {
    return readable(record).ok();
}

template <typename Fn>
void MetadataCache::forEachLiveLocked(const std::string& canonicalPath, Fn&& fn) {
    auto it = _registry.find(canonicalPath);
    if (it == _registry.end()) return;

    auto& refs = it->second;
    refs.erase(std::remove_if(refs.begin(), refs.end(),
                              [](const std::weak_ptr<EntryRecord>& w) { return w.expired(); }),
               refs.end());
    for (auto& weak : refs) {
        if (auto rec = weak.lock()) fn(rec);
    }
    if (refs.empty()) _registry.erase(it);
}

void MetadataCache::track(const std::shared_ptr<EntryRecord>& record) {
    if (!record) return;
    std::lock_guard<std::mutex> lock(_registryMutex);
    auto& refs = _registry[record->path.canonical];
    refs.erase(std::remove_if(refs.begin(), refs.end(),
                              [](const std::weak_ptr<EntryRecord>& w) { return w.expired(); }),
               refs.end());
    refs.push_back(record);
}

void MetadataCache::invalidatePath(const std::string& canonicalPath) {
    std::lock_guard<std::mutex> lock(_registryMutex);
    forEachLiveLocked(canonicalPath, [](const std::shared_ptr<EntryRecord>& rec) { rec->cache.reset(); });
}

std::vector<std::weak_ptr<EntryRecord>> MetadataCache::markStale(const std::string& canonicalPath,
                                                                 const EntryRecord* except) {
    std::lock_guard<std::mutex> lock(_registryMutex);
    std::vector<std::weak_ptr<EntryRecord>> marked;
    forEachLiveLocked(canonicalPath, [&](const std::shared_ptr<EntryRecord>& rec) {
        if (rec.get() == except || rec->state == HandleState::Stale) return;
        rec->state = HandleState::Stale;
        rec->cache.reset();
        marked.push_back(rec);
    });
    if (!marked.empty()) {
        TRANSIT_LOG_DEBUG_CAT("MetadataCache", "Marked " + std::to_string(marked.size()) + " handle(s) stale for " + canonicalPath);
    }
    return marked;
}

void MetadataCache::retarget(const std::shared_ptr<EntryRecord>& record, const ResolvedPath& newPath) {
    if (!record) return;
    std::lock_guard<std::mutex> lock(_registryMutex);

    auto it = _registry.find(record->path.canonical);
    if (it != _registry.end()) {
        auto& refs = it->second;
        refs.erase(std::remove_if(refs.begin(), refs.end(),
                                  [&](const std::weak_ptr<EntryRecord>& w) {
                                      auto locked = w.lock();
                                      return !locked || locked == record;
                                  }),
                   refs.end());
        if (refs.empty()) _registry.erase(it);
    }

    record->path = newPath;
    record->state = HandleState::Valid;
    record->cache.reset();
    _registry[newPath.canonical].push_back(record);
}

void MetadataCache::restoreOnRollback(TransactionContext& tx, std::vector<std::string> paths,
                                      std::vector<std::weak_ptr<EntryRecord>> staled) {
    std::weak_ptr<bool> alive = _alive;
    tx.onRollback([this, alive, paths = std::move(paths), staled = std::move(staled)]() {
        if (alive.expired()) return;
        for (const auto& weak : staled) {
            if (auto rec = weak.lock()) {
                rec->state = HandleState::Valid;
                rec->cache.reset();
            }
        }
        for (const auto& path : paths) invalidatePath(path);
    });
}

void MetadataCache::retargetOnRollback(TransactionContext& tx, const std::shared_ptr<EntryRecord>& record,
                                       ResolvedPath previousPath, std::string previousInput) {
    std::weak_ptr<bool> alive = _alive;
    std::weak_ptr<EntryRecord> weak = record;
    tx.onRollback([this, alive, weak, previousPath = std::move(previousPath),
                   previousInput = std::move(previousInput)]() {
        if (alive.expired()) return;
        auto rec = weak.lock();
        if (!rec) return;
        retarget(rec, previousPath);
        rec->originalInput = previousInput;
        TRANSIT_LOG_DEBUG_CAT("MetadataCache", "Rolled handle back to " + previousPath.canonical);
    });
}

size_t MetadataCache::liveHandleCount(const std::string& canonicalPath) const {
    std::lock_guard<std::mutex> lock(_registryMutex);
    auto it = _registry.find(canonicalPath);
    if (it == _registry.end()) return 0;
    return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
                                             [](const std::weak_ptr<EntryRecord>& w) { return !w.expired(); }));
}

} // namespace TransitEngine::Core::IO
