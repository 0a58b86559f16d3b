/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file TransferEngine.h
 * @brief Copy, move and replace of single entries with progress and rollback
 *
 * One synchronous entry point, transfer(), selects the strategy from TransferOptions::mode.
 * Every step is journaled in a per-call TransactionContext. A failed or cancelled transfer
 * rolls its journal back before returning, so partial destinations never survive. A
 * successful one is folded into the caller's transaction when one is given and committed
 * otherwise.
 *
 * Strategies:
 * - Copy streams data in chunks. Overwriting copies stage into a hidden sibling and
 *   swap it in only after the data and metadata are complete.
 * - Move renames in place. A rename that crosses volumes falls back to copy followed by
 *   removal of the source, when allowCrossVolume is set.
 * - Replace archives the destination (to backupPath, or aside), moves the source in and
 *   merges the destination's permission bits and owner onto it.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "FileError.h"
#include "FileMetadata.h"
#include "PathResolver.h"
#include "ProgressChannel.h"
#include "TransferOptions.h"

namespace TransitEngine::Core::IO {

class IAttributeProvider; // fwd
class MetadataCache; // fwd
class TransactionContext; // fwd
struct EntryRecord; // fwd

class TransferEngine {
public:
    struct Config {
        size_t chunkSize;                   // bytes per read/write and per progress report
        uint64_t minReportIntervalBytes;    // skip reports closer together than this (0 = every chunk)
        bool simulateCrossVolume;           // every rename reports EXDEV, forcing the copy fallback

        Config()
            : chunkSize(64 * 1024)
            , minReportIntervalBytes(0)
            , simulateCrossVolume(false) {}
    };

    /**
     * @param resolver Resolves destination and backup paths
     * @param provider Metadata query/apply collaborator
     * @param cache Cache to notify after successful mutations (may be null)
     */
    TransferEngine(const PathResolver& resolver,
                   std::shared_ptr<IAttributeProvider> provider,
                   MetadataCache* cache = nullptr,
                   Config cfg = {});

    /**
     * @brief Transfers one entry
     *
     * Failure mapping: missing source or destination parent -> NotFound; permission
     * failure -> AccessDenied; existing destination under Fail -> AlreadyExists; directory
     * source -> NotAFile; same entry on both sides -> InvalidArgument; cross-volume without
     * allowCrossVolume -> Failed(EXDEV).
     *
     * @param sourceCanonical Canonical (or extended) source path
     * @param destRaw Raw destination path, resolved with destFormat
     * @param destFormat Interpretation of destRaw
     * @param options Mode, overwrite policy and flags
     * @param progress Optional callback; never invoked for a pure rename
     * @param tx Optional enclosing transaction; must be active
     * @return Completed/Cancelled/Stopped, or Failed with error set
     */
    TransferResult transfer(const std::string& sourceCanonical,
                            std::string_view destRaw,
                            PathFormat destFormat,
                            const TransferOptions& options,
                            ProgressCallback progress = {},
                            TransactionContext* tx = nullptr);

    /**
     * @brief Deletes a file entry
     *
     * A missing entry is a no-op. A read-only entry fails with AccessDenied unless
     * ignoreReadOnly is set. With a transaction the entry is stashed until commit.
     * Other live handles on the path become Stale.
     * @param except Handle record left Valid (the caller's own), may be null
     */
    FileErrorInfo remove(const ResolvedPath& path, bool ignoreReadOnly,
                         TransactionContext* tx = nullptr, const EntryRecord* except = nullptr);

    const Config& config() const noexcept { return _cfg; }

private:
    struct Operation;

    struct StepResult {
        FileErrorInfo error;
        uint64_t bytes = 0;
        bool aborted = false;
    };

    TransferResult copy(Operation& op);
    TransferResult move(Operation& op);
    TransferResult replace(Operation& op);

    // Streams from -> to in chunks, reporting to progress
    StepResult streamCopy(const std::string& from, const std::string& to, bool createNew,
                          const MetadataSnapshot& sourceMeta, Operation& op, ProgressChannel& progress);
    // Applies permission bits (and timestamps when requested) from meta onto path
    FileErrorInfo applyCopiedMetadata(const MetadataSnapshot& meta, const std::string& path,
                                      bool timestamps, Operation& op);
    // Renames, falling back to copy + stash of the origin when the rename crosses volumes
    StepResult relocate(const std::string& from, const std::string& to,
                        const MetadataSnapshot& fromMeta, Operation& op, ProgressChannel& progress);

    // Checks the parent of path is an existing directory
    FileErrorInfo checkParentDirectory(const ResolvedPath& path) const;

    const PathResolver& _resolver;
    std::shared_ptr<IAttributeProvider> _provider;
    MetadataCache* _cache;
    Config _cfg;
};

} // namespace TransitEngine::Core::IO
