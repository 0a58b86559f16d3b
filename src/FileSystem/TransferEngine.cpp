/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "TransferEngine.h"
#include "IAttributeProvider.h"
#include "LocalFileStream.h"
#include "MetadataCache.h"
#include "TransactionContext.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

#include <unistd.h>    // close(), unlink()

namespace TransitEngine::Core::IO {

const char* toString(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Completed: return "Completed";
        case TransferStatus::Cancelled: return "Cancelled";
        case TransferStatus::Stopped: return "Stopped";
        case TransferStatus::Failed: return "Failed";
    }
    return "Unknown";
}

const char* toString(TransferMode mode) noexcept {
    switch (mode) {
        case TransferMode::Copy: return "Copy";
        case TransferMode::Move: return "Move";
        case TransferMode::Replace: return "Replace";
    }
    return "Unknown";
}

struct TransferEngine::Operation {
    ResolvedPath source;
    ResolvedPath destination;
    std::optional<ResolvedPath> backup;
    const TransferOptions& options;
    ProgressChannel& progress;
    TransactionContext& journal;
    MetadataSnapshot sourceMeta;
};

namespace {
    constexpr const char* kLogCategory = "TransferEngine";

    // Existence of the path itself, without following a final symlink
    bool entryPresent(const std::string& path, bool* isDirectory = nullptr) {
        std::error_code ec;
        auto st = std::filesystem::symlink_status(PathResolver::toNativePath(path), ec);
        if (ec || st.type() == std::filesystem::file_type::not_found) return false;
        if (isDirectory) *isDirectory = st.type() == std::filesystem::file_type::directory;
        return true;
    }

    int nativeRename(const std::string& from, const std::string& to) {
        const std::string a = PathResolver::toNativePath(from);
        const std::string b = PathResolver::toNativePath(to);
        if (::rename(a.c_str(), b.c_str()) == 0) return 0;
        return errno;
    }

    // Reserves a hidden sibling of path to stage data in
    FileResult<std::string> reserveStagingPath(const std::string& path) {
        std::filesystem::path p(PathResolver::toNativePath(path));
        std::string tmpl = (p.parent_path() / ("." + p.filename().string() + ".transit-tmp.XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        int fd = ::mkstemp(buf.data());
        if (fd < 0) {
            return FileResult<std::string>::failure(errorFromErrno(errno, "Cannot create staging file", path));
        }
        ::close(fd);
        return FileResult<std::string>::success(std::string(buf.data()));
    }

    TransferStatus abortStatus(const ProgressChannel& progress) {
        return progress.abortReason() == ProgressResult::StopAndQuiet ? TransferStatus::Stopped
                                                                      : TransferStatus::Cancelled;
    }
}

TransferEngine::TransferEngine(const PathResolver& resolver,
                               std::shared_ptr<IAttributeProvider> provider,
                               MetadataCache* cache,
                               Config cfg)
    : _resolver(resolver)
    , _provider(std::move(provider))
    , _cache(cache)
    , _cfg(cfg) {
    TRANSIT_ASSERT(_provider, "TransferEngine requires an attribute provider");
    if (_cfg.chunkSize == 0) _cfg.chunkSize = Config().chunkSize;
}

FileErrorInfo TransferEngine::checkParentDirectory(const ResolvedPath& path) const {
    auto parent = std::filesystem::path(path.canonical).parent_path().generic_string();
    if (parent.empty() || parent == path.canonical) return {};

    auto meta = _provider->queryMetadata(parent);
    if (!meta) {
        if (meta.error.code == FileError::NotFound) {
            return FileErrorInfo::make(FileError::NotFound, "Destination directory not found", path.canonical,
                                       meta.error.systemError);
        }
        return meta.error;
    }
    if (!meta->isDirectory()) {
        return FileErrorInfo::make(FileError::NotFound, "Destination parent is not a directory", path.canonical);
    }
    return {};
}

TransferResult TransferEngine::transfer(const std::string& sourceCanonical,
                                        std::string_view destRaw,
                                        PathFormat destFormat,
                                        const TransferOptions& options,
                                        ProgressCallback progress,
                                        TransactionContext* tx) {
    if (tx && !tx->isActive()) {
        return TransferResult::failed(FileErrorInfo::make(FileError::InvalidArgument,
                                                          "Transaction is no longer active"));
    }

    auto source = _resolver.resolve(sourceCanonical, PathFormat::AlreadyCanonical);
    if (!source) return TransferResult::failed(source.error);

    auto destination = _resolver.resolve(destRaw, destFormat);
    if (!destination) return TransferResult::failed(destination.error);

    if (source->canonical == destination->canonical) {
        return TransferResult::failed(FileErrorInfo::make(FileError::InvalidArgument,
                                                          "Source and destination are the same entry",
                                                          destination->canonical),
                                      destination->canonical);
    }

    auto sourceMeta = _provider->queryMetadata(source->extended);
    if (!sourceMeta) return TransferResult::failed(sourceMeta.error, destination->canonical);
    if (sourceMeta->isDirectory()) {
        return TransferResult::failed(FileErrorInfo::make(FileError::NotAFile, "Source is a directory",
                                                          source->canonical),
                                      destination->canonical);
    }

    if (auto err = checkParentDirectory(*destination); !err.ok()) {
        return TransferResult::failed(std::move(err), destination->canonical);
    }

    // Hard links and other aliases of the source are the same entry too
    if (entryPresent(destination->extended)) {
        auto destMeta = _provider->queryMetadata(destination->extended);
        if (destMeta && destMeta->sameEntryAs(*sourceMeta)) {
            return TransferResult::failed(FileErrorInfo::make(FileError::InvalidArgument,
                                                              "Source and destination are the same entry",
                                                              destination->canonical),
                                          destination->canonical);
        }
    }

    std::optional<ResolvedPath> backup;
    if (options.mode == TransferMode::Replace && options.backupPath) {
        auto resolvedBackup = _resolver.resolve(*options.backupPath, PathFormat::Relative);
        if (!resolvedBackup) return TransferResult::failed(resolvedBackup.error, destination->canonical);
        if (resolvedBackup->canonical == source->canonical || resolvedBackup->canonical == destination->canonical) {
            return TransferResult::failed(FileErrorInfo::make(FileError::InvalidArgument,
                                                              "Backup path must differ from source and destination",
                                                              resolvedBackup->canonical),
                                          destination->canonical);
        }
        if (auto err = checkParentDirectory(*resolvedBackup); !err.ok()) {
            return TransferResult::failed(std::move(err), destination->canonical);
        }
        backup = *resolvedBackup;
    }

    TRANSIT_LOG_DEBUG_CAT(kLogCategory, std::string(toString(options.mode)) + " " + source->canonical +
                          " -> " + destination->canonical);

    ProgressChannel channel(std::move(progress), _cfg.minReportIntervalBytes);
    TransactionContext journal;
    Operation op{*source, *destination, backup, options, channel, journal, *sourceMeta};

    TransferResult result;
    switch (options.mode) {
        case TransferMode::Copy: result = copy(op); break;
        case TransferMode::Move: result = move(op); break;
        case TransferMode::Replace: result = replace(op); break;
    }
    result.destinationPath = destination->canonical;

    if (result.status != TransferStatus::Completed) {
        // The original outcome is what the caller sees; leftovers are reported here
        if (auto cleanup = journal.rollback(); !cleanup.ok()) {
            TRANSIT_LOG_ERROR_CAT(kLogCategory, "Rollback left artifacts behind: " + cleanup.message +
                                  " (" + cleanup.path + ")");
        }
        if (result.status == TransferStatus::Failed) {
            TRANSIT_LOG_DEBUG_CAT(kLogCategory, std::string(toString(options.mode)) + " failed: " +
                                  result.error.message + " (" + toString(result.error.code) + ")");
        } else {
            TRANSIT_LOG_DEBUG_CAT(kLogCategory, std::string(toString(options.mode)) + " " +
                                  toString(result.status) + " after " + std::to_string(result.bytesTransferred) + " bytes");
        }
        return result;
    }

    if (tx) {
        tx->absorb(journal);
    } else if (auto err = journal.commit(); !err.ok()) {
        // The transfer itself is complete; a leftover stash is reported in the log only
        TRANSIT_LOG_WARNING_CAT(kLogCategory, "Transfer completed but cleanup failed: " + err.message);
    }

    if (_cache) {
        std::vector<std::string> touched{destination->canonical};
        std::vector<std::weak_ptr<EntryRecord>> staled;
        _cache->invalidatePath(destination->canonical);
        if (options.mode != TransferMode::Copy) {
            staled = _cache->markStale(source->canonical);
            touched.push_back(source->canonical);
        }
        if (backup) {
            _cache->invalidatePath(backup->canonical);
            touched.push_back(backup->canonical);
        }
        if (tx) _cache->restoreOnRollback(*tx, std::move(touched), std::move(staled));
    }

    TRANSIT_LOG_DEBUG_CAT(kLogCategory, std::string(toString(options.mode)) + " completed: " +
                          std::to_string(result.bytesTransferred) + " bytes");
    return result;
}

TransferEngine::StepResult TransferEngine::streamCopy(const std::string& from, const std::string& to, bool createNew,
                                                      const MetadataSnapshot& sourceMeta, Operation& op,
                                                      ProgressChannel& progress) {
    StepResult step;

    StreamOptions in;
    in.mode = StreamOptions::Read;
    in.shareMode = StreamOptions::ShareRead;
    auto src = LocalFileStream::open(from, in);
    if (!src) {
        step.error = src.error;
        return step;
    }

    StreamOptions out;
    out.mode = StreamOptions::Write;
    out.createMode = createNew ? StreamOptions::CreateNew : StreamOptions::CreateAlways;
    out.shareMode = StreamOptions::ShareNone;
    out.permissions = (sourceMeta.mode & 0777) | 0200;
    out.noBuffering = op.options.noBuffering;
    auto dst = LocalFileStream::open(to, out);
    if (!dst) {
        step.error = dst.error;
        return step;
    }
    if (createNew) op.journal.recordCreated(to);

    const uint64_t total = (*src)->size().value_or(sourceMeta.sizeBytes);
    if (!progress.begin(total)) {
        step.aborted = true;
        return step;
    }

    std::vector<std::byte> buffer(_cfg.chunkSize);
    for (;;) {
        auto r = (*src)->read(buffer);
        if (!r.success()) {
            step.error = *r.error;
            return step;
        }
        if (r.bytesTransferred == 0) break;

        auto w = (*dst)->write(std::span<const std::byte>(buffer.data(), r.bytesTransferred));
        step.bytes += w.bytesTransferred;
        if (!w.success()) {
            step.error = *w.error;
            return step;
        }
        if (!progress.advance(step.bytes, std::max(total, step.bytes))) {
            step.aborted = true;
            return step;
        }
    }

    (*dst)->close();
    if ((*dst)->fail()) {
        step.error = (*dst)->lastError().value_or(FileErrorInfo::make(FileError::Failed, "Close failed", to));
    }
    return step;
}

FileErrorInfo TransferEngine::applyCopiedMetadata(const MetadataSnapshot& meta, const std::string& path,
                                                  bool timestamps, Operation& op) {
    auto err = _provider->setPermissions(path, meta.mode);
    if (err.ok() && timestamps) err = _provider->setTimestamps(path, meta.timestamps());
    if (!err.ok() && op.options.ignoreMetadataErrors) {
        TRANSIT_LOG_WARNING_CAT(kLogCategory, "Ignoring metadata error on " + path + ": " + err.message);
        return {};
    }
    return err;
}

TransferEngine::StepResult TransferEngine::relocate(const std::string& from, const std::string& to,
                                                    const MetadataSnapshot& fromMeta, Operation& op,
                                                    ProgressChannel& progress) {
    StepResult step;
    if (!_cfg.simulateCrossVolume) {
        int err = nativeRename(from, to);
        if (err == 0) {
            op.journal.recordRename(from, to);
            return step;
        }
        if (err != EXDEV) {
            step.error = errorFromErrno(err, "Rename failed", from);
            return step;
        }
    }

    if (!op.options.allowCrossVolume) {
        step.error = FileErrorInfo::make(FileError::Failed, "Source and destination are on different volumes", to,
                                         std::error_code(EXDEV, std::generic_category()));
        return step;
    }

    TRANSIT_LOG_WARNING_CAT(kLogCategory, "Rename crosses volumes, copying instead: " + from + " -> " + to);
    step = streamCopy(from, to, true, fromMeta, op, progress);
    if (step.aborted || !step.error.ok()) return step;

    // The fallback always carries timestamps so the result looks like a rename
    if (auto err = applyCopiedMetadata(fromMeta, to, true, op); !err.ok()) {
        step.error = std::move(err);
        return step;
    }

    // The origin goes only after the copy is complete, and stays recoverable until commit
    auto stashed = op.journal.stash(from);
    if (!stashed) step.error = stashed.error;
    return step;
}

TransferResult TransferEngine::copy(Operation& op) {
    const std::string& dst = op.destination.extended;

    bool destIsDirectory = false;
    const bool destExists = entryPresent(dst, &destIsDirectory);
    if (destExists) {
        if (op.options.overwritePolicy == OverwritePolicy::Fail) {
            return TransferResult::failed(FileErrorInfo::make(FileError::AlreadyExists,
                                                              "Destination already exists", op.destination.canonical));
        }
        if (destIsDirectory) {
            return TransferResult::failed(FileErrorInfo::make(FileError::NotAFile,
                                                              "Destination is a directory", op.destination.canonical));
        }
    }

    std::string target = dst;
    if (destExists) {
        auto staging = reserveStagingPath(dst);
        if (!staging) return TransferResult::failed(staging.error);
        op.journal.recordCreated(*staging);
        target = *staging;
    }

    auto step = streamCopy(op.source.extended, target, !destExists, op.sourceMeta, op, op.progress);
    TransferResult result;
    result.bytesTransferred = step.bytes;
    if (step.aborted) {
        result.status = abortStatus(op.progress);
        return result;
    }
    if (!step.error.ok()) return TransferResult::failed(std::move(step.error));

    if (auto err = applyCopiedMetadata(op.sourceMeta, target, op.options.preserveTimestamps, op); !err.ok()) {
        return TransferResult::failed(std::move(err));
    }

    if (destExists) {
        auto stashed = op.journal.stash(dst);
        if (!stashed) return TransferResult::failed(stashed.error);
        if (int err = nativeRename(target, dst); err != 0) {
            return TransferResult::failed(errorFromErrno(err, "Cannot move staged copy into place", op.destination.canonical));
        }
        op.journal.recordRename(target, dst);
    }

    result.status = TransferStatus::Completed;
    return result;
}

TransferResult TransferEngine::move(Operation& op) {
    const std::string& dst = op.destination.extended;

    bool destIsDirectory = false;
    if (entryPresent(dst, &destIsDirectory)) {
        if (op.options.overwritePolicy == OverwritePolicy::Fail) {
            return TransferResult::failed(FileErrorInfo::make(FileError::AlreadyExists,
                                                              "Destination already exists", op.destination.canonical));
        }
        if (destIsDirectory) {
            return TransferResult::failed(FileErrorInfo::make(FileError::NotAFile,
                                                              "Destination is a directory", op.destination.canonical));
        }
        auto stashed = op.journal.stash(dst);
        if (!stashed) return TransferResult::failed(stashed.error);
    }

    auto step = relocate(op.source.extended, dst, op.sourceMeta, op, op.progress);
    TransferResult result;
    result.bytesTransferred = step.bytes;
    if (step.aborted) {
        result.status = abortStatus(op.progress);
        return result;
    }
    if (!step.error.ok()) return TransferResult::failed(std::move(step.error));

    result.status = TransferStatus::Completed;
    return result;
}

TransferResult TransferEngine::replace(Operation& op) {
    const std::string& dst = op.destination.extended;

    if (!entryPresent(dst)) {
        return TransferResult::failed(FileErrorInfo::make(FileError::NotFound, "Replace target not found",
                                                          op.destination.canonical));
    }
    auto destMeta = _provider->queryMetadata(dst);
    if (!destMeta) return TransferResult::failed(destMeta.error);
    if (destMeta->isDirectory()) {
        return TransferResult::failed(FileErrorInfo::make(FileError::NotAFile, "Replace target is a directory",
                                                          op.destination.canonical));
    }

    if (op.backup) {
        const std::string& backup = op.backup->extended;
        bool backupIsDirectory = false;
        if (entryPresent(backup, &backupIsDirectory)) {
            if (backupIsDirectory) {
                return TransferResult::failed(FileErrorInfo::make(FileError::NotAFile, "Backup path is a directory",
                                                                  op.backup->canonical));
            }
            auto stashed = op.journal.stash(backup);
            if (!stashed) return TransferResult::failed(stashed.error);
        }
        ProgressChannel silent;
        auto archived = relocate(dst, backup, *destMeta, op, silent);
        if (!archived.error.ok()) return TransferResult::failed(std::move(archived.error));
    } else {
        auto stashed = op.journal.stash(dst);
        if (!stashed) return TransferResult::failed(stashed.error);
    }

    auto step = relocate(op.source.extended, dst, op.sourceMeta, op, op.progress);
    TransferResult result;
    result.bytesTransferred = step.bytes;
    if (step.aborted) {
        result.status = abortStatus(op.progress);
        return result;
    }
    if (!step.error.ok()) return TransferResult::failed(std::move(step.error));

    // The replacement takes on the identity of the entry it replaced
    op.journal.recordPermissions(dst, op.sourceMeta.mode);
    auto merge = _provider->setPermissions(dst, destMeta->mode);
    if (merge.ok() && destMeta->owner != op.sourceMeta.owner) {
        merge = _provider->setOwner(dst, destMeta->owner);
    }
    if (!merge.ok()) {
        if (!op.options.ignoreMetadataErrors) return TransferResult::failed(std::move(merge));
        TRANSIT_LOG_WARNING_CAT(kLogCategory, "Ignoring metadata merge error on " + op.destination.canonical +
                                ": " + merge.message);
    }

    result.status = TransferStatus::Completed;
    return result;
}

FileErrorInfo TransferEngine::remove(const ResolvedPath& path, bool ignoreReadOnly,
                                     TransactionContext* tx, const EntryRecord* except) {
    if (tx && !tx->isActive()) {
        return FileErrorInfo::make(FileError::InvalidArgument, "Transaction is no longer active");
    }

    bool isDirectory = false;
    if (!entryPresent(path.extended, &isDirectory)) return {};
    if (isDirectory) {
        return FileErrorInfo::make(FileError::NotAFile, "Entry is a directory", path.canonical);
    }

    if (!ignoreReadOnly) {
        auto meta = _provider->queryMetadata(path.extended);
        if (meta && meta->isReadOnly()) {
            return FileErrorInfo::make(FileError::AccessDenied, "Entry is read-only", path.canonical);
        }
    }

    if (tx) {
        auto stashed = tx->stash(path.extended);
        if (!stashed) return stashed.error;
    } else {
        const std::string native = PathResolver::toNativePath(path.extended);
        if (::unlink(native.c_str()) != 0 && errno != ENOENT) {
            return errorFromErrno(errno, "Cannot delete entry", path.canonical);
        }
    }

    TRANSIT_LOG_DEBUG_CAT(kLogCategory, "Removed " + path.canonical);
    if (_cache) {
        auto staled = _cache->markStale(path.canonical, except);
        if (tx) _cache->restoreOnRollback(*tx, {path.canonical}, std::move(staled));
    }
    return {};
}

} // namespace TransitEngine::Core::IO
