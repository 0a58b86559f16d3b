/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "FileEntryHandle.h"
#include "FileEntrySystem.h"
#include "LocalFileStream.h"
#include "TransactionContext.h"
#include <filesystem>

namespace TransitEngine::Core::IO {

FileEntryHandle::FileEntryHandle(FileEntrySystem* system, std::shared_ptr<EntryRecord> record)
    : _system(system)
    , _record(std::move(record)) {
}

std::string FileEntryHandle::name() const {
    return std::filesystem::path(_record->path.canonical).filename().string();
}

std::string FileEntryHandle::directoryName() const {
    return std::filesystem::path(_record->path.canonical).parent_path().generic_string();
}

std::string FileEntryHandle::extension() const {
    return std::filesystem::path(_record->path.canonical).extension().string();
}

std::string FileEntryHandle::toString() const {
    return _record->originalInput;
}

FileErrorInfo FileEntryHandle::staleError() const {
    return FileErrorInfo::make(FileError::StaleHandle, "Entry was moved or deleted through another handle",
                               _record->path.canonical);
}

bool FileEntryHandle::exists() const {
    return _system->_cache.exists(*_record);
}

FileResult<uint64_t> FileEntryHandle::length() const {
    return _system->_cache.size(*_record);
}

FileResult<FileAttributes> FileEntryHandle::attributes() const {
    return _system->_cache.attributes(*_record);
}

bool FileEntryHandle::isReadOnly() const {
    auto attrs = attributes();
    return attrs && hasAttribute(*attrs, FileAttributes::ReadOnly);
}

FileErrorInfo FileEntryHandle::setReadOnly(bool readOnly) {
    if (isStale()) return staleError();

    auto& provider = *_system->_provider;
    auto current = provider.getAttributes(_record->path.extended);
    if (!current) return current.error;

    FileAttributes wanted = *current;
    if (readOnly) wanted |= FileAttributes::ReadOnly;
    else wanted &= ~FileAttributes::ReadOnly;

    auto err = provider.setAttributes(_record->path.extended, wanted);
    _system->_cache.invalidatePath(_record->path.canonical);
    return err;
}

FileResult<FileTime> FileEntryHandle::creationTime() const {
    return _system->_cache.createdAt(*_record);
}

FileResult<FileTime> FileEntryHandle::lastWriteTime() const {
    return _system->_cache.modifiedAt(*_record);
}

FileResult<FileTime> FileEntryHandle::lastAccessTime() const {
    return _system->_cache.accessedAt(*_record);
}

FileResult<MetadataSnapshot> FileEntryHandle::metadata() const {
    return _system->_cache.snapshot(*_record);
}

void FileEntryHandle::refresh() {
    _system->_cache.refresh(*_record);
}

void FileEntryHandle::invalidate() {
    _system->_cache.invalidate(*_record);
}

FileResult<std::unique_ptr<FileStream>> FileEntryHandle::open(const StreamOptions& options) const {
    if (isStale()) return FileResult<std::unique_ptr<FileStream>>::failure(staleError());

    auto stream = LocalFileStream::open(_record->path.extended, options);
    if (stream && options.mode != StreamOptions::Read) {
        _system->_cache.invalidatePath(_record->path.canonical);
    }
    return stream;
}

FileResult<std::unique_ptr<FileStream>> FileEntryHandle::openRead() const {
    StreamOptions options;
    options.mode = StreamOptions::Read;
    options.createMode = StreamOptions::OpenExisting;
    options.shareMode = StreamOptions::ShareRead;
    return open(options);
}

FileResult<std::unique_ptr<FileStream>> FileEntryHandle::openWrite() const {
    StreamOptions options;
    options.mode = StreamOptions::Write;
    options.createMode = StreamOptions::OpenAlways;
    options.shareMode = StreamOptions::ShareNone;
    return open(options);
}

FileResult<std::unique_ptr<FileStream>> FileEntryHandle::create() const {
    StreamOptions options;
    options.mode = StreamOptions::ReadWrite;
    options.createMode = StreamOptions::CreateAlways;
    options.shareMode = StreamOptions::ShareNone;
    return open(options);
}

TransferResult FileEntryHandle::copyTo(std::string_view destination, TransferOptions options,
                                       ProgressCallback progress, TransactionContext* tx) const {
    if (isStale()) return TransferResult::failed(staleError());
    options.mode = TransferMode::Copy;
    return _system->_engine.transfer(_record->path.canonical, destination, PathFormat::Relative,
                                     options, std::move(progress), tx);
}

TransferResult FileEntryHandle::moveTo(std::string_view destination, TransferOptions options,
                                       ProgressCallback progress, TransactionContext* tx) {
    return relocate(TransferMode::Move, destination, std::move(options), std::move(progress), tx);
}

TransferResult FileEntryHandle::replace(std::string_view destination, TransferOptions options,
                                        ProgressCallback progress, TransactionContext* tx) {
    return relocate(TransferMode::Replace, destination, std::move(options), std::move(progress), tx);
}

TransferResult FileEntryHandle::relocate(TransferMode mode, std::string_view destination, TransferOptions options,
                                         ProgressCallback progress, TransactionContext* tx) {
    if (isStale()) return TransferResult::failed(staleError());
    options.mode = mode;

    auto result = _system->_engine.transfer(_record->path.canonical, destination, PathFormat::Relative,
                                            options, std::move(progress), tx);
    if (!result.ok()) return result;

    // The engine has already marked every handle on the old path Stale, this one included
    auto target = _system->_resolver.resolve(result.destinationPath, PathFormat::AlreadyCanonical);
    if (target) {
        if (tx) _system->_cache.retargetOnRollback(*tx, _record, _record->path, _record->originalInput);
        _system->_cache.retarget(_record, *target);
        _record->originalInput = result.destinationPath;
    }
    return result;
}

FileErrorInfo FileEntryHandle::remove(bool ignoreReadOnly, TransactionContext* tx) {
    if (isStale()) return staleError();
    auto err = _system->_engine.remove(_record->path, ignoreReadOnly, tx, _record.get());
    _system->_cache.invalidate(*_record);
    return err;
}

} // namespace TransitEngine::Core::IO
