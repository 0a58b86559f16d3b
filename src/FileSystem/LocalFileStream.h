/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once
#include <memory>
#include "FileStream.h"

namespace TransitEngine::Core::IO {

/**
 * @brief File-descriptor backed stream for local files
 *
 * Owns the descriptor and any advisory lock taken for the share mode; both are
 * released by close() or the destructor. Paths may carry the long-path marker,
 * which is stripped before the open call.
 */
class LocalFileStream : public FileStream {
public:
    ~LocalFileStream() override;

    LocalFileStream(const LocalFileStream&) = delete;
    LocalFileStream& operator=(const LocalFileStream&) = delete;

    /**
     * @brief Opens a stream
     * @param path Canonical or extended path
     * @param options Access mode, creation disposition and share mode
     * @return The stream, or NotFound/AlreadyExists/AccessDenied/NotAFile/Failed
     */
    static FileResult<std::unique_ptr<FileStream>> open(const std::string& path, const StreamOptions& options = {});

    IoResult read(std::span<std::byte> buffer) override;
    IoResult write(std::span<const std::byte> data) override;
    bool seek(int64_t offset, std::ios_base::seekdir dir) override;
    int64_t tell() const override;
    bool good() const override { return _fd >= 0 && !_failFlag; }
    bool eof() const override { return _eof; }
    bool fail() const override { return _failFlag; }
    std::optional<FileErrorInfo> lastError() const override { return _lastError; }
    void flush() override;
    void close() override;
    std::optional<uint64_t> size() const override;
    std::string path() const override { return _path; }

private:
    LocalFileStream(int fd, std::string path, StreamOptions options, bool locked);

    FileErrorInfo recordErrno(int err, const char* what);

    int _fd = -1;
    std::string _path;
    StreamOptions _options;
    bool _locked = false;
    bool _eof = false;
    bool _failFlag = false;
    std::optional<FileErrorInfo> _lastError;
};

} // namespace TransitEngine::Core::IO
