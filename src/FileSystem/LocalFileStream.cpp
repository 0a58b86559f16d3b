/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "LocalFileStream.h"
#include "PathResolver.h"
#include <cerrno>

#include <sys/file.h>  // flock()
#include <fcntl.h>     // open(), posix_fadvise()
#include <unistd.h>    // read(), write(), close(), fdatasync()
#include <sys/stat.h>  // fstat()

namespace TransitEngine::Core::IO {

namespace {
    int openFlags(const StreamOptions& options) {
        int flags = O_CLOEXEC;
        switch (options.mode) {
            case StreamOptions::Read:      flags |= O_RDONLY; break;
            case StreamOptions::Write:     flags |= O_WRONLY; break;
            case StreamOptions::ReadWrite: flags |= O_RDWR; break;
        }
        switch (options.createMode) {
            case StreamOptions::OpenExisting: break;
            case StreamOptions::OpenAlways:   flags |= O_CREAT; break;
            case StreamOptions::CreateNew:    flags |= O_CREAT | O_EXCL; break;
            case StreamOptions::CreateAlways: flags |= O_CREAT | O_TRUNC; break;
        }
        return flags;
    }

    int lockOperation(StreamOptions::ShareMode share) {
        switch (share) {
            case StreamOptions::ShareNone: return LOCK_EX;
            case StreamOptions::ShareRead: return LOCK_SH;
            case StreamOptions::ShareReadWrite: return 0;
        }
        return 0;
    }
}

LocalFileStream::LocalFileStream(int fd, std::string path, StreamOptions options, bool locked)
    : _fd(fd)
    , _path(std::move(path))
    , _options(options)
    , _locked(locked) {
}

LocalFileStream::~LocalFileStream() {
    close();
}

FileResult<std::unique_ptr<FileStream>> LocalFileStream::open(const std::string& path, const StreamOptions& options) {
    using Result = FileResult<std::unique_ptr<FileStream>>;
    const std::string native = PathResolver::toNativePath(path);

    int fd;
    do {
        fd = ::open(native.c_str(), openFlags(options), static_cast<mode_t>(options.permissions));
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return Result::failure(errorFromErrno(errno, "Cannot open file", path));
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int e = errno;
        ::close(fd);
        return Result::failure(errorFromErrno(e, "Cannot stat opened file", path));
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        return Result::failure(FileErrorInfo::make(FileError::NotAFile, "Path names a directory", path));
    }

    bool locked = false;
    if (int op = lockOperation(options.shareMode); op != 0) {
        if (::flock(fd, op | LOCK_NB) != 0) {
            int e = errno;
            ::close(fd);
            // A held lock is a sharing violation, not a permission problem
            return Result::failure(FileErrorInfo::make(FileError::Failed, "File is locked by another stream", path,
                                                       std::error_code(e, std::generic_category())));
        }
        locked = true;
    }

    return Result::success(std::unique_ptr<FileStream>(new LocalFileStream(fd, path, options, locked)));
}

FileErrorInfo LocalFileStream::recordErrno(int err, const char* what) {
    _failFlag = true;
    _lastError = errorFromErrno(err, what, _path);
    return *_lastError;
}

IoResult LocalFileStream::read(std::span<std::byte> buffer) {
    IoResult result;
    if (!good()) {
        result.error = FileErrorInfo::make(FileError::Failed, "Stream is not readable", _path);
        return result;
    }
    if (buffer.empty()) {
        result.complete = true;
        return result;
    }

    ssize_t n;
    do {
        n = ::read(_fd, buffer.data(), buffer.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        result.error = recordErrno(errno, "Read failed");
        return result;
    }
    result.bytesTransferred = static_cast<size_t>(n);
    _eof = (n == 0);
    result.complete = (result.bytesTransferred == buffer.size()) || _eof;
    return result;
}

IoResult LocalFileStream::write(std::span<const std::byte> data) {
    IoResult result;
    if (!good()) {
        result.error = FileErrorInfo::make(FileError::Failed, "Stream is not writable", _path);
        return result;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(_fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = recordErrno(errno, "Write failed");
            break;
        }
        written += static_cast<size_t>(n);
    }

    result.bytesTransferred = written;
    result.complete = (written == data.size());
    return result;
}

bool LocalFileStream::seek(int64_t offset, std::ios_base::seekdir dir) {
    if (_fd < 0) return false;
    int whence = SEEK_SET;
    if (dir == std::ios_base::cur) whence = SEEK_CUR;
    else if (dir == std::ios_base::end) whence = SEEK_END;

    if (::lseek(_fd, static_cast<off_t>(offset), whence) < 0) {
        recordErrno(errno, "Seek failed");
        return false;
    }
    _eof = false;
    return true;
}

int64_t LocalFileStream::tell() const {
    if (_fd < 0) return -1;
    return static_cast<int64_t>(::lseek(_fd, 0, SEEK_CUR));
}

void LocalFileStream::flush() {
    if (_fd < 0 || !_options.noBuffering || _options.mode == StreamOptions::Read) return;
    if (::fdatasync(_fd) != 0) {
        recordErrno(errno, "fdatasync failed");
        return;
    }
#if defined(POSIX_FADV_DONTNEED)
    (void)::posix_fadvise(_fd, 0, 0, POSIX_FADV_DONTNEED);
#endif
}

void LocalFileStream::close() {
    if (_fd < 0) return;
    flush();
    if (_locked) {
        ::flock(_fd, LOCK_UN);
        _locked = false;
    }
    if (::close(_fd) != 0 && errno != EINTR) {
        int e = errno;
        _fd = -1;
        recordErrno(e, "Close failed");
        return;
    }
    _fd = -1;
}

std::optional<uint64_t> LocalFileStream::size() const {
    if (_fd < 0) return std::nullopt;
    struct stat st{};
    if (::fstat(_fd, &st) != 0) return std::nullopt;
    return static_cast<uint64_t>(st.st_size);
}

} // namespace TransitEngine::Core::IO
