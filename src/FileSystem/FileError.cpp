/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "FileError.h"

#include <cerrno>

namespace TransitEngine::Core::IO {

const char* toString(FileError error) noexcept {
    switch (error) {
        case FileError::None:            return "None";
        case FileError::InvalidArgument: return "InvalidArgument";
        case FileError::NotFound:        return "NotFound";
        case FileError::AlreadyExists:   return "AlreadyExists";
        case FileError::AccessDenied:    return "AccessDenied";
        case FileError::NotAFile:        return "NotAFile";
        case FileError::Unsupported:     return "Unsupported";
        case FileError::StaleHandle:     return "StaleHandle";
        case FileError::Failed:          return "Failed";
    }
    return "Unknown";
}

FileError mapErrnoToFileError(int err) noexcept {
    switch (err) {
        case 0:
            return FileError::None;
        case ENOENT:
        case ENOTDIR:
            return FileError::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return FileError::AccessDenied;
        case EEXIST:
            return FileError::AlreadyExists;
        case EISDIR:
            return FileError::NotAFile;
        case EINVAL:
        case ENAMETOOLONG:
            return FileError::InvalidArgument;
#if defined(__unix__) || defined(__APPLE__)
        case ENOTSUP:
#if defined(EOPNOTSUPP) && EOPNOTSUPP != ENOTSUP
        case EOPNOTSUPP:
#endif
        case ENOSYS:
            return FileError::Unsupported;
#endif
        default:
            return FileError::Failed;
    }
}

FileErrorInfo errorFromErrno(int err, std::string message, std::string path) {
    return FileErrorInfo::make(mapErrnoToFileError(err), std::move(message), std::move(path),
                               std::error_code(err, std::generic_category()));
}

bool isRetryable(const FileErrorInfo& info) noexcept {
    if (info.code != FileError::Failed || !info.systemError) return false;
    switch (info.systemError->value()) {
        case EBUSY:
        case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case EINTR:
#if defined(ETXTBSY)
        case ETXTBSY:
#endif
            return true;
        default:
            return false;
    }
}

} // namespace TransitEngine::Core::IO
