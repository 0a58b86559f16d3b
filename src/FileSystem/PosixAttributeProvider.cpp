/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "PosixAttributeProvider.h"
#include "PathResolver.h"
#include <cerrno>
#include <filesystem>

#include <fcntl.h>     // AT_FDCWD
#include <unistd.h>    // chown()
#include <sys/stat.h>  // stat(), statx(), chmod(), utimensat()

namespace TransitEngine::Core::IO {

namespace {
    FileTime fromTimespec(int64_t sec, int64_t nsec) {
        auto d = std::chrono::seconds(sec) + std::chrono::nanoseconds(nsec);
        return FileTime(std::chrono::duration_cast<FileClock::duration>(d));
    }

    struct timespec toTimespec(FileTime t) {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
        struct timespec ts{};
        ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
        ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
        if (ts.tv_nsec < 0) {
            ts.tv_nsec += 1000000000L;
            ts.tv_sec -= 1;
        }
        return ts;
    }

    bool isHiddenName(const std::string& native) {
        auto name = std::filesystem::path(native).filename().string();
        return name.size() > 1 && name[0] == '.' && name != "..";
    }

    FileAttributes deriveAttributes(const std::string& native, uint32_t mode, bool isLink) {
        FileAttributes attrs = FileAttributes::None;
        if (S_ISDIR(mode)) attrs |= FileAttributes::Directory;
        if (S_ISCHR(mode) || S_ISBLK(mode) || S_ISFIFO(mode) || S_ISSOCK(mode)) attrs |= FileAttributes::Device;
        if ((mode & S_IWUSR) == 0) attrs |= FileAttributes::ReadOnly;
        if (isHiddenName(native)) attrs |= FileAttributes::Hidden;
        if (isLink) attrs |= FileAttributes::ReparsePoint;
        if (attrs == FileAttributes::None) attrs = FileAttributes::Normal;
        return attrs;
    }

    // Fills everything except attributes. Returns errno, 0 on success.
    int statPath(const std::string& native, MetadataSnapshot& out) {
#if defined(STATX_BTIME)
        struct statx stx{};
        if (::statx(AT_FDCWD, native.c_str(), AT_STATX_SYNC_AS_STAT,
                    STATX_BASIC_STATS | STATX_BTIME, &stx) == 0) {
            out.mode = stx.stx_mode;
            out.sizeBytes = stx.stx_size;
            out.owner = FileOwner{stx.stx_uid, stx.stx_gid};
            out.device = (static_cast<uint64_t>(stx.stx_dev_major) << 32) | stx.stx_dev_minor;
            out.inode = stx.stx_ino;
            out.modifiedAt = fromTimespec(stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec);
            out.accessedAt = fromTimespec(stx.stx_atime.tv_sec, stx.stx_atime.tv_nsec);
            if (stx.stx_mask & STATX_BTIME) {
                out.createdAt = fromTimespec(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
            }
            return 0;
        }
        if (errno != ENOSYS) return errno;
#endif
        struct stat st{};
        if (::stat(native.c_str(), &st) != 0) return errno;
        out.mode = st.st_mode;
        out.sizeBytes = static_cast<uint64_t>(st.st_size);
        out.owner = FileOwner{st.st_uid, st.st_gid};
        out.device = static_cast<uint64_t>(st.st_dev);
        out.inode = static_cast<uint64_t>(st.st_ino);
        out.modifiedAt = fromTimespec(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
        out.accessedAt = fromTimespec(st.st_atim.tv_sec, st.st_atim.tv_nsec);
        return 0;
    }
}

FileResult<MetadataSnapshot> PosixAttributeProvider::queryMetadata(const std::string& path) {
    using Result = FileResult<MetadataSnapshot>;
    const std::string native = PathResolver::toNativePath(path);

    MetadataSnapshot snap;
    if (int err = statPath(native, snap); err != 0) {
        return Result::failure(errorFromErrno(err, "Cannot query metadata", path));
    }

    struct stat lst{};
    bool isLink = ::lstat(native.c_str(), &lst) == 0 && S_ISLNK(lst.st_mode);

    snap.attributes = deriveAttributes(native, snap.mode, isLink);
    snap.mode &= 07777;
    if (snap.isDirectory()) snap.sizeBytes = 0;
    snap.valid = true;
    return Result::success(snap);
}

FileResult<FileAttributes> PosixAttributeProvider::getAttributes(const std::string& path) {
    auto meta = queryMetadata(path);
    if (!meta) return FileResult<FileAttributes>::failure(meta.error);
    return FileResult<FileAttributes>::success(meta->attributes);
}

FileErrorInfo PosixAttributeProvider::setAttributes(const std::string& path, FileAttributes attributes) {
    auto meta = queryMetadata(path);
    if (!meta) return meta.error;

    const bool wantHidden = hasAttribute(attributes, FileAttributes::Hidden);
    if (wantHidden != hasAttribute(meta->attributes, FileAttributes::Hidden)) {
        return FileErrorInfo::make(FileError::Unsupported, "Hidden is derived from the entry name", path);
    }

    uint32_t mode = meta->mode;
    if (hasAttribute(attributes, FileAttributes::ReadOnly)) {
        mode &= ~static_cast<uint32_t>(S_IWUSR | S_IWGRP | S_IWOTH);
    } else {
        mode |= S_IWUSR;
    }
    if (mode == meta->mode) return {};
    return setPermissions(path, mode);
}

FileResult<FileTimestamps> PosixAttributeProvider::getTimestamps(const std::string& path) {
    auto meta = queryMetadata(path);
    if (!meta) return FileResult<FileTimestamps>::failure(meta.error);
    return FileResult<FileTimestamps>::success(meta->timestamps());
}

FileErrorInfo PosixAttributeProvider::setTimestamps(const std::string& path, const FileTimestamps& timestamps) {
    const std::string native = PathResolver::toNativePath(path);
    struct timespec times[2] = { toTimespec(timestamps.accessed), toTimespec(timestamps.modified) };
    if (::utimensat(AT_FDCWD, native.c_str(), times, 0) != 0) {
        return errorFromErrno(errno, "Cannot set timestamps", path);
    }
    return {};
}

FileResult<FileOwner> PosixAttributeProvider::getOwner(const std::string& path) {
    auto meta = queryMetadata(path);
    if (!meta) return FileResult<FileOwner>::failure(meta.error);
    return FileResult<FileOwner>::success(meta->owner);
}

FileErrorInfo PosixAttributeProvider::setOwner(const std::string& path, const FileOwner& owner) {
    const std::string native = PathResolver::toNativePath(path);
    if (::chown(native.c_str(), static_cast<uid_t>(owner.uid), static_cast<gid_t>(owner.gid)) != 0) {
        return errorFromErrno(errno, "Cannot set owner", path);
    }
    return {};
}

FileErrorInfo PosixAttributeProvider::setPermissions(const std::string& path, uint32_t mode) {
    const std::string native = PathResolver::toNativePath(path);
    if (::chmod(native.c_str(), static_cast<mode_t>(mode & 07777)) != 0) {
        return errorFromErrno(errno, "Cannot set permissions", path);
    }
    return {};
}

} // namespace TransitEngine::Core::IO
