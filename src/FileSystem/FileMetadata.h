/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file FileMetadata.h
 * @brief Attribute flags, timestamps and the cached metadata snapshot
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

namespace TransitEngine::Core::IO {

/**
 * @brief Attribute bitmask reported for an entry
 *
 * POSIX has no attribute word, so the bits are derived: ReadOnly means the owner
 * write bit is clear, Hidden means the name starts with a dot, ReparsePoint means
 * the path itself is a symbolic link. Normal is reported only when no other bit is set.
 */
enum class FileAttributes : uint32_t {
    None         = 0,
    ReadOnly     = 1u << 0,
    Hidden       = 1u << 1,
    Directory    = 1u << 4,
    Normal       = 1u << 7,
    ReparsePoint = 1u << 10,
    Device       = 1u << 6
};

constexpr FileAttributes operator|(FileAttributes a, FileAttributes b) noexcept {
    return static_cast<FileAttributes>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
constexpr FileAttributes operator&(FileAttributes a, FileAttributes b) noexcept {
    return static_cast<FileAttributes>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}
constexpr FileAttributes operator~(FileAttributes a) noexcept {
    return static_cast<FileAttributes>(~static_cast<uint32_t>(a));
}
inline FileAttributes& operator|=(FileAttributes& a, FileAttributes b) noexcept { return a = a | b; }
inline FileAttributes& operator&=(FileAttributes& a, FileAttributes b) noexcept { return a = a & b; }

constexpr bool hasAttribute(FileAttributes set, FileAttributes flag) noexcept {
    return (set & flag) != FileAttributes::None;
}

using FileClock = std::chrono::system_clock;
using FileTime = FileClock::time_point;

struct FileTimestamps {
    std::optional<FileTime> created;   // birth time; absent where the filesystem does not record it
    FileTime modified{};
    FileTime accessed{};
};

struct FileOwner {
    uint32_t uid = 0;
    uint32_t gid = 0;

    friend bool operator==(const FileOwner& a, const FileOwner& b) noexcept { return a.uid == b.uid && a.gid == b.gid; }
    friend bool operator!=(const FileOwner& a, const FileOwner& b) noexcept { return !(a == b); }
};

/**
 * @brief OS-reported metadata for one entry at one point in time
 *
 * valid stays false until a query succeeds. device and inode identify the entry
 * independently of its path and are used to detect same-entry transfers.
 */
struct MetadataSnapshot {
    FileAttributes attributes = FileAttributes::None;
    uint64_t sizeBytes = 0;
    std::optional<FileTime> createdAt;
    FileTime modifiedAt{};
    FileTime accessedAt{};
    bool valid = false;

    uint32_t mode = 0;          // permission bits (07777)
    FileOwner owner;
    uint64_t device = 0;
    uint64_t inode = 0;

    bool isDirectory() const noexcept { return hasAttribute(attributes, FileAttributes::Directory); }
    bool isReadOnly() const noexcept { return hasAttribute(attributes, FileAttributes::ReadOnly); }
    bool sameEntryAs(const MetadataSnapshot& other) const noexcept {
        return valid && other.valid && device == other.device && inode == other.inode;
    }
    FileTimestamps timestamps() const { return FileTimestamps{createdAt, modifiedAt, accessedAt}; }
};

} // namespace TransitEngine::Core::IO
