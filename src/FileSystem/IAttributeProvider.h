/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file IAttributeProvider.h
 * @brief Interface for querying and applying native entry metadata
 *
 * The metadata cache and transfer engine never call stat/chmod/utimensat directly;
 * they go through an IAttributeProvider so hosts and tests can substitute their own.
 * PosixAttributeProvider is the default implementation.
 */
#pragma once
#include <string>
#include "FileError.h"
#include "FileMetadata.h"

namespace TransitEngine::Core::IO {

class IAttributeProvider {
public:
    virtual ~IAttributeProvider() = default;

    /**
     * @brief Queries a full metadata snapshot
     * @param path Canonical or extended path
     * @return Snapshot with valid=true, or NotFound/AccessDenied/Failed
     */
    virtual FileResult<MetadataSnapshot> queryMetadata(const std::string& path) = 0;

    virtual FileResult<FileAttributes> getAttributes(const std::string& path) = 0;
    /**
     * @brief Applies settable attribute bits
     *
     * Only ReadOnly is settable. Requesting a Hidden state different from the current
     * one fails with Unsupported. Derived bits (Directory, Device, ReparsePoint) are ignored.
     */
    virtual FileErrorInfo setAttributes(const std::string& path, FileAttributes attributes) = 0;

    virtual FileResult<FileTimestamps> getTimestamps(const std::string& path) = 0;
    // Applies modified and accessed times. Creation time is ignored.
    virtual FileErrorInfo setTimestamps(const std::string& path, const FileTimestamps& timestamps) = 0;

    virtual FileResult<FileOwner> getOwner(const std::string& path) = 0;
    virtual FileErrorInfo setOwner(const std::string& path, const FileOwner& owner) = 0;

    // Applies raw permission bits (07777)
    virtual FileErrorInfo setPermissions(const std::string& path, uint32_t mode) = 0;
};

} // namespace TransitEngine::Core::IO
