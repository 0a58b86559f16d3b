/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once
#include "IAttributeProvider.h"

namespace TransitEngine::Core::IO {

/**
 * @brief IAttributeProvider over stat/statx, chmod, utimensat and chown
 *
 * Symbolic links are followed for every query except the ReparsePoint bit,
 * which reflects the path itself.
 */
class PosixAttributeProvider : public IAttributeProvider {
public:
    PosixAttributeProvider() = default;
    ~PosixAttributeProvider() override = default;

    FileResult<MetadataSnapshot> queryMetadata(const std::string& path) override;
    FileResult<FileAttributes> getAttributes(const std::string& path) override;
    FileErrorInfo setAttributes(const std::string& path, FileAttributes attributes) override;
    FileResult<FileTimestamps> getTimestamps(const std::string& path) override;
    FileErrorInfo setTimestamps(const std::string& path, const FileTimestamps& timestamps) override;
    FileResult<FileOwner> getOwner(const std::string& path) override;
    FileErrorInfo setOwner(const std::string& path, const FileOwner& owner) override;
    FileErrorInfo setPermissions(const std::string& path, uint32_t mode) override;
};

} // namespace TransitEngine::Core::IO
