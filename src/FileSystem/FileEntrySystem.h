/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file FileEntrySystem.h
 * @brief Facade owning path resolution, metadata caching and transfers
 *
 * FileEntrySystem wires a PathResolver, an IAttributeProvider (PosixAttributeProvider by
 * default), a MetadataCache and a TransferEngine together and hands out FileEntryHandles
 * bound to them. All operations run synchronously on the calling thread.
 */
#pragma once
#include <memory>
#include <string_view>
#include "FileEntryHandle.h"
#include "IAttributeProvider.h"
#include "MetadataCache.h"
#include "PathResolver.h"
#include "TransferEngine.h"

namespace TransitEngine::Core::IO {

class FileEntrySystem {
public:
    struct Config {
        PathResolver::Config paths;
        TransferEngine::Config transfer;

        Config() = default;

        /**
         * @brief Defaults overridden from the environment
         *
         * TRANSIT_LONG_PATH_THRESHOLD and TRANSIT_TRANSFER_CHUNK_SIZE take unsigned
         * integers; TRANSIT_STRICT_PATHS and TRANSIT_TEST_SIMULATE_CROSS_VOLUME take
         * 1/true/on. Malformed values are ignored.
         */
        static Config fromEnvironment();
    };

    /**
     * @param cfg Resolver and transfer configuration
     * @param provider Attribute collaborator; null selects PosixAttributeProvider
     */
    explicit FileEntrySystem(Config cfg = {}, std::shared_ptr<IAttributeProvider> provider = nullptr);
    ~FileEntrySystem();

    FileEntrySystem(const FileEntrySystem&) = delete;
    FileEntrySystem& operator=(const FileEntrySystem&) = delete;

    /**
     * @brief Resolves raw and creates a handle for it. No I/O is performed.
     * @param raw Raw path text
     * @param format Interpretation of raw
     * @return Handle, or InvalidArgument when the path cannot be resolved
     */
    FileResult<FileEntryHandle> createEntryHandle(std::string_view raw, PathFormat format = PathFormat::Relative);
    /**
     * @brief Shorthand for createEntryHandle(raw, format)
     */
    FileResult<FileEntryHandle> handle(std::string_view raw, PathFormat format = PathFormat::Relative) {
        return createEntryHandle(raw, format);
    }

    const Config& config() const noexcept { return _cfg; }
    const PathResolver& resolver() const noexcept { return _resolver; }
    MetadataCache& cache() noexcept { return _cache; }
    TransferEngine& engine() noexcept { return _engine; }
    IAttributeProvider& provider() noexcept { return *_provider; }

private:
    Config _cfg;
    PathResolver _resolver;
    std::shared_ptr<IAttributeProvider> _provider;
    MetadataCache _cache;
    TransferEngine _engine;

    friend class FileEntryHandle;
};

} // namespace TransitEngine::Core::IO
