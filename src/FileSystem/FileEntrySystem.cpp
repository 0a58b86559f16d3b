/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "FileEntrySystem.h"
#include "PosixAttributeProvider.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <cctype>

namespace TransitEngine::Core::IO {

namespace {
    std::shared_ptr<IAttributeProvider> providerOrDefault(std::shared_ptr<IAttributeProvider> provider) {
        if (provider) return provider;
        return std::make_shared<PosixAttributeProvider>();
    }

    std::optional<bool> parseFlag(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "1" || value == "true" || value == "on" || value == "yes") return true;
        if (value == "0" || value == "false" || value == "off" || value == "no") return false;
        return std::nullopt;
    }
}

FileEntrySystem::Config FileEntrySystem::Config::fromEnvironment() {
    Config cfg;
    if (auto threshold = safeGetEnvUnsigned("TRANSIT_LONG_PATH_THRESHOLD")) {
        cfg.paths.longPathThreshold = static_cast<size_t>(*threshold);
    }
    if (auto chunk = safeGetEnvUnsigned("TRANSIT_TRANSFER_CHUNK_SIZE"); chunk && *chunk > 0) {
        cfg.transfer.chunkSize = static_cast<size_t>(*chunk);
    }
    if (auto strict = safeGetEnv("TRANSIT_STRICT_PATHS")) {
        if (auto flag = parseFlag(*strict)) {
            cfg.paths.strict = *flag;
        } else {
            TRANSIT_LOG_WARNING_CAT("FileEntrySystem", "Ignoring malformed TRANSIT_STRICT_PATHS: " + *strict);
        }
    }
    if (auto crossVolume = safeGetEnv("TRANSIT_TEST_SIMULATE_CROSS_VOLUME")) {
        if (auto flag = parseFlag(*crossVolume)) {
            cfg.transfer.simulateCrossVolume = *flag;
        } else {
            TRANSIT_LOG_WARNING_CAT("FileEntrySystem",
                                    "Ignoring malformed TRANSIT_TEST_SIMULATE_CROSS_VOLUME: " + *crossVolume);
        }
    }
    return cfg;
}

FileEntrySystem::FileEntrySystem(Config cfg, std::shared_ptr<IAttributeProvider> provider)
    : _cfg(std::move(cfg))
    , _resolver(_cfg.paths)
    , _provider(providerOrDefault(std::move(provider)))
    , _cache(_provider)
    , _engine(_resolver, _provider, &_cache, _cfg.transfer) {
}

FileEntrySystem::~FileEntrySystem() = default;

FileResult<FileEntryHandle> FileEntrySystem::createEntryHandle(std::string_view raw, PathFormat format) {
    auto resolved = _resolver.resolve(raw, format);
    if (!resolved) return FileResult<FileEntryHandle>::failure(resolved.error);

    auto record = std::make_shared<EntryRecord>();
    record->originalInput = std::string(raw);
    record->path = std::move(*resolved.value);
    _cache.track(record);
    return FileResult<FileEntryHandle>::success(FileEntryHandle(this, std::move(record)));
}

} // namespace TransitEngine::Core::IO
