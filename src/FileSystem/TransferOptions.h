/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "FileError.h"

namespace TransitEngine::Core::IO {

enum class TransferMode { Copy, Move, Replace };

enum class OverwritePolicy { Fail, Overwrite };

/**
 * @brief Options for TransferEngine::transfer
 *
 * - preserveTimestamps: copy modified/accessed times onto a copied destination
 * - noBuffering: push written data to storage and drop it from the page cache
 * - allowCrossVolume: permit the copy-then-delete fallback when a rename crosses volumes
 * - ignoreMetadataErrors: a failing permission/owner/timestamp merge is logged and skipped
 * - backupPath: Replace only; where the previous destination is archived
 */
struct TransferOptions {
    TransferMode mode = TransferMode::Copy;
    OverwritePolicy overwritePolicy = OverwritePolicy::Fail;
    bool preserveTimestamps = false;
    bool noBuffering = false;
    bool allowCrossVolume = false;
    bool ignoreMetadataErrors = false;
    std::optional<std::string> backupPath;
};

enum class TransferStatus {
    Completed,
    Cancelled,  // callback returned Cancel
    Stopped,    // callback returned StopAndQuiet
    Failed
};

const char* toString(TransferStatus status) noexcept;
const char* toString(TransferMode mode) noexcept;

struct TransferResult {
    TransferStatus status = TransferStatus::Failed;
    std::string destinationPath;    // canonical destination (or the attempted one on failure)
    uint64_t bytesTransferred = 0;
    FileErrorInfo error;            // set only when status == Failed

    bool ok() const noexcept { return status == TransferStatus::Completed; }

    static TransferResult failed(FileErrorInfo err, std::string destination = {}) {
        TransferResult r;
        r.status = TransferStatus::Failed;
        r.error = std::move(err);
        r.destinationPath = std::move(destination);
        return r;
    }
};

} // namespace TransitEngine::Core::IO
