/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once

/**
 * @file TransitCore.h
 * @brief Single header that includes all TransitCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// File entries and transfers
#include "FileSystem/FileError.h"
#include "FileSystem/FileMetadata.h"
#include "FileSystem/FileStream.h"
#include "FileSystem/LocalFileStream.h"
#include "FileSystem/PathResolver.h"
#include "FileSystem/IAttributeProvider.h"
#include "FileSystem/PosixAttributeProvider.h"
#include "FileSystem/MetadataCache.h"
#include "FileSystem/ProgressChannel.h"
#include "FileSystem/TransferOptions.h"
#include "FileSystem/TransactionContext.h"
#include "FileSystem/TransferEngine.h"
#include "FileSystem/FileEntryHandle.h"
#include "FileSystem/FileEntrySystem.h"
