/**
 * @file transit_file_entry_c.cpp
 * @brief Implementation of FileEntrySystem / FileEntryHandle C API
 */

#include "transit/transit_file_entry.h"
#include "FileSystem/FileEntrySystem.h"
#include "FileSystem/FileEntryHandle.h"
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

using namespace TransitEngine::Core::IO;

/* ============================================================================
 * Exception Translation
 * ============================================================================ */

static void translate_exception(TransitStatus* status) {
    try {
        throw;
    } catch (const std::bad_alloc&) {
        if (status) *status = TRANSIT_ERR_NO_MEMORY;
    } catch (const std::invalid_argument&) {
        if (status) *status = TRANSIT_ERR_INVALID_ARG;
    } catch (...) {
        if (status) *status = TRANSIT_ERR_UNKNOWN;
    }
}

/* ============================================================================
 * Type Conversions
 * ============================================================================ */

static TransitStatus to_status(FileError error) {
    switch (error) {
        case FileError::None: return TRANSIT_OK;
        case FileError::InvalidArgument: return TRANSIT_ERR_INVALID_ARG;
        case FileError::NotFound: return TRANSIT_ERR_NOT_FOUND;
        case FileError::AlreadyExists: return TRANSIT_ERR_ALREADY_EXISTS;
        case FileError::AccessDenied: return TRANSIT_ERR_ACCESS_DENIED;
        case FileError::NotAFile: return TRANSIT_ERR_NOT_A_FILE;
        case FileError::Unsupported: return TRANSIT_ERR_UNSUPPORTED;
        case FileError::StaleHandle: return TRANSIT_ERR_STALE_HANDLE;
        case FileError::Failed: return TRANSIT_ERR_FAILED;
    }
    return TRANSIT_ERR_UNKNOWN;
}

static PathFormat to_cpp_format(TransitPathFormat format) {
    switch (format) {
        case TRANSIT_PATH_ABSOLUTE_SHORT: return PathFormat::AbsoluteShort;
        case TRANSIT_PATH_ALREADY_CANONICAL: return PathFormat::AlreadyCanonical;
        case TRANSIT_PATH_RELATIVE:
        default: return PathFormat::Relative;
    }
}

static TransitTransferStatus to_c_status(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed: return TRANSIT_TRANSFER_COMPLETED;
        case TransferStatus::Cancelled: return TRANSIT_TRANSFER_CANCELLED;
        case TransferStatus::Stopped: return TRANSIT_TRANSFER_STOPPED;
        case TransferStatus::Failed: return TRANSIT_TRANSFER_FAILED;
    }
    return TRANSIT_TRANSFER_FAILED;
}

static TransferOptions to_cpp_options(const TransitTransferOptions* opts) {
    TransferOptions to;
    if (!opts) return to;
    to.overwritePolicy = opts->overwrite_policy == TRANSIT_OVERWRITE_REPLACE ? OverwritePolicy::Overwrite
                                                                             : OverwritePolicy::Fail;
    to.preserveTimestamps = opts->preserve_timestamps != TRANSIT_FALSE;
    to.noBuffering = opts->no_buffering != TRANSIT_FALSE;
    to.allowCrossVolume = opts->allow_cross_volume != TRANSIT_FALSE;
    to.ignoreMetadataErrors = opts->ignore_metadata_errors != TRANSIT_FALSE;
    if (opts->backup_path) to.backupPath = std::string(opts->backup_path);
    return to;
}

static ProgressCallback to_cpp_progress(TransitProgressFn fn, void* user_data) {
    if (!fn) return {};
    return [fn, user_data](const ProgressReport& r) {
        TransitProgressReport report{r.bytesTransferred, r.totalBytes, r.streamIndex};
        switch (fn(&report, user_data)) {
            case TRANSIT_PROGRESS_CANCEL: return ProgressResult::Cancel;
            case TRANSIT_PROGRESS_QUIET: return ProgressResult::Quiet;
            case TRANSIT_PROGRESS_STOP_AND_QUIET: return ProgressResult::StopAndQuiet;
            case TRANSIT_PROGRESS_CONTINUE:
            default: return ProgressResult::Continue;
        }
    };
}

static TransitStatus copy_string_out(const std::string& s, TransitOwnedString* out) {
    char* mem = static_cast<char*>(transit_alloc(s.size() + 1));
    if (!mem) return TRANSIT_ERR_NO_MEMORY;
    std::memcpy(mem, s.data(), s.size());
    mem[s.size()] = '\0';
    out->ptr = mem;
    out->len = static_cast<uint32_t>(s.size());
    return TRANSIT_OK;
}

enum class EntryTransfer { Copy, Move, Replace };

static TransitStatus run_transfer(EntryTransfer kind,
                                  transit_FileEntry entry,
                                  const char* destination,
                                  const TransitTransferOptions* options,
                                  TransitProgressFn progress,
                                  void* user_data,
                                  TransitTransferResult* out_result) {
    if (!entry || !destination) return TRANSIT_ERR_INVALID_ARG;

    TransitStatus status = TRANSIT_OK;
    if (out_result) out_result->destination_path = TransitOwnedString{nullptr, 0};
    try {
        auto* cpp_entry = reinterpret_cast<FileEntryHandle*>(entry);
        auto opts = to_cpp_options(options);
        auto cb = to_cpp_progress(progress, user_data);

        TransferResult r;
        switch (kind) {
            case EntryTransfer::Copy: r = cpp_entry->copyTo(destination, opts, cb); break;
            case EntryTransfer::Move: r = cpp_entry->moveTo(destination, opts, cb); break;
            case EntryTransfer::Replace: r = cpp_entry->replace(destination, opts, cb); break;
        }

        status = r.status == TransferStatus::Failed ? to_status(r.error.code) : TRANSIT_OK;
        if (out_result) {
            out_result->status = to_c_status(r.status);
            out_result->bytes_transferred = r.bytesTransferred;
            out_result->error = status;
            if (!r.destinationPath.empty()) {
                TransitStatus copied = copy_string_out(r.destinationPath, &out_result->destination_path);
                if (copied != TRANSIT_OK && status == TRANSIT_OK) status = copied;
            }
        }
    } catch (...) {
        translate_exception(&status);
    }
    return status;
}

/* ============================================================================
 * FileEntrySystem Implementation
 * ============================================================================ */

extern "C" {

transit_FileEntrySystem transit_file_entry_system_create(TransitStatus* status) {
    if (!status) return nullptr;
    try {
        auto* system = new(std::nothrow) FileEntrySystem();
        if (!system) {
            *status = TRANSIT_ERR_NO_MEMORY;
            return nullptr;
        }
        *status = TRANSIT_OK;
        return reinterpret_cast<transit_FileEntrySystem>(system);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

transit_FileEntrySystem transit_file_entry_system_create_from_env(TransitStatus* status) {
    if (!status) return nullptr;
    try {
        auto* system = new(std::nothrow) FileEntrySystem(FileEntrySystem::Config::fromEnvironment());
        if (!system) {
            *status = TRANSIT_ERR_NO_MEMORY;
            return nullptr;
        }
        *status = TRANSIT_OK;
        return reinterpret_cast<transit_FileEntrySystem>(system);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void transit_file_entry_system_destroy(transit_FileEntrySystem system) {
    if (!system) return;
    delete reinterpret_cast<FileEntrySystem*>(system);
}

/* ============================================================================
 * FileEntry Implementation
 * ============================================================================ */

transit_FileEntry transit_file_entry_create(
    transit_FileEntrySystem system,
    const char* path,
    TransitPathFormat format,
    TransitStatus* status
) {
    if (!status) return nullptr;
    if (!system || !path) {
        *status = TRANSIT_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        auto* cpp_system = reinterpret_cast<FileEntrySystem*>(system);
        auto result = cpp_system->createEntryHandle(path, to_cpp_format(format));
        if (!result) {
            *status = to_status(result.error.code);
            return nullptr;
        }
        auto* entry = new(std::nothrow) FileEntryHandle(std::move(*result.value));
        if (!entry) {
            *status = TRANSIT_ERR_NO_MEMORY;
            return nullptr;
        }
        *status = TRANSIT_OK;
        return reinterpret_cast<transit_FileEntry>(entry);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

transit_FileEntry transit_file_entry_clone(transit_FileEntry entry, TransitStatus* status) {
    if (!status) return nullptr;
    if (!entry) {
        *status = TRANSIT_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        auto* cpp_entry = reinterpret_cast<FileEntryHandle*>(entry);
        auto* clone = new(std::nothrow) FileEntryHandle(*cpp_entry);
        if (!clone) {
            *status = TRANSIT_ERR_NO_MEMORY;
            return nullptr;
        }
        *status = TRANSIT_OK;
        return reinterpret_cast<transit_FileEntry>(clone);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void transit_file_entry_destroy(transit_FileEntry entry) {
    if (!entry) return;
    delete reinterpret_cast<FileEntryHandle*>(entry);
}

TransitStatus transit_file_entry_canonical_path(transit_FileEntry entry, TransitOwnedString* out) {
    if (!entry || !out) return TRANSIT_ERR_INVALID_ARG;
    try {
        return copy_string_out(reinterpret_cast<FileEntryHandle*>(entry)->canonicalPath(), out);
    } catch (...) {
        TransitStatus status = TRANSIT_ERR_UNKNOWN;
        translate_exception(&status);
        return status;
    }
}

TransitBool transit_file_entry_exists(transit_FileEntry entry, TransitStatus* status) {
    if (!status) return TRANSIT_FALSE;
    if (!entry) {
        *status = TRANSIT_ERR_INVALID_ARG;
        return TRANSIT_FALSE;
    }
    try {
        bool exists = reinterpret_cast<FileEntryHandle*>(entry)->exists();
        *status = TRANSIT_OK;
        return exists ? TRANSIT_TRUE : TRANSIT_FALSE;
    } catch (...) {
        translate_exception(status);
        return TRANSIT_FALSE;
    }
}

TransitBool transit_file_entry_is_stale(transit_FileEntry entry, TransitStatus* status) {
    if (!status) return TRANSIT_FALSE;
    if (!entry) {
        *status = TRANSIT_ERR_INVALID_ARG;
        return TRANSIT_FALSE;
    }
    *status = TRANSIT_OK;
    return reinterpret_cast<FileEntryHandle*>(entry)->isStale() ? TRANSIT_TRUE : TRANSIT_FALSE;
}

TransitStatus transit_file_entry_length(transit_FileEntry entry, uint64_t* out_length) {
    if (!entry || !out_length) return TRANSIT_ERR_INVALID_ARG;
    try {
        auto result = reinterpret_cast<FileEntryHandle*>(entry)->length();
        if (!result) return to_status(result.error.code);
        *out_length = *result;
        return TRANSIT_OK;
    } catch (...) {
        TransitStatus status = TRANSIT_ERR_UNKNOWN;
        translate_exception(&status);
        return status;
    }
}

TransitStatus transit_file_entry_refresh(transit_FileEntry entry) {
    if (!entry) return TRANSIT_ERR_INVALID_ARG;
    try {
        reinterpret_cast<FileEntryHandle*>(entry)->refresh();
        return TRANSIT_OK;
    } catch (...) {
        TransitStatus status = TRANSIT_ERR_UNKNOWN;
        translate_exception(&status);
        return status;
    }
}

TransitStatus transit_file_entry_invalidate(transit_FileEntry entry) {
    if (!entry) return TRANSIT_ERR_INVALID_ARG;
    reinterpret_cast<FileEntryHandle*>(entry)->invalidate();
    return TRANSIT_OK;
}

TransitStatus transit_file_entry_copy_to(
    transit_FileEntry entry,
    const char* destination,
    const TransitTransferOptions* options,
    TransitProgressFn progress,
    void* user_data,
    TransitTransferResult* out_result
) {
    return run_transfer(EntryTransfer::Copy, entry, destination, options, progress, user_data, out_result);
}

TransitStatus transit_file_entry_move_to(
    transit_FileEntry entry,
    const char* destination,
    const TransitTransferOptions* options,
    TransitProgressFn progress,
    void* user_data,
    TransitTransferResult* out_result
) {
    return run_transfer(EntryTransfer::Move, entry, destination, options, progress, user_data, out_result);
}

TransitStatus transit_file_entry_replace(
    transit_FileEntry entry,
    const char* destination,
    const TransitTransferOptions* options,
    TransitProgressFn progress,
    void* user_data,
    TransitTransferResult* out_result
) {
    return run_transfer(EntryTransfer::Replace, entry, destination, options, progress, user_data, out_result);
}

TransitStatus transit_file_entry_remove(transit_FileEntry entry, TransitBool ignore_read_only) {
    if (!entry) return TRANSIT_ERR_INVALID_ARG;
    try {
        auto err = reinterpret_cast<FileEntryHandle*>(entry)->remove(ignore_read_only != TRANSIT_FALSE);
        return to_status(err.code);
    } catch (...) {
        TransitStatus status = TRANSIT_ERR_UNKNOWN;
        translate_exception(&status);
        return status;
    }
}

} // extern "C"
