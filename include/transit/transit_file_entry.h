#pragma once

/**
 * @file transit_file_entry.h
 * @brief C API for FileEntrySystem and FileEntryHandle
 *
 * A file entry system owns path resolution, the metadata cache and the transfer engine.
 * Entries are handles to one path each. All operations are synchronous.
 */

#include "transit/transit_fs_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * FileEntrySystem Lifecycle
 * ============================================================================ */

/**
 * @brief Create a file entry system with default configuration
 *
 * @param status Error reporting (required)
 * @return Owned system or NULL on error
 * @ownership Returns owned pointer - must call transit_file_entry_system_destroy()
 */
TRANSIT_API transit_FileEntrySystem transit_file_entry_system_create(TransitStatus* status);

/**
 * @brief Create a file entry system configured from TRANSIT_* environment variables
 */
TRANSIT_API transit_FileEntrySystem transit_file_entry_system_create_from_env(TransitStatus* status);

/**
 * @brief Destroy a file entry system
 *
 * All entries created from it must be destroyed first.
 *
 * @param system System to destroy (can be NULL)
 */
TRANSIT_API void transit_file_entry_system_destroy(transit_FileEntrySystem system);

/* ============================================================================
 * FileEntry Lifecycle
 * ============================================================================ */

/**
 * @brief Create an entry for a path. No I/O is performed.
 *
 * @param system Owning system (required)
 * @param path UTF-8 path (required)
 * @param format How path is interpreted
 * @param status Error reporting (required); TRANSIT_ERR_INVALID_ARG for unresolvable paths
 * @return Owned entry or NULL on error
 * @ownership Returns owned pointer - must call transit_file_entry_destroy()
 */
TRANSIT_API transit_FileEntry transit_file_entry_create(
    transit_FileEntrySystem system,
    const char* path,
    TransitPathFormat format,
    TransitStatus* status
);

/**
 * @brief Clone an entry. The clone shares state with the original.
 */
TRANSIT_API transit_FileEntry transit_file_entry_clone(transit_FileEntry entry, TransitStatus* status);

/**
 * @brief Destroy an entry (can be NULL)
 */
TRANSIT_API void transit_file_entry_destroy(transit_FileEntry entry);

/* ============================================================================
 * Identity and Metadata
 * ============================================================================ */

/**
 * @brief Get the canonical path
 *
 * @param entry Entry (required)
 * @param out Receives an owned string - dispose with transit_string_dispose()
 * @return TRANSIT_OK or error
 */
TRANSIT_API TransitStatus transit_file_entry_canonical_path(transit_FileEntry entry, TransitOwnedString* out);

/**
 * @brief Whether the entry exists. Never fails for a valid entry.
 */
TRANSIT_API TransitBool transit_file_entry_exists(transit_FileEntry entry, TransitStatus* status);

/**
 * @brief Whether the entry was moved or deleted through another handle
 */
TRANSIT_API TransitBool transit_file_entry_is_stale(transit_FileEntry entry, TransitStatus* status);

/**
 * @brief Size in bytes (cached)
 *
 * @return TRANSIT_OK, TRANSIT_ERR_NOT_FOUND, TRANSIT_ERR_NOT_A_FILE, TRANSIT_ERR_STALE_HANDLE, ...
 */
TRANSIT_API TransitStatus transit_file_entry_length(transit_FileEntry entry, uint64_t* out_length);

/**
 * @brief Re-query metadata now
 */
TRANSIT_API TransitStatus transit_file_entry_refresh(transit_FileEntry entry);

/**
 * @brief Drop cached metadata; the next read re-queries
 */
TRANSIT_API TransitStatus transit_file_entry_invalidate(transit_FileEntry entry);

/* ============================================================================
 * Transfers
 * ============================================================================ */

/**
 * @brief Copy the entry to destination
 *
 * @param entry Source entry (required)
 * @param destination Destination path, resolved relative to the working directory (required)
 * @param options Options (NULL = defaults)
 * @param progress Progress callback (can be NULL)
 * @param user_data Passed to progress
 * @param out_result Receives the outcome (can be NULL); dispose out_result->destination_path
 * @return TRANSIT_OK when the transfer ran to an outcome (including cancellation), or the failure code
 *
 * @code
 * TransitTransferOptions opts;
 * transit_transfer_options_init(&opts);
 * opts.overwrite_policy = TRANSIT_OVERWRITE_REPLACE;
 * TransitTransferResult r;
 * TransitStatus s = transit_file_entry_copy_to(entry, "/tmp/copy.bin", &opts, NULL, NULL, &r);
 * transit_string_dispose(r.destination_path);
 * @endcode
 */
TRANSIT_API TransitStatus transit_file_entry_copy_to(
    transit_FileEntry entry,
    const char* destination,
    const TransitTransferOptions* options,
    TransitProgressFn progress,
    void* user_data,
    TransitTransferResult* out_result
);

/**
 * @brief Move the entry to destination. On success the entry names the destination.
 */
TRANSIT_API TransitStatus transit_file_entry_move_to(
    transit_FileEntry entry,
    const char* destination,
    const TransitTransferOptions* options,
    TransitProgressFn progress,
    void* user_data,
    TransitTransferResult* out_result
);

/**
 * @brief Replace destination with the entry, optionally archiving it to options->backup_path
 */
TRANSIT_API TransitStatus transit_file_entry_replace(
    transit_FileEntry entry,
    const char* destination,
    const TransitTransferOptions* options,
    TransitProgressFn progress,
    void* user_data,
    TransitTransferResult* out_result
);

/**
 * @brief Delete the entry. A missing entry is not an error.
 *
 * @param ignore_read_only Delete even if the entry is read-only
 */
TRANSIT_API TransitStatus transit_file_entry_remove(transit_FileEntry entry, TransitBool ignore_read_only);

#ifdef __cplusplus
} // extern "C"
#endif
