#pragma once

/**
 * @file transit_fs_types.h
 * @brief Type definitions for the file entry C API
 *
 * This header defines all enums, structs, and opaque types for the file entry C API.
 * It follows the hourglass pattern: stable C89 ABI with internal C++ implementation.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/transit_c_api.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Enumerations
 * ============================================================================ */

/**
 * @brief How a raw path string is interpreted
 */
typedef enum TransitPathFormat
{
    TRANSIT_PATH_RELATIVE = 0,          /**< May be relative; resolved against the working directory */
    TRANSIT_PATH_ABSOLUTE_SHORT = 1,    /**< Must be absolute */
    TRANSIT_PATH_ALREADY_CANONICAL = 2  /**< Trusted canonical form */
} TransitPathFormat;

/**
 * @brief Overwrite behavior when the destination exists
 */
typedef enum TransitOverwritePolicy
{
    TRANSIT_OVERWRITE_FAIL = 0,     /**< Fail with TRANSIT_ERR_ALREADY_EXISTS */
    TRANSIT_OVERWRITE_REPLACE = 1   /**< Replace the destination atomically */
} TransitOverwritePolicy;

/**
 * @brief Final state of a transfer
 */
typedef enum TransitTransferStatus
{
    TRANSIT_TRANSFER_COMPLETED = 0, /**< Transfer finished */
    TRANSIT_TRANSFER_CANCELLED = 1, /**< Progress callback returned CANCEL */
    TRANSIT_TRANSFER_STOPPED = 2,   /**< Progress callback returned STOP_AND_QUIET */
    TRANSIT_TRANSFER_FAILED = 3     /**< Transfer failed (check error) */
} TransitTransferStatus;

/**
 * @brief Progress callback verdict
 */
typedef enum TransitProgressResult
{
    TRANSIT_PROGRESS_CONTINUE = 0,      /**< Keep going */
    TRANSIT_PROGRESS_CANCEL = 1,        /**< Abort the transfer */
    TRANSIT_PROGRESS_QUIET = 2,         /**< Keep going, stop reporting */
    TRANSIT_PROGRESS_STOP_AND_QUIET = 3 /**< Abort without further reports */
} TransitProgressResult;

/* ============================================================================
 * Structures
 * ============================================================================ */

/**
 * @brief Progress data passed to TransitProgressFn
 */
typedef struct TransitProgressReport
{
    uint64_t bytes_transferred;
    uint64_t total_bytes;
    uint32_t stream_index;
} TransitProgressReport;

/**
 * @brief Progress callback, invoked synchronously on the transferring thread
 */
typedef TransitProgressResult (*TransitProgressFn)(const TransitProgressReport* report, void* user_data);

/**
 * @brief Options for copy/move/replace
 */
typedef struct TransitTransferOptions
{
    /** Behavior when the destination exists (ignored by replace) */
    TransitOverwritePolicy overwrite_policy;

    /** Copy modified/accessed times onto a copied destination */
    TransitBool preserve_timestamps;

    /** Push written data to storage and drop it from the page cache */
    TransitBool no_buffering;

    /** Allow copy-then-delete when a move crosses volumes */
    TransitBool allow_cross_volume;

    /** Proceed when permissions/owner/timestamps cannot be applied */
    TransitBool ignore_metadata_errors;

    /** Replace only: where to archive the old destination (NULL = no backup). Borrowed. */
    const char* backup_path;
} TransitTransferOptions;

/**
 * @brief Outcome of a transfer
 */
typedef struct TransitTransferResult
{
    TransitTransferStatus status;
    uint64_t bytes_transferred;
    TransitStatus error;            /**< TRANSIT_OK unless status is FAILED */
    /** Canonical destination path; NULL ptr when the destination could not be resolved.
     *  Owned - dispose with transit_string_dispose(). */
    TransitOwnedString destination_path;
} TransitTransferResult;

/* ============================================================================
 * Opaque Types
 * ============================================================================ */

/** @brief Opaque handle to FileEntrySystem */
typedef struct transit_FileEntrySystem_t* transit_FileEntrySystem;

/** @brief Opaque handle to FileEntryHandle */
typedef struct transit_FileEntry_t* transit_FileEntry;

/* ============================================================================
 * Helpers
 * ============================================================================ */

/**
 * @brief Initialize transfer options with defaults
 * @param options Options to initialize (required)
 */
TRANSIT_API void transit_transfer_options_init(TransitTransferOptions* options);

/**
 * @brief Convert transfer status to string
 * @return Static string, do not free
 */
TRANSIT_API const char* transit_transfer_status_to_string(TransitTransferStatus status);

#ifdef __cplusplus
} // extern "C"
#endif
