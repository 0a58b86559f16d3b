/**
 * @file transit_fs_types_c.cpp
 * @brief Implementation of file entry type helpers
 */

#include <string.h>

#include "transit/transit_fs_types.h"

extern "C" {

/* ============================================================================
 * Options Initialization
 * ============================================================================ */

void transit_transfer_options_init(TransitTransferOptions* options) {
    if (!options) return;

    options->overwrite_policy = TRANSIT_OVERWRITE_FAIL;
    options->preserve_timestamps = TRANSIT_FALSE;
    options->no_buffering = TRANSIT_FALSE;
    options->allow_cross_volume = TRANSIT_FALSE;
    options->ignore_metadata_errors = TRANSIT_FALSE;
    options->backup_path = NULL;
}

/* ============================================================================
 * String Conversions
 * ============================================================================ */

const char* transit_transfer_status_to_string(TransitTransferStatus status) {
    switch (status) {
        case TRANSIT_TRANSFER_COMPLETED:
            return "Completed";
        case TRANSIT_TRANSFER_CANCELLED:
            return "Cancelled";
        case TRANSIT_TRANSFER_STOPPED:
            return "Stopped";
        case TRANSIT_TRANSFER_FAILED:
            return "Failed";
        default:
            return "Unknown";
    }
}

} // extern "C"
