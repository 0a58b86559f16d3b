/*
 * C API bridge for TransitCore
 */

#include <new>

#include "transit_c_api.h"

extern "C" {

TRANSIT_API void transit_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi) {
    if (major) *major = 1;
    if (minor) *minor = 0;
    if (patch) *patch = 0;
    if (abi) *abi = 0;
}

TRANSIT_API void* transit_alloc(size_t size) {
    return ::operator new(size, std::nothrow);
}

TRANSIT_API void transit_free(void* p) {
    ::operator delete(p);
}

TRANSIT_API const char* transit_status_to_string(TransitStatus s) {
    switch (s) {
        case TRANSIT_OK:
            return "TRANSIT_OK";
        case TRANSIT_ERR_UNKNOWN:
            return "TRANSIT_ERR_UNKNOWN";
        case TRANSIT_ERR_INVALID_ARG:
            return "TRANSIT_ERR_INVALID_ARG";
        case TRANSIT_ERR_NOT_FOUND:
            return "TRANSIT_ERR_NOT_FOUND";
        case TRANSIT_ERR_NO_MEMORY:
            return "TRANSIT_ERR_NO_MEMORY";
        case TRANSIT_ERR_ALREADY_EXISTS:
            return "TRANSIT_ERR_ALREADY_EXISTS";
        case TRANSIT_ERR_ACCESS_DENIED:
            return "TRANSIT_ERR_ACCESS_DENIED";
        case TRANSIT_ERR_NOT_A_FILE:
            return "TRANSIT_ERR_NOT_A_FILE";
        case TRANSIT_ERR_UNSUPPORTED:
            return "TRANSIT_ERR_UNSUPPORTED";
        case TRANSIT_ERR_STALE_HANDLE:
            return "TRANSIT_ERR_STALE_HANDLE";
        case TRANSIT_ERR_FAILED:
            return "TRANSIT_ERR_FAILED";
    }
    return "TRANSIT_ERR_UNKNOWN";
}

TRANSIT_API void transit_string_dispose(TransitOwnedString s) {
    if (s.ptr) transit_free((void*)s.ptr);
}

} // extern "C"
