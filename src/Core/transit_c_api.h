#pragma once

// C ABI base definitions for TransitCore
// This header is C-compatible and can be consumed by C, Rust, C#, etc.

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(TRANSITCORE_SHARED)
    #if defined(TRANSITCORE_BUILDING)
      #define TRANSIT_API __declspec(dllexport)
    #else
      #define TRANSIT_API __declspec(dllimport)
    #endif
  #else
    #define TRANSIT_API
  #endif
#else
  #if defined(TRANSITCORE_SHARED)
    #define TRANSIT_API __attribute__((visibility("default")))
  #else
    #define TRANSIT_API
  #endif
#endif

// Status codes for C API functions
typedef enum TransitStatus {
    TRANSIT_OK = 0,
    TRANSIT_ERR_UNKNOWN = 1,
    TRANSIT_ERR_INVALID_ARG = 2,
    TRANSIT_ERR_NOT_FOUND = 3,
    TRANSIT_ERR_NO_MEMORY = 4,
    TRANSIT_ERR_ALREADY_EXISTS = 5,
    TRANSIT_ERR_ACCESS_DENIED = 6,
    TRANSIT_ERR_NOT_A_FILE = 7,
    TRANSIT_ERR_UNSUPPORTED = 8,
    TRANSIT_ERR_STALE_HANDLE = 9,
    TRANSIT_ERR_FAILED = 10
} TransitStatus;

// Booleans (explicit, stable width across languages)
typedef int32_t TransitBool; // 0 = false, non-zero = true
#define TRANSIT_FALSE 0
#define TRANSIT_TRUE  1

// Owned string (UTF-8). Caller must dispose via transit_string_dispose.
typedef struct TransitOwnedString {
    const char* ptr;
    uint32_t    len;
} TransitOwnedString;

// Library/version/memory -----------------------------------------------------
TRANSIT_API void transit_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi);
TRANSIT_API void* transit_alloc(size_t size);
TRANSIT_API void  transit_free(void* p);

// Convenience/diagnostics ----------------------------------------------------
TRANSIT_API const char* transit_status_to_string(TransitStatus s); // static string, no free
TRANSIT_API void        transit_string_dispose(TransitOwnedString s);

#ifdef __cplusplus
} // extern "C"
#endif
