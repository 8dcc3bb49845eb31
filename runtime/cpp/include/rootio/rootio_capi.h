/**
 * rootio runtime: minimal C ABI
 *
 * Read-only access to the keys and trees of a rootio file from any language
 * that can call C. Errors are reported as status codes; the message of the
 * last failure on the calling thread is available from rootio_error_string().
 */
#ifndef ROOTIO_ROOTIO_CAPI_H
#define ROOTIO_ROOTIO_CAPI_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) && defined(ROOTIO_CAPI_EXPORT)
#  define ROOTIO_CAPI_API __declspec(dllexport)
#elif defined(_WIN32)
#  define ROOTIO_CAPI_API __declspec(dllimport)
#else
#  define ROOTIO_CAPI_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/** Opaque handle to an opened file. */
typedef struct rootio_handle* rootio_handle_t;

/** Status codes. Values above ROOTIO_OK mirror rootio::ErrorCode. */
typedef enum {
    ROOTIO_OK                = 0,
    ROOTIO_NOT_FOUND         = 1,
    ROOTIO_INVALID_DIRECTORY = 2,
    ROOTIO_CORRUPT_BLOCK     = 3,
    ROOTIO_CORRUPT_BASKET    = 4,
    ROOTIO_UNKNOWN_CLASS     = 5,
    ROOTIO_UNKNOWN_VERSION   = 6,
    ROOTIO_IO_ERROR          = 7,
    ROOTIO_CLOSED_HANDLE     = 8,
    ROOTIO_INVALID_ARGUMENT  = 9,
    ROOTIO_CANCELLED         = 10,
    ROOTIO_BUFFER_TOO_SMALL  = 100,
    ROOTIO_INTERNAL          = 101
} rootio_status_t;

/**
 * Open a file read-only and load its top-level key index.
 * Returns NULL on failure; see rootio_error_string().
 */
ROOTIO_CAPI_API rootio_handle_t rootio_open(const char* path);

/** Close the file. Safe to call with NULL. */
ROOTIO_CAPI_API void rootio_close(rootio_handle_t h);

/** Number of keys in the top directory (0 on error). */
ROOTIO_CAPI_API uint32_t rootio_key_count(rootio_handle_t h);

/**
 * Describe top-level key i. Names are written NUL-terminated; any output
 * pointer may be NULL.
 */
ROOTIO_CAPI_API int rootio_key_info(rootio_handle_t h, uint32_t i,
                                    char* name_buf, size_t name_size,
                                    char* class_buf, size_t class_size,
                                    int16_t* cycle_out, uint64_t* objlen_out);

/**
 * Copy the decompressed payload of the key at `path` ("dir/name" or
 * "name;cycle") into `buffer`. *size_out always receives the payload size,
 * so a call with buffer_size 0 queries it (ROOTIO_BUFFER_TOO_SMALL).
 */
ROOTIO_CAPI_API int rootio_key_bytes(rootio_handle_t h, const char* path,
                                     uint8_t* buffer, uint64_t buffer_size,
                                     uint64_t* size_out);

/** Entry count of the tree at `path`, or -1 on error. */
ROOTIO_CAPI_API int64_t rootio_tree_entries(rootio_handle_t h, const char* path);

/**
 * Last error message of the calling thread (UTF-8, NUL-terminated).
 * Never returns NULL.
 */
ROOTIO_CAPI_API const char* rootio_error_string(void);

#ifdef __cplusplus
}
#endif

#endif /* ROOTIO_ROOTIO_CAPI_H */
