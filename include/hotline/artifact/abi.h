/**
 * hotline artifact ABI
 *
 * Include this header in the shared library that the hotline host loads and
 * hot-reloads. Every entry point is exported with C linkage under a common
 * symbol prefix (default "game_"):
 *
 *   HOTLINE_ARTIFACT_EXPORT void   game_init_window(void);
 *   HOTLINE_ARTIFACT_EXPORT void   game_init(void);
 *   HOTLINE_ARTIFACT_EXPORT void   game_update(void);
 *   HOTLINE_ARTIFACT_EXPORT bool   game_should_close(void);
 *   HOTLINE_ARTIFACT_EXPORT void   game_shutdown(void);
 *   HOTLINE_ARTIFACT_EXPORT void   game_shutdown_window(void);
 *   HOTLINE_ARTIFACT_EXPORT void*  game_get_memory(void);
 *   HOTLINE_ARTIFACT_EXPORT size_t game_get_memory_size(void);
 *   HOTLINE_ARTIFACT_EXPORT void   game_hot_reloaded(void* memory);
 *   HOTLINE_ARTIFACT_EXPORT bool   game_force_reload_requested(void);
 *   HOTLINE_ARTIFACT_EXPORT bool   game_force_restart_requested(void);
 *
 * Optional:
 *
 *   HOTLINE_ARTIFACT_EXPORT void game_attach_allocator(const hotline_allocator_api_v1* api);
 *
 * The host calls attach_allocator on every freshly loaded version before
 * init() or hot_reloaded(). Allocations made through the table are tracked
 * for leaks and bad frees; temp_alloc memory is released at the end of each
 * frame.
 */

#ifndef HOTLINE_ARTIFACT_ABI_H
#define HOTLINE_ARTIFACT_ABI_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform Macros
// ============================================================================

#ifdef _WIN32
    #define HOTLINE_EXPORT __declspec(dllexport)
#else
    #define HOTLINE_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
    #define HOTLINE_ARTIFACT_EXPORT extern "C" HOTLINE_EXPORT
#else
    #define HOTLINE_ARTIFACT_EXPORT HOTLINE_EXPORT
#endif

#define HOTLINE_ABI_VERSION_V1 1u

// ============================================================================
// Host Allocator
// ============================================================================

typedef void* (*hotline_alloc_fn)(void* ctx, size_t size, size_t align, const char* file, int line);
typedef void (*hotline_free_fn)(void* ctx, void* ptr, const char* file, int line);
typedef void* (*hotline_resize_fn)(void* ctx, void* ptr, size_t new_size, size_t align,
                                   const char* file, int line);
typedef void* (*hotline_temp_alloc_fn)(void* ctx, size_t size, size_t align);

/// Allocator table handed to artifacts by the host
typedef struct hotline_allocator_api_v1 {
    unsigned int abi_version;
    void* ctx;
    hotline_alloc_fn alloc;
    hotline_free_fn free;
    hotline_resize_fn resize;
    hotline_temp_alloc_fn temp_alloc;
} hotline_allocator_api_v1;

// Call-site capturing helpers for artifact code
#define HOTLINE_ALLOC(api, size, align) (api)->alloc((api)->ctx, (size), (align), __FILE__, __LINE__)
#define HOTLINE_FREE(api, ptr) (api)->free((api)->ctx, (ptr), __FILE__, __LINE__)
#define HOTLINE_RESIZE(api, ptr, size, align) \
    (api)->resize((api)->ctx, (ptr), (size), (align), __FILE__, __LINE__)
#define HOTLINE_TEMP_ALLOC(api, size, align) (api)->temp_alloc((api)->ctx, (size), (align))

#ifdef __cplusplus
} // extern "C"
#endif

#endif // HOTLINE_ARTIFACT_ABI_H
