/**
 * @file vgl_types.h
 * @brief Virgil Commons - Basic C types shared by both sides of the boundary
 */

#ifndef VGL_TYPES_H
#define VGL_TYPES_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#define VGL_API __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
#define VGL_API __attribute__((visibility("default")))
#else
#define VGL_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/** Result code returned by every fallible C entry point (0 = success). */
typedef int32_t vgl_result_t;

/** C-compatible boolean. */
typedef int32_t vgl_bool_t;

#define VGL_TRUE 1
#define VGL_FALSE 0

/** Opaque handle. */
typedef void* vgl_handle_t;

#ifdef __cplusplus
}
#endif

#endif  // VGL_TYPES_H
