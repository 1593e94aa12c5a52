/*
 * scratchpad/host_api.h - C ABI between the host runner and a compiled image.
 *
 * A compiled script image is a shared object built from the scaffold around
 * the user's body. The image and the runner are built separately (the image
 * at run time, by whatever compiler the configuration names), so nothing
 * C++-typed crosses between them. The runner hands the image one
 * scratchpad_host_api table; the image calls back through it.
 *
 * EXPORTED BY EVERY IMAGE (see SCRATCHPAD_EXPORT_ENTRY in script_host.hpp):
 *   unsigned scratchpad_scaffold_version(void);
 *   int      scratchpad_bind_host(const scratchpad_host_api* api);
 *   void     scratchpad_<Holder>_set_<Property>(const char* value);
 *   void     scratchpad_<Holder>_<Entry>(void);
 *
 * OWNERSHIP CONTRACT:
 *   - The table and ctx are owned by the runner and outlive the entry call.
 *   - Strings passed in either direction are borrowed for the duration of
 *     the call only. Callees copy what they keep.
 *   - load_native returns a dlopen handle owned by the runner. The image
 *     never dlclose()s it; the boundary process exit releases it.
 *
 * THREAD SAFETY:
 *   write/dump/set_return may be called from any thread the script starts.
 *   The runner serializes frames behind a mutex.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Bump on any change to scratchpad_host_api layout. */
#define SCRATCHPAD_HOST_ABI_VERSION 1

/* Bump when the scaffold's exported symbols change. */
#define SCRATCHPAD_SCAFFOLD_VERSION 1

typedef struct scratchpad_host_api {
  uint32_t abi_version;
  void* ctx;

  /* One output fragment. Not NUL-terminated; len bytes are valid. */
  void (*write)(void* ctx, const char* data, size_t len);

  /* One structured value: label may be empty, type_name is demangled. */
  void (*dump)(void* ctx, const char* label, const char* type_name, const char* text);

  /* Return descriptor of the entry method. Called at most once. */
  void (*set_return)(void* ctx, const char* type_name, const char* text);

  /* Resolve a native library through the boundary's probing paths and
   * dlopen() it. NULL when the library cannot be found or mapped. */
  void* (*load_native)(void* ctx, const char* name);
} scratchpad_host_api;

#ifdef __cplusplus
}
#endif
