/*
 * lindos/c_api.h - Stable C ABI between the lindos engine and a foreign runtime.
 *
 * This header is the only surface a managed front-end (Swift, Python ctypes,
 * JNI, ...) links against. No C++ types, exceptions or STL containers cross it.
 * All text is null-terminated UTF-8.
 *
 * OWNERSHIP CONTRACT:
 *   - Caller owns all INPUT strings. The engine reads them for the duration of
 *     the call and never stores them.
 *   - Every OUTPUT pointer (lindos_result_t.data, lindos_error_message(),
 *     lindos_stats(), lindos_process_message_legacy()) is engine-owned memory.
 *   - Release each envelope exactly once with lindos_release_result() and each
 *     returned string exactly once with lindos_release_string().
 *   - Do NOT free output memory with free(), delete[] or a foreign allocator.
 *   - Releasing the same pointer twice, or a pointer this library did not
 *     return, is a protocol violation: a message is written to stderr and the
 *     process aborts.
 *   - Releasing an envelope whose data is NULL is a no-op.
 *
 * THREAD SAFETY:
 *   - Every function may be called from any thread, concurrently.
 *   - lindos_set_debug() may race with in-flight calls; each call samples the
 *     flag once, so at most that call's diagnostic record is affected.
 *   - lindos_configure() swaps the engine atomically. Calls already running
 *     finish on the engine they started with.
 *
 * ERROR CODES:
 *   0 none, 1 null input, 2 invalid encoding, 3 empty message,
 *   4 processing failure. Any other value is an unknown code; consumers must
 *   display it via lindos_error_message() rather than reject it.
 *
 * ABI VERSIONING:
 *   - LINDOS_ABI_VERSION is the version these declarations describe.
 *   - Consumers compare it with lindos_abi_version() at load time.
 *
 * EXAMPLE (C):
 *   lindos_result_t r = lindos_process_message("Hello");
 *   if (r.success) {
 *     printf("%s\n", r.data);
 *   } else {
 *     char* msg = lindos_error_message(r.error_code);
 *     fprintf(stderr, "%s\n", msg);
 *     lindos_release_string(msg);
 *   }
 *   lindos_release_result(r);
 */

#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Current C ABI version. Bump on any breaking change. */
#define LINDOS_ABI_VERSION 1

#define LINDOS_ERROR_NONE 0
#define LINDOS_ERROR_NULL_INPUT 1
#define LINDOS_ERROR_INVALID_ENCODING 2
#define LINDOS_ERROR_EMPTY_MESSAGE 3
#define LINDOS_ERROR_PROCESSING_FAILURE 4

/* lindos_configure() return values. */
#define LINDOS_CONFIG_OK 0
#define LINDOS_CONFIG_INVALID (-1)

/*
 * lindos_result_t - Result envelope returned by value.
 *
 * success == true:  error_code == 0, data is the non-empty reply.
 * success == false: error_code != 0. data is NULL for input errors (1-3) and
 *                   holds a diagnostic for processing failures (4), or NULL
 *                   if even that could not be allocated.
 *
 * Field order and types are fixed by ENVELOPE_LAYOUT_VERSION (version.hpp).
 */
typedef struct lindos_result {
  bool success;
  int32_t error_code;
  char* data;
} lindos_result_t;

/*
 * lindos_set_debug - Turn diagnostic logging on or off for the whole process.
 * Affects diagnostic volume only, never results.
 */
void lindos_set_debug(bool enabled);

/* lindos_debug_enabled - Current value of the debug flag. */
bool lindos_debug_enabled(void);

/*
 * lindos_validate_message - Structural check without processing.
 *
 * Returns 0 if the message is valid, otherwise the error code process would
 * fail with: 1 (NULL), 2 (not UTF-8), 3 (empty or whitespace only).
 * Returns no owned memory.
 */
int32_t lindos_validate_message(const char* message);

/*
 * lindos_process_message - Validate and process a message.
 *
 * Never returns an uninitialized envelope and never throws. The caller must
 * pass the envelope to lindos_release_result() exactly once.
 */
lindos_result_t lindos_process_message(const char* message);

/*
 * lindos_release_result - Release the data owned by an envelope.
 * Aborts the process if result.data was already released.
 */
void lindos_release_result(lindos_result_t result);

/*
 * lindos_error_message - User-facing text for an error code.
 *
 * Never returns an empty string. Unknown codes yield
 * "Unknown error (code: N)". Returns NULL only on allocation failure.
 * Caller must free via lindos_release_string.
 */
char* lindos_error_message(int32_t code);

/*
 * lindos_release_string - Release a string returned by this API.
 * NULL is a no-op. Aborts the process on a second release.
 */
void lindos_release_string(char* s);

/*
 * lindos_process_message_legacy - Single-string entry point.
 *
 * Returns the reply on success, otherwise the user-facing error line for the
 * failure kind. Callers cannot distinguish the two; prefer
 * lindos_process_message(). Caller must free via lindos_release_string.
 */
char* lindos_process_message_legacy(const char* message);

/*
 * lindos_configure - Replace the engine configuration.
 *
 * config_json: flat JSON object, keys (all optional):
 *   "max_message_bytes": reply limit of the built-in responder (default 1000)
 *   "event_log_path":    JSONL file for debug diagnostics (default: stderr)
 *   "debug":             initial debug flag
 *   "worker_threads":    consumer-side worker pool size hint
 *
 * Returns LINDOS_CONFIG_OK, or LINDOS_CONFIG_INVALID if the config was rejected.
 * A rejected config leaves the running engine untouched.
 */
int32_t lindos_configure(const char* config_json);

/*
 * lindos_stats - Engine statistics as JSON (see observability.hpp).
 * Caller must free via lindos_release_string.
 */
char* lindos_stats(void);

/*
 * lindos_abi_version - Return the compiled ABI version.
 */
uint32_t lindos_abi_version(void);

#ifdef __cplusplus
}  /* extern "C" */
#endif
