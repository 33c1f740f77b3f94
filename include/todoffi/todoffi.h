#ifndef TODOFFI_TODOFFI_H
#define TODOFFI_TODOFFI_H

/*
 * C ABI for the todoffi Todo list.
 *
 * Ownership rules:
 *   - A TodoFfiListHandle returned by TodoFfiListNew is owned by the caller
 *     and must be consumed exactly once by TodoFfiListRelease.
 *   - Every non-null char* returned through an out-parameter (NoteAt,
 *     FormatAt) is owned by the caller and must be released exactly once with
 *     TodoFfiStringRelease. Do not use free() or any other deallocator.
 *   - Views returned by NoteViewAt are borrowed and stay valid until the
 *     owning list is released.
 *
 * Every function that can fail returns a TodoFfiStatus and writes its result
 * through out-parameters only on TODOFFI_OK. No function ever unwinds an
 * exception into the caller.
 *
 * A single list is not thread-safe. Distinct lists may be used concurrently
 * from different threads.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define TODOFFI_ABI_VERSION 1u

typedef enum TodoFfiStatus {
  TODOFFI_OK = 0,
  TODOFFI_INVALID_ARGUMENT = 1,
  TODOFFI_INDEX_OUT_OF_RANGE = 2,
  TODOFFI_ALLOCATION_FAILURE = 3,
  TODOFFI_INVALID_HANDLE = 4,
  TODOFFI_INTERNAL_ERROR = 5
} TodoFfiStatus;

/* Opaque token. Never dereference; the bits are not an address. */
typedef struct TodoFfiList* TodoFfiListHandle;

typedef struct TodoFfiRuntimeStats {
  uint64_t live_lists;
  uint64_t slot_capacity;
  uint64_t outstanding_strings;
  uint64_t lists_created;
  uint64_t lists_released;
} TodoFfiRuntimeStats;

uint32_t TodoFfiAbiVersion(void);

/* Static, never null. */
const char* TodoFfiStatusName(TodoFfiStatus status);

/* Message of the most recent failure on the calling thread, "" after a
 * success. Valid until the next todoffi call on the same thread. */
const char* TodoFfiLastError(void);

TodoFfiStatus TodoFfiListNew(TodoFfiListHandle* out_handle);

/* Null is a no-op. Stale or already-released tokens are ignored. */
void TodoFfiListRelease(TodoFfiListHandle handle);

/* note must be zero-terminated. */
TodoFfiStatus TodoFfiListAdd(
    TodoFfiListHandle handle, int32_t id, const char* note);

/* note is len bytes, not necessarily zero-terminated. Rejected with
 * TODOFFI_INVALID_ARGUMENT if it contains a zero byte. note may be null only
 * when len is 0. */
TodoFfiStatus TodoFfiListAddWithLength(
    TodoFfiListHandle handle, int32_t id, const char* note, size_t len);

/* All-or-nothing append of count records. ids/notes may be null only when
 * count is 0. */
TodoFfiStatus TodoFfiListAddBatch(
    TodoFfiListHandle handle, const int32_t* ids, const char* const* notes,
    size_t count);

TodoFfiStatus TodoFfiListCount(TodoFfiListHandle handle, size_t* out_count);

TodoFfiStatus TodoFfiListIdAt(
    TodoFfiListHandle handle, size_t index, int32_t* out_id);

/* On success *out_note is a caller-owned copy; release with
 * TodoFfiStringRelease. */
TodoFfiStatus TodoFfiListNoteAt(
    TodoFfiListHandle handle, size_t index, char** out_note);

/* Borrowed, zero-terminated view into the list. Do not release. */
TodoFfiStatus TodoFfiListNoteViewAt(
    TodoFfiListHandle handle, size_t index, const char** out_ptr,
    size_t* out_len);

/* "#<id> <note>". Caller-owned; release with TodoFfiStringRelease. */
TodoFfiStatus TodoFfiListFormatAt(
    TodoFfiListHandle handle, size_t index, char** out_text);

/* Null is a no-op. */
void TodoFfiStringRelease(char* text);

/* Loads a todoffi.toml runtime configuration and applies it process-wide. */
TodoFfiStatus TodoFfiRuntimeLoadConfig(const char* path);

TodoFfiStatus TodoFfiRuntimeGetStats(TodoFfiRuntimeStats* out_stats);

#ifdef __cplusplus
}
#endif

#endif /* TODOFFI_TODOFFI_H */
