#include "todoffi/todoffi.h"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <format>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "todoffi/common/error.hpp"
#include "todoffi/common/internal_error.hpp"
#include "todoffi/config/runtime_config.hpp"
#include "todoffi/core/todo.hpp"
#include "todoffi/core/todo_store.hpp"
#include "todoffi/runtime/c_string.hpp"
#include "todoffi/runtime/handle_table.hpp"
#include "todoffi/runtime/list_registry.hpp"
#include "todoffi/runtime/logging.hpp"

static_assert(
    sizeof(TodoFfiListHandle) >= sizeof(uint64_t),
    "todoffi list handles carry a 64-bit slot token");

using todoffi::Error;
using todoffi::ErrorCode;
using todoffi::Result;
using todoffi::core::TodoStore;
using todoffi::runtime::LogErrorNoThrow;
using todoffi::runtime::Logger;
using todoffi::runtime::Registry;
using todoffi::runtime::SlotToken;

namespace {

thread_local std::string t_last_error;

void SetLastError(std::string_view message) noexcept {
  try {
    t_last_error.assign(message);
  } catch (const std::bad_alloc&) {
    t_last_error.clear();
  }
}

// "context: detail", falling back to the bare detail when out of memory.
void SetLastError(std::string_view context, std::string_view detail) noexcept {
  try {
    t_last_error = std::format("{}: {}", context, detail);
  } catch (const std::exception&) {
    SetLastError(detail);
  }
}

auto ToToken(TodoFfiListHandle handle) -> SlotToken {
  return SlotToken{.bits = static_cast<uint64_t>(
                       reinterpret_cast<uintptr_t>(handle))};
}

auto ToHandle(SlotToken token) -> TodoFfiListHandle {
  // NOLINTNEXTLINE(performance-no-int-to-ptr)
  return reinterpret_cast<TodoFfiListHandle>(
      static_cast<uintptr_t>(token.bits));
}

auto ToStatus(ErrorCode code) -> TodoFfiStatus {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return TODOFFI_INVALID_ARGUMENT;
    case ErrorCode::kIndexOutOfRange:
      return TODOFFI_INDEX_OUT_OF_RANGE;
    case ErrorCode::kAllocationFailure:
      return TODOFFI_ALLOCATION_FAILURE;
    case ErrorCode::kInvalidHandle:
      return TODOFFI_INVALID_HANDLE;
    case ErrorCode::kInternalError:
      return TODOFFI_INTERNAL_ERROR;
  }
  return TODOFFI_INTERNAL_ERROR;
}

auto Fail(const char* context, const Error& error) -> TodoFfiStatus {
  SetLastError(context, error.message);
  return ToStatus(error.code);
}

auto FailNull(const char* context, const char* parameter) -> TodoFfiStatus {
  return Fail(
      context,
      Error::InvalidArgument(std::format("'{}' must not be null", parameter)));
}

// Runs an entry point body, translating every C++ exception into a status so
// nothing unwinds into the foreign caller.
template <typename Fn>
auto Guarded(const char* context, Fn&& body) noexcept -> TodoFfiStatus {
  try {
    TodoFfiStatus status = body();
    if (status == TODOFFI_OK) {
      t_last_error.clear();
    }
    return status;
  } catch (const std::bad_alloc&) {
    SetLastError(context, "out of memory");
    return TODOFFI_ALLOCATION_FAILURE;
  } catch (const todoffi::common::InternalError& e) {
    LogErrorNoThrow(context, e.what());
    SetLastError(e.what());
    return TODOFFI_INTERNAL_ERROR;
  } catch (const std::exception& e) {
    LogErrorNoThrow(context, e.what());
    SetLastError(context, e.what());
    return TODOFFI_INTERNAL_ERROR;
  }
}

auto ResolveList(const char* context, TodoFfiListHandle handle)
    -> Result<TodoStore*> {
  auto store = Registry().Resolve(ToToken(handle));
  if (!store && handle != nullptr) {
    Logger()->warn("{}: {}", context, store.error().message);
  }
  return store;
}

// Shared body of NoteAt and FormatAt: render entry `index` and hand a copy
// to the caller.
template <typename Render>
auto CopyOutAt(
    const char* context, TodoFfiListHandle handle, size_t index,
    char** out_text, Render&& render) -> TodoFfiStatus {
  if (out_text == nullptr) {
    return FailNull(context, "out_text");
  }
  auto store = ResolveList(context, handle);
  if (!store) {
    return Fail(context, store.error());
  }
  auto todo = (*store)->At(index);
  if (!todo) {
    return Fail(context, todo.error());
  }
  auto copy = todoffi::runtime::AllocateCString(render(**todo));
  if (!copy) {
    return Fail(context, copy.error());
  }
  *out_text = *copy;
  return TODOFFI_OK;
}

}  // namespace

extern "C" auto TodoFfiAbiVersion() -> uint32_t {
  return TODOFFI_ABI_VERSION;
}

extern "C" auto TodoFfiStatusName(TodoFfiStatus status) -> const char* {
  switch (status) {
    case TODOFFI_OK:
      return "ok";
    case TODOFFI_INVALID_ARGUMENT:
      return "invalid_argument";
    case TODOFFI_INDEX_OUT_OF_RANGE:
      return "index_out_of_range";
    case TODOFFI_ALLOCATION_FAILURE:
      return "allocation_failure";
    case TODOFFI_INVALID_HANDLE:
      return "invalid_handle";
    case TODOFFI_INTERNAL_ERROR:
      return "internal_error";
  }
  return "unknown";
}

extern "C" auto TodoFfiLastError() -> const char* {
  return t_last_error.c_str();
}

extern "C" auto TodoFfiListNew(TodoFfiListHandle* out_handle)
    -> TodoFfiStatus {
  return Guarded("TodoFfiListNew", [&]() -> TodoFfiStatus {
    if (out_handle == nullptr) {
      return FailNull("TodoFfiListNew", "out_handle");
    }
    auto token = Registry().Create();
    if (!token) {
      return Fail("TodoFfiListNew", token.error());
    }
    *out_handle = ToHandle(*token);
    return TODOFFI_OK;
  });
}

extern "C" void TodoFfiListRelease(TodoFfiListHandle handle) {
  if (handle == nullptr) {
    return;
  }
  try {
    if (auto released = Registry().Release(ToToken(handle)); !released) {
      Logger()->warn(
          "TodoFfiListRelease: ignoring {} (double release?)",
          released.error().message);
    }
  } catch (const std::exception& e) {
    LogErrorNoThrow("TodoFfiListRelease", e.what());
  }
}

extern "C" auto TodoFfiListAdd(
    TodoFfiListHandle handle, int32_t id, const char* note) -> TodoFfiStatus {
  return Guarded("TodoFfiListAdd", [&]() -> TodoFfiStatus {
    if (note == nullptr) {
      return FailNull("TodoFfiListAdd", "note");
    }
    auto store = ResolveList("TodoFfiListAdd", handle);
    if (!store) {
      return Fail("TodoFfiListAdd", store.error());
    }
    if (auto added = (*store)->Add(id, note); !added) {
      return Fail("TodoFfiListAdd", added.error());
    }
    return TODOFFI_OK;
  });
}

extern "C" auto TodoFfiListAddWithLength(
    TodoFfiListHandle handle, int32_t id, const char* note, size_t len)
    -> TodoFfiStatus {
  return Guarded("TodoFfiListAddWithLength", [&]() -> TodoFfiStatus {
    if (note == nullptr && len != 0) {
      return FailNull("TodoFfiListAddWithLength", "note");
    }
    auto store = ResolveList("TodoFfiListAddWithLength", handle);
    if (!store) {
      return Fail("TodoFfiListAddWithLength", store.error());
    }
    std::string_view text =
        len == 0 ? std::string_view() : std::string_view(note, len);
    if (auto added = (*store)->Add(id, text); !added) {
      return Fail("TodoFfiListAddWithLength", added.error());
    }
    return TODOFFI_OK;
  });
}

extern "C" auto TodoFfiListAddBatch(
    TodoFfiListHandle handle, const int32_t* ids, const char* const* notes,
    size_t count) -> TodoFfiStatus {
  return Guarded("TodoFfiListAddBatch", [&]() -> TodoFfiStatus {
    auto store = ResolveList("TodoFfiListAddBatch", handle);
    if (!store) {
      return Fail("TodoFfiListAddBatch", store.error());
    }
    if (count == 0) {
      return TODOFFI_OK;
    }
    if (ids == nullptr) {
      return FailNull("TodoFfiListAddBatch", "ids");
    }
    if (notes == nullptr) {
      return FailNull("TodoFfiListAddBatch", "notes");
    }

    std::span<const int32_t> id_span(ids, count);
    std::span<const char* const> note_span(notes, count);
    std::vector<todoffi::core::Todo> batch;
    batch.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      if (note_span[i] == nullptr) {
        return Fail(
            "TodoFfiListAddBatch",
            Error::InvalidArgument(std::format("notes[{}] is null", i)));
      }
      batch.push_back(
          todoffi::core::Todo{.id = id_span[i], .note = note_span[i]});
    }
    if (auto added = (*store)->AddBatch(batch); !added) {
      return Fail("TodoFfiListAddBatch", added.error());
    }
    return TODOFFI_OK;
  });
}

extern "C" auto TodoFfiListCount(TodoFfiListHandle handle, size_t* out_count)
    -> TodoFfiStatus {
  return Guarded("TodoFfiListCount", [&]() -> TodoFfiStatus {
    if (out_count == nullptr) {
      return FailNull("TodoFfiListCount", "out_count");
    }
    auto store = ResolveList("TodoFfiListCount", handle);
    if (!store) {
      return Fail("TodoFfiListCount", store.error());
    }
    *out_count = (*store)->Count();
    return TODOFFI_OK;
  });
}

extern "C" auto TodoFfiListIdAt(
    TodoFfiListHandle handle, size_t index, int32_t* out_id) -> TodoFfiStatus {
  return Guarded("TodoFfiListIdAt", [&]() -> TodoFfiStatus {
    if (out_id == nullptr) {
      return FailNull("TodoFfiListIdAt", "out_id");
    }
    auto store = ResolveList("TodoFfiListIdAt", handle);
    if (!store) {
      return Fail("TodoFfiListIdAt", store.error());
    }
    auto todo = (*store)->At(index);
    if (!todo) {
      return Fail("TodoFfiListIdAt", todo.error());
    }
    *out_id = (*todo)->id;
    return TODOFFI_OK;
  });
}

extern "C" auto TodoFfiListNoteAt(
    TodoFfiListHandle handle, size_t index, char** out_note) -> TodoFfiStatus {
  return Guarded("TodoFfiListNoteAt", [&]() -> TodoFfiStatus {
    return CopyOutAt(
        "TodoFfiListNoteAt", handle, index, out_note,
        [](const todoffi::core::Todo& todo) -> std::string_view {
          return todo.note;
        });
  });
}

extern "C" auto TodoFfiListNoteViewAt(
    TodoFfiListHandle handle, size_t index, const char** out_ptr,
    size_t* out_len) -> TodoFfiStatus {
  return Guarded("TodoFfiListNoteViewAt", [&]() -> TodoFfiStatus {
    if (out_ptr == nullptr) {
      return FailNull("TodoFfiListNoteViewAt", "out_ptr");
    }
    if (out_len == nullptr) {
      return FailNull("TodoFfiListNoteViewAt", "out_len");
    }
    auto store = ResolveList("TodoFfiListNoteViewAt", handle);
    if (!store) {
      return Fail("TodoFfiListNoteViewAt", store.error());
    }
    auto todo = (*store)->At(index);
    if (!todo) {
      return Fail("TodoFfiListNoteViewAt", todo.error());
    }
    *out_ptr = (*todo)->note.c_str();
    *out_len = (*todo)->note.size();
    return TODOFFI_OK;
  });
}

extern "C" auto TodoFfiListFormatAt(
    TodoFfiListHandle handle, size_t index, char** out_text) -> TodoFfiStatus {
  return Guarded("TodoFfiListFormatAt", [&]() -> TodoFfiStatus {
    return CopyOutAt(
        "TodoFfiListFormatAt", handle, index, out_text,
        [](const todoffi::core::Todo& todo) -> std::string {
          return std::format("#{} {}", todo.id, todo.note);
        });
  });
}

extern "C" void TodoFfiStringRelease(char* text) {
  try {
    todoffi::runtime::ReleaseCString(text);
  } catch (const std::exception& e) {
    LogErrorNoThrow("TodoFfiStringRelease", e.what());
  }
}

extern "C" auto TodoFfiRuntimeLoadConfig(const char* path) -> TodoFfiStatus {
  return Guarded("TodoFfiRuntimeLoadConfig", [&]() -> TodoFfiStatus {
    if (path == nullptr) {
      return FailNull("TodoFfiRuntimeLoadConfig", "path");
    }
    auto config = todoffi::config::LoadConfig(path);
    if (!config) {
      return Fail("TodoFfiRuntimeLoadConfig", config.error());
    }
    Registry().Configure(*config);
    Logger()->info("loaded runtime config from {}", path);
    return TODOFFI_OK;
  });
}

extern "C" auto TodoFfiRuntimeGetStats(TodoFfiRuntimeStats* out_stats)
    -> TodoFfiStatus {
  return Guarded("TodoFfiRuntimeGetStats", [&]() -> TodoFfiStatus {
    if (out_stats == nullptr) {
      return FailNull("TodoFfiRuntimeGetStats", "out_stats");
    }
    auto stats = Registry().Stats();
    out_stats->live_lists = stats.live_lists;
    out_stats->slot_capacity = stats.slot_capacity;
    out_stats->outstanding_strings = todoffi::runtime::OutstandingCStrings();
    out_stats->lists_created = stats.lists_created;
    out_stats->lists_released = stats.lists_released;
    return TODOFFI_OK;
  });
}
