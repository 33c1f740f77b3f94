#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "todoffi/common/error.hpp"
#include "todoffi/core/todo.hpp"
#include "todoffi/todoffi.h"

namespace todoffi::sdk {

// Deleter for strings the C ABI hands to the caller.
struct CStringReleaser {
  void operator()(char* text) const noexcept {
    TodoFfiStringRelease(text);
  }
};

using OwnedCString = std::unique_ptr<char, CStringReleaser>;

// Builds an Error from a failed status and the thread's last error message.
inline auto ErrorFromStatus(TodoFfiStatus status) -> Error {
  return Error{
      .code = static_cast<ErrorCode>(status), .message = TodoFfiLastError()};
}

// Move-only owner of one list handle. The handle is released when the
// TodoList goes out of scope, and every string copied out of the list is
// released before the call returns, so C++ callers never see the manual
// release obligations of todoffi.h.
class TodoList {
 public:
  static auto Create() -> Result<TodoList> {
    TodoFfiListHandle handle = nullptr;
    if (auto status = TodoFfiListNew(&handle); status != TODOFFI_OK) {
      return std::unexpected(ErrorFromStatus(status));
    }
    return TodoList(handle);
  }

  // Takes ownership of a handle obtained from TodoFfiListNew.
  static auto Adopt(TodoFfiListHandle handle) -> TodoList {
    return TodoList(handle);
  }

  TodoList(const TodoList&) = delete;
  auto operator=(const TodoList&) -> TodoList& = delete;

  TodoList(TodoList&& other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)) {
  }

  auto operator=(TodoList&& other) noexcept -> TodoList& {
    if (this != &other) {
      TodoFfiListRelease(handle_);
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  ~TodoList() {
    TodoFfiListRelease(handle_);
  }

  auto Add(int32_t id, std::string_view note) -> Result<void> {
    return Check(
        TodoFfiListAddWithLength(handle_, id, note.data(), note.size()));
  }

  auto AddBatch(std::span<const core::Todo> todos) -> Result<void> {
    std::vector<int32_t> ids;
    std::vector<const char*> notes;
    ids.reserve(todos.size());
    notes.reserve(todos.size());
    for (size_t i = 0; i < todos.size(); ++i) {
      // c_str() would silently truncate at an embedded NUL.
      if (todos[i].note.find('\0') != std::string::npos) {
        return std::unexpected(
            Error::InvalidArgument(
                std::format("batch entry {}: note contains a NUL byte", i)));
      }
      ids.push_back(todos[i].id);
      notes.push_back(todos[i].note.c_str());
    }
    return Check(
        TodoFfiListAddBatch(handle_, ids.data(), notes.data(), todos.size()));
  }

  [[nodiscard]] auto Count() const -> Result<size_t> {
    size_t count = 0;
    if (auto r = Check(TodoFfiListCount(handle_, &count)); !r) {
      return std::unexpected(std::move(r.error()));
    }
    return count;
  }

  [[nodiscard]] auto IdAt(size_t index) const -> Result<int32_t> {
    int32_t id = 0;
    if (auto r = Check(TodoFfiListIdAt(handle_, index, &id)); !r) {
      return std::unexpected(std::move(r.error()));
    }
    return id;
  }

  [[nodiscard]] auto NoteAt(size_t index) const -> Result<std::string> {
    return TakeString([&](char** out) {
      return TodoFfiListNoteAt(handle_, index, out);
    });
  }

  // Borrowed view, valid while this list is alive.
  [[nodiscard]] auto NoteViewAt(size_t index) const
      -> Result<std::string_view> {
    const char* ptr = nullptr;
    size_t len = 0;
    if (auto r = Check(TodoFfiListNoteViewAt(handle_, index, &ptr, &len));
        !r) {
      return std::unexpected(std::move(r.error()));
    }
    return std::string_view(ptr, len);
  }

  [[nodiscard]] auto FormatAt(size_t index) const -> Result<std::string> {
    return TakeString([&](char** out) {
      return TodoFfiListFormatAt(handle_, index, out);
    });
  }

  // Snapshot of every entry in insertion order.
  [[nodiscard]] auto Items() const -> Result<std::vector<core::Todo>> {
    auto count = Count();
    if (!count) {
      return std::unexpected(std::move(count.error()));
    }
    std::vector<core::Todo> items;
    items.reserve(*count);
    for (size_t i = 0; i < *count; ++i) {
      auto id = IdAt(i);
      if (!id) {
        return std::unexpected(std::move(id.error()));
      }
      auto note = NoteAt(i);
      if (!note) {
        return std::unexpected(std::move(note.error()));
      }
      items.push_back(core::Todo{.id = *id, .note = std::move(*note)});
    }
    return items;
  }

  [[nodiscard]] auto Handle() const -> TodoFfiListHandle {
    return handle_;
  }

  // Gives up ownership; the caller must pass the handle to
  // TodoFfiListRelease.
  [[nodiscard]] auto Detach() -> TodoFfiListHandle {
    return std::exchange(handle_, nullptr);
  }

 private:
  explicit TodoList(TodoFfiListHandle handle) : handle_(handle) {
  }

  static auto Check(TodoFfiStatus status) -> Result<void> {
    if (status != TODOFFI_OK) {
      return std::unexpected(ErrorFromStatus(status));
    }
    return {};
  }

  template <typename Fetch>
  static auto TakeString(Fetch&& fetch) -> Result<std::string> {
    char* raw = nullptr;
    if (auto r = Check(fetch(&raw)); !r) {
      return std::unexpected(std::move(r.error()));
    }
    OwnedCString owned(raw);
    return std::string(owned.get());
  }

  TodoFfiListHandle handle_ = nullptr;
};

inline auto LoadRuntimeConfig(const std::string& path) -> Result<void> {
  if (auto status = TodoFfiRuntimeLoadConfig(path.c_str());
      status != TODOFFI_OK) {
    return std::unexpected(ErrorFromStatus(status));
  }
  return {};
}

inline auto RuntimeStats() -> Result<TodoFfiRuntimeStats> {
  TodoFfiRuntimeStats stats{};
  if (auto status = TodoFfiRuntimeGetStats(&stats); status != TODOFFI_OK) {
    return std::unexpected(ErrorFromStatus(status));
  }
  return stats;
}

}  // namespace todoffi::sdk
