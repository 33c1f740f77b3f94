#include "todoffi/core/todo_store.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "todoffi/common/error.hpp"
#include "todoffi/core/todo.hpp"

namespace todoffi::core {

auto TodoStore::ValidateNote(std::string_view note) const -> Result<void> {
  if (auto pos = note.find('\0'); pos != std::string_view::npos) {
    return std::unexpected(
        Error::InvalidArgument(
            std::format("note contains a NUL byte at offset {}", pos)));
  }
  if (limits_.max_note_bytes != 0 && note.size() > limits_.max_note_bytes) {
    return std::unexpected(
        Error::InvalidArgument(
            std::format(
                "note is {} bytes, limit is {}", note.size(),
                limits_.max_note_bytes)));
  }
  return {};
}

auto TodoStore::Add(int32_t id, std::string_view note) -> Result<void> {
  if (auto valid = ValidateNote(note); !valid) {
    return std::unexpected(std::move(valid.error()));
  }
  todos_.push_back(Todo{.id = id, .note = std::string(note)});
  return {};
}

auto TodoStore::AddBatch(std::span<const Todo> todos) -> Result<void> {
  for (size_t i = 0; i < todos.size(); ++i) {
    if (auto valid = ValidateNote(todos[i].note); !valid) {
      return std::unexpected(
          Error::InvalidArgument(
              std::format("batch entry {}: {}", i, valid.error().message)));
    }
  }
  // Copy before touching todos_; on allocation failure while appending, the
  // records already appended are popped again so no partial batch remains.
  std::vector<Todo> staged(todos.begin(), todos.end());
  size_t appended = 0;
  try {
    for (auto& todo : staged) {
      todos_.push_back(std::move(todo));
      ++appended;
    }
  } catch (const std::bad_alloc&) {
    for (; appended > 0; --appended) {
      todos_.pop_back();
    }
    throw;
  }
  return {};
}

auto TodoStore::At(size_t index) const -> Result<const Todo*> {
  if (index >= todos_.size()) {
    return std::unexpected(
        Error::IndexOutOfRange(
            std::format(
                "index {} out of range for list of {} entries", index,
                todos_.size())));
  }
  return &todos_[index];
}

}  // namespace todoffi::core
