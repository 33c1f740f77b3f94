#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <string_view>

#include "todoffi/common/error.hpp"
#include "todoffi/core/todo.hpp"

namespace todoffi::core {

struct StoreLimits {
  // 0 means unlimited.
  size_t max_note_bytes = 0;
};

// Ordered, append-only list of Todo records. Records never move once
// appended, so indices and the pointers returned by At() stay valid for the
// lifetime of the store.
class TodoStore {
 public:
  explicit TodoStore(StoreLimits limits = {}) : limits_(limits) {
  }

  // Fails with kInvalidArgument, leaving the store unchanged, if the note
  // holds a NUL byte or exceeds max_note_bytes.
  auto Add(int32_t id, std::string_view note) -> Result<void>;

  // All-or-nothing: every record is validated before any is appended.
  auto AddBatch(std::span<const Todo> todos) -> Result<void>;

  [[nodiscard]] auto Count() const -> size_t {
    return todos_.size();
  }

  auto At(size_t index) const -> Result<const Todo*>;

  [[nodiscard]] auto Limits() const -> const StoreLimits& {
    return limits_;
  }

 private:
  auto ValidateNote(std::string_view note) const -> Result<void>;

  StoreLimits limits_;
  // deque: push_back leaves existing elements in place.
  std::deque<Todo> todos_;
};

}  // namespace todoffi::core
