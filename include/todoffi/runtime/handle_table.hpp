#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "todoffi/common/error.hpp"
#include "todoffi/common/internal_error.hpp"

namespace todoffi::runtime {

// Opaque token minted by HandleTable. Encodes (generation << 32) |
// (slot_index + 1), so 0 is never a valid token.
struct SlotToken {
  uint64_t bits = 0;

  auto operator==(const SlotToken&) const -> bool = default;
  explicit operator bool() const {
    return bits != 0;
  }

  [[nodiscard]] auto Index() const -> uint32_t {
    return static_cast<uint32_t>(bits & 0xFFFF'FFFFU) - 1;
  }
  [[nodiscard]] auto Generation() const -> uint32_t {
    return static_cast<uint32_t>(bits >> 32);
  }

  static auto Make(uint32_t index, uint32_t generation) -> SlotToken {
    return SlotToken{
        .bits = (static_cast<uint64_t>(generation) << 32) |
                (static_cast<uint64_t>(index) + 1)};
  }
};

constexpr SlotToken kNullSlotToken{};

// Owns objects in reusable slots. Every erase bumps the slot generation, so
// tokens minted before the erase no longer resolve, even after the slot is
// handed out again. Not synchronized.
template <typename T>
class HandleTable {
 public:
  HandleTable() = default;
  HandleTable(const HandleTable&) = delete;
  auto operator=(const HandleTable&) -> HandleTable& = delete;
  HandleTable(HandleTable&&) noexcept = default;
  auto operator=(HandleTable&&) noexcept -> HandleTable& = default;
  ~HandleTable() = default;

  // 0 means unlimited.
  void SetMaxLive(size_t max_live) {
    max_live_ = max_live;
  }

  auto Insert(std::unique_ptr<T> object) -> Result<SlotToken> {
    if (object == nullptr) {
      common::ThrowInternalError("HandleTable::Insert", "null object");
    }
    if (max_live_ != 0 && live_ >= max_live_) {
      return std::unexpected(
          Error::AllocationFailure(
              std::format("live handle limit of {} reached", max_live_)));
    }
    uint32_t index = 0;
    if (!free_.empty()) {
      index = free_.back();
      free_.pop_back();
    } else {
      if (slots_.size() >= kMaxSlots) {
        return std::unexpected(
            Error::AllocationFailure("handle table slot space exhausted"));
      }
      slots_.emplace_back();
      index = static_cast<uint32_t>(slots_.size() - 1);
    }
    Slot& slot = slots_[index];
    slot.object = std::move(object);
    ++live_;
    return SlotToken::Make(index, slot.generation);
  }

  auto Get(SlotToken token) const -> Result<T*> {
    auto index = FindIndex(token);
    if (!index) {
      return std::unexpected(Error::InvalidHandle(Describe(token)));
    }
    return slots_[*index].object.get();
  }

  // Hands the object back to the caller and retires the token.
  auto Erase(SlotToken token) -> Result<std::unique_ptr<T>> {
    auto index = FindIndex(token);
    if (!index) {
      return std::unexpected(Error::InvalidHandle(Describe(token)));
    }
    // Reserve the free-list entry up front; nothing below may throw once the
    // object has left its slot.
    free_.reserve(free_.size() + 1);
    Slot& slot = slots_[*index];
    std::unique_ptr<T> object = std::move(slot.object);
    --live_;
    // A slot whose generation would wrap is retired for good instead of
    // risking a stale token matching again.
    if (slot.generation == UINT32_MAX) {
      return object;
    }
    ++slot.generation;
    free_.push_back(*index);
    return object;
  }

  [[nodiscard]] auto LiveCount() const -> size_t {
    return live_;
  }

  [[nodiscard]] auto Capacity() const -> size_t {
    return slots_.size();
  }

 private:
  static constexpr size_t kMaxSlots = UINT32_MAX - 1;

  struct Slot {
    std::unique_ptr<T> object;
    uint32_t generation = 1;
  };

  auto FindIndex(SlotToken token) const -> std::optional<uint32_t> {
    if (!token) {
      return std::nullopt;
    }
    uint32_t index = token.Index();
    if (index >= slots_.size()) {
      return std::nullopt;
    }
    const Slot& slot = slots_[index];
    if (slot.object == nullptr || slot.generation != token.Generation()) {
      return std::nullopt;
    }
    return index;
  }

  static auto Describe(SlotToken token) -> std::string {
    if (!token) {
      return "null handle";
    }
    return std::format(
        "stale or unknown handle (slot {}, generation {})", token.Index(),
        token.Generation());
  }

  std::vector<Slot> slots_;
  std::vector<uint32_t> free_;
  size_t live_ = 0;
  size_t max_live_ = 0;
};

}  // namespace todoffi::runtime
