#include "todoffi/runtime/c_string.hpp"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <format>
#include <string_view>

#include "todoffi/common/error.hpp"
#include "todoffi/common/internal_error.hpp"

namespace todoffi::runtime {

namespace {

std::atomic<uint64_t> g_outstanding{0};

}  // namespace

auto AllocateCString(std::string_view text) -> Result<char*> {
  // Paired with std::free in ReleaseCString.
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory,cppcoreguidelines-no-malloc)
  auto* buffer = static_cast<char*>(std::malloc(text.size() + 1));
  if (buffer == nullptr) {
    return std::unexpected(
        Error::AllocationFailure(
            std::format("cannot allocate {} bytes for text", text.size() + 1)));
  }
  if (!text.empty()) {
    std::memcpy(buffer, text.data(), text.size());
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  buffer[text.size()] = '\0';
  g_outstanding.fetch_add(1, std::memory_order_relaxed);
  return buffer;
}

void ReleaseCString(char* text) {
  if (text == nullptr) {
    return;
  }
  uint64_t current = g_outstanding.load(std::memory_order_relaxed);
  bool underflow = false;
  do {
    if (current == 0) {
      underflow = true;
      break;
    }
  } while (!g_outstanding.compare_exchange_weak(
      current, current - 1, std::memory_order_relaxed));
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory,cppcoreguidelines-no-malloc)
  std::free(text);
  if (underflow) {
    common::ThrowInternalError(
        "ReleaseCString", "more strings released than allocated");
  }
}

auto OutstandingCStrings() -> uint64_t {
  return g_outstanding.load(std::memory_order_relaxed);
}

}  // namespace todoffi::runtime
