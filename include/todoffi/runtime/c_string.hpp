#pragma once

#include <cstdint>
#include <string_view>

#include "todoffi/common/error.hpp"

namespace todoffi::runtime {

// Copies `text` into a new NUL-terminated malloc'd buffer owned by the
// caller. Every successful call must be paired with one ReleaseCString.
auto AllocateCString(std::string_view text) -> Result<char*>;

// Null is a no-op. The buffer is always freed; releasing more strings than
// were allocated then throws InternalError.
void ReleaseCString(char* text);

// Number of strings handed out by AllocateCString and not yet released.
auto OutstandingCStrings() -> uint64_t;

}  // namespace todoffi::runtime
