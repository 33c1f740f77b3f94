#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace todoffi::common {

// Exception type for internal todoffi errors (library bugs, not caller errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in todoffi, not in the calling code.",
                context, detail)) {
  }
};

// Helper function to throw internal error (marked [[noreturn]] for
// optimization)
[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace todoffi::common
