#include "todoffi/common/error.hpp"

namespace todoffi {

auto ErrorCodeName(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
    case ErrorCode::kIndexOutOfRange:
      return "index out of range";
    case ErrorCode::kAllocationFailure:
      return "allocation failure";
    case ErrorCode::kInvalidHandle:
      return "invalid handle";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown error";
}

}  // namespace todoffi
