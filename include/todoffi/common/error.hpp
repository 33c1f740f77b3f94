#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace todoffi {

// Mirrors TodoFfiStatus in todoffi.h; values must stay in sync.
enum class ErrorCode : uint8_t {
  kInvalidArgument = 1,
  kIndexOutOfRange = 2,
  kAllocationFailure = 3,
  kInvalidHandle = 4,
  kInternalError = 5,
};

struct Error {
  ErrorCode code;
  std::string message;

  static auto InvalidArgument(std::string msg) -> Error {
    return Error{.code = ErrorCode::kInvalidArgument, .message = std::move(msg)};
  }

  static auto IndexOutOfRange(std::string msg) -> Error {
    return Error{.code = ErrorCode::kIndexOutOfRange, .message = std::move(msg)};
  }

  static auto AllocationFailure(std::string msg) -> Error {
    return Error{
        .code = ErrorCode::kAllocationFailure, .message = std::move(msg)};
  }

  static auto InvalidHandle(std::string msg) -> Error {
    return Error{.code = ErrorCode::kInvalidHandle, .message = std::move(msg)};
  }
};

template <typename T>
using Result = std::expected<T, Error>;

auto ErrorCodeName(ErrorCode code) -> const char*;

}  // namespace todoffi
