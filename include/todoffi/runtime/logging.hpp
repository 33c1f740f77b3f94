#pragma once

#include <memory>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace todoffi::runtime {

inline constexpr const char* kLoggerName = "todoffi";

// Process-wide "todoffi" logger writing to stderr. Created on first use at
// level warn.
auto Logger() -> const std::shared_ptr<spdlog::logger>&;

void SetLogLevel(spdlog::level::level_enum level);

// Logs "context: detail" at error level without throwing. If the logger
// cannot be created, the line goes to stderr directly.
void LogErrorNoThrow(
    std::string_view context, std::string_view detail) noexcept;

}  // namespace todoffi::runtime
