#include "todoffi/runtime/logging.hpp"

#include <cstdio>
#include <exception>
#include <memory>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace todoffi::runtime {

auto Logger() -> const std::shared_ptr<spdlog::logger>& {
  // Registered under kLoggerName so an embedding application can retrieve it
  // with spdlog::get and swap sinks.
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%n][%l] %v");
    return created;
  }();
  return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
  Logger()->set_level(level);
}

void LogErrorNoThrow(
    std::string_view context, std::string_view detail) noexcept {
  try {
    Logger()->error("{}: {}", context, detail);
  } catch (const std::exception& e) {
    std::fprintf(
        stderr, "[%s][error] %.*s: %.*s (logger unavailable: %s)\n",
        kLoggerName, static_cast<int>(context.size()), context.data(),
        static_cast<int>(detail.size()), detail.data(), e.what());
  }
}

}  // namespace todoffi::runtime
