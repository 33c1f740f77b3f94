#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

#include <spdlog/common.h>

#include "todoffi/common/error.hpp"

namespace todoffi::config {

inline constexpr const char* kConfigFileName = "todoffi.toml";

struct RuntimeConfig {
  spdlog::level::level_enum log_level = spdlog::level::warn;
  // 0 means unlimited for both limits.
  size_t max_live_lists = 0;
  size_t max_note_bytes = 0;

  auto operator==(const RuntimeConfig&) const -> bool = default;
};

// Search for todoffi.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse todoffi.toml. A missing [runtime] section yields the defaults;
// unknown keys are ignored.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<RuntimeConfig>;

// Accepts the spdlog level names: trace, debug, info, warn, error, critical,
// off.
auto ParseLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

}  // namespace todoffi::config
