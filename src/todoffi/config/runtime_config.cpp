#include "todoffi/config/runtime_config.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/common.h>

#include "todoffi/common/error.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include "toml.hpp"
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace todoffi::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(const fs::path& path, std::string_view detail) -> Error {
  return Error::InvalidArgument(std::format("{}: {}", path.string(), detail));
}

// Reads an optional non-negative integer field. Absent leaves `out` as is.
auto ReadLimit(
    const toml::node_view<toml::node>& runtime, std::string_view key,
    const fs::path& path, size_t& out) -> Result<void> {
  auto node = runtime[key];
  if (!node) {
    return {};
  }
  auto value = node.value_exact<int64_t>();
  if (!value) {
    return std::unexpected(
        ConfigError(path, std::format("'runtime.{}' must be an integer", key)));
  }
  if (*value < 0) {
    return std::unexpected(
        ConfigError(
            path, std::format("'runtime.{}' must be non-negative", key)));
  }
  out = static_cast<size_t>(*value);
  return {};
}

}  // namespace

auto ParseLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
  static constexpr std::array<
      std::pair<std::string_view, spdlog::level::level_enum>, 7>
      kLevels = {{
          {"trace", spdlog::level::trace},
          {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},
          {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},
          {"critical", spdlog::level::critical},
          {"off", spdlog::level::off},
      }};
  for (const auto& [level_name, level] : kLevels) {
    if (level_name == name) {
      return level;
    }
  }
  return std::nullopt;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<RuntimeConfig> {
  RuntimeConfig config;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        ConfigError(config_path, std::format("failed to parse: {}", e.what())));
  }

  // [runtime] section
  auto runtime = tbl["runtime"];
  if (!runtime) {
    return config;
  }
  if (!runtime.is_table()) {
    return std::unexpected(
        ConfigError(config_path, "'runtime' must be a table"));
  }

  if (auto level_node = runtime["log_level"]) {
    auto level_name = level_node.value_exact<std::string>();
    if (!level_name) {
      return std::unexpected(
          ConfigError(config_path, "'runtime.log_level' must be a string"));
    }
    auto level = ParseLogLevel(*level_name);
    if (!level) {
      return std::unexpected(
          ConfigError(
              config_path,
              std::format("unknown log level '{}'", *level_name)));
    }
    config.log_level = *level;
  }

  if (auto r = ReadLimit(
          runtime, "max_live_lists", config_path, config.max_live_lists);
      !r) {
    return std::unexpected(std::move(r.error()));
  }
  if (auto r = ReadLimit(
          runtime, "max_note_bytes", config_path, config.max_note_bytes);
      !r) {
    return std::unexpected(std::move(r.error()));
  }

  return config;
}

}  // namespace todoffi::config
