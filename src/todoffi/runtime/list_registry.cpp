#include "todoffi/runtime/list_registry.hpp"

#include <expected>
#include <memory>
#include <mutex>
#include <utility>

#include "todoffi/common/error.hpp"
#include "todoffi/config/runtime_config.hpp"
#include "todoffi/core/todo_store.hpp"
#include "todoffi/runtime/handle_table.hpp"
#include "todoffi/runtime/logging.hpp"

namespace todoffi::runtime {

auto ListRegistry::Create() -> Result<SlotToken> {
  std::lock_guard lock(mutex_);
  auto store = std::make_unique<core::TodoStore>(
      core::StoreLimits{.max_note_bytes = config_.max_note_bytes});
  auto token = table_.Insert(std::move(store));
  if (!token) {
    return std::unexpected(std::move(token.error()));
  }
  ++created_;
  Logger()->debug(
      "created list slot={} generation={} live={}", token->Index(),
      token->Generation(), table_.LiveCount());
  return *token;
}

auto ListRegistry::Resolve(SlotToken token) const -> Result<core::TodoStore*> {
  std::lock_guard lock(mutex_);
  return table_.Get(token);
}

auto ListRegistry::Release(SlotToken token) -> Result<void> {
  std::unique_ptr<core::TodoStore> store;
  {
    std::lock_guard lock(mutex_);
    auto erased = table_.Erase(token);
    if (!erased) {
      return std::unexpected(std::move(erased.error()));
    }
    store = std::move(*erased);
    ++released_;
    Logger()->debug(
        "released list slot={} generation={} entries={} live={}",
        token.Index(), token.Generation(), store->Count(), table_.LiveCount());
  }
  // Store is destroyed here, outside the lock.
  return {};
}

void ListRegistry::Configure(const config::RuntimeConfig& config) {
  std::lock_guard lock(mutex_);
  config_ = config;
  table_.SetMaxLive(config.max_live_lists);
  SetLogLevel(config.log_level);
}

auto ListRegistry::Config() const -> config::RuntimeConfig {
  std::lock_guard lock(mutex_);
  return config_;
}

auto ListRegistry::Stats() const -> RegistryStats {
  std::lock_guard lock(mutex_);
  return RegistryStats{
      .live_lists = table_.LiveCount(),
      .slot_capacity = table_.Capacity(),
      .lists_created = created_,
      .lists_released = released_,
  };
}

auto Registry() -> ListRegistry& {
  static ListRegistry registry;
  return registry;
}

}  // namespace todoffi::runtime
