#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "todoffi/common/error.hpp"
#include "todoffi/config/runtime_config.hpp"
#include "todoffi/core/todo_store.hpp"
#include "todoffi/runtime/handle_table.hpp"

namespace todoffi::runtime {

struct RegistryStats {
  uint64_t live_lists = 0;
  uint64_t slot_capacity = 0;
  uint64_t lists_created = 0;
  uint64_t lists_released = 0;
};

// Owns every TodoStore reachable from a foreign token. The table itself is
// guarded by a mutex so distinct lists can be created, used and released
// from different threads. The stores are not; see todoffi.h.
class ListRegistry {
 public:
  ListRegistry() = default;
  ListRegistry(const ListRegistry&) = delete;
  auto operator=(const ListRegistry&) -> ListRegistry& = delete;
  ListRegistry(ListRegistry&&) = delete;
  auto operator=(ListRegistry&&) -> ListRegistry& = delete;
  ~ListRegistry() = default;

  auto Create() -> Result<SlotToken>;

  // The pointer stays valid until Release(token).
  auto Resolve(SlotToken token) const -> Result<core::TodoStore*>;

  auto Release(SlotToken token) -> Result<void>;

  // Applies limits and log level. Lists created earlier keep their limits.
  void Configure(const config::RuntimeConfig& config);

  [[nodiscard]] auto Config() const -> config::RuntimeConfig;

  [[nodiscard]] auto Stats() const -> RegistryStats;

 private:
  mutable std::mutex mutex_;
  HandleTable<core::TodoStore> table_;
  config::RuntimeConfig config_;
  uint64_t created_ = 0;
  uint64_t released_ = 0;
};

// Process-wide registry used by the C ABI.
auto Registry() -> ListRegistry&;

}  // namespace todoffi::runtime
