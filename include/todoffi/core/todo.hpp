#pragma once

#include <cstdint>
#include <string>

namespace todoffi::core {

struct Todo {
  int32_t id = 0;
  std::string note;

  auto operator==(const Todo&) const -> bool = default;
};

}  // namespace todoffi::core
