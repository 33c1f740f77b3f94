#pragma once

#include <string>

#include "todoffi/common/error.hpp"

namespace todoffi::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintError(const Error& error);

}  // namespace todoffi::driver
