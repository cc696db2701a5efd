#pragma once

#include <string>

namespace cadence::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

}  // namespace cadence::driver
