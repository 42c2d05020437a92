#pragma once

#include <string>

namespace betme {

// Caller identity supplied by the execution substrate. Only compared for equality.
using Identity = std::string;

void requireCaller(const Identity& caller, const Identity& expected, const std::string& reason);
void requireMember(const Identity& caller,
                   const Identity& first,
                   const Identity& second,
                   const std::string& reason);

} // namespace betme
