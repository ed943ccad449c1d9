#pragma once

#include <string_view>

// Injected by CMake via -DTOOLGATE_VERSION_STRING=...
#ifndef TOOLGATE_VERSION_STRING
#define TOOLGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace toolgate {

inline constexpr std::string_view kVersion = TOOLGATE_VERSION_STRING;

} // namespace toolgate
