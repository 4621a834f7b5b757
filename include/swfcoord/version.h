#pragma once

/// @file version.h
/// @brief Library version information.

#define SWFCOORD_VERSION_MAJOR 0
#define SWFCOORD_VERSION_MINOR 1
#define SWFCOORD_VERSION_PATCH 0
#define SWFCOORD_VERSION_STRING "0.1.0"

namespace swfcoord {

/// Returns the library version string.
const char* version() noexcept;

} // namespace swfcoord
