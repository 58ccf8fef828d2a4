/// @file str_cursor.hpp
/// @brief Umbrella header for the str-cursor library.
///
/// Include this single header for access to StrCursor, the spanners,
/// the patterns, the UTF-8 primitives and Error. The nlohmann/json
/// interop lives separately in <str-cursor/json.hpp>.

#pragma once

#include <str-cursor/cursor.hpp>
#include <str-cursor/error.hpp>
#include <str-cursor/pattern.hpp>
#include <str-cursor/spanner.hpp>
#include <str-cursor/utf8.hpp>
