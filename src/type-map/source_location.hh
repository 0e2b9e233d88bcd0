#pragma once

#include <source_location>

namespace tmap
{
/// Type alias for std::source_location
/// Provides information about source code location (file, line, column, function)
/// Usage:
///   void report(tmap::source_location loc = tmap::source_location::current());
using source_location = std::source_location;
} // namespace tmap
