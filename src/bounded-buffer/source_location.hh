#pragma once

#include <source_location>

namespace bb
{
/// Type alias for std::source_location
/// Captured by assertions to report file, line, column and function of a failure
/// Usage:
///   void log(bb::source_location loc = bb::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace bb
