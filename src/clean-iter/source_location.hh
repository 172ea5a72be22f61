#pragma once

#include <source_location>

namespace ci
{
/// Type alias for std::source_location
/// Errors thrown by the iteration API record the call site of the public operation
/// Usage:
///   void check(ci::source_location site = ci::source_location::current()) {
///       std::cerr << site.file_name() << ":" << site.line();
///   }
using source_location = std::source_location;
} // namespace ci
