#pragma once

#include <source_location>

namespace vd
{
/// Source position (file, line, column, function) of a failure site or assertion.
/// any_error and vd::failure capture it as a defaulted argument:
///   any_error(std::string msg, vd::source_location site = vd::source_location::current());
using source_location = std::source_location;
} // namespace vd
