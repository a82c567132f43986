#pragma once

#include <string>
#include <string_view>

namespace vd
{
/// Human-readable form of a mangled symbol or typeid name, e.g. "N12_GLOBAL__N_16widgetE" -> "(anonymous namespace)::widget".
/// Names the offending type in unsupported_default_type and the function in any_error reports.
/// Returns the input unchanged if it cannot be demangled (and always on MSVC, whose names are already readable).
[[nodiscard]] std::string demangle_symbol(std::string_view symbol);
} // namespace vd
