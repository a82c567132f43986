#pragma once

#include <verdict/macros.hh>
#include <verdict/source_location.hh>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// VD_ASSERT(cond, msg)         checked when VD_ASSERT_ENABLED, otherwise only type-checked
// VD_ASSERT_ALWAYS(cond, msg)  checked in every build
//
// msg is a string literal. A failing assertion reports to the topmost handler
// (see <verdict/assert-handler.hh>), breaks into an attached debugger and aborts.
//
// Failure channels in verdict:
//   - assertions     programmer errors, e.g. result::value() on a failure
//   - result<T, E>   expected errors
//   - exceptions     unwrap, expect and unwrap_or_default misuse (see <verdict/result_error.hh>)
//
// Never assert on user input.

#define VD_ASSERT_ALWAYS(cond, msg)                                                   \
    do                                                                                \
    {                                                                                 \
        if (!(cond)) [[unlikely]]                                                     \
            ::vd::impl::assertion_failed(#cond, msg, ::vd::source_location::current()); \
    } while (false)

#if VD_ASSERT_ENABLED
#define VD_ASSERT(cond, msg) VD_ASSERT_ALWAYS(cond, msg)
#else
#define VD_ASSERT(cond, msg) \
    do                       \
    {                        \
        VD_UNUSED(cond);     \
        VD_UNUSED(msg);      \
    } while (false)
#endif

namespace vd::impl
{
/// reports to the active handler, then breaks into the debugger (if attached) and aborts
/// leaves early only if the handler throws
[[noreturn]] VD_COLD_FUNC void assertion_failed(char const* expression, char const* message, vd::source_location location);

[[nodiscard]] bool is_debugger_attached();
} // namespace vd::impl
