#include "assert.hh"

#include <verdict/assert-handler.hh>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string_view>
#include <vector>

#ifdef VD_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#else
#include <csignal>
#endif

namespace
{
std::vector<vd::impl::assertion_handler>& handler_stack()
{
    static std::vector<vd::impl::assertion_handler> handlers;
    return handlers;
}

void break_into_debugger()
{
    if (!vd::impl::is_debugger_attached())
        return;
#ifdef VD_COMPILER_MSVC
    __debugbreak();
#else
    std::raise(SIGTRAP);
#endif
}
} // namespace

std::string vd::impl::assertion_info::to_string() const
{
    auto s = std::string("assertion failed: ");
    s += expression;
    s += "\n  message: ";
    s += message;
    s += "\n  at ";
    s += location.file_name();
    s += ':';
    s += std::to_string(location.line());
    s += ':';
    s += std::to_string(location.column());
    s += " (";
    s += location.function_name();
    s += ")\n";
    return s;
}

void vd::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void vd::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

void vd::impl::assertion_failed(char const* expression, char const* message, vd::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        std::cerr << info.to_string() << std::flush;
    else
        handlers.back()(info);

    break_into_debugger();
    std::abort();
}

bool vd::impl::is_debugger_attached()
{
#if defined(VD_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(__linux__)
    // "TracerPid:\t<pid>" is non-zero while ptrace'd
    auto status = std::ifstream("/proc/self/status");
    auto line = std::string();
    while (std::getline(status, line))
    {
        auto const key = std::string_view("TracerPid:");
        if (line.starts_with(key))
            return std::atoi(line.c_str() + key.size()) != 0;
    }
    return false;
#else
    return false;
#endif
}
