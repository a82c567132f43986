#include "native.hh"

#include <verdict/macros.hh>

#ifdef VD_COMPILER_POSIX
#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#endif

std::string vd::demangle_symbol(std::string_view symbol)
{
    auto name = std::string(symbol); // null-terminated copy

#ifdef VD_COMPILER_POSIX
    // the demangler is not guaranteed to be reentrant
    static std::mutex mutex;
    auto const lock = std::lock_guard<std::mutex>(mutex);

    int status = -1;
    auto const demangled = std::unique_ptr<char, decltype(&std::free)>(
        abi::__cxa_demangle(name.c_str(), nullptr, nullptr, &status), &std::free);

    if (status == 0 && demangled)
        name = demangled.get();
#endif

    return name;
}
