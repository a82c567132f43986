#pragma once

#include <string>
#include <string_view>

// Textual forms of the primitive payload types.
// Used by to_debug_string to render result payloads in unwrap errors and result::to_string().

namespace vd
{
// in hex, 0x prefixed
[[nodiscard]] std::string to_string(void const* ptr);

// true/false
[[nodiscard]] std::string to_string(bool b);

// simply the char
[[nodiscard]] std::string to_string(char c);

// integer types
// note: does not use the sized versions because this style is _complete_ for users
[[nodiscard]] std::string to_string(signed char i);
[[nodiscard]] std::string to_string(unsigned char i);
[[nodiscard]] std::string to_string(signed short i);
[[nodiscard]] std::string to_string(unsigned short i);
[[nodiscard]] std::string to_string(signed int i);
[[nodiscard]] std::string to_string(unsigned int i);
[[nodiscard]] std::string to_string(signed long i);
[[nodiscard]] std::string to_string(unsigned long i);
[[nodiscard]] std::string to_string(signed long long i);
[[nodiscard]] std::string to_string(unsigned long long i);

// float/double, shortest round-trip form
[[nodiscard]] std::string to_string(float f);
[[nodiscard]] std::string to_string(double f);

// no-op
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string s);
[[nodiscard]] std::string to_string(std::string_view s);

} // namespace vd
