#include "to_string.hh"

#include <charconv>
#include <cstdint>

namespace
{
template <class T>
std::string chars_of(T v, int base = 10)
{
    char buf[64];
    auto const res = std::to_chars(buf, buf + sizeof(buf), v, base);
    return std::string(buf, res.ptr);
}

template <class T>
std::string chars_of_float(T v)
{
    char buf[64];
    auto const res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}
} // namespace

std::string vd::to_string(void const* ptr)
{
    return "0x" + chars_of(reinterpret_cast<std::uintptr_t>(ptr), 16);
}

std::string vd::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string vd::to_string(char c)
{
    return std::string(1, c);
}

std::string vd::to_string(signed char i)
{
    return chars_of(int(i));
}

std::string vd::to_string(unsigned char i)
{
    return chars_of(unsigned(i));
}

std::string vd::to_string(signed short i)
{
    return chars_of(i);
}

std::string vd::to_string(unsigned short i)
{
    return chars_of(i);
}

std::string vd::to_string(signed int i)
{
    return chars_of(i);
}

std::string vd::to_string(unsigned int i)
{
    return chars_of(i);
}

std::string vd::to_string(signed long i)
{
    return chars_of(i);
}

std::string vd::to_string(unsigned long i)
{
    return chars_of(i);
}

std::string vd::to_string(signed long long i)
{
    return chars_of(i);
}

std::string vd::to_string(unsigned long long i)
{
    return chars_of(i);
}

std::string vd::to_string(float f)
{
    return chars_of_float(f);
}

std::string vd::to_string(double f)
{
    return chars_of_float(f);
}

std::string vd::to_string(char const* s)
{
    return {s};
}

std::string vd::to_string(std::string s)
{
    return s;
}

std::string vd::to_string(std::string_view s)
{
    return std::string(s);
}
