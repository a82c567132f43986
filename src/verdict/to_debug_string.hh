#pragma once

#include <verdict/fwd.hh>
#include <verdict/to_string.hh>

#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace vd
{
struct debug_string_config
{
    /// soft limit: ranges and tuples stop adding elements once the output is this long
    isize max_length = 100;
};

/// Developer-facing rendering of v, used for result::to_string() and the payload text of unwrap errors.
/// Best effort, the format is not stable. First match wins:
///
///   string-like          "text"
///   char                 'c', with escapes for control characters ('\n', '\x1B')
///   to_string(v)         verdict overloads and ADL
///   v.to_string()
///   range                [a, b, c]
///   tuple-like           (a, b)
///   anything else        hex dump of the object bytes, '_' between alignment units
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

namespace impl
{
inline void append_hex(std::string& s, unsigned char byte)
{
    constexpr char digits[] = "0123456789ABCDEF";
    s += digits[byte >> 4];
    s += digits[byte & 0xF];
}

inline void append_escaped_char(std::string& s, char c)
{
    switch (c)
    {
    case '\0': s += "\\0"; return;
    case '\a': s += "\\a"; return;
    case '\b': s += "\\b"; return;
    case '\t': s += "\\t"; return;
    case '\n': s += "\\n"; return;
    case '\v': s += "\\v"; return;
    case '\f': s += "\\f"; return;
    case '\r': s += "\\r"; return;
    case '\'': s += "\\'"; return;
    case '\\': s += "\\\\"; return;
    default: break;
    }

    auto const u = static_cast<unsigned char>(c);
    if (u < 32 || u >= 127)
    {
        s += "\\x";
        append_hex(s, u);
    }
    else
        s += c;
}

// appends ", elem" (or just elem as the first one), false once the limit is hit
template <class T>
bool append_element(std::string& s, bool first, T const& elem, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }
    if (!first)
        s += ", ";
    s += vd::to_debug_string(elem, cfg);
    return true;
}

template <class T, std::size_t... I>
void append_tuple_elements(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(impl::append_element(s, I == 0, std::get<I>(v), cfg) && ...);
}

template <class T>
void append_bytes(std::string& s, T const& v)
{
    auto const bytes = reinterpret_cast<unsigned char const*>(&v);
    for (std::size_t i = 0; i < sizeof(T); ++i)
    {
        if (i > 0 && i % alignof(T) == 0)
            s += '_';
        append_hex(s, bytes[i]);
    }
}
} // namespace impl
} // namespace vd

template <class T>
std::string vd::to_debug_string(T const& v, debug_string_config const& cfg)
{
    auto s = std::string();

    if constexpr (requires { std::string_view(v); })
    {
        s += '"';
        s += std::string_view(v);
        s += '"';
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        s += '\'';
        impl::append_escaped_char(s, v);
        s += '\'';
    }
    else if constexpr (requires { to_string(v); })
    {
        s = to_string(v);
    }
    else if constexpr (requires { v.to_string(); })
    {
        s = v.to_string();
    }
    else if constexpr (requires { std::begin(v) != std::end(v); })
    {
        s += '[';
        auto first = true;
        for (auto const& elem : v)
        {
            if (!impl::append_element(s, first, elem, cfg))
                break;
            first = false;
        }
        s += ']';
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        s += '(';
        impl::append_tuple_elements(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ')';
    }
    else
    {
        s += "0x";
        impl::append_bytes(s, v);
    }

    return s;
}
