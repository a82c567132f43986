#pragma once

#include <verdict/fwd.hh>

#include <chrono>
#include <concepts>
#include <deque>
#include <filesystem>
#include <list>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// =========================================================================================================
// Canonical defaults for result::unwrap_or_default
// =========================================================================================================
//
// A closed whitelist: canonical_default<T> only provides make() for the well-known types below.
// Everything else is rejected at runtime by unwrap_or_default with vd::unsupported_default_type
// (instead of silently fabricating T{}, which would hide bugs).
//
//   numeric zero      arithmetic types (except bool), __int128        0
//   false             bool                                            false
//   empty text        std::basic_string, std::basic_string_view       ""
//   empty list        std::vector, std::deque, std::list              {}
//   empty mapping     std::map, std::unordered_map                    {}
//   empty set         std::set, std::unordered_set                    {}
//   zero duration     std::chrono::duration                           duration::zero()
//   epoch timestamp   std::chrono::time_point                         time_since_epoch() == 0
//   empty pattern     std::basic_regex                                matches nothing
//   empty locator     std::filesystem::path                           ""
//
// NOTE: the whitelist is deliberately not a customization point for user types.
//       Callers with other types use unwrap_or / unwrap_or_else.

namespace vd
{
/// not whitelisted: no make()
template <class T>
struct canonical_default
{
};

// numeric zero
template <class T>
    requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
struct canonical_default<T>
{
    [[nodiscard]] static constexpr T make() { return T(0); }
};

// numeric zero for 128 bit integers, which are not arithmetic types in strict ISO mode
#ifdef __SIZEOF_INT128__
__extension__ typedef __int128 impl_int128;
__extension__ typedef unsigned __int128 impl_uint128;

template <>
struct canonical_default<impl_int128>
{
    [[nodiscard]] static constexpr impl_int128 make() { return 0; }
};
template <>
struct canonical_default<impl_uint128>
{
    [[nodiscard]] static constexpr impl_uint128 make() { return 0; }
};
#endif

// false
template <>
struct canonical_default<bool>
{
    [[nodiscard]] static constexpr bool make() { return false; }
};

// empty text
template <class CharT, class Traits, class Alloc>
struct canonical_default<std::basic_string<CharT, Traits, Alloc>>
{
    [[nodiscard]] static std::basic_string<CharT, Traits, Alloc> make() { return {}; }
};
template <class CharT, class Traits>
struct canonical_default<std::basic_string_view<CharT, Traits>>
{
    [[nodiscard]] static constexpr std::basic_string_view<CharT, Traits> make() { return {}; }
};

// empty list
template <class T, class Alloc>
struct canonical_default<std::vector<T, Alloc>>
{
    [[nodiscard]] static std::vector<T, Alloc> make() { return {}; }
};
template <class T, class Alloc>
struct canonical_default<std::deque<T, Alloc>>
{
    [[nodiscard]] static std::deque<T, Alloc> make() { return {}; }
};
template <class T, class Alloc>
struct canonical_default<std::list<T, Alloc>>
{
    [[nodiscard]] static std::list<T, Alloc> make() { return {}; }
};

// empty mapping
template <class K, class V, class Compare, class Alloc>
struct canonical_default<std::map<K, V, Compare, Alloc>>
{
    [[nodiscard]] static std::map<K, V, Compare, Alloc> make() { return {}; }
};
template <class K, class V, class Hash, class Eq, class Alloc>
struct canonical_default<std::unordered_map<K, V, Hash, Eq, Alloc>>
{
    [[nodiscard]] static std::unordered_map<K, V, Hash, Eq, Alloc> make() { return {}; }
};

// empty set
template <class K, class Compare, class Alloc>
struct canonical_default<std::set<K, Compare, Alloc>>
{
    [[nodiscard]] static std::set<K, Compare, Alloc> make() { return {}; }
};
template <class K, class Hash, class Eq, class Alloc>
struct canonical_default<std::unordered_set<K, Hash, Eq, Alloc>>
{
    [[nodiscard]] static std::unordered_set<K, Hash, Eq, Alloc> make() { return {}; }
};

// zero duration
template <class Rep, class Period>
struct canonical_default<std::chrono::duration<Rep, Period>>
{
    [[nodiscard]] static constexpr std::chrono::duration<Rep, Period> make()
    {
        return std::chrono::duration<Rep, Period>::zero();
    }
};

// epoch timestamp
template <class Clock, class Duration>
struct canonical_default<std::chrono::time_point<Clock, Duration>>
{
    [[nodiscard]] static constexpr std::chrono::time_point<Clock, Duration> make()
    {
        return std::chrono::time_point<Clock, Duration>(Duration::zero());
    }
};

// empty pattern
template <class CharT, class Traits>
struct canonical_default<std::basic_regex<CharT, Traits>>
{
    [[nodiscard]] static std::basic_regex<CharT, Traits> make() { return {}; }
};

// empty locator
template <>
struct canonical_default<std::filesystem::path>
{
    [[nodiscard]] static std::filesystem::path make() { return {}; }
};

/// true iff T is on the whitelist
template <class T>
constexpr bool has_canonical_default = requires {
    { canonical_default<T>::make() } -> std::same_as<T>;
};
} // namespace vd
