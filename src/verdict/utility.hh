#pragma once

#include <verdict/fwd.hh>
#include <verdict/macros.hh>

#include <type_traits>

namespace vd
{
// lvalue-only: vd::move on a temporary does not compile
template <class T>
[[nodiscard]] VD_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] VD_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] VD_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Selects verdict's placement new without pulling in <new>:
///   new (vd::placement_new, &storage) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Raw, aligned room for one T. The owner constructs and destroys .value by hand.
/// Trivially copyable and destructible iff T is.
template <class T>
union storage_for
{
    T value;

    storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

/// f(x) == x, used by result::flatten as and_then(identity_function{})
struct identity_function
{
    template <class T>
    constexpr T&& operator()(T&& arg) const noexcept
    {
        return vd::forward<T>(arg);
    }
};

/// Order-dependent hash mixing (boost::hash_combine with the 64 bit golden ratio)
[[nodiscard]] constexpr u64 hash_combine(u64 seed, u64 h) noexcept
{
    return seed ^ (h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}
} // namespace vd

[[nodiscard]] inline void* operator new(std::size_t, vd::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
// paired with the above, called when a constructor throws; nothing to release
inline void operator delete(void*, vd::placement_new_t, void*) noexcept {}
