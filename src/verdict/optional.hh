#pragma once

#include <verdict/assert.hh>
#include <verdict/fwd.hh>
#include <verdict/utility.hh>

#include <type_traits>

/// Marker for "no value", only obtainable as vd::nullopt.
struct vd::nullopt_t
{
    struct impl_tag
    {
    };
    explicit constexpr nullopt_t(impl_tag) {}
};

namespace vd
{
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::impl_tag{}};
} // namespace vd

/// A value of type T or nothing.
/// The output type of result::success_or_none() and result::failure_or_none().
///
/// Only the checked value() and value_or() give access, there is no operator* or operator->.
/// optional<T> is trivially copyable iff T is.
/// Moving out of an engaged optional leaves the source empty.
template <class T>
struct vd::optional
{
    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) // NOLINT
    {
        impl_emplace(vd::forward<U>(value));
    }

    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            impl_emplace(rhs._storage.value);
    }
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            impl_emplace(vd::move(rhs._storage.value));
            rhs.impl_reset();
        }
    }
    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (this != &rhs)
        {
            impl_reset();
            if (rhs._has_value)
                impl_emplace(rhs._storage.value);
        }
        return *this;
    }
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            impl_reset();
            if (rhs._has_value)
            {
                impl_emplace(vd::move(rhs._storage.value));
                rhs.impl_reset();
            }
        }
        return *this;
    }
    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        impl_reset();
    }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    [[nodiscard]] T& value() &
    {
        VD_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        VD_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        VD_ASSERT(_has_value, "value() called on an empty optional");
        return vd::move(_storage.value);
    }

    [[nodiscard]] T value_or(T fallback) const& { return _has_value ? _storage.value : vd::move(fallback); }
    [[nodiscard]] T value_or(T fallback) && { return _has_value ? vd::move(_storage.value) : vd::move(fallback); }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (!lhs._has_value || !rhs._has_value)
            return lhs._has_value == rhs._has_value;
        return lhs._storage.value == rhs._storage.value;
    }

    /// an empty optional never equals a value
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    // otherwise opt == true would silently compare optional<int> against 1
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

private:
    template <class... Args>
    void impl_emplace(Args&&... args)
    {
        new (vd::placement_new, &_storage.value) T(vd::forward<Args>(args)...);
        _has_value = true;
    }

    void impl_reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

    vd::storage_for<T> _storage;
    bool _has_value = false;
};
