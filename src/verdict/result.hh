#pragma once

#include <verdict/assert.hh>
#include <verdict/default_value.hh>
#include <verdict/fwd.hh>
#include <verdict/macros.hh>
#include <verdict/optional.hh>
#include <verdict/result_error.hh>
#include <verdict/sequence.hh>
#include <verdict/source_location.hh>
#include <verdict/to_debug_string.hh>
#include <verdict/utility.hh>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#ifdef VD_HAS_RTTI
#include <verdict/native.hh>

#include <typeinfo>
#endif

// =========================================================================================================
// vd::result<T, E> - either a success payload T or a failure payload E
// =========================================================================================================
//
// Construction:
//   result<T, E>::success(v) / result<T, E>::failure(e)   static variant constructors
//   return v;                                             implicit success from anything convertible to T
//   return vd::failure(e);                                tag, converts into any compatible result
//   return vd::success(v);                                tag, converts into any compatible result
//
// Queries:
//   is_success / is_failure / is_success_and(pred) / is_failure_and(pred)
//   value() / error()                                     unchecked access, asserts on the wrong variant
//   success_or_none() / failure_or_none()                 vd::optional, discards the other side
//
// Transformation (total):
//   map / map_error / map_or / map_or_else / inspect / inspect_error / to_sequence
//
// Chaining:
//   and_ / and_then / or_ / or_else / flatten
//
// Extraction:
//   unwrap / expect / unwrap_error / expect_failure      throw typed errors (see <verdict/result_error.hh>)
//   unwrap_or / unwrap_or_else                           never fail
//   unwrap_or_default                                    closed whitelist (see <verdict/default_value.hh>)
//   ~res                                                 shorthand for unwrap()
//
// The active payload is never mutated in place:
// lvalue members observe (const&), rvalue members consume (vd::move(res).unwrap()).
// A whole result can still be rebound by assignment.
//
// "and" and "or" are alternative tokens in C++, hence and_ / or_.

/// Type-erased error: a message, the site where it was raised, and a chain of added context.
/// This is the default E of vd::result<T>.
///
/// Move-only. A default-constructed or moved-from any_error is "empty".
/// The payload lives on the heap so that result<T> stays small.
///
/// Usage:
///   vd::result<config> load(path p)
///   {
///       auto text = read_file(p);
///       if (text.is_failure())
///           return vd::failure(vd::move(text).unwrap_error().with_context("while loading config"));
///       ...
///   }
struct vd::any_error
{
    // construction
public:
    any_error() = default;

    /// site defaults to the caller
    explicit any_error(std::string message, vd::source_location site = vd::source_location::current());

    any_error(any_error&& rhs) noexcept;
    any_error& operator=(any_error&& rhs) noexcept;
    ~any_error();

    any_error(any_error const&) = delete;
    any_error& operator=(any_error const&) = delete;

    // context
public:
    /// Appends a context entry (shown above the older ones in to_string()).
    /// An empty error becomes non-empty with a placeholder message.
    any_error& add_context(std::string message, vd::source_location site = vd::source_location::current()) &;

    [[nodiscard]] any_error with_context(std::string message,
                                         vd::source_location site = vd::source_location::current()) &&;

    // queries
public:
    [[nodiscard]] bool is_empty() const;

    /// "" if empty
    [[nodiscard]] std::string const& message() const;

    /// default-constructed location if empty
    [[nodiscard]] vd::source_location site() const;

    [[nodiscard]] isize context_count() const;

    /// Multi-line report:
    ///   error: <message>
    ///     at <file>:<line> - <function>
    ///     context: <newest> (at <file>:<line> - <function>)
    ///     context: ...
    [[nodiscard]] std::string to_string() const;

private:
    struct payload;
    std::unique_ptr<payload> _payload;

    void impl_ensure_payload();
};

/// Tag returned by vd::failure(e), converts into any result whose E is constructible from the payload.
/// The site is forwarded when E can record one (e.g. vd::any_error).
template <class E>
struct vd::as_failure_t
{
    E error;
    vd::source_location site;
};

/// Tag returned by vd::success(v), converts into any result whose T is constructible from the payload.
template <class T>
struct vd::as_success_t
{
    T value;
};

namespace vd
{
/// Marks a value as a failure payload.
/// Usage:
///   vd::result<int, std::string> parse(std::string_view s)
///   {
///       if (s.empty())
///           return vd::failure("empty input");
///       ...
///   }
template <class E>
[[nodiscard]] as_failure_t<std::decay_t<E>> failure(E&& error, source_location site = source_location::current())
{
    return as_failure_t<std::decay_t<E>>{vd::forward<E>(error), site};
}

/// Marks a value as a success payload.
/// Mostly useful when T is not implicitly constructible from the value.
template <class T>
[[nodiscard]] as_success_t<std::decay_t<T>> success(T&& value)
{
    return as_success_t<std::decay_t<T>>{vd::forward<T>(value)};
}

namespace impl
{
template <class T>
constexpr bool is_result = false;
template <class T, class E>
constexpr bool is_result<vd::result<T, E>> = true;

template <class T>
constexpr bool is_result_tag = false;
template <class E>
constexpr bool is_result_tag<vd::as_failure_t<E>> = true;
template <class T>
constexpr bool is_result_tag<vd::as_success_t<T>> = true;

// accepted by the implicit success constructor:
// everything except tags and results of another type (result<result<...>> still takes its T)
template <class U, class T>
constexpr bool is_plain_success_arg = !is_result_tag<std::remove_cvref_t<U>>
                                   && (!is_result<std::remove_cvref_t<U>> || std::is_same_v<std::remove_cvref_t<U>, T>);

template <class T>
[[nodiscard]] std::string type_name_of()
{
#ifdef VD_HAS_RTTI
    return vd::demangle_symbol(typeid(T).name());
#else
    return "<unknown type, compiled without rtti>";
#endif
}

template <class T>
[[nodiscard]] T make_canonical_default()
{
    if constexpr (vd::has_canonical_default<T>)
        return vd::canonical_default<T>::make();
    else
        throw vd::unsupported_default_type(impl::type_name_of<T>());
}

inline constexpr char const* unwrap_failure_message = "called `result::unwrap` on a failure value";
inline constexpr char const* unwrap_success_message = "called `result::unwrap_error` on a success value";
} // namespace impl
} // namespace vd

/// Either a success payload of type T or a failure payload of type E.
/// Exactly one is active, there is no empty state.
///
/// Trivially copyable and destructible when T and E are.
/// Move-only payloads are supported (consume them via rvalue members).
///
/// Usage:
///   vd::result<int, std::string> parse_port(std::string_view s);
///
///   auto port = parse_port(arg).unwrap_or(8080);
///   auto url = parse_port(arg).map([](int p) { return "localhost:" + vd::to_string(p); });
template <class T, class E>
struct vd::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not hold references");
    static_assert(!std::is_void_v<T> && !std::is_void_v<E>, "result does not hold void");

public:
    using value_t = T;
    using error_t = E;

    // construction
public:
    /// failure(E{})
    result()
        requires std::is_default_constructible_v<E>
      : _error(), _is_success(false)
    {
    }

    /// Implicit success, allows "return value;" in functions returning a result.
    template <class U = std::remove_cv_t<T>>
        requires(impl::is_plain_success_arg<U, T> && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) // NOLINT
      : _value(vd::forward<U>(value)), _is_success(true)
    {
    }

    template <class U>
        requires std::is_constructible_v<T, U&&>
    result(as_success_t<U> tag) // NOLINT
      : _value(vd::move(tag.value)), _is_success(true)
    {
    }

    template <class G>
        requires(std::is_constructible_v<E, G &&> || std::is_constructible_v<E, G &&, vd::source_location>)
    result(as_failure_t<G> tag) // NOLINT
      : _is_success(false)
    {
        if constexpr (std::is_constructible_v<E, G&&, vd::source_location>)
            new (vd::placement_new, &_error) E(vd::move(tag.error), tag.site);
        else
            new (vd::placement_new, &_error) E(vd::move(tag.error));
    }

    /// Converts both payloads, e.g. result<int, std::string> -> result<long, vd::any_error>.
    /// When E records sites, the conversion site is recorded.
    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && std::is_constructible_v<T, U const&>
                 && std::is_constructible_v<E, G const&> && !std::is_constructible_v<T, result<U, G> const&>)
    explicit(!std::is_convertible_v<U const&, T> || !std::is_convertible_v<G const&, E>)
        result(result<U, G> const& rhs, vd::source_location site = vd::source_location::current())
      : _is_success(rhs.is_success())
    {
        if (_is_success)
            new (vd::placement_new, &_value) T(rhs.value());
        else
            impl_construct_error(rhs.error(), site);
    }

    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && std::is_constructible_v<T, U &&>
                 && std::is_constructible_v<E, G &&> && !std::is_constructible_v<T, result<U, G> &&>)
    explicit(!std::is_convertible_v<U&&, T> || !std::is_convertible_v<G&&, E>)
        result(result<U, G>&& rhs, vd::source_location site = vd::source_location::current())
      : _is_success(rhs.is_success())
    {
        if (_is_success)
            new (vd::placement_new, &_value) T(vd::move(rhs).value());
        else
            impl_construct_error(vd::move(rhs).error(), site);
    }

    [[nodiscard]] static result success(T value) { return result(impl_success_tag{}, vd::move(value)); }
    [[nodiscard]] static result failure(E error) { return result(impl_failure_tag{}, vd::move(error)); }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;

    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    /// rhs keeps its variant with a moved-from payload
    result(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_move_constructible_v<T> && std::is_move_constructible_v<E>)
      : _is_success(rhs._is_success)
    {
        if (_is_success)
            new (vd::placement_new, &_value) T(vd::move(rhs._value));
        else
            new (vd::placement_new, &_error) E(vd::move(rhs._error));
    }

    result(result const& rhs)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _is_success(rhs._is_success)
    {
        if (_is_success)
            new (vd::placement_new, &_value) T(rhs._value);
        else
            new (vd::placement_new, &_error) E(rhs._error);
    }

    result& operator=(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>
                                             && std::is_nothrow_move_constructible_v<E>
                                             && std::is_nothrow_move_assignable_v<T>
                                             && std::is_nothrow_move_assignable_v<E>)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_move_constructible_v<T> && std::is_move_constructible_v<E>
                 && std::is_move_assignable_v<T> && std::is_move_assignable_v<E>
                 && (std::is_nothrow_move_constructible_v<T> || std::is_nothrow_move_constructible_v<E>))
    {
        if (this == &rhs)
            return *this;

        if (_is_success && rhs._is_success)
            _value = vd::move(rhs._value);
        else if (!_is_success && !rhs._is_success)
            _error = vd::move(rhs._error);
        else if (rhs._is_success)
            impl_switch_payload(_error, _value, vd::move(rhs._value));
        else
            impl_switch_payload(_value, _error, vd::move(rhs._error));

        _is_success = rhs._is_success;
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>
                 && std::is_copy_assignable_v<T> && std::is_copy_assignable_v<E>
                 && (std::is_nothrow_move_constructible_v<T> || std::is_nothrow_move_constructible_v<E>))
    {
        if (this == &rhs)
            return *this;

        if (_is_success && rhs._is_success)
            _value = rhs._value;
        else if (!_is_success && !rhs._is_success)
            _error = rhs._error;
        else if (rhs._is_success)
            impl_switch_payload(_error, _value, rhs._value);
        else
            impl_switch_payload(_value, _error, rhs._error);

        _is_success = rhs._is_success;
        return *this;
    }

    ~result()
        requires(!(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>))
    {
        impl_destroy();
    }

    // predicates
public:
    [[nodiscard]] bool is_success() const { return _is_success; }
    [[nodiscard]] bool is_failure() const { return !_is_success; }

    /// true iff success and pred(value) holds. pred is not invoked on a failure.
    template <class Pred>
    [[nodiscard]] bool is_success_and(Pred&& pred) const
    {
        return _is_success && bool(std::invoke(pred, _value));
    }

    /// true iff failure and pred(error) holds. pred is not invoked on a success.
    template <class Pred>
    [[nodiscard]] bool is_failure_and(Pred&& pred) const
    {
        return !_is_success && bool(std::invoke(pred, _error));
    }

    // unchecked access
public:
    /// Precondition: is_success()
    [[nodiscard]] T const& value() const&
    {
        VD_ASSERT(_is_success, "value() called on a failure");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        VD_ASSERT(_is_success, "value() called on a failure");
        return vd::move(_value);
    }

    /// Precondition: is_failure()
    [[nodiscard]] E const& error() const&
    {
        VD_ASSERT(!_is_success, "error() called on a success");
        return _error;
    }
    [[nodiscard]] E&& error() &&
    {
        VD_ASSERT(!_is_success, "error() called on a success");
        return vd::move(_error);
    }

    // conversion to optional
public:
    [[nodiscard]] vd::optional<T> success_or_none() const&
    {
        if (_is_success)
            return vd::optional<T>(_value);
        return {};
    }
    [[nodiscard]] vd::optional<T> success_or_none() &&
    {
        if (_is_success)
            return vd::optional<T>(vd::move(_value));
        return {};
    }

    [[nodiscard]] vd::optional<E> failure_or_none() const&
    {
        if (!_is_success)
            return vd::optional<E>(_error);
        return {};
    }
    [[nodiscard]] vd::optional<E> failure_or_none() &&
    {
        if (!_is_success)
            return vd::optional<E>(vd::move(_error));
        return {};
    }

    // transformation
public:
    /// success(v) -> success(f(v)), failures pass through unchanged
    template <class F>
    [[nodiscard]] auto map(F&& f) const&
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&, T const&>>;
        static_assert(!std::is_void_v<U>, "map requires a function returning a value, use inspect for side effects");

        if (_is_success)
            return result<U, E>::success(std::invoke(f, _value));
        return result<U, E>::failure(_error);
    }
    template <class F>
    [[nodiscard]] auto map(F&& f) &&
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&, T&&>>;
        static_assert(!std::is_void_v<U>, "map requires a function returning a value, use inspect for side effects");

        if (_is_success)
            return result<U, E>::success(std::invoke(f, vd::move(_value)));
        return result<U, E>::failure(vd::move(_error));
    }

    /// failure(e) -> failure(f(e)), successes pass through unchanged
    template <class F>
    [[nodiscard]] auto map_error(F&& f) const&
    {
        using G = std::remove_cvref_t<std::invoke_result_t<F&, E const&>>;
        static_assert(!std::is_void_v<G>, "map_error requires a function returning a value");

        if (_is_success)
            return result<T, G>::success(_value);
        return result<T, G>::failure(std::invoke(f, _error));
    }
    template <class F>
    [[nodiscard]] auto map_error(F&& f) &&
    {
        using G = std::remove_cvref_t<std::invoke_result_t<F&, E&&>>;
        static_assert(!std::is_void_v<G>, "map_error requires a function returning a value");

        if (_is_success)
            return result<T, G>::success(vd::move(_value));
        return result<T, G>::failure(std::invoke(f, vd::move(_error)));
    }

    /// f(value) on success, default_value otherwise
    template <class U, class F>
    [[nodiscard]] U map_or(U default_value, F&& f) const&
    {
        if (_is_success)
            return U(std::invoke(f, _value));
        return default_value;
    }
    template <class U, class F>
    [[nodiscard]] U map_or(U default_value, F&& f) &&
    {
        if (_is_success)
            return U(std::invoke(f, vd::move(_value)));
        return default_value;
    }

    /// on_success(value) or on_error(error), exactly one of them is invoked
    template <class FE, class FS>
    [[nodiscard]] auto map_or_else(FE&& on_error, FS&& on_success) const&
    {
        using U = std::remove_cvref_t<std::invoke_result_t<FS&, T const&>>;
        if (_is_success)
            return U(std::invoke(on_success, _value));
        return U(std::invoke(on_error, _error));
    }
    template <class FE, class FS>
    [[nodiscard]] auto map_or_else(FE&& on_error, FS&& on_success) &&
    {
        using U = std::remove_cvref_t<std::invoke_result_t<FS&, T&&>>;
        if (_is_success)
            return U(std::invoke(on_success, vd::move(_value)));
        return U(std::invoke(on_error, vd::move(_error)));
    }

    /// calls f(value) on success, returns the result unchanged
    template <class F>
    result const& inspect(F&& f) const&
    {
        if (_is_success)
            std::invoke(f, std::as_const(_value));
        return *this;
    }
    template <class F>
    [[nodiscard]] result inspect(F&& f) &&
    {
        if (_is_success)
            std::invoke(f, std::as_const(_value));
        return vd::move(*this);
    }

    /// calls f(error) on failure, returns the result unchanged
    template <class F>
    result const& inspect_error(F&& f) const&
    {
        if (!_is_success)
            std::invoke(f, std::as_const(_error));
        return *this;
    }
    template <class F>
    [[nodiscard]] result inspect_error(F&& f) &&
    {
        if (!_is_success)
            std::invoke(f, std::as_const(_error));
        return vd::move(*this);
    }

    /// Lazy sequence with the success payload as its single element, empty on failure.
    /// Borrows the payload: the sequence must not outlive this result.
    [[nodiscard]] auto to_sequence() const&
    {
        return vd::make_sequence_from_pointee(_is_success ? &_value : static_cast<T const*>(nullptr));
    }
    /// Takes ownership of the payload.
    [[nodiscard]] auto to_sequence() && { return vd::make_sequence_from_optional(vd::move(*this).success_or_none()); }

    // chaining
public:
    /// other if success, otherwise this failure
    template <class U>
    [[nodiscard]] result<U, E> and_(result<U, E> other) const&
    {
        if (_is_success)
            return other;
        return result<U, E>::failure(_error);
    }
    template <class U>
    [[nodiscard]] result<U, E> and_(result<U, E> other) &&
    {
        if (_is_success)
            return other;
        return result<U, E>::failure(vd::move(_error));
    }

    /// f(value) if success, otherwise this failure
    /// f must return a result with the same E
    template <class F>
    [[nodiscard]] auto and_then(F&& f) const&
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F&, T const&>>;
        static_assert(impl::is_result<R>, "and_then requires a function returning a vd::result");
        static_assert(std::is_same_v<typename R::error_t, E>, "and_then requires the same error type");

        if (_is_success)
            return R(std::invoke(f, _value));
        return R::failure(_error);
    }
    template <class F>
    [[nodiscard]] auto and_then(F&& f) &&
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F&, T&&>>;
        static_assert(impl::is_result<R>, "and_then requires a function returning a vd::result");
        static_assert(std::is_same_v<typename R::error_t, E>, "and_then requires the same error type");

        if (_is_success)
            return R(std::invoke(f, vd::move(_value)));
        return R::failure(vd::move(_error));
    }

    /// this success, otherwise other
    template <class G>
    [[nodiscard]] result<T, G> or_(result<T, G> other) const&
    {
        if (_is_success)
            return result<T, G>::success(_value);
        return other;
    }
    template <class G>
    [[nodiscard]] result<T, G> or_(result<T, G> other) &&
    {
        if (_is_success)
            return result<T, G>::success(vd::move(_value));
        return other;
    }

    /// this success, otherwise f(error)
    /// f must return a result with the same T
    template <class F>
    [[nodiscard]] auto or_else(F&& f) const&
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F&, E const&>>;
        static_assert(impl::is_result<R>, "or_else requires a function returning a vd::result");
        static_assert(std::is_same_v<typename R::value_t, T>, "or_else requires the same value type");

        if (_is_success)
            return R::success(_value);
        return R(std::invoke(f, _error));
    }
    template <class F>
    [[nodiscard]] auto or_else(F&& f) &&
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F&, E&&>>;
        static_assert(impl::is_result<R>, "or_else requires a function returning a vd::result");
        static_assert(std::is_same_v<typename R::value_t, T>, "or_else requires the same value type");

        if (_is_success)
            return R::success(vd::move(_value));
        return R(std::invoke(f, vd::move(_error)));
    }

    /// result<result<U, E>, E> -> result<U, E>
    [[nodiscard]] auto flatten() const&
        requires(impl::is_result<T> && std::is_same_v<typename T::error_t, E>)
    {
        return this->and_then(vd::identity_function{});
    }
    [[nodiscard]] auto flatten() &&
        requires(impl::is_result<T> && std::is_same_v<typename T::error_t, E>)
    {
        return vd::move(*this).and_then(vd::identity_function{});
    }

    // extraction
public:
    /// Success payload, throws vd::unwrap_on_failure<E> on a failure.
    [[nodiscard]] T const& unwrap() const&
    {
        if (!_is_success)
            impl_throw_on_failure(impl::unwrap_failure_message);
        return _value;
    }
    [[nodiscard]] T unwrap() &&
    {
        if (!_is_success)
            vd::move(*this).impl_throw_on_failure(impl::unwrap_failure_message);
        return vd::move(_value);
    }

    /// Like unwrap(), but the thrown error carries the given message.
    [[nodiscard]] T const& expect(std::string message) const&
    {
        if (!_is_success)
            impl_throw_on_failure(vd::move(message));
        return _value;
    }
    [[nodiscard]] T expect(std::string message) &&
    {
        if (!_is_success)
            vd::move(*this).impl_throw_on_failure(vd::move(message));
        return vd::move(_value);
    }

    /// Failure payload, throws vd::unwrap_on_success<T> on a success.
    [[nodiscard]] E const& unwrap_error() const&
    {
        if (_is_success)
            impl_throw_on_success(impl::unwrap_success_message);
        return _error;
    }
    [[nodiscard]] E unwrap_error() &&
    {
        if (_is_success)
            vd::move(*this).impl_throw_on_success(impl::unwrap_success_message);
        return vd::move(_error);
    }

    /// Like unwrap_error(), but the thrown error carries the given message.
    [[nodiscard]] E const& expect_failure(std::string message) const&
    {
        if (_is_success)
            impl_throw_on_success(vd::move(message));
        return _error;
    }
    [[nodiscard]] E expect_failure(std::string message) &&
    {
        if (_is_success)
            vd::move(*this).impl_throw_on_success(vd::move(message));
        return vd::move(_error);
    }

    [[nodiscard]] T unwrap_or(T default_value) const&
    {
        if (_is_success)
            return _value;
        return default_value;
    }
    [[nodiscard]] T unwrap_or(T default_value) &&
    {
        if (_is_success)
            return vd::move(_value);
        return default_value;
    }

    /// f(error) is only invoked on a failure
    template <class F>
    [[nodiscard]] T unwrap_or_else(F&& f) const&
    {
        if (_is_success)
            return _value;
        return T(std::invoke(f, _error));
    }
    template <class F>
    [[nodiscard]] T unwrap_or_else(F&& f) &&
    {
        if (_is_success)
            return vd::move(_value);
        return T(std::invoke(f, vd::move(_error)));
    }

    /// Success payload, or the canonical default of T on a failure.
    /// Throws vd::unsupported_default_type on a failure if T has none (see vd::canonical_default).
    [[nodiscard]] T unwrap_or_default() const&
    {
        if (_is_success)
            return _value;
        return impl::make_canonical_default<T>();
    }
    [[nodiscard]] T unwrap_or_default() &&
    {
        if (_is_success)
            return vd::move(_value);
        return impl::make_canonical_default<T>();
    }

    /// ~res is res.unwrap()
    [[nodiscard]] T const& operator~() const& { return unwrap(); }
    [[nodiscard]] T operator~() && { return vd::move(*this).unwrap(); }

    // context (vd::any_error only)
public:
    /// Adds context to a failure, successes pass through unchanged.
    [[nodiscard]] result with_context(std::string message, vd::source_location site = vd::source_location::current()) &&
        requires std::is_same_v<E, vd::any_error>
    {
        if (!_is_success)
            _error.add_context(vd::move(message), site);
        return vd::move(*this);
    }

    /// Like with_context, but the message is only computed on a failure.
    template <class F>
    [[nodiscard]] result with_context_lazy(F&& make_message, vd::source_location site = vd::source_location::current()) &&
        requires std::is_same_v<E, vd::any_error>
    {
        if (!_is_success)
            _error.add_context(std::string(std::invoke(make_message)), site);
        return vd::move(*this);
    }

    // comparison and text
public:
    /// Same variant and equal payloads. success(x) never equals failure(x).
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& t, E const& e) {
            bool(t == t);
            bool(e == e);
        }
    {
        if (lhs._is_success != rhs._is_success)
            return false;
        if (lhs._is_success)
            return bool(lhs._value == rhs._value);
        return bool(lhs._error == rhs._error);
    }

    /// "success(<payload>)" or "failure(<payload>)", payloads via vd::to_debug_string
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::string(_is_success ? "success(" : "failure(");
        s += _is_success ? vd::to_debug_string(_value) : vd::to_debug_string(_error);
        s += ')';
        return s;
    }

private:
    struct impl_success_tag
    {
    };
    struct impl_failure_tag
    {
    };

    result(impl_success_tag, T&& value) : _value(vd::move(value)), _is_success(true) {}
    result(impl_failure_tag, E&& error) : _error(vd::move(error)), _is_success(false) {}

    template <class G>
    void impl_construct_error(G&& error, vd::source_location site)
    {
        if constexpr (std::is_constructible_v<E, G&&, vd::source_location>)
            new (vd::placement_new, &_error) E(vd::forward<G>(error), site);
        else
            new (vd::placement_new, &_error) E(vd::forward<G>(error));
    }

    void impl_destroy()
    {
        if (_is_success)
            _value.~T();
        else
            _error.~E();
    }

    // Ends the lifetime of old_payload and constructs new_payload from arg.
    // If the construction throws, old_payload is still the live member on exit,
    // so the caller only flips _is_success after this returns.
    template <class Old, class New, class Arg>
    static void impl_switch_payload(Old& old_payload, New& new_payload, Arg&& arg)
    {
        if constexpr (std::is_nothrow_constructible_v<New, Arg&&>)
        {
            old_payload.~Old();
            new (vd::placement_new, &new_payload) New(vd::forward<Arg>(arg));
        }
        else if constexpr (std::is_nothrow_move_constructible_v<New>)
        {
            New tmp(vd::forward<Arg>(arg));
            old_payload.~Old();
            new (vd::placement_new, &new_payload) New(vd::move(tmp));
        }
        else
        {
            // the assignment constraints guarantee Old is nothrow movable here
            Old backup(vd::move(old_payload));
            old_payload.~Old();
            try
            {
                new (vd::placement_new, &new_payload) New(vd::forward<Arg>(arg));
            }
            catch (...)
            {
                new (vd::placement_new, &old_payload) Old(vd::move(backup));
                throw;
            }
        }
    }

    [[noreturn]] VD_COLD_FUNC void impl_throw_on_failure(std::string message) const&
    {
        throw vd::unwrap_on_failure<E>(vd::move(message), _error);
    }
    [[noreturn]] VD_COLD_FUNC void impl_throw_on_failure(std::string message) &&
    {
        throw vd::unwrap_on_failure<E>(vd::move(message), vd::move(_error));
    }
    [[noreturn]] VD_COLD_FUNC void impl_throw_on_success(std::string message) const&
    {
        throw vd::unwrap_on_success<T>(vd::move(message), _value);
    }
    [[noreturn]] VD_COLD_FUNC void impl_throw_on_success(std::string message) &&
    {
        throw vd::unwrap_on_success<T>(vd::move(message), vd::move(_value));
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _is_success;
};

/// Hash of the active payload, mixed with a variant-specific seed.
namespace std
{
template <class T, class E>
    requires requires(T const& t, E const& e) {
        std::size_t(std::hash<T>{}(t));
        std::size_t(std::hash<E>{}(e));
    }
struct hash<vd::result<T, E>>
{
    [[nodiscard]] std::size_t operator()(vd::result<T, E> const& r) const noexcept
    {
        if (r.is_success())
            return std::size_t(vd::hash_combine(0x7c1ba86f3e4b1d05ull, vd::u64(std::hash<T>{}(r.value()))));
        return std::size_t(vd::hash_combine(0xe2d04a3b95f16c8dull, vd::u64(std::hash<E>{}(r.error()))));
    }
};
} // namespace std
