#pragma once

#include <verdict/assert.hh>
#include <verdict/fwd.hh>
#include <verdict/to_debug_string.hh>
#include <verdict/utility.hh>

#include <exception>
#include <memory>
#include <string>
#include <type_traits>

// =========================================================================================================
// Typed errors for explicit result misuse
// =========================================================================================================
//
//   unwrap_on_failure<E>       unwrap() / expect(msg) called on a failure, carries the failure payload
//   unwrap_on_success<T>       unwrap_error() / expect_failure(msg) called on a success, carries the success payload
//   unsupported_default_type   unwrap_or_default() on a failure whose T is not whitelisted
//
// All of them are std::exceptions with a what() of the form "<message>: <payload>".
// Payloads are held in a shared immutable copy so that the errors stay copyable
// (a requirement for thrown objects) even for move-only payload types.
// Unwrapping an lvalue result cannot take a move-only payload: the error then carries
// only its rendering, has_error()/has_value() is false and payload_string() is the sole record.

/// Common base of unwrap_on_failure and unwrap_on_success
struct vd::result_access_error : std::exception
{
public:
    result_access_error(std::string message, std::string payload_string);

    [[nodiscard]] char const* what() const noexcept override;

    /// the fixed or caller-supplied diagnostic message
    [[nodiscard]] std::string const& message() const { return _message; }

    /// debug rendering of the opposite-variant payload (see vd::to_debug_string)
    [[nodiscard]] std::string const& payload_string() const { return _payload_string; }

private:
    std::string _message;
    std::string _payload_string;
    std::string _what;
};

/// Thrown by unwrap() and expect() on a failure
template <class E>
struct vd::unwrap_on_failure : vd::result_access_error
{
public:
    unwrap_on_failure(std::string message, E&& error)
      : result_access_error(vd::move(message), vd::to_debug_string(error)),
        _error(std::make_shared<E const>(vd::move(error)))
    {
    }
    unwrap_on_failure(std::string message, E const& error)
      : result_access_error(vd::move(message), vd::to_debug_string(error))
    {
        if constexpr (std::is_copy_constructible_v<E>)
            _error = std::make_shared<E const>(error);
    }

    [[nodiscard]] bool has_error() const { return _error != nullptr; }

    /// the failure payload of the result that was unwrapped
    /// Precondition: has_error()
    [[nodiscard]] E const& error() const
    {
        VD_ASSERT(_error != nullptr, "error() on an unwrap_on_failure without payload, see payload_string()");
        return *_error;
    }

private:
    std::shared_ptr<E const> _error;
};

/// Thrown by unwrap_error() and expect_failure() on a success
template <class T>
struct vd::unwrap_on_success : vd::result_access_error
{
public:
    unwrap_on_success(std::string message, T&& value)
      : result_access_error(vd::move(message), vd::to_debug_string(value)),
        _value(std::make_shared<T const>(vd::move(value)))
    {
    }
    unwrap_on_success(std::string message, T const& value)
      : result_access_error(vd::move(message), vd::to_debug_string(value))
    {
        if constexpr (std::is_copy_constructible_v<T>)
            _value = std::make_shared<T const>(value);
    }

    [[nodiscard]] bool has_value() const { return _value != nullptr; }

    /// the success payload of the result that was unwrapped
    /// Precondition: has_value()
    [[nodiscard]] T const& value() const
    {
        VD_ASSERT(_value != nullptr, "value() on an unwrap_on_success without payload, see payload_string()");
        return *_value;
    }

private:
    std::shared_ptr<T const> _value;
};

/// Thrown by unwrap_or_default() on a failure when T has no canonical default
struct vd::unsupported_default_type : std::exception
{
public:
    explicit unsupported_default_type(std::string type_name);

    [[nodiscard]] char const* what() const noexcept override;

    /// human-readable name of the rejected type
    [[nodiscard]] std::string const& type_name() const { return _type_name; }

private:
    std::string _type_name;
    std::string _what;
};
