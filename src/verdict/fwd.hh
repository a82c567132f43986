#pragma once

#include <cstddef>
#include <cstdint>

namespace vd
{
// fixed-width integers where the width is part of the contract (hash values)
using i64 = std::int64_t;
using u64 = std::uint64_t;

// sizes and indices in sequences are signed, "count - 1" never wraps
using isize = i64;

// result
struct any_error;
template <class E>
struct as_failure_t;
template <class T>
struct as_success_t;
template <class T, class E = any_error>
struct result;

// errors thrown by result's extraction operations
struct result_access_error;
template <class E>
struct unwrap_on_failure;
template <class T>
struct unwrap_on_success;
struct unsupported_default_type;

// supporting types
struct nullopt_t;
template <class T>
struct optional;
template <class RangeT>
struct sequence;
template <class T>
struct canonical_default;
} // namespace vd
