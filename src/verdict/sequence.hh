#pragma once

#include <verdict/fwd.hh>
#include <verdict/optional.hh>
#include <verdict/utility.hh>

#include <functional>
#include <type_traits>

// =========================================================================================================
// vd::sequence - lazy cursor over a range of zero or more elements
// =========================================================================================================
//
// result::to_sequence() returns one of these: one element on success, none on failure.
// That lets a payload be consumed with the same reductions as a collection.
//
//   res.to_sequence().each([](auto const& v) { ... });
//   res.to_sequence().push_to(all_values);
//
// Every reduction goes through try_fold and restarts from the beginning of the range,
// so a sequence can be traversed any number of times with the same outcome.
//
// Callbacks may take the element index as an optional first argument:
//   seq.each([](vd::isize idx, auto const& v) { ... });
//
// A sequence is neither copyable nor movable. Use it where it is returned.
// A borrowing sequence (to_sequence() on an lvalue result) must not outlive its result.

namespace vd
{
enum class sequence_fold_result
{
    empty,     // there was nothing to fold
    stopped,   // the step returned true
    completed, // every element was visited
};

namespace impl
{
// f(idx, args...) if f accepts an index, f(args...) otherwise
template <class F, class... Args>
decltype(auto) call_maybe_indexed(isize idx, F& f, Args&&... args)
{
    if constexpr (std::is_invocable_v<F&, isize, Args&&...>)
        return std::invoke(f, idx, vd::forward<Args>(args)...);
    else
        return std::invoke(f, vd::forward<Args>(args)...);
}

template <class T>
struct borrowed_single_range
{
    T const* ptr = nullptr;

    T const* begin() const { return ptr; }
    T const* end() const { return ptr ? ptr + 1 : nullptr; }
};

template <class T>
struct owned_single_range
{
    vd::optional<T> value;

    T* begin() { return value.has_value() ? &value.value() : nullptr; }
    T* end() { return value.has_value() ? &value.value() + 1 : nullptr; }
};
} // namespace impl

/// one element if p is not null; borrows *p
template <class T>
[[nodiscard]] sequence<impl::borrowed_single_range<T>> make_sequence_from_pointee(T const* p)
{
    return sequence<impl::borrowed_single_range<T>>(impl::borrowed_single_range<T>{p});
}

/// one element if value is engaged; owns it
template <class T>
[[nodiscard]] sequence<impl::owned_single_range<T>> make_sequence_from_optional(vd::optional<T> value)
{
    return sequence<impl::owned_single_range<T>>(impl::owned_single_range<T>{vd::move(value)});
}
} // namespace vd

template <class RangeT>
struct vd::sequence
{
public:
    using element_t = std::remove_cvref_t<decltype(*std::declval<RangeT&>().begin())>;

    /// elements are handed out by reference, addresses stay valid while the sequence lives
    static constexpr bool has_stable_elements = std::is_reference_v<decltype(*std::declval<RangeT&>().begin())>;

    explicit sequence(RangeT range) : _range(vd::move(range)) {}

    sequence(sequence&&) = delete;
    sequence(sequence const&) = delete;
    sequence& operator=(sequence&&) = delete;
    sequence& operator=(sequence const&) = delete;

    // range-for
public:
    [[nodiscard]] auto begin() { return _range.begin(); }
    [[nodiscard]] auto end() { return _range.end(); }

    // reductions
public:
    [[nodiscard]] bool is_empty() { return _range.begin() == _range.end(); }

    [[nodiscard]] isize count()
    {
        return count_if([](auto const&) { return true; });
    }

    [[nodiscard]] isize count_if(auto&& predicate)
    {
        isize n = 0;
        try_fold([&](isize idx, auto& elem) { n += bool(impl::call_maybe_indexed(idx, predicate, elem)) ? 1 : 0; });
        return n;
    }

    [[nodiscard]] bool any(auto&& predicate)
    {
        auto const r = try_fold([&](isize idx, auto& elem) { return bool(impl::call_maybe_indexed(idx, predicate, elem)); });
        return r == sequence_fold_result::stopped;
    }

    /// true for an empty sequence
    [[nodiscard]] bool all(auto&& predicate)
    {
        auto const r = try_fold([&](isize idx, auto& elem) { return !bool(impl::call_maybe_indexed(idx, predicate, elem)); });
        return r != sequence_fold_result::stopped;
    }

    /// index of the first element satisfying predicate
    [[nodiscard]] vd::optional<isize> index_of(auto&& predicate)
    {
        auto found = vd::optional<isize>();
        try_fold(
            [&](isize idx, auto& elem)
            {
                if (!impl::call_maybe_indexed(idx, predicate, elem))
                    return false;
                found = idx;
                return true;
            });
        return found;
    }

    /// apply(acc&, elem) or apply(idx, acc&, elem), returns the final acc
    template <class Acc>
    [[nodiscard]] Acc accumulate(Acc acc, auto&& apply)
    {
        try_fold([&](isize idx, auto& elem) { impl::call_maybe_indexed(idx, apply, acc, elem); });
        return acc;
    }

    void each(auto&& fun)
    {
        try_fold([&](isize idx, auto& elem) { impl::call_maybe_indexed(idx, fun, elem); });
    }

    // materialization
public:
    template <class ContainerT>
    [[nodiscard]] ContainerT to_container()
    {
        ContainerT c;
        push_to(c);
        return c;
    }

    void push_to(auto& container)
    {
        each([&](auto& elem) { container.push_back(elem); });
    }

    // basis of all reductions
public:
    /// Visits elements in order until step returns true.
    /// step may return void (never stops) and may take the index first.
    sequence_fold_result try_fold(auto&& step)
    {
        auto it = _range.begin();
        auto const end = _range.end();
        if (it == end)
            return sequence_fold_result::empty;

        for (isize idx = 0; it != end; ++it, ++idx)
        {
            using step_result = decltype(impl::call_maybe_indexed(idx, step, *it));
            if constexpr (std::is_void_v<step_result>)
                impl::call_maybe_indexed(idx, step, *it);
            else if (impl::call_maybe_indexed(idx, step, *it))
                return sequence_fold_result::stopped;
        }
        return sequence_fold_result::completed;
    }

private:
    RangeT _range;
};
