#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/utility.hh>

#include <functional>
#include <type_traits>

// =========================================================================================================
// Invocation helpers
// =========================================================================================================
//
// invoke(f, args...)                              - call anything callable (incl. member pointers)
// is_invocable<F, Args...>                        - can invoke(f, args...) be called
// is_invocable_r<R, F, Args...>                   - ... and does the result convert to R
// invoke_result<F, Args...>                       - result type of invoke(f, args...)
// unit                                            - regular stand-in for a void result
// regular_invoke(f, args...)                      - invoke, but returns unit instead of void
// invoke_with_optional_idx(idx, f, args...)       - invoke f(idx, args...) if possible, else f(args...)
// regular_invoke_with_optional_idx(idx, f, ...)   - both of the above
//
// User operations (predicates, key functions, comparators, ...) always go through ci::invoke.
// This is what makes member pointers valid operations:
//   ci::group_by(people, &person::city);
//   ci::sort_this_by(people, &person::age);


namespace ci
{
/// Calls f with args, supporting function pointers, callables and pointers to members
/// Delegates to std::invoke; exists so that every call site reads the same
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    return std::invoke(ci::forward<F>(f), ci::forward<Args>(args)...);
}

template <class F, class... Args>
constexpr bool is_invocable = std::is_invocable_v<F, Args...>;

template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

template <class F, class... Args>
using invoke_result = std::invoke_result_t<F, Args...>;

/// The result of a regular_invoke of a void-returning callable
/// Fold steps that return unit never stop early, steps returning bool stop on true
struct unit
{
    friend constexpr bool operator==(unit, unit) = default;
};

/// Like invoke, but a void result becomes unit
/// Lets generic code store and inspect the result without special-casing void
template <class F, class... Args>
constexpr decltype(auto) regular_invoke(F&& f, Args&&... args)
{
    if constexpr (std::is_void_v<invoke_result<F, Args...>>)
    {
        ci::invoke(ci::forward<F>(f), ci::forward<Args>(args)...);
        return unit{};
    }
    else
    {
        return ci::invoke(ci::forward<F>(f), ci::forward<Args>(args)...);
    }
}

/// Invokes f with a leading index if it accepts one, otherwise without
/// Unused indices are optimized away
template <class F, class... Args>
constexpr decltype(auto) invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    if constexpr (is_invocable<F, isize, Args...>)
        return ci::invoke(ci::forward<F>(f), idx, ci::forward<Args>(args)...);
    else
    {
        static_assert(is_invocable<F, Args...>, "callable can be invoked neither with nor without index");
        return ci::invoke(ci::forward<F>(f), ci::forward<Args>(args)...);
    }
}

/// invoke_with_optional_idx with the void -> unit conversion of regular_invoke
template <class F, class... Args>
constexpr decltype(auto) regular_invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    if constexpr (is_invocable<F, isize, Args...>)
        return ci::regular_invoke(ci::forward<F>(f), idx, ci::forward<Args>(args)...);
    else
    {
        static_assert(is_invocable<F, Args...>, "callable can be invoked neither with nor without index");
        return ci::regular_invoke(ci::forward<F>(f), ci::forward<Args>(args)...);
    }
}
} // namespace ci
