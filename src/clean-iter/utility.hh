#pragma once

#include <clean-iter/assert.hh>
#include <clean-iter/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Template metaprogramming:
//   always_false_t<T...>             - always false for static_assert with type parameters
//   is_specialization_of<T, Tmpl>    - true if T is Tmpl<Args...> for some Args
//
// Object lifetime:
//   placement_new                    - tag for the non-allocating placement new below
//   storage_for<T>                   - uninitialized, correctly aligned storage for one T
//


namespace ci
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   target.push_back(ci::move(elem));
template <class T>
[[nodiscard]] CI_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] CI_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] CI_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto old_size = ci::exchange(_size, 0);
template <class T, class U = T>
[[nodiscard]] CI_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T, template <class...> class Tmpl>
struct is_specialization_of_t
{
    static constexpr bool value = false;
};
template <class... Args, template <class...> class Tmpl>
struct is_specialization_of_t<Tmpl<Args...>, Tmpl>
{
    static constexpr bool value = true;
};
} // namespace impl

/// True if T (ignoring cv) is an instantiation of the class template Tmpl
/// Usage:
///   static_assert(ci::is_specialization_of<ci::vector<int> const, ci::vector>);
///   static_assert(!ci::is_specialization_of<std::list<int>, ci::vector>);
template <class T, template <class...> class Tmpl>
constexpr bool is_specialization_of = impl::is_specialization_of_t<std::remove_cv_t<T>, Tmpl>::value;

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the non-allocating placement new declared below
/// Usage:
///   new (ci::placement_new, ptr) T(ci::forward<Args>(args)...);
struct placement_new_tag
{
};
constexpr placement_new_tag placement_new = {};

/// Uninitialized storage for exactly one T
/// The value is constructed / destroyed manually (used by ci::optional)
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    // stays trivially destructible for trivial T so that optional<T> can be trivial too
    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

} // namespace ci

// non-allocating placement new, selected by ci::placement_new
inline void* operator new(std::size_t, ci::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}
// only called if a constructor throws during placement new
inline void operator delete(void*, ci::placement_new_tag, void*) noexcept {}
