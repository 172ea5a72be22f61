#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/utility.hh>

#include <concepts>
#include <iterator>
#include <memory>
#include <type_traits>

// =========================================================================================================
// Source classification
// =========================================================================================================
//
// Every operation of iterate.hh looks at the static type of its source exactly once and picks
// the most specific engine that type supports:
//
//   native_rich    - the type implements the operation set itself (derives ci::rich_iterable)
//   array_backed   - ci::vector: pointer loops over data()
//   random_access  - operator[](isize) and size(), with random access iterators if it has any
//   sequential     - begin() / end()
//
// A type can state its class explicitly:
//
//   struct my_tree
//   {
//       static constexpr ci::iteration_capability iteration_capability = ci::iteration_capability::sequential;
//       ...
//   };
//
// The capability only decides HOW an operation runs. Results never depend on it.
//
// Mutating operations (sort_this, sort_this_by, remove_if) additionally require is_mutable_source:
// const sources and types declaring `static constexpr bool is_immutable = true;` are rejected at runtime
// with ci::unsupported_operation_error.

enum class ci::iteration_capability
{
    sequential,
    random_access,
    array_backed,
    native_rich,
};

namespace ci
{
/// Iterator to the first element (member begin() or C array)
template <class R>
    requires requires(R& r) { r.begin(); } || requires(R& r) { std::begin(r); }
[[nodiscard]] constexpr auto begin(R& range)
{
    if constexpr (requires { range.begin(); })
        return range.begin();
    else
        return std::begin(range);
}

/// Iterator past the last element (member end() or C array)
template <class R>
    requires requires(R& r) { r.end(); } || requires(R& r) { std::end(r); }
[[nodiscard]] constexpr auto end(R& range)
{
    if constexpr (requires { range.end(); })
        return range.end();
    else
        return std::end(range);
}

/// The type of an element as yielded by the source, without cv and reference
/// e.g. "std::list<int> const" -> int
///      "ci::interval"          -> i64
template <class S>
using element_t = std::remove_cvref_t<decltype(*ci::begin(std::declval<S&>()))>;

namespace impl
{
// the lvalue type engines hand to their fold steps (const for const sources)
template <class S>
using element_ref_t = std::remove_reference_t<decltype(*ci::begin(std::declval<S&>()))>&;

template <class S>
constexpr bool has_begin_end = requires(S& s) {
    ci::begin(s) != ci::end(s);
    *ci::begin(s);
};

template <class S>
constexpr bool declares_capability = requires {
    { S::iteration_capability } -> std::convertible_to<ci::iteration_capability>;
};

template <class S>
constexpr bool has_index_access = requires(S& s, isize i) {
    s[i];
    { s.size() } -> std::convertible_to<isize>;
};

// operator[] of associative containers is a key lookup, not a position
// so a type with iterators only counts as indexable if they are random access
template <class S>
constexpr bool has_random_access_iterators = []
{
    if constexpr (has_begin_end<S>)
        return std::random_access_iterator<decltype(ci::begin(std::declval<S&>()))>;
    else
        return true;
}();

template <class S>
constexpr iteration_capability deduce_capability()
{
    using T = std::remove_cv_t<S>;

    if constexpr (declares_capability<T>)
        return T::iteration_capability;
    else if constexpr (ci::is_specialization_of<T, ci::vector>)
        return iteration_capability::array_backed;
    else if constexpr (has_index_access<S> && has_random_access_iterators<S>)
        return iteration_capability::random_access;
    else if constexpr (has_begin_end<S>)
        return iteration_capability::sequential;
    else
    {
        static_assert(always_false_t<S>, "cannot perform on unsupported source: needs begin()/end(), "
                                         "operator[] with size(), or a declared iteration_capability");
        return iteration_capability::sequential;
    }
}

template <class S>
constexpr bool declares_immutable = []
{
    if constexpr (requires { { S::is_immutable } -> std::convertible_to<bool>; })
        return bool(S::is_immutable);
    else
        return false;
}();

template <class P>
struct is_source_pointer_t : std::false_type
{
};
template <class T>
struct is_source_pointer_t<T*> : std::true_type
{
};
template <class T>
struct is_source_pointer_t<std::unique_ptr<T>> : std::true_type
{
};
template <class T>
struct is_source_pointer_t<std::shared_ptr<T>> : std::true_type
{
};
} // namespace impl

/// True if S can be used as a source at all
template <class S>
constexpr bool is_iterable_source = impl::declares_capability<std::remove_cv_t<S>>
                                 || ci::is_specialization_of<S, ci::vector> || impl::has_index_access<S>
                                 || impl::has_begin_end<S>;

/// Static description of a source type S (possibly const)
template <class S>
struct source_traits
{
    static constexpr iteration_capability capability = impl::deduce_capability<S>();

    /// in-place operations are allowed (sort_this, sort_this_by, remove_if)
    static constexpr bool is_mutable = !std::is_const_v<S> && !impl::declares_immutable<std::remove_cv_t<S>>;
};

template <class S>
constexpr iteration_capability capability_of = source_traits<S>::capability;

template <class S>
constexpr bool is_mutable_source = source_traits<S>::is_mutable;

template <class S>
constexpr bool is_rich_source = capability_of<S> == iteration_capability::native_rich;

/// Raw pointers, unique_ptr and shared_ptr are accepted in place of a source and may be null
/// (pointers to arrays are not sources)
template <class P>
constexpr bool is_source_pointer = impl::is_source_pointer_t<std::remove_cv_t<P>>::value;

/// What the free functions of iterate.hh accept in source position: a source or a pointer to one
/// (keeps them from competing with two-argument overloads like ci::min(a, b))
template <class S>
concept source_argument = is_source_pointer<std::remove_cvref_t<S>> || is_iterable_source<std::remove_reference_t<S>>;
} // namespace ci
