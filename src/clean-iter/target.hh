#pragma once

#include <clean-iter/capability.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/utility.hh>
#include <clean-iter/vector.hh>

#include <deque>
#include <list>
#include <set>
#include <type_traits>
#include <unordered_set>

// =========================================================================================================
// Result builder
// =========================================================================================================
//
// Operations either write into a caller-supplied target or build a fresh one.
//
// append_to(target, value)      - push_back, else emplace_back, else insert
// reserve_for(target, n)        - capacity hint if the target can take one
// same_family_t<S>              - fresh target of element-preserving operations (select, reject, take, ...)
// list_target_t<T>              - fresh target of transforming operations (collect, zip, chunk, ...)
//
// same_family_t keeps the family of the source:
//   std::set           -> std::set
//   std::unordered_set -> std::unordered_set
//   std::list          -> std::list
//   std::deque         -> std::deque
//   everything else    -> ci::vector
// A (rich) source can name its own family:
//   template <class U>
//   using species_t = my_container<U>;
//
// Targets are never retained after the call that filled them.

namespace ci
{
/// Appends value to target.
template <class ContainerT, class V>
void append_to(ContainerT& target, V&& value)
{
    if constexpr (requires { target.push_back(ci::forward<V>(value)); })
        target.push_back(ci::forward<V>(value));
    else if constexpr (requires { target.emplace_back(ci::forward<V>(value)); })
        target.emplace_back(ci::forward<V>(value));
    else if constexpr (requires { target.insert(ci::forward<V>(value)); })
        target.insert(ci::forward<V>(value));
    else
        static_assert(always_false_t<ContainerT>, "target supports neither push_back, emplace_back nor insert");
}

/// Announces that count more elements will be appended.
/// Growing a target with a capacity at least doubles it, so repeated calls stay amortized O(1) per element.
/// No-op for targets without a reserve.
template <class ContainerT>
void reserve_for(ContainerT& target, isize count)
{
    if constexpr (requires { target.has_capacity_back_for(count); target.reserve_back(count); })
    {
        if (!target.has_capacity_back_for(count))
            target.reserve_back(ci::max(count, isize(target.size())));
    }
    else if constexpr (requires { target.reserve_back(count); })
        target.reserve_back(count);
    else if constexpr (requires { target.reserve(std::size_t(count)); target.capacity(); })
    {
        auto const needed = target.size() + std::size_t(count);
        if (needed > target.capacity())
            target.reserve(ci::max(needed, 2 * target.capacity()));
    }
    else if constexpr (requires { target.reserve(std::size_t(count)); })
        target.reserve(target.size() + std::size_t(count));
}

namespace impl
{
template <class S, class T>
struct same_family
{
    using type = ci::vector<T>;
};

template <class S, class T>
    requires requires { typename S::template species_t<T>; }
struct same_family<S, T>
{
    using type = typename S::template species_t<T>;
};

template <class X, class C, class A, class T>
struct same_family<std::set<X, C, A>, T>
{
    using type = std::conditional_t<std::is_same_v<X, T>, std::set<X, C, A>, std::set<T>>;
};

template <class X, class H, class E, class A, class T>
struct same_family<std::unordered_set<X, H, E, A>, T>
{
    using type = std::conditional_t<std::is_same_v<X, T>, std::unordered_set<X, H, E, A>, std::unordered_set<T>>;
};

template <class X, class A, class T>
struct same_family<std::list<X, A>, T>
{
    using type = std::list<T>;
};

template <class X, class A, class T>
struct same_family<std::deque<X, A>, T>
{
    using type = std::deque<T>;
};
} // namespace impl

/// Fresh target for element-preserving operations on a source S
template <class S, class T = ci::element_t<S>>
using same_family_t = typename impl::same_family<std::remove_cv_t<S>, T>::type;

/// Fresh target for transforming operations
/// Always a list so that the result length equals the number of produced values
template <class T>
using list_target_t = ci::vector<T>;
} // namespace ci
