#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/utility.hh>

#include <utility>

/// Two values of potentially different types
/// Element type of zip (left element, right element) and zip_with_index (element, position)
/// Aggregate, supports structured bindings:
///   for (auto const& [name, idx] : ci::zip_with_index(names))
///       ...
template <class T, class U>
struct ci::pair
{
    using first_t = T;
    using second_t = U;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;
    [[nodiscard]] friend constexpr auto operator<=>(pair const&, pair const&) = default;

    T first;
    U second;

    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    {
        if constexpr (I == 0)
            return (ci::forward<P>(p).first);
        else
            return (ci::forward<P>(p).second);
    }
};

template <class T, class U>
struct std::tuple_size<ci::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct std::tuple_element<I, ci::pair<T, U>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, T, U>;
};
