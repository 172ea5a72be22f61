#pragma once

#include <clean-iter/impl/random_access_engine.hh>
#include <clean-iter/span.hh>

#include <algorithm>
#include <type_traits>

/// Pointer loops over contiguous storage: data() and size()
/// Used for ci::vector and the primitive entry points
struct ci::impl::array_engine : ci::impl::random_access_ops<array_engine>
{
    template <class S, class StepF>
    static fold_result try_fold(S& src, StepF&& step)
    {
        auto const size = isize(src.size());
        if (size == 0)
            return fold_result::empty;

        auto const p = src.data();
        for (isize i = 0; i < size; ++i)
            if (impl::invoke_step(step, i, p[i]))
                return fold_result::stopped;
        return fold_result::completed;
    }

    template <class S>
    [[nodiscard]] static auto take(S& src, isize count)
    {
        if constexpr (std::is_same_v<ci::same_family_t<S>, ci::vector<ci::element_t<S>>>)
        {
            check_count(count, "take");
            return ci::vector<ci::element_t<S>>::create_copy_of(contents(src).first(ci::min(count, isize(src.size()))));
        }
        else
            return random_access_ops::take(src, count);
    }

    template <class S>
    [[nodiscard]] static auto drop(S& src, isize count)
    {
        if constexpr (std::is_same_v<ci::same_family_t<S>, ci::vector<ci::element_t<S>>>)
        {
            check_count(count, "drop");
            auto const all = contents(src);
            return ci::vector<ci::element_t<S>>::create_copy_of(all.subspan(ci::min(count, all.size())));
        }
        else
            return random_access_ops::drop(src, count);
    }

    template <class S, class LessF>
    static void sort_with_less(S& src, LessF&& less)
    {
        if constexpr (std::is_assignable_v<decltype(*src.data())&, ci::element_t<S>&&>)
            std::stable_sort(src.data(), src.data() + src.size(), less);
        else
            impl::throw_unsupported_operation("sort_this needs a source with assignable elements");
    }

    template <class S, class LessF>
    [[nodiscard]] static ci::vector<ci::element_t<S>> to_sorted_with_less(S& src, LessF&& less)
    {
        auto result = ci::vector<ci::element_t<S>>::create_copy_of(contents(src));
        std::stable_sort(result.begin(), result.end(), less);
        return result;
    }

    template <class S>
    [[nodiscard]] static ci::vector<ci::element_t<S>> to_vector(S& src)
    {
        return ci::vector<ci::element_t<S>>::create_copy_of(contents(src));
    }

    template <class S>
    static isize remove_if(S& src, auto&& pred)
    {
        if constexpr (requires { src.truncate_to(isize(0)); })
        {
            isize removed = 0;
            auto const doomed = array_engine::removal_flags(src, pred, removed);
            if (removed == 0)
                return 0;

            auto const first = src.data();
            auto const size = isize(src.size());
            auto out = first;
            for (isize i = 0; i < size; ++i)
            {
                if (doomed[i])
                    continue;

                if (out != first + i)
                    *out = ci::move(first[i]);
                ++out;
            }

            src.truncate_to(isize(out - first));
            return removed;
        }
        else
            return random_access_ops::remove_if(src, pred);
    }

private:
    template <class S>
    static ci::span<ci::element_t<S> const> contents(S& src)
    {
        return ci::span<ci::element_t<S> const>(src.data(), isize(src.size()));
    }
};
