#pragma once

#include <clean-iter/impl/engine_ops.hh>

#include <algorithm>

namespace ci::impl
{
/// Shadowed operations for everything with operator[](isize) and size()
/// Shared by random_access_engine and array_engine
template <class EngineT>
struct random_access_ops : engine_ops<EngineT>
{
    using base = engine_ops<EngineT>;

    template <class S>
    [[nodiscard]] static auto take(S& src, isize count)
    {
        base::check_count(count, "take");

        auto const n = ci::min(count, isize(src.size()));
        ci::same_family_t<S> target;
        ci::reserve_for(target, n);
        for (isize i = 0; i < n; ++i)
            ci::append_to(target, src[i]);
        return target;
    }

    template <class S>
    [[nodiscard]] static auto drop(S& src, isize count)
    {
        base::check_count(count, "drop");

        auto const size = isize(src.size());
        ci::same_family_t<S> target;
        if (count >= size)
            return target;

        ci::reserve_for(target, size - count);
        for (isize i = count; i < size; ++i)
            ci::append_to(target, src[i]);
        return target;
    }

    template <class S>
    [[nodiscard]] static ci::optional<ci::element_t<S>> get_last(S& src)
    {
        auto const size = isize(src.size());
        if (size == 0)
            return {};
        return ci::optional<ci::element_t<S>>(src[size - 1]);
    }

    template <class S, class LessF>
    static void sort_with_less(S& src, LessF&& less)
    {
        if constexpr (has_random_access_iterators<S> && has_begin_end<S> && has_assignable_elements<S>)
        {
            std::stable_sort(ci::begin(src), ci::end(src), less);
        }
        else if constexpr (requires { src[0] = std::declval<ci::element_t<S>&&>(); })
        {
            auto sorted = EngineT::to_sorted_with_less(src, less);
            for (isize i = 0; i < sorted.size(); ++i)
                src[i] = ci::move(sorted[i]);
        }
        else
        {
            impl::throw_unsupported_operation("sort_this needs a source with assignable elements");
        }
    }

    /// order-preserving compaction, then one truncation at the end
    /// the source is left untouched if it cannot shrink or if pred throws
    template <class S>
    static isize remove_if(S& src, auto&& pred)
    {
        constexpr bool can_truncate = requires { src.truncate_to(isize(0)); };
        constexpr bool can_erase_tail = requires { src.erase(ci::begin(src) + isize(0), ci::end(src)); };

        if constexpr (can_truncate || can_erase_tail)
        {
            isize removed = 0;
            auto const doomed = EngineT::removal_flags(src, pred, removed);
            if (removed == 0)
                return 0;

            auto const size = isize(src.size());
            isize kept = 0;
            for (isize i = 0; i < size; ++i)
            {
                if (doomed[i])
                    continue;

                if (kept != i)
                    src[kept] = ci::move(src[i]);
                ++kept;
            }

            if constexpr (can_truncate)
                src.truncate_to(kept);
            else
                src.erase(ci::begin(src) + kept, ci::end(src));

            return removed;
        }
        else
        {
            impl::throw_unsupported_operation("remove_if needs a source that can shrink");
        }
    }
};
} // namespace ci::impl

/// operator[] loop over [0, size())
/// Used for std::vector, std::deque, std::array, ci::span and user types with index access
struct ci::impl::random_access_engine : ci::impl::random_access_ops<random_access_engine>
{
    template <class S, class StepF>
    static fold_result try_fold(S& src, StepF&& step)
    {
        auto const size = isize(src.size());
        if (size == 0)
            return fold_result::empty;

        for (isize i = 0; i < size; ++i)
        {
            auto&& elem = src[i];
            if (impl::invoke_step(step, i, elem))
                return fold_result::stopped;
        }
        return fold_result::completed;
    }
};
