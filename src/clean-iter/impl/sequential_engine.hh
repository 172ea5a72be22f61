#pragma once

#include <clean-iter/impl/engine_ops.hh>

/// Engine of last resort: a begin() / end() cursor loop
/// Used for std::list, std::set, std::unordered_map, immutable_map and everything else that only iterates
struct ci::impl::sequential_engine : ci::impl::engine_ops<sequential_engine>
{
    template <class S, class StepF>
    static fold_result try_fold(S& src, StepF&& step)
    {
        auto it = ci::begin(src);
        auto const end = ci::end(src);
        if (it == end)
            return fold_result::empty;

        isize idx = 0;
        for (; it != end; ++it, ++idx)
        {
            auto&& elem = *it;
            if (impl::invoke_step(step, idx, elem))
                return fold_result::stopped;
        }
        return fold_result::completed;
    }

    /// std::list and friends sort by relinking nodes
    template <class S, class LessF>
    static void sort_with_less(S& src, LessF&& less)
    {
        if constexpr (requires { src.sort(less); })
            src.sort(less);
        else
            engine_ops::sort_with_less(src, less);
    }

    /// member remove_if (std::list, std::forward_list) before the erase loop
    /// relinks nodes, the predicate has already run for all elements
    template <class S>
    static isize remove_if(S& src, auto&& pred)
    {
        auto const keep_all = [](auto const&) { return false; };
        if constexpr (requires { src.remove_if(keep_all); })
        {
            isize removed = 0;
            auto const doomed = sequential_engine::removal_flags(src, pred, removed);
            if (removed == 0)
                return 0;

            isize idx = 0;
            src.remove_if([&](auto const&) { return bool(doomed[idx++]); });
            return removed;
        }
        else
            return engine_ops::remove_if(src, pred);
    }
};
