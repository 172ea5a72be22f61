#pragma once

#include <clean-iter/capability.hh>
#include <clean-iter/errors.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/invocable.hh>
#include <clean-iter/list_multimap.hh>
#include <clean-iter/macros.hh>
#include <clean-iter/optional.hh>
#include <clean-iter/pair.hh>
#include <clean-iter/partition_result.hh>
#include <clean-iter/target.hh>
#include <clean-iter/to_string.hh>
#include <clean-iter/utility.hh>
#include <clean-iter/vector.hh>

#include <algorithm>
#include <concepts>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

// -----------------------------------------------------------------------------
// engine model
// -----------------------------------------------------------------------------

// 1) An engine is a stateless struct of static functions for one capability class.
//    sequential_engine, random_access_engine, array_engine, rich_engine.

// 2) The only thing an engine MUST provide is an early-outable internal fold:
//      try_fold(src, step) -> fold_result
//    step(idx?, elem&) returns void (never stop) or bool (true = stop).

// 3) engine_ops<EngineT> implements every operation exactly once on top of EngineT::try_fold.
//    Engines inherit it and shadow individual operations with faster versions
//    (index-based take/drop, in-place compaction for remove_if, std::stable_sort, ...).
//    Inside engine_ops, every call that an engine may shadow goes through EngineT::.

// 4) Shadowing never changes observable results:
//    same elements, same order, same number of user-operation calls for short-circuiting operations.

// 5) User operations (predicates, functions, comparators) are called through ci::invoke,
//    so pointers to members work everywhere.

// 6) The source is never retained. Targets are filled and handed back.

/// tri-state result of a try_fold
enum class ci::fold_result
{
    // source is empty, step was never called
    empty,
    // step returned true, fold was stopped
    stopped,
    // step never returned true, source was fully traversed
    completed,
};

namespace ci::impl
{
/// calls a fold step, returns true if the fold should stop
/// void/unit steps never stop, bool steps stop on true
template <class StepF, class ElemT>
CI_FORCE_INLINE bool invoke_step(StepF& step, isize idx, ElemT& elem)
{
    auto const res = ci::regular_invoke_with_optional_idx(idx, step, elem);
    if constexpr (std::is_same_v<std::remove_cvref_t<decltype(res)>, bool>)
        return res;
    else
        return false;
}

// a < b
struct natural_less
{
    template <class A, class B>
    constexpr bool operator()(A const& a, B const& b) const
    {
        return a < b;
    }
};

/// turns a user comparator into a less-than predicate
/// bool-returning comparators already are one, everything else is three-way: compare(a, b) < 0 means less
template <class CompareF>
auto as_less(CompareF& compare)
{
    return [&compare](auto const& a, auto const& b) -> bool
    {
        if constexpr (std::is_same_v<std::remove_cvref_t<decltype(ci::invoke(compare, a, b))>, bool>)
            return ci::invoke(compare, a, b);
        else
            return ci::invoke(compare, a, b) < 0;
    };
}

/// less-than on a projected key
template <class KeyF>
auto by_key_less(KeyF& key_fn)
{
    return [&key_fn](auto const& a, auto const& b) -> bool { return ci::invoke(key_fn, a) < ci::invoke(key_fn, b); };
}

template <class S>
constexpr bool has_member_size = requires(S& s) {
    { s.size() } -> std::convertible_to<isize>;
};

template <class S>
constexpr bool has_bidirectional_iterators = []
{
    if constexpr (has_begin_end<S>)
        return std::bidirectional_iterator<decltype(ci::begin(std::declval<S&>()))>;
    else
        return false;
}();

template <class S>
constexpr bool has_assignable_elements = []
{
    if constexpr (has_begin_end<S>)
        return std::is_assignable_v<decltype(*ci::begin(std::declval<S&>())), element_t<S>&&>;
    else
        return false;
}();

/// capacity hint for a fresh target that will receive one value per source element
template <class TargetT, class S>
void reserve_like(TargetT& target, S& src)
{
    if constexpr (has_member_size<S>)
        ci::reserve_for(target, isize(src.size()));
}

/// last write wins
template <class MapT, class K, class V>
void put_last_wins(MapT& map, K&& key, V&& value)
{
    if constexpr (requires { map.insert_or_assign(ci::forward<K>(key), ci::forward<V>(value)); })
        map.insert_or_assign(ci::forward<K>(key), ci::forward<V>(value));
    else
        map[ci::forward<K>(key)] = ci::forward<V>(value);
}

/// the accumulator of key, created from zero_fn() on first use
template <class MapT, class K, class ZeroF>
auto& slot_for(MapT& map, K&& key, ZeroF& zero_fn)
{
    auto it = map.find(key);
    if (it == map.end())
        it = map.emplace(ci::forward<K>(key), ci::invoke(zero_fn)).first;
    return it->second;
}

template <class EngineT>
struct engine_ops
{
    //
    // iteration
    //

    /// fn(elem) for every element in traversal order
    template <class S>
    static void for_each(S& src, auto&& fn)
    {
        EngineT::try_fold(src, [&](auto& elem) { ci::invoke(fn, elem); });
    }

    /// fn(elem, idx) for every element, idx counts from 0
    template <class S>
    static void for_each_with_index(S& src, auto&& fn)
    {
        EngineT::try_fold(src, [&](isize idx, auto& elem) { ci::invoke(fn, elem, idx); });
    }

    //
    // filtering
    //

    template <class S>
    [[nodiscard]] static auto select(S& src, auto&& pred)
    {
        ci::same_family_t<S> target;
        EngineT::select(src, pred, target);
        return target;
    }

    template <class S, class TargetT>
    static TargetT& select(S& src, auto&& pred, TargetT& target)
    {
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (bool(ci::invoke(pred, elem)))
                                  ci::append_to(target, elem);
                          });
        return target;
    }

    template <class S>
    [[nodiscard]] static auto reject(S& src, auto&& pred)
    {
        ci::same_family_t<S> target;
        EngineT::reject(src, pred, target);
        return target;
    }

    template <class S, class TargetT>
    static TargetT& reject(S& src, auto&& pred, TargetT& target)
    {
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (!bool(ci::invoke(pred, elem)))
                                  ci::append_to(target, elem);
                          });
        return target;
    }

    /// one pass, pred is called exactly once per element
    template <class S>
    [[nodiscard]] static auto partition(S& src, auto&& pred)
    {
        ci::partition_result<ci::same_family_t<S>> result;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (bool(ci::invoke(pred, elem)))
                                  ci::append_to(result.selected, elem);
                              else
                                  ci::append_to(result.rejected, elem);
                          });
        return result;
    }

    /// the first count elements, stops traversal after them
    template <class S>
    [[nodiscard]] static auto take(S& src, isize count)
    {
        check_count(count, "take");

        ci::same_family_t<S> target;
        if (count == 0)
            return target;

        isize taken = 0;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              ci::append_to(target, elem);
                              return ++taken == count;
                          });
        return target;
    }

    /// all but the first count elements
    template <class S>
    [[nodiscard]] static auto drop(S& src, isize count)
    {
        check_count(count, "drop");

        ci::same_family_t<S> target;
        EngineT::try_fold(src,
                          [&](isize idx, auto& elem)
                          {
                              if (idx >= count)
                                  ci::append_to(target, elem);
                          });
        return target;
    }

    //
    // transformation
    //

    template <class S, class F>
    [[nodiscard]] static auto collect(S& src, F&& fn)
    {
        using value_t = std::remove_cvref_t<ci::invoke_result<F&, element_ref_t<S>>>;
        ci::list_target_t<value_t> target;
        impl::reserve_like(target, src);
        EngineT::collect(src, fn, target);
        return target;
    }

    template <class S, class F, class TargetT>
    static TargetT& collect(S& src, F&& fn, TargetT& target)
    {
        EngineT::try_fold(src, [&](auto& elem) { ci::append_to(target, ci::invoke(fn, elem)); });
        return target;
    }

    /// fn(elem) for the elements where pred holds
    template <class S, class F>
    [[nodiscard]] static auto collect_if(S& src, auto&& pred, F&& fn)
    {
        using value_t = std::remove_cvref_t<ci::invoke_result<F&, element_ref_t<S>>>;
        ci::list_target_t<value_t> target;
        EngineT::collect_if(src, pred, fn, target);
        return target;
    }

    template <class S, class F, class TargetT>
    static TargetT& collect_if(S& src, auto&& pred, F&& fn, TargetT& target)
    {
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (bool(ci::invoke(pred, elem)))
                                  ci::append_to(target, ci::invoke(fn, elem));
                          });
        return target;
    }

    /// fn returns an enumerable per element, the results are concatenated
    template <class S, class F>
    [[nodiscard]] static auto flat_collect(S& src, F&& fn)
    {
        using range_t = std::remove_cvref_t<ci::invoke_result<F&, element_ref_t<S>>>;
        ci::list_target_t<ci::element_t<range_t>> target;
        EngineT::flat_collect(src, fn, target);
        return target;
    }

    template <class S, class F, class TargetT>
    static TargetT& flat_collect(S& src, F&& fn, TargetT& target)
    {
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              auto&& inner = ci::invoke(fn, elem);
                              for (auto&& v : inner)
                                  ci::append_to(target, v);
                          });
        return target;
    }

    /// a source of enumerables, concatenated
    template <class S>
    [[nodiscard]] static auto flatten(S& src)
    {
        ci::list_target_t<ci::element_t<ci::element_t<S>>> target;
        EngineT::flatten(src, target);
        return target;
    }

    template <class S, class TargetT>
    static TargetT& flatten(S& src, TargetT& target)
    {
        EngineT::try_fold(src,
                          [&](auto& inner)
                          {
                              for (auto&& v : inner)
                                  ci::append_to(target, v);
                          });
        return target;
    }

    //
    // predicates and counting
    //

    template <class S>
    [[nodiscard]] static isize count(S& src, auto&& pred)
    {
        isize cnt = 0;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (bool(ci::invoke(pred, elem)))
                                  ++cnt;
                          });
        return cnt;
    }

    template <class S>
    [[nodiscard]] static bool any_satisfy(S& src, auto&& pred)
    {
        return EngineT::try_fold(src, [&](auto& elem) { return bool(ci::invoke(pred, elem)); })
            == fold_result::stopped; // stopped => we found one with "true"
    }

    template <class S>
    [[nodiscard]] static bool all_satisfy(S& src, auto&& pred)
    {
        return EngineT::try_fold(src, [&](auto& elem) { return !bool(ci::invoke(pred, elem)); })
            != fold_result::stopped; // stopped => we found one with "false"
    }

    template <class S>
    [[nodiscard]] static bool none_satisfy(S& src, auto&& pred)
    {
        return EngineT::try_fold(src, [&](auto& elem) { return bool(ci::invoke(pred, elem)); })
            != fold_result::stopped;
    }

    template <class S, class V>
    [[nodiscard]] static bool contains(S& src, V const& value)
    {
        return EngineT::try_fold(src, [&](auto& elem) { return bool(elem == value); }) == fold_result::stopped;
    }

    /// member size() if there is one, otherwise a full traversal
    template <class S>
    [[nodiscard]] static isize size_of(S& src)
    {
        if constexpr (has_member_size<S>)
            return isize(src.size());
        else
        {
            isize cnt = 0;
            EngineT::try_fold(src, [&](auto&) { ++cnt; });
            return cnt;
        }
    }

    template <class S>
    [[nodiscard]] static bool is_empty(S& src)
    {
        if constexpr (requires { { src.empty() } -> std::convertible_to<bool>; })
            return bool(src.empty());
        else
            return EngineT::try_fold(src, [](auto&) { return true; }) == fold_result::empty;
    }

    template <class S>
    [[nodiscard]] static bool not_empty(S& src)
    {
        return !EngineT::is_empty(src);
    }

    //
    // finding
    //

    /// the first element where pred holds
    template <class S>
    [[nodiscard]] static ci::optional<ci::element_t<S>> detect(S& src, auto&& pred)
    {
        ci::optional<ci::element_t<S>> result;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (bool(ci::invoke(pred, elem)))
                              {
                                  result.emplace(elem);
                                  return true; // stop
                              }
                              return false;
                          });
        return result;
    }

    template <class S>
    [[nodiscard]] static ci::element_t<S> detect_if_none(S& src, auto&& pred, ci::element_t<S> fallback)
    {
        auto found = EngineT::detect(src, pred);
        if (found.has_value())
            return ci::move(found).value();
        return fallback;
    }

    /// position of the first element where pred holds, -1 if there is none
    template <class S>
    [[nodiscard]] static isize detect_index(S& src, auto&& pred)
    {
        isize result = -1;
        EngineT::try_fold(src,
                          [&](isize idx, auto& elem)
                          {
                              if (bool(ci::invoke(pred, elem)))
                              {
                                  result = idx;
                                  return true; // stop
                              }
                              return false;
                          });
        return result;
    }

    template <class S>
    [[nodiscard]] static ci::optional<ci::element_t<S>> get_first(S& src)
    {
        ci::optional<ci::element_t<S>> result;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              result.emplace(elem);
                              return true;
                          });
        return result;
    }

    /// steps back from end() where the iterators allow it, traverses everything otherwise
    template <class S>
    [[nodiscard]] static ci::optional<ci::element_t<S>> get_last(S& src)
    {
        ci::optional<ci::element_t<S>> result;
        if constexpr (has_bidirectional_iterators<S>)
        {
            auto const begin = ci::begin(src);
            auto end = ci::end(src);
            if (begin != end)
                result.emplace(*--end);
        }
        else
        {
            EngineT::try_fold(src, [&](auto& elem) { result.emplace(elem); });
        }
        return result;
    }

    /// the one and only element
    /// throws invalid_argument_error if the source is empty or has more than one element
    template <class S>
    [[nodiscard]] static ci::element_t<S> get_only(S& src)
    {
        ci::optional<ci::element_t<S>> result;
        isize seen = 0;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (++seen == 1)
                                  result.emplace(elem);
                              return seen > 1; // a second element is enough to fail
                          });

        if (seen == 0)
            impl::throw_invalid_argument("get_only needs exactly one element, but the source is empty");
        if (seen > 1)
            impl::throw_invalid_argument("get_only needs exactly one element, but the source has more");

        return ci::move(result).value();
    }

    //
    // folding
    //

    /// left fold in traversal order: acc = fn(acc, elem)
    template <class S, class V>
    [[nodiscard]] static V inject_into(S& src, V seed, auto&& fn)
    {
        EngineT::try_fold(src, [&](auto& elem) { seed = ci::invoke(fn, ci::move(seed), elem); });
        return seed;
    }

    template <class S>
    [[nodiscard]] static i64 sum_of_int(S& src, auto&& fn)
    {
        i64 sum = 0;
        EngineT::try_fold(src, [&](auto& elem) { sum += i64(ci::invoke(fn, elem)); });
        return sum;
    }

    template <class S>
    [[nodiscard]] static i64 sum_of_long(S& src, auto&& fn)
    {
        return EngineT::sum_of_int(src, fn);
    }

    template <class S>
    [[nodiscard]] static f64 sum_of_float(S& src, auto&& fn)
    {
        return EngineT::sum_of_double(src, fn);
    }

    template <class S>
    [[nodiscard]] static f64 sum_of_double(S& src, auto&& fn)
    {
        f64 sum = 0;
        EngineT::try_fold(src, [&](auto& elem) { sum += f64(ci::invoke(fn, elem)); });
        return sum;
    }

    //
    // grouping and maps
    //

    template <class S, class KeyF>
    [[nodiscard]] static auto group_by(S& src, KeyF&& key_fn)
    {
        using key_t = std::remove_cvref_t<ci::invoke_result<KeyF&, element_ref_t<S>>>;
        ci::list_multimap<key_t, ci::element_t<S>> result;
        EngineT::group_by(src, key_fn, result);
        return result;
    }

    template <class S, class KeyF, class MultimapT>
    static MultimapT& group_by(S& src, KeyF&& key_fn, MultimapT& target)
    {
        EngineT::try_fold(src, [&](auto& elem) { target.put(ci::invoke(key_fn, elem), elem); });
        return target;
    }

    /// keys_fn returns an enumerable of keys, the element is filed under each of them
    template <class S, class KeysF>
    [[nodiscard]] static auto group_by_each(S& src, KeysF&& keys_fn)
    {
        using keys_t = std::remove_cvref_t<ci::invoke_result<KeysF&, element_ref_t<S>>>;
        ci::list_multimap<ci::element_t<keys_t>, ci::element_t<S>> result;
        EngineT::group_by_each(src, keys_fn, result);
        return result;
    }

    template <class S, class KeysF, class MultimapT>
    static MultimapT& group_by_each(S& src, KeysF&& keys_fn, MultimapT& target)
    {
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              auto&& keys = ci::invoke(keys_fn, elem);
                              for (auto&& key : keys)
                                  target.put(key, elem);
                          });
        return target;
    }

    /// key_fn(elem) -> elem, duplicate keys: the last element wins
    template <class S, class KeyF>
    [[nodiscard]] static auto to_map(S& src, KeyF&& key_fn)
    {
        using key_t = std::remove_cvref_t<ci::invoke_result<KeyF&, element_ref_t<S>>>;
        std::unordered_map<key_t, ci::element_t<S>> result;
        EngineT::try_fold(src, [&](auto& elem) { impl::put_last_wins(result, ci::invoke(key_fn, elem), elem); });
        return result;
    }

    /// key_fn(elem) -> value_fn(elem), duplicate keys: the last value wins
    template <class S, class KeyF, class ValueF>
    [[nodiscard]] static auto to_map(S& src, KeyF&& key_fn, ValueF&& value_fn)
    {
        using key_t = std::remove_cvref_t<ci::invoke_result<KeyF&, element_ref_t<S>>>;
        using value_t = std::remove_cvref_t<ci::invoke_result<ValueF&, element_ref_t<S>>>;
        std::unordered_map<key_t, value_t> result;
        EngineT::add_to_map(src, key_fn, value_fn, result);
        return result;
    }

    template <class S, class MapT>
    static MapT& add_to_map(S& src, auto&& key_fn, auto&& value_fn, MapT& map)
    {
        EngineT::try_fold(src,
                          [&](auto& elem)
                          { impl::put_last_wins(map, ci::invoke(key_fn, elem), ci::invoke(value_fn, elem)); });
        return map;
    }

    /// per group: acc = merge_fn(acc, elem), starting from zero_fn()
    template <class S, class GroupF, class ZeroF>
    [[nodiscard]] static auto aggregate_by(S& src, GroupF&& group_fn, ZeroF&& zero_fn, auto&& merge_fn)
    {
        using key_t = std::remove_cvref_t<ci::invoke_result<GroupF&, element_ref_t<S>>>;
        using value_t = std::remove_cvref_t<ci::invoke_result<ZeroF&>>;
        std::unordered_map<key_t, value_t> result;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              auto& acc = impl::slot_for(result, ci::invoke(group_fn, elem), zero_fn);
                              acc = ci::invoke(merge_fn, ci::move(acc), elem);
                          });
        return result;
    }

    /// per group: mutate_fn(acc&, elem), starting from zero_fn()
    template <class S, class GroupF, class ZeroF>
    [[nodiscard]] static auto aggregate_in_place_by(S& src, GroupF&& group_fn, ZeroF&& zero_fn, auto&& mutate_fn)
    {
        using key_t = std::remove_cvref_t<ci::invoke_result<GroupF&, element_ref_t<S>>>;
        using value_t = std::remove_cvref_t<ci::invoke_result<ZeroF&>>;
        std::unordered_map<key_t, value_t> result;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              auto& acc = impl::slot_for(result, ci::invoke(group_fn, elem), zero_fn);
                              ci::invoke(mutate_fn, acc, elem);
                          });
        return result;
    }

    //
    // combination
    //

    /// pairs positionally, stops at the end of the shorter side
    template <class A, class B>
    [[nodiscard]] static auto zip(A& xs, B& ys)
    {
        ci::list_target_t<ci::pair<ci::element_t<A>, ci::element_t<B>>> target;
        EngineT::zip(xs, ys, target);
        return target;
    }

    template <class A, class B, class TargetT>
    static TargetT& zip(A& xs, B& ys, TargetT& target)
    {
        using pair_t = ci::pair<ci::element_t<A>, ci::element_t<B>>;

        auto it = ci::begin(ys);
        auto const end = ci::end(ys);
        EngineT::try_fold(xs,
                          [&](auto& x)
                          {
                              if (it == end)
                                  return true; // ys is exhausted
                              ci::append_to(target, pair_t{x, *it});
                              ++it;
                              return false;
                          });
        return target;
    }

    /// (elem, idx) pairs, idx counts from 0
    template <class S>
    [[nodiscard]] static auto zip_with_index(S& src)
    {
        ci::list_target_t<ci::pair<ci::element_t<S>, isize>> target;
        impl::reserve_like(target, src);
        EngineT::zip_with_index(src, target);
        return target;
    }

    template <class S, class TargetT>
    static TargetT& zip_with_index(S& src, TargetT& target)
    {
        using pair_t = ci::pair<ci::element_t<S>, isize>;
        EngineT::try_fold(src, [&](isize idx, auto& elem) { ci::append_to(target, pair_t{elem, idx}); });
        return target;
    }

    /// consecutive groups of size elements, the last one may be shorter
    template <class S>
    [[nodiscard]] static ci::vector<ci::vector<ci::element_t<S>>> chunk(S& src, isize size)
    {
        if (size <= 0)
            impl::throw_invalid_argument("chunk size must be greater than zero, but was " + ci::to_string(size));

        ci::vector<ci::vector<ci::element_t<S>>> result;
        ci::vector<ci::element_t<S>> current;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              current.push_back(elem);
                              if (current.size() == size)
                              {
                                  result.push_back(ci::move(current));
                                  current = ci::vector<ci::element_t<S>>();
                              }
                          });
        if (!current.empty())
            result.push_back(ci::move(current));
        return result;
    }

    //
    // ordering
    //

    template <class S>
    static S& sort_this(S& src)
    {
        EngineT::sort_with_less(src, impl::natural_less{});
        return src;
    }

    template <class S, class CompareF>
    static S& sort_this(S& src, CompareF&& compare)
    {
        EngineT::sort_with_less(src, impl::as_less(compare));
        return src;
    }

    template <class S, class KeyF>
    static S& sort_this_by(S& src, KeyF&& key_fn)
    {
        EngineT::sort_with_less(src, impl::by_key_less(key_fn));
        return src;
    }

    /// stable in-place sort by writing a sorted copy back through the iterators
    /// throws unsupported_operation_error if the elements cannot be assigned (e.g. std::set)
    template <class S, class LessF>
    static void sort_with_less(S& src, LessF&& less)
    {
        if constexpr (has_assignable_elements<S>)
        {
            auto sorted = EngineT::to_sorted_with_less(src, less);
            auto it = ci::begin(src);
            for (auto& v : sorted)
            {
                *it = ci::move(v);
                ++it;
            }
        }
        else
        {
            impl::throw_unsupported_operation("sort_this needs a source with assignable elements");
        }
    }

    template <class S>
    [[nodiscard]] static ci::vector<ci::element_t<S>> to_sorted_list(S& src)
    {
        return EngineT::to_sorted_with_less(src, impl::natural_less{});
    }

    template <class S, class CompareF>
    [[nodiscard]] static ci::vector<ci::element_t<S>> to_sorted_list(S& src, CompareF&& compare)
    {
        return EngineT::to_sorted_with_less(src, impl::as_less(compare));
    }

    template <class S, class LessF>
    [[nodiscard]] static ci::vector<ci::element_t<S>> to_sorted_with_less(S& src, LessF&& less)
    {
        auto result = EngineT::to_vector(src);
        std::stable_sort(result.begin(), result.end(), less);
        return result;
    }

    /// first element is the initial best, ties keep the first-seen element
    template <class S>
    [[nodiscard]] static ci::optional<ci::element_t<S>> min(S& src)
    {
        return EngineT::min_with_less(src, impl::natural_less{});
    }

    template <class S, class CompareF>
    [[nodiscard]] static ci::optional<ci::element_t<S>> min(S& src, CompareF&& compare)
    {
        return EngineT::min_with_less(src, impl::as_less(compare));
    }

    template <class S, class KeyF>
    [[nodiscard]] static ci::optional<ci::element_t<S>> min_by(S& src, KeyF&& key_fn)
    {
        return EngineT::min_with_less(src, impl::by_key_less(key_fn));
    }

    template <class S>
    [[nodiscard]] static ci::optional<ci::element_t<S>> max(S& src)
    {
        return EngineT::max_with_less(src, impl::natural_less{});
    }

    template <class S, class CompareF>
    [[nodiscard]] static ci::optional<ci::element_t<S>> max(S& src, CompareF&& compare)
    {
        return EngineT::max_with_less(src, impl::as_less(compare));
    }

    template <class S, class KeyF>
    [[nodiscard]] static ci::optional<ci::element_t<S>> max_by(S& src, KeyF&& key_fn)
    {
        return EngineT::max_with_less(src, impl::by_key_less(key_fn));
    }

    template <class S, class LessF>
    [[nodiscard]] static ci::optional<ci::element_t<S>> min_with_less(S& src, LessF&& less)
    {
        ci::optional<ci::element_t<S>> best;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (!best.has_value() || less(elem, best.value()))
                                  best.emplace(elem);
                          });
        return best;
    }

    template <class S, class LessF>
    [[nodiscard]] static ci::optional<ci::element_t<S>> max_with_less(S& src, LessF&& less)
    {
        ci::optional<ci::element_t<S>> best;
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              if (!best.has_value() || less(best.value(), elem))
                                  best.emplace(elem);
                          });
        return best;
    }

    //
    // mutation
    //

    /// removes the matching elements through erase(iterator)
    /// throws unsupported_operation_error if the source cannot erase
    /// returns the number of removed elements
    template <class S>
    static isize remove_if(S& src, auto&& pred)
    {
        if constexpr (requires { src.erase(ci::begin(src)); })
        {
            isize removed = 0;
            auto const doomed = EngineT::removal_flags(src, pred, removed);
            if (removed == 0)
                return 0;

            isize idx = 0;
            for (auto it = ci::begin(src); it != ci::end(src); ++idx)
            {
                if (doomed[idx])
                    it = src.erase(it);
                else
                    ++it;
            }
            return removed;
        }
        else
        {
            impl::throw_unsupported_operation("remove_if needs a source that can erase elements");
        }
    }

    /// pred(elem) for every element in traversal order, before anything is removed
    /// if pred throws, the source is still untouched
    template <class S>
    [[nodiscard]] static ci::vector<bool> removal_flags(S& src, auto&& pred, isize& count)
    {
        ci::vector<bool> flags;
        impl::reserve_like(flags, src);
        EngineT::try_fold(src,
                          [&](auto& elem)
                          {
                              auto const doomed = bool(ci::invoke(pred, elem));
                              flags.push_back(doomed);
                              count += doomed ? 1 : 0;
                          });
        return flags;
    }

    /// appends every element to target
    template <class S, class TargetT>
    static TargetT& add_all_to(S& src, TargetT& target)
    {
        impl::reserve_like(target, src);
        EngineT::try_fold(src, [&](auto& elem) { ci::append_to(target, elem); });
        return target;
    }

    template <class S>
    [[nodiscard]] static ci::vector<ci::element_t<S>> to_vector(S& src)
    {
        ci::vector<ci::element_t<S>> result;
        EngineT::add_all_to(src, result);
        return result;
    }

    //
    // strings
    //

    /// start, then the text of all elements with separator in between, then end
    /// element text: to_string(elem) (ci overloads or ADL), else elem.to_string()
    template <class S>
    static void append_string(S& src, std::string& out, std::string_view start, std::string_view separator, std::string_view end)
    {
        out += start;
        EngineT::try_fold(src,
                          [&](isize idx, auto& elem)
                          {
                              if (idx > 0)
                                  out += separator;
                              out += impl::element_to_string(elem);
                          });
        out += end;
    }

    template <class S>
    [[nodiscard]] static std::string make_string(S& src, std::string_view start, std::string_view separator, std::string_view end)
    {
        std::string result;
        EngineT::append_string(src, result, start, separator, end);
        return result;
    }

    template <class S>
    [[nodiscard]] static std::string make_string(S& src, std::string_view separator)
    {
        return EngineT::make_string(src, "", separator, "");
    }

    template <class S>
    [[nodiscard]] static std::string make_string(S& src)
    {
        return EngineT::make_string(src, ", ");
    }

protected:
    static void check_count(isize count, char const* operation)
    {
        if (count < 0)
            impl::throw_invalid_argument(std::string(operation) + " count must not be negative, but was "
                                         + ci::to_string(count));
    }
};
} // namespace ci::impl
