#pragma once

#include <clean-iter/capability.hh>
#include <clean-iter/errors.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/impl/array_engine.hh>
#include <clean-iter/impl/random_access_engine.hh>
#include <clean-iter/impl/sequential_engine.hh>
#include <clean-iter/rich_iterable.hh>

#include <string>
#include <string_view>
#include <type_traits>

// =========================================================================================================
// Bulk iteration over arbitrary sources
// =========================================================================================================
//
// Every function takes the source first:
//
//   auto evens = ci::select(numbers, [](int i) { return i % 2 == 0; });
//   auto names = ci::collect(people, &person::name);
//   auto by_city = ci::group_by(people, &person::city);
//   ci::sort_this_by(people, &person::age);
//
// A source is anything iterable (see capability.hh), or a raw / unique / shared pointer to one.
// Each call looks at the static type of the source once and forwards to:
//
//   1. null pointer                -> ci::invalid_argument_error (is_empty / not_empty treat null as empty)
//   2. ci::rich_iterable           -> the member operation of the source
//   3. ci::vector                  -> impl::array_engine
//   4. operator[] and size()       -> impl::random_access_engine
//   5. begin() / end()             -> impl::sequential_engine
//
// The choice never changes a result, only how it is computed.
//
// Results:
//   - element-preserving operations (select, reject, partition, take, drop) return a container of the
//     same family as the source (see target.hh)
//   - transforming operations (collect, flat_collect, zip, chunk, ...) return a ci::vector
//   - all operations that produce elements have an overload taking a caller-supplied target,
//     which is filled and returned by reference
//
// Mutating operations (sort_this, sort_this_by, remove_if) work on the source itself.
// Const sources and immutable types reject them with ci::unsupported_operation_error.

namespace ci::impl
{
template <class S>
using engine_for = std::conditional_t<
    capability_of<S> == iteration_capability::array_backed,
    array_engine,
    std::conditional_t<capability_of<S> == iteration_capability::random_access,
                       random_access_engine,
                       std::conditional_t<capability_of<S> == iteration_capability::native_rich, rich_engine, sequential_engine>>>;

/// the source behind a source argument
/// pointers are dereferenced, null pointers throw
template <class Src>
decltype(auto) source_ref(Src& source, char const* operation)
{
    if constexpr (ci::is_source_pointer<Src>)
    {
        if (source == nullptr)
            impl::throw_null_source(operation);
        return *source;
    }
    else
        return (source);
}
} // namespace ci::impl

namespace ci
{
//
// iteration
//

template <source_argument Src>
void for_each(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "for_each");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        src.for_each(fn);
    else
        impl::engine_for<S>::for_each(src, fn);
}

/// fn(elem, idx)
template <source_argument Src>
void for_each_with_index(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "for_each_with_index");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        src.for_each_with_index(fn);
    else
        impl::engine_for<S>::for_each_with_index(src, fn);
}

//
// filtering
//

/// all elements where pred holds, in traversal order
template <source_argument Src>
[[nodiscard]] auto select(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "select");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.select(pred);
    else
        return impl::engine_for<S>::select(src, pred);
}

template <source_argument Src, class TargetT>
TargetT& select(Src&& source, auto&& pred, TargetT& target)
{
    auto& src = impl::source_ref(source, "select");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.select(pred, target);
    else
        return impl::engine_for<S>::select(src, pred, target);
}

/// all elements where pred does not hold, in traversal order
template <source_argument Src>
[[nodiscard]] auto reject(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "reject");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.reject(pred);
    else
        return impl::engine_for<S>::reject(src, pred);
}

template <source_argument Src, class TargetT>
TargetT& reject(Src&& source, auto&& pred, TargetT& target)
{
    auto& src = impl::source_ref(source, "reject");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.reject(pred, target);
    else
        return impl::engine_for<S>::reject(src, pred, target);
}

/// {selected, rejected} in one pass
template <source_argument Src>
[[nodiscard]] auto partition(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "partition");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.partition(pred);
    else
        return impl::engine_for<S>::partition(src, pred);
}

/// the first count elements (all if there are fewer)
/// throws ci::invalid_argument_error for a negative count
template <source_argument Src>
[[nodiscard]] auto take(Src&& source, isize count)
{
    auto& src = impl::source_ref(source, "take");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.take(count);
    else
        return impl::engine_for<S>::take(src, count);
}

/// all but the first count elements
/// throws ci::invalid_argument_error for a negative count
template <source_argument Src>
[[nodiscard]] auto drop(Src&& source, isize count)
{
    auto& src = impl::source_ref(source, "drop");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.drop(count);
    else
        return impl::engine_for<S>::drop(src, count);
}

//
// transformation
//

/// fn(elem) for every element
template <source_argument Src>
[[nodiscard]] auto collect(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "collect");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.collect(fn);
    else
        return impl::engine_for<S>::collect(src, fn);
}

template <source_argument Src, class TargetT>
TargetT& collect(Src&& source, auto&& fn, TargetT& target)
{
    auto& src = impl::source_ref(source, "collect");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.collect(fn, target);
    else
        return impl::engine_for<S>::collect(src, fn, target);
}

template <source_argument Src>
[[nodiscard]] auto collect_if(Src&& source, auto&& pred, auto&& fn)
{
    auto& src = impl::source_ref(source, "collect_if");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.collect_if(pred, fn);
    else
        return impl::engine_for<S>::collect_if(src, pred, fn);
}

template <source_argument Src, class TargetT>
TargetT& collect_if(Src&& source, auto&& pred, auto&& fn, TargetT& target)
{
    auto& src = impl::source_ref(source, "collect_if");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.collect_if(pred, fn, target);
    else
        return impl::engine_for<S>::collect_if(src, pred, fn, target);
}

template <source_argument Src>
[[nodiscard]] auto flat_collect(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "flat_collect");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.flat_collect(fn);
    else
        return impl::engine_for<S>::flat_collect(src, fn);
}

template <source_argument Src, class TargetT>
TargetT& flat_collect(Src&& source, auto&& fn, TargetT& target)
{
    auto& src = impl::source_ref(source, "flat_collect");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.flat_collect(fn, target);
    else
        return impl::engine_for<S>::flat_collect(src, fn, target);
}

template <source_argument Src>
[[nodiscard]] auto flatten(Src&& source)
{
    auto& src = impl::source_ref(source, "flatten");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.flatten();
    else
        return impl::engine_for<S>::flatten(src);
}

template <source_argument Src, class TargetT>
TargetT& flatten(Src&& source, TargetT& target)
{
    auto& src = impl::source_ref(source, "flatten");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.flatten(target);
    else
        return impl::engine_for<S>::flatten(src, target);
}

//
// predicates and counting
//

template <source_argument Src>
[[nodiscard]] isize count(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "count");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.count(pred);
    else
        return impl::engine_for<S>::count(src, pred);
}

/// stops at the first element where pred holds
template <source_argument Src>
[[nodiscard]] bool any_satisfy(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "any_satisfy");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.any_satisfy(pred);
    else
        return impl::engine_for<S>::any_satisfy(src, pred);
}

/// true for an empty source
template <source_argument Src>
[[nodiscard]] bool all_satisfy(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "all_satisfy");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.all_satisfy(pred);
    else
        return impl::engine_for<S>::all_satisfy(src, pred);
}

/// true for an empty source
template <source_argument Src>
[[nodiscard]] bool none_satisfy(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "none_satisfy");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.none_satisfy(pred);
    else
        return impl::engine_for<S>::none_satisfy(src, pred);
}

template <source_argument Src, class V>
[[nodiscard]] bool contains(Src&& source, V const& value)
{
    auto& src = impl::source_ref(source, "contains");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.contains(value);
    else
        return impl::engine_for<S>::contains(src, value);
}

template <source_argument Src>
[[nodiscard]] isize size_of(Src&& source)
{
    auto& src = impl::source_ref(source, "size_of");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.size_of();
    else
        return impl::engine_for<S>::size_of(src);
}

/// null sources are empty
template <source_argument Src>
[[nodiscard]] bool is_empty(Src&& source)
{
    if constexpr (is_source_pointer<std::remove_cvref_t<Src>>)
    {
        if (source == nullptr)
            return true;
    }

    auto& src = impl::source_ref(source, "is_empty");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.is_empty();
    else
        return impl::engine_for<S>::is_empty(src);
}

[[nodiscard]] constexpr bool is_empty(nullptr_t) { return true; }

/// null sources are empty
template <source_argument Src>
[[nodiscard]] bool not_empty(Src&& source)
{
    return !ci::is_empty(source);
}

[[nodiscard]] constexpr bool not_empty(nullptr_t) { return false; }

//
// finding
//

/// the first element (in traversal order) where pred holds
template <source_argument Src>
[[nodiscard]] auto detect(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "detect");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.detect(pred);
    else
        return impl::engine_for<S>::detect(src, pred);
}

template <source_argument Src, class T>
[[nodiscard]] auto detect_if_none(Src&& source, auto&& pred, T&& fallback)
{
    auto& src = impl::source_ref(source, "detect_if_none");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.detect_if_none(pred, ci::forward<T>(fallback));
    else
        return impl::engine_for<S>::detect_if_none(src, pred, ci::forward<T>(fallback));
}

/// -1 if no element matches
template <source_argument Src>
[[nodiscard]] isize detect_index(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "detect_index");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.detect_index(pred);
    else
        return impl::engine_for<S>::detect_index(src, pred);
}

template <source_argument Src>
[[nodiscard]] auto get_first(Src&& source)
{
    auto& src = impl::source_ref(source, "get_first");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.get_first();
    else
        return impl::engine_for<S>::get_first(src);
}

template <source_argument Src>
[[nodiscard]] auto get_last(Src&& source)
{
    auto& src = impl::source_ref(source, "get_last");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.get_last();
    else
        return impl::engine_for<S>::get_last(src);
}

/// throws ci::invalid_argument_error unless the source has exactly one element
template <source_argument Src>
[[nodiscard]] auto get_only(Src&& source)
{
    auto& src = impl::source_ref(source, "get_only");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.get_only();
    else
        return impl::engine_for<S>::get_only(src);
}

//
// folding
//

/// fn(fn(fn(seed, e0), e1), e2) ...
template <source_argument Src, class V>
[[nodiscard]] V inject_into(Src&& source, V seed, auto&& fn)
{
    auto& src = impl::source_ref(source, "inject_into");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.inject_into(ci::move(seed), fn);
    else
        return impl::engine_for<S>::inject_into(src, ci::move(seed), fn);
}

template <source_argument Src>
[[nodiscard]] i64 sum_of_int(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "sum_of_int");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.sum_of_int(fn);
    else
        return impl::engine_for<S>::sum_of_int(src, fn);
}

template <source_argument Src>
[[nodiscard]] i64 sum_of_long(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "sum_of_long");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.sum_of_long(fn);
    else
        return impl::engine_for<S>::sum_of_long(src, fn);
}

template <source_argument Src>
[[nodiscard]] f64 sum_of_float(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "sum_of_float");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.sum_of_float(fn);
    else
        return impl::engine_for<S>::sum_of_float(src, fn);
}

template <source_argument Src>
[[nodiscard]] f64 sum_of_double(Src&& source, auto&& fn)
{
    auto& src = impl::source_ref(source, "sum_of_double");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.sum_of_double(fn);
    else
        return impl::engine_for<S>::sum_of_double(src, fn);
}

//
// grouping and maps
//

/// key_fn(elem) -> all elements with that key, in traversal order
template <source_argument Src>
[[nodiscard]] auto group_by(Src&& source, auto&& key_fn)
{
    auto& src = impl::source_ref(source, "group_by");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.group_by(key_fn);
    else
        return impl::engine_for<S>::group_by(src, key_fn);
}

template <source_argument Src, class MultimapT>
MultimapT& group_by(Src&& source, auto&& key_fn, MultimapT& target)
{
    auto& src = impl::source_ref(source, "group_by");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.group_by(key_fn, target);
    else
        return impl::engine_for<S>::group_by(src, key_fn, target);
}

template <source_argument Src>
[[nodiscard]] auto group_by_each(Src&& source, auto&& keys_fn)
{
    auto& src = impl::source_ref(source, "group_by_each");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.group_by_each(keys_fn);
    else
        return impl::engine_for<S>::group_by_each(src, keys_fn);
}

template <source_argument Src, class MultimapT>
MultimapT& group_by_each(Src&& source, auto&& keys_fn, MultimapT& target)
{
    auto& src = impl::source_ref(source, "group_by_each");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.group_by_each(keys_fn, target);
    else
        return impl::engine_for<S>::group_by_each(src, keys_fn, target);
}

/// key_fn(elem) -> elem, the last element with a given key wins
template <source_argument Src>
[[nodiscard]] auto to_map(Src&& source, auto&& key_fn)
{
    auto& src = impl::source_ref(source, "to_map");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.to_map(key_fn);
    else
        return impl::engine_for<S>::to_map(src, key_fn);
}

/// key_fn(elem) -> value_fn(elem), the last value for a given key wins
template <source_argument Src>
[[nodiscard]] auto to_map(Src&& source, auto&& key_fn, auto&& value_fn)
{
    auto& src = impl::source_ref(source, "to_map");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.to_map(key_fn, value_fn);
    else
        return impl::engine_for<S>::to_map(src, key_fn, value_fn);
}

template <source_argument Src, class MapT>
MapT& add_to_map(Src&& source, auto&& key_fn, auto&& value_fn, MapT& map)
{
    auto& src = impl::source_ref(source, "add_to_map");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.add_to_map(key_fn, value_fn, map);
    else
        return impl::engine_for<S>::add_to_map(src, key_fn, value_fn, map);
}

/// per group_fn(elem): acc = merge_fn(acc, elem) starting from zero_fn()
template <source_argument Src>
[[nodiscard]] auto aggregate_by(Src&& source, auto&& group_fn, auto&& zero_fn, auto&& merge_fn)
{
    auto& src = impl::source_ref(source, "aggregate_by");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.aggregate_by(group_fn, zero_fn, merge_fn);
    else
        return impl::engine_for<S>::aggregate_by(src, group_fn, zero_fn, merge_fn);
}

/// per group_fn(elem): mutate_fn(acc, elem) starting from zero_fn()
template <source_argument Src>
[[nodiscard]] auto aggregate_in_place_by(Src&& source, auto&& group_fn, auto&& zero_fn, auto&& mutate_fn)
{
    auto& src = impl::source_ref(source, "aggregate_in_place_by");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.aggregate_in_place_by(group_fn, zero_fn, mutate_fn);
    else
        return impl::engine_for<S>::aggregate_in_place_by(src, group_fn, zero_fn, mutate_fn);
}

//
// combination
//

/// (xs[i], ys[i]) pairs up to the end of the shorter source
template <source_argument SrcA, source_argument SrcB>
[[nodiscard]] auto zip(SrcA&& xs_source, SrcB&& ys_source)
{
    auto& xs = impl::source_ref(xs_source, "zip");
    auto& ys = impl::source_ref(ys_source, "zip");
    using A = std::remove_reference_t<decltype(xs)>;
    if constexpr (is_rich_source<A>)
        return xs.zip(ys);
    else
        return impl::engine_for<A>::zip(xs, ys);
}

template <source_argument SrcA, source_argument SrcB, class TargetT>
TargetT& zip(SrcA&& xs_source, SrcB&& ys_source, TargetT& target)
{
    auto& xs = impl::source_ref(xs_source, "zip");
    auto& ys = impl::source_ref(ys_source, "zip");
    using A = std::remove_reference_t<decltype(xs)>;
    if constexpr (is_rich_source<A>)
        return xs.zip(ys, target);
    else
        return impl::engine_for<A>::zip(xs, ys, target);
}

template <source_argument Src>
[[nodiscard]] auto zip_with_index(Src&& source)
{
    auto& src = impl::source_ref(source, "zip_with_index");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.zip_with_index();
    else
        return impl::engine_for<S>::zip_with_index(src);
}

template <source_argument Src, class TargetT>
TargetT& zip_with_index(Src&& source, TargetT& target)
{
    auto& src = impl::source_ref(source, "zip_with_index");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.zip_with_index(target);
    else
        return impl::engine_for<S>::zip_with_index(src, target);
}

/// throws ci::invalid_argument_error if size <= 0
template <source_argument Src>
[[nodiscard]] auto chunk(Src&& source, isize size)
{
    auto& src = impl::source_ref(source, "chunk");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.chunk(size);
    else
        return impl::engine_for<S>::chunk(src, size);
}

//
// ordering
//

/// stable in-place sort by operator<
template <source_argument Src>
decltype(auto) sort_this(Src&& source)
{
    auto& src = impl::source_ref(source, "sort_this");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (!is_mutable_source<S>)
    {
        impl::throw_immutable_source("sort_this");
        return (src);
    }
    else if constexpr (is_rich_source<S>)
        return src.sort_this();
    else
        return impl::engine_for<S>::sort_this(src);
}

/// stable in-place sort
/// compare is a less-than predicate (bool) or a three-way comparator (< 0 means less)
template <source_argument Src>
decltype(auto) sort_this(Src&& source, auto&& compare)
{
    auto& src = impl::source_ref(source, "sort_this");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (!is_mutable_source<S>)
    {
        impl::throw_immutable_source("sort_this");
        return (src);
    }
    else if constexpr (is_rich_source<S>)
        return src.sort_this(compare);
    else
        return impl::engine_for<S>::sort_this(src, compare);
}

/// stable in-place sort by key_fn(elem)
template <source_argument Src>
decltype(auto) sort_this_by(Src&& source, auto&& key_fn)
{
    auto& src = impl::source_ref(source, "sort_this_by");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (!is_mutable_source<S>)
    {
        impl::throw_immutable_source("sort_this_by");
        return (src);
    }
    else if constexpr (is_rich_source<S>)
        return src.sort_this_by(key_fn);
    else
        return impl::engine_for<S>::sort_this_by(src, key_fn);
}

template <source_argument Src>
[[nodiscard]] auto to_sorted_list(Src&& source)
{
    auto& src = impl::source_ref(source, "to_sorted_list");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.to_sorted_list();
    else
        return impl::engine_for<S>::to_sorted_list(src);
}

template <source_argument Src>
[[nodiscard]] auto to_sorted_list(Src&& source, auto&& compare)
{
    auto& src = impl::source_ref(source, "to_sorted_list");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.to_sorted_list(compare);
    else
        return impl::engine_for<S>::to_sorted_list(src, compare);
}

/// smallest element, the first one on ties
template <source_argument Src>
[[nodiscard]] auto min(Src&& source)
{
    auto& src = impl::source_ref(source, "min");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.min();
    else
        return impl::engine_for<S>::min(src);
}

template <source_argument Src>
[[nodiscard]] auto min(Src&& source, auto&& compare)
{
    auto& src = impl::source_ref(source, "min");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.min(compare);
    else
        return impl::engine_for<S>::min(src, compare);
}

template <source_argument Src>
[[nodiscard]] auto min_by(Src&& source, auto&& key_fn)
{
    auto& src = impl::source_ref(source, "min_by");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.min_by(key_fn);
    else
        return impl::engine_for<S>::min_by(src, key_fn);
}

/// largest element, the first one on ties
template <source_argument Src>
[[nodiscard]] auto max(Src&& source)
{
    auto& src = impl::source_ref(source, "max");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.max();
    else
        return impl::engine_for<S>::max(src);
}

template <source_argument Src>
[[nodiscard]] auto max(Src&& source, auto&& compare)
{
    auto& src = impl::source_ref(source, "max");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.max(compare);
    else
        return impl::engine_for<S>::max(src, compare);
}

template <source_argument Src>
[[nodiscard]] auto max_by(Src&& source, auto&& key_fn)
{
    auto& src = impl::source_ref(source, "max_by");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.max_by(key_fn);
    else
        return impl::engine_for<S>::max_by(src, key_fn);
}

//
// mutation and conversion
//

/// removes all elements where pred holds, returns how many
template <source_argument Src>
isize remove_if(Src&& source, auto&& pred)
{
    auto& src = impl::source_ref(source, "remove_if");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (!is_mutable_source<S>)
        impl::throw_immutable_source("remove_if");
    else if constexpr (is_rich_source<S>)
        return src.remove_if(pred);
    else
        return impl::engine_for<S>::remove_if(src, pred);
}

template <source_argument Src, class TargetT>
TargetT& add_all_to(Src&& source, TargetT& target)
{
    auto& src = impl::source_ref(source, "add_all_to");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.add_all_to(target);
    else
        return impl::engine_for<S>::add_all_to(src, target);
}

template <source_argument Src>
[[nodiscard]] auto to_vector(Src&& source)
{
    auto& src = impl::source_ref(source, "to_vector");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.to_vector();
    else
        return impl::engine_for<S>::to_vector(src);
}

//
// strings
//

/// "e0, e1, e2"
template <source_argument Src>
[[nodiscard]] std::string make_string(Src&& source)
{
    auto& src = impl::source_ref(source, "make_string");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.make_string();
    else
        return impl::engine_for<S>::make_string(src);
}

template <source_argument Src>
[[nodiscard]] std::string make_string(Src&& source, std::string_view separator)
{
    auto& src = impl::source_ref(source, "make_string");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.make_string(separator);
    else
        return impl::engine_for<S>::make_string(src, separator);
}

/// e.g. make_string(v, "[", ", ", "]")
template <source_argument Src>
[[nodiscard]] std::string make_string(Src&& source, std::string_view start, std::string_view separator, std::string_view end)
{
    auto& src = impl::source_ref(source, "make_string");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        return src.make_string(start, separator, end);
    else
        return impl::engine_for<S>::make_string(src, start, separator, end);
}

template <source_argument Src>
void append_string(Src&& source, std::string& out, std::string_view start, std::string_view separator, std::string_view end)
{
    auto& src = impl::source_ref(source, "append_string");
    using S = std::remove_reference_t<decltype(src)>;
    if constexpr (is_rich_source<S>)
        src.append_string(out, start, separator, end);
    else
        impl::engine_for<S>::append_string(src, out, start, separator, end);
}
} // namespace ci
