#pragma once

#include <clean-iter/capability.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/impl/engine_ops.hh>

#include <string>
#include <string_view>

/// Engine of types that implement try_fold themselves
/// The fold is the type's own traversal, everything else comes from engine_ops
struct ci::impl::rich_engine : ci::impl::engine_ops<rich_engine>
{
    template <class S, class StepF>
    static fold_result try_fold(S& src, StepF&& step)
    {
        return src.try_fold(step);
    }
};

/// CRTP base of sources that carry the whole operation set as members
///
/// Derived types provide
///
///   template <class StepF>
///   ci::fold_result try_fold(StepF&& step) const;
///
/// which calls step(elem) or step(idx, elem) for each element in order,
/// stops (and returns fold_result::stopped) as soon as a bool-returning step returns true,
/// and returns fold_result::empty / fold_result::completed otherwise.
/// ci::impl::invoke_step does the step invocation.
///
/// Derived types can shadow any operation with a cheaper one (e.g. interval::contains is O(1)).
/// ci::select(x, pred) and x.select(pred) are interchangeable for rich sources.
///
/// Usage:
///
///   struct bag : ci::rich_iterable<bag>
///   {
///       template <class StepF>
///       ci::fold_result try_fold(StepF&& step) const { return ci::impl::array_engine::try_fold(_items, step); }
///
///       int const* begin() const { ... }
///       int const* end() const { ... }
///
///   private:
///       ci::vector<int> _items;
///   };
template <class Derived>
struct ci::rich_iterable
{
    static constexpr ci::iteration_capability iteration_capability = ci::iteration_capability::native_rich;

    // iteration
public:
    void for_each(auto&& fn) const { engine::for_each(self(), fn); }
    void for_each_with_index(auto&& fn) const { engine::for_each_with_index(self(), fn); }

    // filtering
public:
    [[nodiscard]] auto select(auto&& pred) const { return engine::select(self(), pred); }
    template <class TargetT>
    TargetT& select(auto&& pred, TargetT& target) const
    {
        return engine::select(self(), pred, target);
    }

    [[nodiscard]] auto reject(auto&& pred) const { return engine::reject(self(), pred); }
    template <class TargetT>
    TargetT& reject(auto&& pred, TargetT& target) const
    {
        return engine::reject(self(), pred, target);
    }

    [[nodiscard]] auto partition(auto&& pred) const { return engine::partition(self(), pred); }
    [[nodiscard]] auto take(isize count) const { return engine::take(self(), count); }
    [[nodiscard]] auto drop(isize count) const { return engine::drop(self(), count); }

    // transformation
public:
    [[nodiscard]] auto collect(auto&& fn) const { return engine::collect(self(), fn); }
    template <class TargetT>
    TargetT& collect(auto&& fn, TargetT& target) const
    {
        return engine::collect(self(), fn, target);
    }

    [[nodiscard]] auto collect_if(auto&& pred, auto&& fn) const { return engine::collect_if(self(), pred, fn); }
    template <class TargetT>
    TargetT& collect_if(auto&& pred, auto&& fn, TargetT& target) const
    {
        return engine::collect_if(self(), pred, fn, target);
    }

    [[nodiscard]] auto flat_collect(auto&& fn) const { return engine::flat_collect(self(), fn); }
    template <class TargetT>
    TargetT& flat_collect(auto&& fn, TargetT& target) const
    {
        return engine::flat_collect(self(), fn, target);
    }

    [[nodiscard]] auto flatten() const { return engine::flatten(self()); }
    template <class TargetT>
    TargetT& flatten(TargetT& target) const
    {
        return engine::flatten(self(), target);
    }

    // predicates and counting
public:
    [[nodiscard]] isize count(auto&& pred) const { return engine::count(self(), pred); }
    [[nodiscard]] bool any_satisfy(auto&& pred) const { return engine::any_satisfy(self(), pred); }
    [[nodiscard]] bool all_satisfy(auto&& pred) const { return engine::all_satisfy(self(), pred); }
    [[nodiscard]] bool none_satisfy(auto&& pred) const { return engine::none_satisfy(self(), pred); }
    template <class V>
    [[nodiscard]] bool contains(V const& value) const
    {
        return engine::contains(self(), value);
    }

    [[nodiscard]] isize size_of() const { return engine::size_of(self()); }
    [[nodiscard]] bool is_empty() const { return engine::is_empty(self()); }
    [[nodiscard]] bool not_empty() const { return engine::not_empty(self()); }

    // finding
public:
    [[nodiscard]] auto detect(auto&& pred) const { return engine::detect(self(), pred); }
    template <class T>
    [[nodiscard]] auto detect_if_none(auto&& pred, T&& fallback) const
    {
        return engine::detect_if_none(self(), pred, ci::forward<T>(fallback));
    }
    [[nodiscard]] isize detect_index(auto&& pred) const { return engine::detect_index(self(), pred); }

    [[nodiscard]] auto get_first() const { return engine::get_first(self()); }
    [[nodiscard]] auto get_last() const { return engine::get_last(self()); }
    [[nodiscard]] auto get_only() const { return engine::get_only(self()); }

    // folding
public:
    template <class V>
    [[nodiscard]] V inject_into(V seed, auto&& fn) const
    {
        return engine::inject_into(self(), ci::move(seed), fn);
    }

    [[nodiscard]] i64 sum_of_int(auto&& fn) const { return engine::sum_of_int(self(), fn); }
    [[nodiscard]] i64 sum_of_long(auto&& fn) const { return engine::sum_of_long(self(), fn); }
    [[nodiscard]] f64 sum_of_float(auto&& fn) const { return engine::sum_of_float(self(), fn); }
    [[nodiscard]] f64 sum_of_double(auto&& fn) const { return engine::sum_of_double(self(), fn); }

    // grouping and maps
public:
    [[nodiscard]] auto group_by(auto&& key_fn) const { return engine::group_by(self(), key_fn); }
    template <class MultimapT>
    MultimapT& group_by(auto&& key_fn, MultimapT& target) const
    {
        return engine::group_by(self(), key_fn, target);
    }

    [[nodiscard]] auto group_by_each(auto&& keys_fn) const { return engine::group_by_each(self(), keys_fn); }
    template <class MultimapT>
    MultimapT& group_by_each(auto&& keys_fn, MultimapT& target) const
    {
        return engine::group_by_each(self(), keys_fn, target);
    }

    [[nodiscard]] auto to_map(auto&& key_fn) const { return engine::to_map(self(), key_fn); }
    [[nodiscard]] auto to_map(auto&& key_fn, auto&& value_fn) const { return engine::to_map(self(), key_fn, value_fn); }
    template <class MapT>
    MapT& add_to_map(auto&& key_fn, auto&& value_fn, MapT& map) const
    {
        return engine::add_to_map(self(), key_fn, value_fn, map);
    }

    [[nodiscard]] auto aggregate_by(auto&& group_fn, auto&& zero_fn, auto&& merge_fn) const
    {
        return engine::aggregate_by(self(), group_fn, zero_fn, merge_fn);
    }
    [[nodiscard]] auto aggregate_in_place_by(auto&& group_fn, auto&& zero_fn, auto&& mutate_fn) const
    {
        return engine::aggregate_in_place_by(self(), group_fn, zero_fn, mutate_fn);
    }

    // combination
public:
    template <class OtherT>
    [[nodiscard]] auto zip(OtherT& other) const
    {
        return engine::zip(self(), other);
    }
    template <class OtherT, class TargetT>
    TargetT& zip(OtherT& other, TargetT& target) const
    {
        return engine::zip(self(), other, target);
    }

    [[nodiscard]] auto zip_with_index() const { return engine::zip_with_index(self()); }
    template <class TargetT>
    TargetT& zip_with_index(TargetT& target) const
    {
        return engine::zip_with_index(self(), target);
    }

    [[nodiscard]] auto chunk(isize size) const { return engine::chunk(self(), size); }

    // ordering
public:
    Derived& sort_this() { return engine::sort_this(self()); }
    Derived& sort_this(auto&& compare) { return engine::sort_this(self(), compare); }
    Derived& sort_this_by(auto&& key_fn) { return engine::sort_this_by(self(), key_fn); }

    [[nodiscard]] auto to_sorted_list() const { return engine::to_sorted_list(self()); }
    [[nodiscard]] auto to_sorted_list(auto&& compare) const { return engine::to_sorted_list(self(), compare); }

    [[nodiscard]] auto min() const { return engine::min(self()); }
    [[nodiscard]] auto min(auto&& compare) const { return engine::min(self(), compare); }
    [[nodiscard]] auto min_by(auto&& key_fn) const { return engine::min_by(self(), key_fn); }
    [[nodiscard]] auto max() const { return engine::max(self()); }
    [[nodiscard]] auto max(auto&& compare) const { return engine::max(self(), compare); }
    [[nodiscard]] auto max_by(auto&& key_fn) const { return engine::max_by(self(), key_fn); }

    // mutation and conversion
public:
    isize remove_if(auto&& pred) { return engine::remove_if(self(), pred); }

    template <class TargetT>
    TargetT& add_all_to(TargetT& target) const
    {
        return engine::add_all_to(self(), target);
    }
    [[nodiscard]] auto to_vector() const { return engine::to_vector(self()); }

    // strings
public:
    [[nodiscard]] std::string make_string() const { return engine::make_string(self()); }
    [[nodiscard]] std::string make_string(std::string_view separator) const
    {
        return engine::make_string(self(), separator);
    }
    [[nodiscard]] std::string make_string(std::string_view start, std::string_view separator, std::string_view end) const
    {
        return engine::make_string(self(), start, separator, end);
    }
    void append_string(std::string& out, std::string_view start, std::string_view separator, std::string_view end) const
    {
        engine::append_string(self(), out, start, separator, end);
    }

private:
    using engine = ci::impl::rich_engine;

    Derived& self() { return static_cast<Derived&>(*this); }
    Derived const& self() const { return static_cast<Derived const&>(*this); }
};
