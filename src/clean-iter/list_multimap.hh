#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/vector.hh>

#include <unordered_map>

/// Hash map from a key to the list of values filed under it.
/// Result of group_by / group_by_each: values under one key keep the order in which they were seen.
///
/// Usage:
///   auto by_city = ci::group_by(people, &person::city);
///   for (auto const& p : by_city.get("Berlin"))
///       ...
///
/// Iterating a list_multimap yields (key, ci::vector<V>) entries in unspecified key order.
template <class K, class V>
struct ci::list_multimap
{
    using key_t = K;
    using value_t = V;
    using map_t = std::unordered_map<K, ci::vector<V>>;

    // modifiers
public:
    /// Appends value to the values of key.
    void put(K const& key, V value) { _map[key].push_back(ci::move(value)); }

    void clear() { _map.clear(); }

    // queries
public:
    /// The values filed under key in insertion order, empty if there are none.
    [[nodiscard]] ci::vector<V> const& get(K const& key) const
    {
        static ci::vector<V> const no_values;
        auto const it = _map.find(key);
        return it == _map.end() ? no_values : it->second;
    }

    [[nodiscard]] bool contains_key(K const& key) const { return _map.contains(key); }

    /// Number of distinct keys.
    [[nodiscard]] isize key_count() const { return isize(_map.size()); }

    /// Number of values over all keys.
    [[nodiscard]] isize size() const
    {
        isize count = 0;
        for (auto const& [key, values] : _map)
            count += values.size();
        return count;
    }

    [[nodiscard]] bool empty() const { return _map.empty(); }

    [[nodiscard]] map_t const& as_map() const { return _map; }

    // iterators
public:
    [[nodiscard]] auto begin() const { return _map.begin(); }
    [[nodiscard]] auto end() const { return _map.end(); }

    [[nodiscard]] friend bool operator==(list_multimap const& lhs, list_multimap const& rhs)
    {
        return lhs._map == rhs._map;
    }

private:
    map_t _map;
};
