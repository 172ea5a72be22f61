#pragma once

#include <clean-iter/errors.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/optional.hh>
#include <clean-iter/utility.hh>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <unordered_map>
#include <utility>

namespace ci::impl
{
/// iterates the keys (Keys = true) or the values (Keys = false) of a map
template <class MapIt, class ValueT, bool Keys>
struct map_view_iterator
{
    using iterator_category = std::forward_iterator_tag;
    using value_type = ValueT;
    using difference_type = std::ptrdiff_t;
    using pointer = ValueT const*;
    using reference = ValueT const&;

    map_view_iterator() = default;
    explicit map_view_iterator(MapIt it) : _it(it) {}

    reference operator*() const
    {
        if constexpr (Keys)
            return _it->first;
        else
            return _it->second;
    }
    pointer operator->() const { return &**this; }

    map_view_iterator& operator++()
    {
        ++_it;
        return *this;
    }
    map_view_iterator operator++(int)
    {
        auto r = *this;
        ++_it;
        return r;
    }

    bool operator==(map_view_iterator const& rhs) const { return _it == rhs._it; }

private:
    MapIt _it;
};

/// read-only projection of the keys or values of an immutable_map
/// element removal through the view is rejected
template <class MapT, class ValueT, bool Keys>
struct map_view
{
    using value_type = ValueT;
    using iterator = map_view_iterator<typename MapT::const_iterator, ValueT, Keys>;

    static constexpr bool is_immutable = true;

    explicit map_view(MapT const& map) : _map(&map) {}

    [[nodiscard]] iterator begin() const { return iterator(_map->begin()); }
    [[nodiscard]] iterator end() const { return iterator(_map->end()); }

    [[nodiscard]] isize size() const { return isize(_map->size()); }
    [[nodiscard]] bool empty() const { return _map->empty(); }

    [[nodiscard]] bool contains(ValueT const& value) const
    {
        if constexpr (Keys)
            return _map->contains(value);
        else
        {
            for (auto const& [k, v] : *_map)
                if (v == value)
                    return true;
            return false;
        }
    }

    // rejected mutation
public:
    [[noreturn]] void remove(ValueT const&) const { reject("remove"); }
    [[noreturn]] void erase(iterator) const { reject("erase"); }
    [[noreturn]] void clear() const { reject("clear"); }

private:
    [[noreturn]] static void reject(char const* operation)
    {
        impl::throw_unsupported_operation(std::string("cannot ") + operation + " through a view of an immutable_map");
    }

    MapT const* _map;
};
} // namespace ci::impl

/// Immutable hash map from K to V.
/// Iterates its entries as std::pair<K const, V> (sequential source).
///
/// Every structural mutation (put, insert_or_assign, remove, erase, clear) throws
/// ci::unsupported_operation_error, on the map as well as on its key_set() and values() views.
/// The map is left untouched.
///
/// Usage:
///   ci::immutable_map<std::string, int> ages = {{"ann", 31}, {"bob", 27}};
///   ci::count(ages.values(), [](int a) { return a > 30; }); // 1
template <class K, class V>
struct ci::immutable_map
{
    using storage_t = std::unordered_map<K, V>;
    using value_type = typename storage_t::value_type;
    using const_iterator = typename storage_t::const_iterator;
    using key_set_t = impl::map_view<storage_t, K, true>;
    using values_t = impl::map_view<storage_t, V, false>;

    static constexpr bool is_immutable = true;

    immutable_map() = default;

    immutable_map(std::initializer_list<value_type> init) : _entries(init) {}

    /// takes over an existing map
    explicit immutable_map(storage_t entries) : _entries(ci::move(entries)) {}

    // lookup
public:
    [[nodiscard]] bool contains_key(K const& key) const { return _entries.contains(key); }

    /// the value for key, empty if there is none
    [[nodiscard]] ci::optional<V> get(K const& key) const
    {
        auto const it = _entries.find(key);
        if (it == _entries.end())
            return {};
        return ci::optional<V>(it->second);
    }

    // iterators
public:
    [[nodiscard]] const_iterator begin() const { return _entries.begin(); }
    [[nodiscard]] const_iterator end() const { return _entries.end(); }

    // queries
public:
    [[nodiscard]] isize size() const { return isize(_entries.size()); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }

    // views
public:
    [[nodiscard]] key_set_t key_set() const { return key_set_t(_entries); }
    [[nodiscard]] values_t values() const { return values_t(_entries); }

    // conversion
public:
    [[nodiscard]] immutable_map const& to_immutable() const { return *this; }
    [[nodiscard]] storage_t to_mutable() const { return _entries; }

    // rejected mutation
public:
    template <class KeyT, class ValueT>
    [[noreturn]] void put(KeyT&&, ValueT&&) const
    {
        reject("put into");
    }
    template <class KeyT, class ValueT>
    [[noreturn]] void insert_or_assign(KeyT&&, ValueT&&) const
    {
        reject("insert into");
    }
    [[noreturn]] void remove(K const&) const { reject("remove from"); }
    [[noreturn]] void erase(const_iterator) const { reject("erase from"); }
    [[noreturn]] void clear() const { reject("clear"); }

    // comparison
public:
    [[nodiscard]] friend bool operator==(immutable_map const& lhs, immutable_map const& rhs)
    {
        return lhs._entries == rhs._entries;
    }

private:
    [[noreturn]] static void reject(char const* operation)
    {
        impl::throw_unsupported_operation(std::string("cannot ") + operation + " an immutable_map");
    }

    storage_t _entries;
};
