#pragma once

#include <clean-iter/impl/allocating_container.hh>

#include <initializer_list>


/// Dynamically allocated vector of T elements with value semantics.
/// Similar to std::vector with support for growth operations (push, pop, remove).
///
/// ci::vector is the default result container of the iteration API:
/// collect, flat_collect, zip, chunk, to_sorted_list, ... all return a ci::vector.
/// As a source it is array-backed, so every bulk operation runs as a plain pointer loop over data().
template <class T>
struct ci::vector : private ci::allocating_container<T, vector<T>>
{
    using base = ci::allocating_container<T, vector<T>>;
    using value_type = T;

    // element access
public:
    using base::operator[]; // access element by index
    using base::back;       // access last element
    using base::data;       // get pointer to underlying storage
    using base::front;      // access first element

    // iterators
public:
    using base::begin; // get pointer to first element
    using base::end;   // get pointer to one past last element

    // queries
public:
    using base::empty; // check if vector is empty
    using base::size;  // get number of elements

    // capacity queries
public:
    using base::capacity_back;         // get available capacity at back
    using base::has_capacity_back_for; // check if capacity exists for N elements at back

    /// Returns the total capacity (elements that can be stored without reallocation).
    [[nodiscard]] constexpr isize capacity() const { return size() + capacity_back(); }

    // factories
public:
    using base::create_copy_of;       // create deep copy from span
    using base::create_filled;        // create with copies of a value
    using base::create_with_capacity; // create with reserved capacity

    // modifiers
public:
    using base::clear;        // destroy all elements, size becomes 0
    using base::reserve_back; // make room for N more elements at back
    using base::truncate_to;  // destroy all elements from index N on

    using base::emplace_back;        // construct element at back (with allocation if needed)
    using base::emplace_back_stable; // construct element at back (requires capacity)
    using base::push_back;           // add element at back (with allocation if needed)
    using base::push_back_stable;    // add element at back (requires capacity)

    using base::pop_back;    // remove and return last element
    using base::remove_back; // remove last element (fast path, no return value)
    using base::remove_at;   // remove element at index (preserves order)

    // vector has deep-copy value semantics
    vector() = default;
    ~vector() = default;
    vector(vector&&) = default;
    vector& operator=(vector&&) = default;
    vector(vector const&) = default;
    vector& operator=(vector const&) = default;

    /// ci::vector<int> v = {1, 2, 3};
    vector(std::initializer_list<T> init)
    {
        reserve_back(static_cast<isize>(init.size()));
        for (auto const& v : init)
            push_back_stable(v);
    }

    // comparison
public:
    /// Element-wise equality.
    [[nodiscard]] friend bool operator==(vector const& lhs, vector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs[i] == rhs[i]))
                return false;
        return true;
    }

    friend base;
};
