#pragma once

#include <clean-iter/assert.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/optional.hh>
#include <clean-iter/rich_iterable.hh>

#include <cstddef>
#include <iterator>

/// Immutable arithmetic progression from, from + step, ... up to and including to (if it is hit).
/// Elements are computed, nothing is stored.
///
/// size, contains, get, get_first and get_last are O(1).
/// Any from / to pair is valid as long as the number of elements fits into isize.
/// All other operations come from ci::rich_iterable.
///
///   ci::interval::from_to(1, 5)        // 1 2 3 4 5
///   ci::interval::from_to(5, 1)        // 5 4 3 2 1
///   ci::interval::from_to_by(0, 9, 3)  // 0 3 6 9
///   ci::interval::zero_to(3)           // 0 1 2 3
struct ci::interval : ci::rich_iterable<interval>
{
    using value_type = i64;

    static constexpr bool is_immutable = true;

    struct iterator
    {
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type = i64;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = i64;

        iterator() = default;
        iterator(i64 from, i64 step, isize idx) : _from(from), _step(step), _idx(idx) {}

        i64 operator*() const { return interval::nth(_from, _step, _idx); }

        iterator& operator++()
        {
            ++_idx;
            return *this;
        }
        iterator operator++(int)
        {
            auto r = *this;
            ++_idx;
            return r;
        }
        iterator& operator--()
        {
            --_idx;
            return *this;
        }
        iterator operator--(int)
        {
            auto r = *this;
            --_idx;
            return r;
        }

        bool operator==(iterator const& rhs) const { return _idx == rhs._idx; }

    private:
        i64 _from = 0;
        i64 _step = 1;
        isize _idx = 0;
    };

    // factories
public:
    /// step is +1 or -1 depending on direction
    /// throws ci::invalid_argument_error if the interval has more than max(isize) elements
    [[nodiscard]] static interval from_to(i64 from, i64 to) { return from_to_by(from, to, from <= to ? 1 : -1); }

    /// throws ci::invalid_argument_error if step is 0, points away from to,
    /// or the interval has more than max(isize) elements
    [[nodiscard]] static interval from_to_by(i64 from, i64 to, i64 step);

    /// 0, 1, ..., count
    [[nodiscard]] static interval zero_to(i64 count) { return from_to(0, count); }

    /// 1, 2, ..., count
    [[nodiscard]] static interval one_to(i64 count) { return from_to(1, count); }

    // properties
public:
    [[nodiscard]] i64 from() const { return _from; }
    [[nodiscard]] i64 to() const { return _to; }
    [[nodiscard]] i64 step() const { return _step; }

    // element access
public:
    [[nodiscard]] i64 get(isize i) const
    {
        CI_ASSERT(0 <= i && i < _size, "index out of bounds");
        return nth(_from, _step, i);
    }
    [[nodiscard]] i64 operator[](isize i) const { return get(i); }

    // iterators
public:
    [[nodiscard]] iterator begin() const { return {_from, _step, 0}; }
    [[nodiscard]] iterator end() const { return {_from, _step, size()}; }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] bool contains(i64 value) const;

    [[nodiscard]] ci::optional<i64> get_first() const { return ci::optional<i64>(_from); }
    [[nodiscard]] ci::optional<i64> get_last() const { return ci::optional<i64>(get(size() - 1)); }

    // iteration protocol
public:
    template <class StepF>
    ci::fold_result try_fold(StepF&& step) const
    {
        auto const n = size();
        if (n == 0)
            return ci::fold_result::empty;

        for (isize i = 0; i < n; ++i)
        {
            auto value = nth(_from, _step, i);
            if (ci::impl::invoke_step(step, i, value))
                return ci::fold_result::stopped;
        }
        return ci::fold_result::completed;
    }

    // conversion
public:
    [[nodiscard]] interval const& to_immutable() const { return *this; }

    // comparison
public:
    [[nodiscard]] friend bool operator==(interval const& lhs, interval const& rhs)
    {
        return lhs._from == rhs._from && lhs._to == rhs._to && lhs._step == rhs._step;
    }

private:
    interval(i64 from, i64 to, i64 step, isize size) : _from(from), _to(to), _step(step), _size(size) {}

    // from + idx * step in wrapping u64 arithmetic, exact for every element of the interval
    static i64 nth(i64 from, i64 step, isize idx) { return i64(u64(from) + u64(idx) * u64(step)); }

    i64 _from;
    i64 _to;
    i64 _step;
    isize _size;
};
