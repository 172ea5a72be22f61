#pragma once

#include <clean-iter/assert.hh>
#include <clean-iter/errors.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/impl/array_engine.hh>
#include <clean-iter/rich_iterable.hh>
#include <clean-iter/span.hh>
#include <clean-iter/vector.hh>

#include <initializer_list>

/// Immutable array-backed list of T elements.
/// Carries the whole operation set as members (native rich protocol), driven by a pointer loop over its storage.
///
/// Every structural mutation throws ci::unsupported_operation_error:
///   - push_back (so it is also rejected as the target of select, collect, ...)
///   - sort_this, sort_this_by, remove_if
///
/// to_immutable() returns the list itself, not a copy.
template <class T>
struct ci::immutable_list : ci::rich_iterable<immutable_list<T>>
{
    using value_type = T;

    static constexpr bool is_immutable = true;

    immutable_list() = default;

    immutable_list(std::initializer_list<T> init) : _values(init) {}

    /// takes over an existing vector
    explicit immutable_list(ci::vector<T> values) : _values(ci::move(values)) {}

    [[nodiscard]] static immutable_list create_copy_of(ci::span<T const> values)
    {
        return immutable_list(ci::vector<T>::create_copy_of(values));
    }

    // element access
public:
    [[nodiscard]] T const& operator[](isize i) const
    {
        CI_ASSERT(0 <= i && i < _values.size(), "index out of bounds");
        return _values[i];
    }

    [[nodiscard]] T const* data() const { return _values.data(); }

    // iterators
public:
    [[nodiscard]] T const* begin() const { return _values.begin(); }
    [[nodiscard]] T const* end() const { return _values.end(); }

    // queries
public:
    [[nodiscard]] isize size() const { return _values.size(); }
    [[nodiscard]] bool empty() const { return _values.empty(); }

    // iteration protocol
public:
    template <class StepF>
    ci::fold_result try_fold(StepF&& step) const
    {
        return ci::impl::array_engine::try_fold(_values, step);
    }

    // conversion
public:
    [[nodiscard]] immutable_list const& to_immutable() const { return *this; }

    /// a mutable copy
    [[nodiscard]] ci::vector<T> to_mutable() const { return _values; }

    // rejected mutation
public:
    [[noreturn]] void push_back(T const&) const { impl::throw_unsupported_operation("cannot add to an immutable_list"); }

    template <class... Args>
    [[noreturn]] void sort_this(Args&&...)
    {
        impl::throw_unsupported_operation("cannot sort an immutable_list");
    }
    template <class KeyF>
    [[noreturn]] void sort_this_by(KeyF&&)
    {
        impl::throw_unsupported_operation("cannot sort an immutable_list");
    }
    template <class PredF>
    [[noreturn]] void remove_if(PredF&&)
    {
        impl::throw_unsupported_operation("cannot remove from an immutable_list");
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(immutable_list const& lhs, immutable_list const& rhs)
    {
        return lhs._values == rhs._values;
    }

private:
    ci::vector<T> _values;
};
