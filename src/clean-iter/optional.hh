#pragma once

#include <clean-iter/assert.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct ci::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace ci
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace ci

/// Sum type representing either a value of type T or no value, similar to std::optional.
/// Result type of every "may find nothing" operation: detect, get_first, get_last, min, max, ...
/// Safer subset of std::optional's API: no operator* or operator-> to avoid misuse.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
template <class T>
struct ci::optional
{
    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (ci::placement_new, &_storage.value) T(ci::forward<U>(value));
    }

    /// Constructs an empty optional from ci::nullopt.
    optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy - custom implementation when T requires special handling
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (ci::placement_new, &_storage.value) T(ci::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ci::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move assignment: move-assigns or move-constructs from rhs, destroys our value if rhs is empty.
    /// Leaves rhs engaged with a moved-from value (matches std::optional behavior).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = ci::move(rhs._storage.value);
            else
                new (ci::placement_new, &_storage.value) T(ci::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (ci::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // modifiers
public:
    /// Destroys the held value (if any) and constructs a new one in place.
    /// Works for T without assignment, e.g. std::pair<K const, V>.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        new (ci::placement_new, &_storage.value) T(ci::forward<Args>(args)...);
        _has_value = true;
        return _storage.value;
    }

    /// Destroys the held value (if any), has_value() becomes false.
    void reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns a reference to the held value.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        CI_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        CI_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        CI_ASSERT(_has_value, "attempted to access value of empty optional");
        return ci::move(_storage.value);
    }

    /// Returns the held value or the fallback if empty.
    [[nodiscard]] T value_or(T fallback) const&
    {
        return _has_value ? _storage.value : fallback;
    }

    // comparison
public:
    /// Two optionals are equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An optional is equal to a value if it holds an equal value.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    /// Comparing with true/false is deleted unless T is bool.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    ci::storage_for<T> _storage;
    bool _has_value = false;
};
