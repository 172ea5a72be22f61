#pragma once

#include <clean-iter/assert.hh>
#include <clean-iter/fwd.hh>

#include <initializer_list>
#include <type_traits>
#include <utility>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size.
/// Trivially copyable regardless of T's triviality.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
///
/// As an iteration source a span is random access (operator[] and size()).
/// A span<T const> is a read-only source, mutating operations (sort_this, remove_if) reject it.
/// A span<T> can be sorted in place but never shrinks, so remove_if rejects it as well.
template <class T>
struct ci::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        CI_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        CI_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows calling ci::primitive::sum({1, 2, 3}).
    /// WARNING: initializer_list temporaries are destroyed at the end of the full expression.
    /// Safe ONLY as an immediate function argument: foo({1, 2, 3}).
    /// NEVER assign to a variable: auto s = span<int const>{1, 2, 3}; // DANGLING!
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Creates a span from any container providing .data() and .size().
    /// The span does not own the container; the container must outlive the span.
    template <class Container>
        requires(!std::is_same_v<std::remove_cvref_t<Container>, span>) && requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// span<T> converts to span<T const>
    constexpr operator span<T const>() const
        requires(!std::is_const_v<T>)
    {
        return span<T const>(_data, _size);
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        CI_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        CI_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        CI_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    /// May be nullptr if the span is default-constructed or empty.
    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // subviews
public:
    /// The first n elements.
    /// Precondition: 0 <= n <= size().
    [[nodiscard]] constexpr span first(isize n) const
    {
        CI_ASSERT(0 <= n && n <= _size, "subspan out of bounds");
        return span(_data, n);
    }

    /// All elements starting at offset.
    /// Precondition: 0 <= offset <= size().
    [[nodiscard]] constexpr span subspan(isize offset) const
    {
        CI_ASSERT(0 <= offset && offset <= _size, "subspan out of bounds");
        return span(_data + offset, _size - offset);
    }

    /// count elements starting at offset.
    /// Precondition: the range lies within the span.
    [[nodiscard]] constexpr span subspan(isize offset, isize count) const
    {
        CI_ASSERT(0 <= offset && 0 <= count && offset + count <= _size, "subspan out of bounds");
        return span(_data + offset, count);
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
