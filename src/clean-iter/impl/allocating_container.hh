#pragma once

#include <clean-iter/assert.hh>
#include <clean-iter/fwd.hh>
#include <clean-iter/impl/object_lifetime_util.hh>
#include <clean-iter/span.hh>
#include <clean-iter/utility.hh>

#include <new>


namespace ci::impl
{
/// Owning, uninitialized heap buffer of T with a live object subrange [obj_start, obj_end).
/// [alloc_start, obj_start) and [obj_end, alloc_end) are slots without live objects.
/// The destructor destroys the live range and frees the buffer.
template <class T>
struct object_buffer
{
    T* alloc_start = nullptr;
    T* obj_start = nullptr;
    T* obj_end = nullptr;
    T* alloc_end = nullptr;

    /// Allocates room for capacity objects, none of them alive yet.
    [[nodiscard]] static object_buffer create_empty(isize capacity)
    {
        CI_ASSERT(capacity >= 0, "capacity must be non-negative");
        object_buffer b;
        if (capacity > 0)
        {
            b.alloc_start = static_cast<T*>(::operator new(capacity * sizeof(T), std::align_val_t(alignof(T))));
            b.obj_start = b.alloc_start;
            b.obj_end = b.alloc_start;
            b.alloc_end = b.alloc_start + capacity;
        }
        return b;
    }

    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }
    [[nodiscard]] isize capacity() const { return alloc_end - alloc_start; }

    object_buffer() = default;
    ~object_buffer() { release(); }

    object_buffer(object_buffer&& rhs) noexcept
      : alloc_start(ci::exchange(rhs.alloc_start, nullptr)),
        obj_start(ci::exchange(rhs.obj_start, nullptr)),
        obj_end(ci::exchange(rhs.obj_end, nullptr)),
        alloc_end(ci::exchange(rhs.alloc_end, nullptr))
    {
    }
    object_buffer& operator=(object_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            alloc_start = ci::exchange(rhs.alloc_start, nullptr);
            obj_start = ci::exchange(rhs.obj_start, nullptr);
            obj_end = ci::exchange(rhs.obj_end, nullptr);
            alloc_end = ci::exchange(rhs.alloc_end, nullptr);
        }
        return *this;
    }
    object_buffer(object_buffer const&) = delete;
    object_buffer& operator=(object_buffer const&) = delete;

private:
    void release()
    {
        if (alloc_start == nullptr)
            return;
        impl::destroy_objects_in_reverse(obj_start, obj_end);
        ::operator delete(alloc_start, std::align_val_t(alignof(T)));
        alloc_start = obj_start = obj_end = alloc_end = nullptr;
    }
};
} // namespace ci::impl

/// Mixin implementing the common "contiguous heap container" surface area.
///
/// This is a CRTP-style helper: concrete containers privately inherit it as
/// `ci::allocating_container<T, Derived>`, then selectively re-expose members via `using`.
/// Example (abridged):
///
///     template<class T>
///     struct ci::vector : private ci::allocating_container<T, vector<T>> {
///         using base = ci::allocating_container<T, vector<T>>;
///         using base::operator[];
///         using base::begin; using base::end;
///         using base::size;  using base::empty;
///         // ...
///     };
///
/// Member functions with the `_stable` suffix never reallocate the buffer.
/// They keep existing references, pointers, and iterators valid and assert that capacity is present.
///
/// === Exception & reference guarantees ===
///
/// Element construction failures leave size and live range unchanged.
/// Reallocation moves the existing elements (no copy fallback).
/// The new element is constructed before the old elements are moved, so `v.push_back(v[0])` is safe.
/// Any reallocation invalidates pointers, references, and iterators.
template <class T, class ContainerT>
struct ci::allocating_container
{
    using container_t = ContainerT;

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        auto const p_obj = _data.obj_start + i;
        CI_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        auto const p_obj = _data.obj_start + i;
        CI_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        CI_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        CI_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        CI_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        CI_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *(_data.obj_end - 1);
    }

    /// Returns a pointer to the underlying contiguous storage.
    /// May be nullptr if the container is default-constructed.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// How many elements can be appended without reallocation.
    [[nodiscard]] constexpr isize capacity_back() const { return _data.alloc_end - _data.obj_end; }

    [[nodiscard]] constexpr bool has_capacity_back_for(isize count) const { return capacity_back() >= count; }

    // resizing
public:
    /// Exponential growth, at least min_size.
    [[nodiscard]] static constexpr isize alloc_grow_size_for(isize curr_capacity, isize min_size)
    {
        return ci::max(ci::max(curr_capacity * 2, min_size), isize(4));
    }

    /// Makes sure that count more elements can be appended without reallocation.
    /// Used by the result builder when the final size is known (or bounded) up front.
    constexpr void reserve_back(isize count)
    {
        CI_ASSERT(count >= 0, "reserve count must be non-negative");
        if (!has_capacity_back_for(count))
            reallocate_to(size() + count);
    }

    /// Destroys all live objects, keeps the capacity.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    /// Destroys all elements at index new_size and beyond.
    /// Precondition: 0 <= new_size <= size().
    constexpr void truncate_to(isize new_size)
    {
        CI_ASSERT(0 <= new_size && new_size <= size(), "truncate_to can only shrink");
        auto const new_end = _data.obj_start + new_size;
        impl::destroy_objects_in_reverse(new_end, _data.obj_end);
        _data.obj_end = new_end;
    }

    // appends
public:
    /// Constructs a new element at the back using existing capacity.
    /// Requires `has_capacity_back_for(1)`.
    template <class... Args>
    constexpr T& emplace_back_stable(Args&&... args)
    {
        static_assert(
            requires { T(ci::forward<Args>(args)...); }, "emplace_back_stable: T is not constructible from "
                                                         "the provided argument types");
        CI_ASSERT(has_capacity_back_for(1), "not enough capacity for emplace_back_stable");
        auto const p = new (ci::placement_new, _data.obj_end) T(ci::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    constexpr T& push_back_stable(T const& value) { return emplace_back_stable(value); }
    constexpr T& push_back_stable(T&& value) { return emplace_back_stable(ci::move(value)); }

    /// Appends a new element to the back, allocating if necessary.
    /// Amortized O(1) complexity.
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(ci::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        if (has_capacity_back_for(1)) [[likely]]
            return emplace_back_stable(ci::forward<Args>(args)...);

        auto new_data = impl::object_buffer<T>::create_empty(alloc_grow_size_for(_data.capacity(), size() + 1));

        // construct the new element first, args might reference our elements
        // the live range of new_data starts behind the slots of the old elements
        new_data.obj_start = new_data.alloc_start + size();
        new_data.obj_end = new_data.obj_start;
        auto const p = new (ci::placement_new, new_data.obj_end) T(ci::forward<Args>(args)...);
        new_data.obj_end++;

        adopt_moved_elements(new_data);
        return *p;
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(ci::move(value)); }

    // removals
public:
    /// Removes and returns the last element by move.
    /// Precondition: !empty().
    [[nodiscard("use remove_back() if you don't need the return value")]] constexpr T pop_back()
    {
        CI_ASSERT(_data.obj_start < _data.obj_end, "cannot pop from empty container");
        auto value = ci::move(*(_data.obj_end - 1));
        (_data.obj_end - 1)->~T();
        _data.obj_end--;
        return value;
    }

    /// Removes the last element.
    /// Precondition: !empty().
    constexpr void remove_back()
    {
        CI_ASSERT(_data.obj_start < _data.obj_end, "cannot remove from empty container");
        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Removes the element at the given index, preserving the order of the others.
    /// Precondition: 0 <= idx < size().
    /// O(n) complexity due to element compaction.
    constexpr void remove_at(isize idx)
    {
        auto const p_obj = _data.obj_start + idx;
        CI_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");

        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);

        // the last element is now in moved-from state
        _data.obj_end--;
        _data.obj_end->~T();
    }

    // factories
public:
    /// Creates a deep copy of the provided span.
    [[nodiscard]] static container_t create_copy_of(ci::span<T const> source)
    {
        container_t c;
        c._data = impl::object_buffer<T>::create_empty(source.size());
        impl::copy_create_objects_to(c._data.obj_end, source.data(), source.data() + source.size());
        return c;
    }

    /// Creates a container with size copies of value.
    [[nodiscard]] static container_t create_filled(isize size, T const& value)
    {
        container_t c;
        c._data = impl::object_buffer<T>::create_empty(size);
        for (isize i = 0; i < size; ++i)
            c.emplace_back_stable(value);
        return c;
    }

    /// Creates an empty container that can take capacity elements without reallocation.
    [[nodiscard]] static container_t create_with_capacity(isize capacity)
    {
        container_t c;
        c._data = impl::object_buffer<T>::create_empty(capacity);
        return c;
    }

    allocating_container() = default;
    ~allocating_container() = default;

    allocating_container(allocating_container&&) = default;
    allocating_container& operator=(allocating_container&&) = default;

    // deep copy semantics
    allocating_container(allocating_container const& rhs)
    {
        _data = impl::object_buffer<T>::create_empty(rhs.size());
        impl::copy_create_objects_to(_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
    }
    allocating_container& operator=(allocating_container const& rhs)
    {
        if (this != &rhs)
        {
            auto new_data = impl::object_buffer<T>::create_empty(rhs.size());
            impl::copy_create_objects_to(new_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
            _data = ci::move(new_data);
        }
        return *this;
    }

private:
    CI_COLD_FUNC void reallocate_to(isize capacity)
    {
        auto new_data = impl::object_buffer<T>::create_empty(capacity);
        new_data.obj_start = new_data.alloc_start + size();
        new_data.obj_end = new_data.obj_start;
        adopt_moved_elements(new_data);
    }

    // moves our elements into the front slots of new_data and makes it our storage
    // precondition: new_data has exactly size() free slots before its live range
    // moving in reverse keeps [obj_start, obj_end) of new_data a valid live range if a move throws
    CI_COLD_FUNC void adopt_moved_elements(impl::object_buffer<T>& new_data)
    {
        CI_ASSERT(new_data.obj_start - new_data.alloc_start == size(), "slot count mismatch");
        impl::move_create_objects_to_reverse(new_data.obj_start, _data.obj_start, _data.obj_end);
        _data = ci::move(new_data);
    }

    impl::object_buffer<T> _data;
};
