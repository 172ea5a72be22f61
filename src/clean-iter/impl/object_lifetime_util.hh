#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/utility.hh>

#include <cstring>
#include <type_traits>

namespace ci::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs objects from [src_start, src_end) using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: Assumes the objects at [*dest_end, *dest_end + (src_end - src_start)) are NOT yet constructed.
/// If copy construction throws, dest_end points to the element that threw, so [obj_start, dest_end) stays
/// the constructed live range. Trivially copyable types are copied with memcpy.
///
/// Usage pattern:
///   auto obj_start = (T*)uninitialized_memory;
///   auto obj_end = obj_start;
///   copy_create_objects_to(obj_end, src, src + count);
///   // [obj_start, obj_end) is now the constructed live range
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (ci::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) in reverse order, ending right before dest_start.
/// dest_start is decremented for each successfully constructed object, so [dest_start, old end) stays
/// the constructed live range even if a move constructor throws.
template <class T>
constexpr void move_create_objects_to_reverse(T*& dest_start, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    while (src_end != src_start)
    {
        --src_end;
        new (ci::placement_new, dest_start - 1) T(ci::move(*src_end));
        --dest_start;
    }
}

/// Move-assigns [src_start, src_end) onto the live objects starting at dest (dest <= src_start).
/// Used to close a gap in a live range: after the call, the last (src_end - src_start) objects
/// of the original range are in a moved-from state and can be destroyed by the caller.
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    while (src_start != src_end)
    {
        *dest = ci::move(*src_start);
        ++dest;
        ++src_start;
    }
}
} // namespace ci::impl
