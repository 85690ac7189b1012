#pragma once

#include <bounded-buffer/fwd.hh>
#include <bounded-buffer/utility.hh>

#include <cstring>
#include <type_traits>

namespace bb::impl
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
/// IMPORTANT: Assumes the objects at [*dest_end, *dest_end + (src_end - src_start)) are NOT yet constructed
/// (uninitialized memory). If copy construction throws, dest_end points to the element that threw, so
/// [obj_start, dest_end) is still exactly the constructed range.
/// Trivially copyable types are optimized to use memcpy at compile time.
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
            new (bb::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Opens a gap at `pos` by moving every object of [pos, end) one slot to the right.
/// IMPORTANT: Assumes [pos, end) is alive, pos < end, and the slot at `end` is owned but NOT constructed.
/// Afterwards `end` is incremented, [pos + 1, end) holds the former values in order and *pos is
/// alive in a moved-from state, ready to be assigned.
///
/// The new last object is move-constructed, all others are move-assigned (back to front).
/// If the move construction throws, nothing changed. If a move assignment throws, the range stays
/// structurally valid (all objects alive) but some values may be moved-from.
/// Trivially copyable types are shifted with a single memmove.
template <class T>
constexpr void shift_objects_right_by_one(T* pos, T*& end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        std::memmove(pos + 1, pos, (end - pos) * sizeof(T));
        ++end;
    }
    else
    {
        static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

        new (bb::placement_new, end) T(bb::move(*(end - 1)));
        ++end; // _after_ so a throwing move ctor leaves the range unchanged

        for (auto p = end - 2; p != pos; --p)
            *p = bb::move(*(p - 1));
    }
}

/// Closes a gap by moving [src_start, src_end) down to dest (dest < src_start), front to back.
/// IMPORTANT: Assumes all objects in [dest, src_end) are alive.
/// Afterwards [dest, dest + (src_end - src_start)) holds the moved values; the trailing
/// (src_start - dest) objects are alive in a moved-from state and must be destroyed by the caller.
/// Trivially copyable types are compacted with a single memmove.
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
            std::memmove(dest, src_start, size * sizeof(T));
    }
    else
    {
        static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

        while (src_start != src_end)
        {
            *dest = bb::move(*src_start);
            ++dest;
            ++src_start;
        }
    }
}
} // namespace bb::impl
