#pragma once

#include <bounded-buffer/fwd.hh>
#include <bounded-buffer/impl/object_lifetime_util.hh>
#include <bounded-buffer/span.hh>
#include <bounded-buffer/utility.hh>

#include <limits>

// bb::allocation<T> is the owning "storage + liveness" handle underlying bb::bounded_buffer<T>.
//
// It models two things explicitly:
// 1) which bytes are owned (one block from the system allocator),
// 2) which objects inside those bytes are currently alive (the live window).
//
// The container on top of it decides *policy* (where obj_end moves, when elements are evicted).
// The sharp mechanics (byte ownership, alignment, release, destruction of the live window) live here.
//
// There is exactly one allocation source: the system allocator (posix_memalign / _aligned_malloc).
// Allocation failure is fatal and never reported as a recoverable error.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range (exclusive end), always within the allocation.
// - alloc_start <= obj_start <= obj_end <= alloc_end (also for empty ranges and empty allocations).
// - obj_start and obj_end are aligned to alignof(T), even when empty.
// - a zero-byte allocation is the all-nullptr state and owns nothing.

namespace bb::impl
{
/// Allocates `bytes` with at least `alignment` alignment from the system allocator.
/// bytes == 0 returns nullptr without calling the allocator.
/// Failure to allocate is fatal (BB_ASSERT_ALWAYS).
[[nodiscard]] bb::byte* system_allocate_bytes(isize bytes, isize alignment);

/// Same as system_allocate_bytes but returns nullptr instead of terminating if the allocation fails.
[[nodiscard]] bb::byte* system_try_allocate_bytes(isize bytes, isize alignment);

/// Releases a block previously returned by system_allocate_bytes or system_try_allocate_bytes.
/// `bytes` and `alignment` must match the values used during allocation. nullptr is a no-op.
void system_deallocate_bytes(bb::byte* p, isize bytes, isize alignment);
} // namespace bb::impl

/// Owning allocation handle for a contiguous byte block plus a typed "live window" inside it.
///
/// Separates "what memory do we own?" from "which objects are currently alive in it?".
/// The byte block never moves or resizes once created; containers built on it can hand out
/// pointers that stay valid for as long as the corresponding objects are alive.
///
/// Move-only: copying an allocation would require copying objects, which downstream containers
/// must decide explicitly.
template <class T>
struct bb::allocation
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "allocations need to refer to non-const objects, not "
                                                              "references/functions/void");

    /// Pointer to the first live object.
    /// INVARIANT: Must always be aligned to alignof(T), even if the range is empty.
    T* obj_start = nullptr;

    /// Pointer one past the last live object (exclusive end).
    /// The number of live elements is (obj_end - obj_start).
    T* obj_end = nullptr;

    /// Start of the owned byte allocation, passed back to the allocator on release.
    bb::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    bb::byte* alloc_end = nullptr;

    /// Alignment that was requested for [alloc_start, alloc_end).
    isize alignment = 0;

    // minimal helper api
public:
    /// True iff this owns a non-empty byte block.
    /// The live window might still be empty.
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live objects
    /// Note: proper mutability ("const correctness") is user responsibility
    [[nodiscard]] bb::span<T> obj_span() const { return bb::span<T>(obj_start, obj_end); }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Number of whole T slots in the block, counted from obj_start.
    [[nodiscard]] isize obj_capacity() const
    {
        // nullptr - nullptr == 0 is well-defined, so the empty state yields 0
        return (alloc_end - (bb::byte const*)obj_start) / isize(sizeof(T));
    }

    // factories
public:
    /// Creates an allocation of exactly `bytes` bytes with no live objects.
    /// obj_start == obj_end == alloc_start afterwards.
    /// bytes == 0 results in the empty (all nullptr) allocation with no allocator call.
    [[nodiscard]] static allocation create_empty_bytes(isize bytes, isize alignment)
    {
        BB_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        BB_ASSERT_ALWAYS(bytes >= 0, "allocation size must be non-negative");

        allocation result;
        result.alignment = alignment;
        result.alloc_start = impl::system_allocate_bytes(bytes, alignment);
        result.alloc_end = result.alloc_start + bytes;
        result.obj_start = (T*)result.alloc_start;
        result.obj_end = result.obj_start;
        return result;
    }

    /// Creates an allocation with room for exactly `size` objects but no live objects.
    /// Terminates if `size` is negative or `size * sizeof(T)` is not representable as a byte count.
    /// size == 0 results in the empty allocation with no allocator call.
    [[nodiscard]] static allocation create_empty(isize size, isize alignment = alignof(T))
    {
        BB_ASSERT_ALWAYS(size >= 0, "element count must be non-negative");
        BB_ASSERT_ALWAYS(size <= std::numeric_limits<isize>::max() / isize(sizeof(T)),
                         "element count exceeds the addressable size");
        return allocation::create_empty_bytes(size * isize(sizeof(T)), alignment);
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(bb::exchange(rhs.obj_start, nullptr)),
        obj_end(bb::exchange(rhs.obj_end, nullptr)),
        alloc_start(bb::exchange(rhs.alloc_start, nullptr)),
        alloc_end(bb::exchange(rhs.alloc_end, nullptr)),
        alignment(bb::exchange(rhs.alignment, 0))
    {
    }

    /// Move assignment that is safe even when rhs lives inside one of the objects owned by *this:
    /// rhs is moved into a temporary first, so destroying our objects cannot double-free it.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = bb::move(rhs);

            release();

            obj_start = bb::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = bb::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = bb::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = bb::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = bb::exchange(rhs_tmp.alignment, 0);
        }

        return *this;
    }

    ~allocation() { release(); }

private:
    // end life of live objects, then return the block
    void release()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        if (alloc_start != nullptr)
            impl::system_deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment);
    }
};
