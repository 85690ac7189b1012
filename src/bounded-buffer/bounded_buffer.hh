#pragma once

#include <bounded-buffer/allocation.hh>
#include <bounded-buffer/optional.hh>
#include <bounded-buffer/span.hh>


/// Heap-allocated, contiguous buffer of up to capacity() elements of type T.
///
/// The capacity is fixed by create_with_capacity() and never changes: the buffer allocates exactly
/// once (nothing at all for capacity 0), never reallocates, and releases its block exactly once on
/// destruction. The element addresses are therefore stable for the lifetime of the buffer.
/// This is the primitive for bounded queues, pools and sliding windows that need a hard upper bound
/// on memory use.
///
/// Storage and liveness are modeled by bb::allocation<T>: [data(), data() + size()) holds constructed
/// objects, the remaining slots up to capacity() are uninitialized. No view, iterator or pointer
/// returned by this type ever reaches past size().
///
/// Operations come in families that differ only in how they treat a full buffer or a bad index:
///
///   fallible   try_push_back, try_emplace_back, try_insert_at, try_emplace_at, try_pop_back, get
///              -> report boundary conditions through bool / nullopt / nullptr, never terminate.
///                 A failed try_ never moves from its argument; the caller keeps the value.
///   lossy      insert_at_lossy, emplace_at_lossy
///              -> never fail on a full buffer: the tail element is evicted to make room.
///   unchecked  push_back_unchecked, emplace_back_unchecked, insert_at_unchecked,
///              emplace_at_unchecked, get_unchecked
///              -> the caller guarantees capacity and index; violations are undefined behavior
///                 (caught by BB_ASSERT in debug builds).
///   fatal      pop_at, remove_at, operator[], front, back
///              -> an invalid index is a programming error and terminates via assertion.
///
/// Any mutation (insert, removal, clear, move, destruction) invalidates spans, pointers and references
/// previously obtained from the buffer.
///
/// Not thread-safe: concurrent access must be synchronized externally.
///
/// Move-only. Use create_copy_of() for an explicit deep copy.
template <class T>
struct bb::bounded_buffer
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "bounded_buffer needs non-const object types, not "
                                                              "references/functions/void");

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        BB_ASSERT_ALWAYS(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        BB_ASSERT_ALWAYS(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    /// Returns a pointer to the element at index i, or nullptr if i is outside the live range [0, size()).
    /// i == size() is outside: the slot there is uninitialized.
    [[nodiscard]] constexpr T* get(isize i)
    {
        if (i < 0 || i >= size())
            return nullptr;
        return _data.obj_start + i;
    }
    [[nodiscard]] constexpr T const* get(isize i) const
    {
        if (i < 0 || i >= size())
            return nullptr;
        return _data.obj_start + i;
    }

    /// Returns a reference to the element at index i without a release-mode bounds check.
    /// Precondition (caller obligation): 0 <= i < size(). Undefined behavior otherwise.
    [[nodiscard]] constexpr T& get_unchecked(isize i)
    {
        BB_ASSERT(0 <= i && i < size(), "get_unchecked: index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] constexpr T const& get_unchecked(isize i) const
    {
        BB_ASSERT(0 <= i && i < size(), "get_unchecked: index out of bounds");
        return _data.obj_start[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        BB_ASSERT_ALWAYS(!empty(), "buffer is empty");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        BB_ASSERT_ALWAYS(!empty(), "buffer is empty");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        BB_ASSERT_ALWAYS(!empty(), "buffer is empty");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        BB_ASSERT_ALWAYS(!empty(), "buffer is empty");
        return *(_data.obj_end - 1);
    }

    /// Returns a pointer to the first slot of the block.
    /// nullptr for zero-capacity buffers.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // views and iterators
public:
    /// View over exactly the live elements [0, size()).
    [[nodiscard]] constexpr bb::span<T> as_span() { return bb::span<T>(_data.obj_start, _data.obj_end); }
    [[nodiscard]] constexpr bb::span<T const> as_span() const
    {
        return bb::span<T const>(_data.obj_start, _data.obj_end);
    }

    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    /// Number of live elements.
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr isize size_bytes() const { return size() * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// Maximum number of elements, fixed at creation.
    [[nodiscard]] constexpr isize capacity() const { return _data.obj_capacity(); }
    [[nodiscard]] constexpr isize remaining_capacity() const { return capacity() - size(); }
    [[nodiscard]] constexpr bool is_full() const { return size() == capacity(); }

    // fallible appends and inserts
public:
    /// Constructs a new element at the back if there is room.
    /// Returns false (and does not touch args) if the buffer is full.
    /// O(1).
    template <class... Args>
    [[nodiscard]] constexpr bool try_emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(bb::forward<Args>(args)...); }, "try_emplace_back: T is not constructible from "
                                                         "the provided argument types");
        if (is_full())
            return false;

        emplace_back_unchecked(bb::forward<Args>(args)...);
        return true;
    }

    /// Returns false if the buffer is full; value is then left untouched.
    [[nodiscard]] constexpr bool try_push_back(T const& value) { return try_emplace_back(value); }
    /// Returns false if the buffer is full; value is then NOT moved from and still owned by the caller.
    [[nodiscard]] constexpr bool try_push_back(T&& value) { return try_emplace_back(bb::move(value)); }

    /// Constructs a new element at idx, shifting [idx, size()) one slot to the right.
    /// Returns false (and does not touch args) if the buffer is full or idx is not in [0, size()].
    /// O(size() - idx).
    template <class... Args>
    [[nodiscard]] constexpr bool try_emplace_at(isize idx, Args&&... args)
    {
        static_assert(
            requires { T(bb::forward<Args>(args)...); }, "try_emplace_at: T is not constructible from "
                                                         "the provided argument types");
        if (is_full() || idx < 0 || idx > size())
            return false;

        emplace_at_unchecked(idx, bb::forward<Args>(args)...);
        return true;
    }

    [[nodiscard]] constexpr bool try_insert_at(isize idx, T const& value) { return try_emplace_at(idx, value); }
    [[nodiscard]] constexpr bool try_insert_at(isize idx, T&& value) { return try_emplace_at(idx, bb::move(value)); }

    // lossy inserts
public:
    /// Inserts at idx, shifting the tail right. Never fails for capacity reasons:
    /// if the buffer is full, the last element is destroyed first so that the shifted tail fits.
    /// If the buffer is full and idx == capacity(), the new element is the one that does not fit
    /// and is discarded without being constructed.
    /// size() grows by one unless the buffer was full.
    ///
    /// Precondition (caller obligation): 0 <= idx <= size(). Checked by BB_ASSERT only.
    /// Validate indices with the try_ family first if they come from elsewhere.
    template <class... Args>
    constexpr void emplace_at_lossy(isize idx, Args&&... args)
    {
        BB_ASSERT(0 <= idx && idx <= size(), "emplace_at_lossy: index out of bounds");

        if (!is_full()) [[likely]]
        {
            emplace_at_unchecked(idx, bb::forward<Args>(args)...);
            return;
        }

        // would land past the last slot
        if (idx == capacity())
            return;

        // construct before evicting: args may refer to the tail element
        T value(bb::forward<Args>(args)...);

        _data.obj_end--;
        _data.obj_end->~T();

        emplace_at_unchecked(idx, bb::move(value));
    }

    constexpr void insert_at_lossy(isize idx, T const& value) { emplace_at_lossy(idx, value); }
    constexpr void insert_at_lossy(isize idx, T&& value) { emplace_at_lossy(idx, bb::move(value)); }

    // unchecked appends and inserts
public:
    /// Constructs a new element at the back.
    /// Precondition (caller obligation): !is_full(). Checked by BB_ASSERT only.
    /// Strong exception safety; O(1).
    template <class... Args>
    constexpr T& emplace_back_unchecked(Args&&... args)
    {
        BB_ASSERT(!is_full(), "emplace_back_unchecked: buffer is full");
        auto const p = new (bb::placement_new, _data.obj_end) T(bb::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    constexpr T& push_back_unchecked(T const& value) { return emplace_back_unchecked(value); }
    constexpr T& push_back_unchecked(T&& value) { return emplace_back_unchecked(bb::move(value)); }

    /// Constructs a new element at idx, shifting [idx, size()) one slot to the right.
    /// Preconditions (caller obligation): !is_full() and 0 <= idx <= size(). Checked by BB_ASSERT only.
    /// O(size() - idx).
    template <class... Args>
    constexpr T& emplace_at_unchecked(isize idx, Args&&... args)
    {
        BB_ASSERT(!is_full(), "emplace_at_unchecked: buffer is full");
        BB_ASSERT(0 <= idx && idx <= size(), "emplace_at_unchecked: index out of bounds");

        auto const p_obj = _data.obj_start + idx;
        if (p_obj == _data.obj_end)
            return emplace_back_unchecked(bb::forward<Args>(args)...);

        // construct first: args may alias elements that are about to be shifted
        T value(bb::forward<Args>(args)...);

        impl::shift_objects_right_by_one(p_obj, _data.obj_end);
        *p_obj = bb::move(value);
        return *p_obj;
    }

    constexpr T& insert_at_unchecked(isize idx, T const& value) { return emplace_at_unchecked(idx, value); }
    constexpr T& insert_at_unchecked(isize idx, T&& value) { return emplace_at_unchecked(idx, bb::move(value)); }

    // removals
public:
    /// Removes and returns the element at idx, shifting [idx + 1, size()) one slot to the left.
    /// Terminates if idx is not in [0, size()), in every build configuration.
    /// O(size() - idx).
    /// NOTE: Prefer remove_at() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_at() if you don't need the return value")]] constexpr T pop_at(isize idx)
    {
        BB_ASSERT_ALWAYS(0 <= idx && idx < size(), "index out of bounds");
        auto const p_obj = _data.obj_start + idx;

        auto value = bb::move(*p_obj);

        // the last slot ends up moved-from
        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);
        _data.obj_end--;
        _data.obj_end->~T();

        return value;
    }

    /// Removes the element at idx, shifting [idx + 1, size()) one slot to the left.
    /// Terminates if idx is not in [0, size()), in every build configuration.
    constexpr void remove_at(isize idx)
    {
        BB_ASSERT_ALWAYS(0 <= idx && idx < size(), "index out of bounds");
        auto const p_obj = _data.obj_start + idx;

        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);
        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Removes and returns the last element, or nullopt if the buffer is empty.
    /// O(1).
    [[nodiscard]] constexpr bb::optional<T> try_pop_back()
    {
        if (empty())
            return bb::nullopt;

        bb::optional<T> value = bb::move(*(_data.obj_end - 1));
        _data.obj_end--;
        _data.obj_end->~T();
        return value;
    }

    /// Destroys all live elements (last to first); size() becomes 0.
    /// Capacity and the allocation are kept.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    // ctors / allocation
public:
    /// Creates an empty buffer with room for exactly `capacity` elements.
    /// capacity == 0 allocates nothing.
    /// Terminates if capacity is negative, if capacity * sizeof(T) is not addressable,
    /// or if the system is out of memory.
    [[nodiscard]] static bounded_buffer create_with_capacity(isize capacity)
    {
        bounded_buffer b;
        b._data = bb::allocation<T>::create_empty(capacity);
        return b;
    }

    /// Creates a deep copy of rhs with the same capacity.
    [[nodiscard]] static bounded_buffer create_copy_of(bounded_buffer const& rhs)
    {
        auto b = bounded_buffer::create_with_capacity(rhs.capacity());
        impl::copy_create_objects_to(b._data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
        return b;
    }

    /// Zero-capacity buffer.
    bounded_buffer() = default;
    ~bounded_buffer() = default;

    // moving transfers the block, rhs is left with capacity 0
    bounded_buffer(bounded_buffer&&) = default;
    bounded_buffer& operator=(bounded_buffer&&) = default;

    bounded_buffer(bounded_buffer const&) = delete;
    bounded_buffer& operator=(bounded_buffer const&) = delete;

    /// Extracts the underlying allocation (block and live objects), leaving a zero-capacity buffer.
    /// O(1).
    [[nodiscard]] bb::allocation<T> extract_allocation() { return bb::move(_data); }

private:
    bb::allocation<T> _data;
};
