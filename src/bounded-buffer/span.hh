#pragma once

#include <bounded-buffer/assert.hh>
#include <bounded-buffer/fwd.hh>

#include <type_traits>

/// Borrowed view over [begin, end) of contiguous T.
///
/// Handed out by bounded_buffer::as_span() and allocation::obj_span(). It always covers exactly the
/// live elements, never uninitialized slots. It is invalidated by any mutation of the owning buffer.
/// span<T> converts implicitly to span<T const>.
template <class T>
struct bb::span
{
public:
    constexpr span() = default;

    /// Precondition: begin <= end, both within the same block.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        BB_ASSERT(begin <= end, "span: end precedes begin");
    }

    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size()) // NOLINT(google-explicit-constructor)
    {
    }

    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        BB_ASSERT(0 <= i && i < _size, "span: index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

private:
    T* _data = nullptr;
    isize _size = 0;
};
