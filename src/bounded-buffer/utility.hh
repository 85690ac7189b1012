#pragma once

#include <bounded-buffer/assert.hh>
#include <bounded-buffer/fwd.hh>

#include <type_traits>

// Small replacements for <utility> and <new> pieces, usable from every header:
//
//   bb::move / bb::forward   value category casts
//   bb::exchange             take a value and leave a replacement (moved-from handles become nullptr)
//   bb::is_power_of_two      alignment validation
//   bb::placement_new        tag for `new (bb::placement_new, ptr) T(...)`
//   bb::storage_for<T>       raw, aligned room for one T whose lifetime the owner manages

namespace bb
{
template <class T>
[[nodiscard]] BB_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] BB_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] BB_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Usage:
///   obj_start = bb::exchange(rhs.obj_start, nullptr);
template <class T, class U = T>
[[nodiscard]] BB_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = bb::forward<U>(new_val);
    return old_val;
}

/// Precondition: value > 0.
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    BB_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new{};

/// value is never constructed or destroyed implicitly.
/// Trivially destructible iff T is, so optional<int> and friends stay trivial to destroy.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {} // NOLINT(modernize-use-equals-default)
    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for() {} // NOLINT(modernize-use-equals-default)
};
} // namespace bb

// non-allocating placement new without pulling in <new>
inline void* operator new(std::size_t, bb::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, bb::placement_new_tag, void*) noexcept {}
