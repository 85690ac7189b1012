#pragma once

#include <bounded-buffer/assert.hh>
#include <bounded-buffer/fwd.hh>
#include <bounded-buffer/utility.hh>

#include <type_traits>

/// Tag for the empty state, compared against and returned as bb::nullopt.
/// Not default constructible so that `opt = {}` stays unambiguous.
struct bb::nullopt_t
{
    struct tag
    {
    };
    explicit constexpr nullopt_t(tag) {}
};

namespace bb
{
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::tag{}};
} // namespace bb

/// Value of type T or nothing; the result of bounded_buffer::try_pop_back.
///
/// Only the part of std::optional a popped element needs: construction from a value or nullopt,
/// moving, has_value() and asserted value() access. There is no operator* or operator->.
/// Move-only. A moved-from optional is empty.
template <class T>
struct bb::optional
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "optional needs a non-array object type");

    // construction
public:
    optional() = default;
    constexpr optional(nullopt_t) {} // NOLINT(google-explicit-constructor)

    optional(T&& value) : _has_value(true) // NOLINT(google-explicit-constructor)
    {
        new (bb::placement_new, &_storage.value) T(bb::move(value));
    }
    optional(T const& value) // NOLINT(google-explicit-constructor)
        requires std::is_copy_constructible_v<T>
      : _has_value(true)
    {
        new (bb::placement_new, &_storage.value) T(value);
    }

    optional(optional&& rhs) noexcept : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (bb::placement_new, &_storage.value) T(bb::move(rhs._storage.value));
            rhs.reset();
        }
    }

    optional(optional const&) = delete;
    optional& operator=(optional const&) = delete;
    optional& operator=(optional&&) = delete;

    ~optional() { reset(); }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value().
    [[nodiscard]] T& value() &
    {
        BB_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        BB_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    /// Allows `buffer.try_pop_back().value()` for move-only T.
    [[nodiscard]] T&& value() &&
    {
        BB_ASSERT(_has_value, "value() called on an empty optional");
        return bb::move(_storage.value);
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

private:
    void reset()
    {
        if constexpr (!std::is_trivially_destructible_v<T>)
            if (_has_value)
                _storage.value.~T();
        _has_value = false;
    }

    bb::storage_for<T> _storage;
    bool _has_value = false;
};
