#pragma once

#include <cstddef>
#include <cstdint>


namespace bb
{
using i64 = int64_t;

// raw storage
using byte = std::byte;

// signed size type
// Sizes and indices are signed so that "size - 1" on an empty buffer and negative indices are
// ordinary values that bounds checks can reject, instead of wrapping around to huge positive numbers.
using isize = i64;

template <class T>
struct allocation;

template <class T>
struct span;

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct bounded_buffer;
} // namespace bb
