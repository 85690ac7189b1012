#include "allocation.hh"

#include <bounded-buffer/assert.hh>
#include <bounded-buffer/macros.hh>
#include <bounded-buffer/utility.hh>

#include <cstdlib>

#ifdef BB_OS_WINDOWS
#include <malloc.h>
#endif

bb::byte* bb::impl::system_try_allocate_bytes(isize bytes, isize alignment)
{
    BB_ASSERT(alignment > 0 && bb::is_power_of_two(alignment), "alignment must be a power of 2");
    BB_ASSERT(bytes >= 0, "bytes must be non-negative");

    // Contract: bytes == 0 always returns nullptr
    if (bytes == 0)
        return nullptr;

#ifdef BB_OS_WINDOWS
    return static_cast<bb::byte*>(_aligned_malloc(size_t(bytes), size_t(alignment)));
#else
    // posix_memalign instead of std::aligned_alloc to avoid the bytes % alignment == 0 requirement.
    // posix_memalign requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    auto const effective_alignment = alignment < isize(sizeof(void*)) ? isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(bytes));
    return result == 0 ? static_cast<bb::byte*>(raw_ptr) : nullptr;
#endif
}

bb::byte* bb::impl::system_allocate_bytes(isize bytes, isize alignment)
{
    if (bytes == 0)
        return nullptr;

    auto const p = system_try_allocate_bytes(bytes, alignment);

    // out of memory is an environment failure, never a recoverable condition for callers
    BB_ASSERT_ALWAYS(p != nullptr, "allocation failed: out of memory");
    return p;
}

void bb::impl::system_deallocate_bytes(bb::byte* p, isize bytes, isize alignment)
{
    BB_UNUSED(bytes);
    BB_UNUSED(alignment);

    // size and alignment are part of the contract, but malloc-family deallocation does not need them
    // IMPORTANT: _aligned_malloc must be paired with _aligned_free, posix_memalign with std::free
#ifdef BB_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}
