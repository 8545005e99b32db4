#include "allocation.hh"

#include <stable-vec/assertf.hh>
#include <stable-vec/macros.hh>
#include <stable-vec/utility.hh>

#include <cstdlib>

#ifdef SV_OS_WINDOWS
#include <malloc.h>
#endif

sv::byte* sv::impl::allocate_bytes(isize bytes, isize alignment)
{
    SV_ASSERT(bytes >= 0, "cannot allocate a negative number of bytes");
    SV_ASSERT(alignment > 0 && sv::is_power_of_two(alignment), "alignment must be a power of 2");

    if (bytes == 0)
        return nullptr;

    byte* p = nullptr;

#ifdef SV_OS_WINDOWS
    p = static_cast<byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement (unlike std::aligned_alloc)
    // but needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    isize const effective_alignment = alignment < isize(sizeof(void*)) ? isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    p = result == 0 ? static_cast<byte*>(raw_ptr) : nullptr;
#endif

    SV_ASSERTF_ALWAYS(p != nullptr, "allocation failed: requested {} bytes with alignment {}", bytes, alignment);
    return p;
}

void sv::impl::deallocate_bytes(byte* p, isize bytes, isize alignment)
{
    // malloc-family deallocation does not need size or alignment
    SV_UNUSED(bytes);
    SV_UNUSED(alignment);

#ifdef SV_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}
