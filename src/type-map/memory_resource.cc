#include "memory_resource.hh"

#include <type-map/assert.hh>
#include <type-map/macros.hh>
#include <type-map/utility.hh>

#include <cstdlib>

namespace
{
/// Static function implementations for the system memory resource.
/// These ignore the userdata parameter as the system allocator is stateless.

tmap::byte* system_try_allocate_bytes(tmap::isize bytes, tmap::isize alignment, void* userdata)
{
    TMAP_UNUSED(userdata);

    TMAP_ASSERT(alignment > 0 && tmap::is_power_of_two(alignment), "alignment must be a power of 2");
    TMAP_ASSERT(bytes >= 0, "cannot allocate a negative number of bytes");

    // Contract: bytes == 0 always returns nullptr
    if (bytes == 0)
        return nullptr;

#ifdef TMAP_OS_WINDOWS
    return static_cast<tmap::byte*>(_aligned_malloc(bytes, alignment));
#else
    // Use posix_memalign instead of std::aligned_alloc to avoid the bytes % alignment == 0 requirement.
    // posix_memalign requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    tmap::isize const effective_alignment = tmap::max(alignment, tmap::isize(sizeof(void*)));
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(bytes));
    return result == 0 ? static_cast<tmap::byte*>(raw_ptr) : nullptr;
#endif
}

tmap::byte* system_allocate_bytes(tmap::isize bytes, tmap::isize alignment, void* userdata)
{
    if (bytes == 0)
        return nullptr;

    auto const p = system_try_allocate_bytes(bytes, alignment, userdata);
    TMAP_ASSERT_ALWAYS(p != nullptr, "system allocation failed");
    return p;
}

void system_deallocate_bytes(tmap::byte* p, tmap::isize bytes, tmap::isize alignment, void* userdata)
{
    TMAP_UNUSED(bytes);
    TMAP_UNUSED(alignment);
    TMAP_UNUSED(userdata);

    // size and alignment are provided for resources that need them (e.g., pooling),
    // but the system functions don't require them for deallocation.
#ifdef TMAP_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// System memory resource instance stored in the data segment.
/// Stored in the data segment (not on heap) so it remains valid during static initialization,
/// making tmap::default_memory_resource safe to use in global/static constructors.
constinit tmap::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit tmap::memory_resource const* const tmap::default_memory_resource = &system_memory_resource;
