#pragma once

#include <type-map/fwd.hh>
#include <type-map/utility.hh>

// tmap::memory_resource is where every heap byte of the library comes from:
// the per-value nodes of tmap::any_box and the slot table of tmap::map.
//
// It is a POD struct of function pointers (no virtual dispatch, no non-trivial constructors),
// which keeps it static-init safe and lets custom allocators live in plain data.
// Containers store a `memory_resource const*`; nullptr means "use tmap::default_memory_resource".
// This avoids allocator-typed container variants: a type_map with a custom resource has the same
// type as one without.

namespace tmap
{
/// Default memory resource used when a container's resource is nullptr.
/// This is a system allocator stored in the data segment, making the pointer valid even during
/// static initialization in other translation units (safe for use in global/static constructors).
extern tmap::memory_resource const* const default_memory_resource;

/// Returns resource if non-null, otherwise the default resource.
[[nodiscard]] inline memory_resource const* resource_or_default(memory_resource const* resource)
{
    return resource != nullptr ? resource : default_memory_resource;
}
} // namespace tmap

/// Polymorphic memory resource interface.
/// Custom allocators implement this interface to provide pluggable allocation strategies.
/// Sizes and alignments are always passed back on deallocation, so resources need no headers.
struct tmap::memory_resource
{
    /// Allocate `bytes` with at least `alignment` alignment (a power of two).
    /// bytes == 0 returns nullptr.
    /// bytes > 0 always returns non-null; failure is fatal (assert/terminate) or throws.
    tmap::function_ptr<tmap::byte*(isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// Like allocate_bytes but returns nullptr on failure instead of terminating.
    /// This provides an escape hatch for callers that must handle allocation failure explicitly.
    tmap::function_ptr<tmap::byte*(isize bytes, isize alignment, void* userdata)> try_allocate_bytes = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `p` must be the exact pointer returned by allocate_bytes or try_allocate_bytes.
    /// Noexcept in spirit: only programmer bugs (e.g., mismatched size) may throw or terminate.
    tmap::function_ptr<void(tmap::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};
