#pragma once

#include <type-map/assert.hh>
#include <type-map/fwd.hh>
#include <type-map/memory_resource.hh>
#include <type-map/to_debug_string.hh>
#include <type-map/type_id.hh>
#include <type-map/utility.hh>

#include <string>
#include <type_traits>

/// Optional capabilities of a type-erased box, combinable with |
/// Each capability is captured when a value is boxed, because afterwards its type is gone:
///   clone - the box (and any container of boxes) becomes copyable; boxed types must be copy constructible
///   debug - the box can render its value via tmap::to_debug_string
enum class tmap::box_caps : tmap::u8
{
    none = 0,
    clone = 1 << 0,
    debug = 1 << 1,
};

namespace tmap
{
[[nodiscard]] constexpr box_caps operator|(box_caps a, box_caps b)
{
    return box_caps(u8(a) | u8(b));
}

/// True if caps contains every capability in required
[[nodiscard]] constexpr bool has_caps(box_caps caps, box_caps required)
{
    return (u8(caps) & u8(required)) == u8(required);
}

namespace impl
{
// everything a box needs to know about the type it erased
// one static instance per (T, Caps), so a box only carries a pointer to it
struct box_ops
{
    type_id type;
    isize size = 0;
    isize alignment = 0;

    // calls ~T(), nullptr for trivially destructible types
    tmap::function_ptr<void(void*) noexcept> destroy = nullptr;

    // allocates from the resource and copy constructs, nullptr without box_caps::clone
    tmap::function_ptr<void*(void const*, memory_resource const*)> clone = nullptr;

    // nullptr without box_caps::debug
    tmap::function_ptr<std::string(void const*)> debug_string = nullptr;
};

// allocates storage for a T from resource and constructs it from args
// the storage is returned to the resource if the constructor throws
template <class T, class... Args>
T* box_allocate_and_construct(memory_resource const* resource, Args&&... args)
{
    auto const res = tmap::resource_or_default(resource);
    auto const bytes = res->allocate_bytes(isize(sizeof(T)), isize(alignof(T)), res->userdata);

    struct deallocate_guard
    {
        memory_resource const* res;
        tmap::byte* bytes;
        ~deallocate_guard()
        {
            if (bytes != nullptr)
                res->deallocate_bytes(bytes, isize(sizeof(T)), isize(alignof(T)), res->userdata);
        }
    } guard{res, bytes};

    auto const obj = new (tmap::placement_new, bytes) T(tmap::forward<Args>(args)...);
    guard.bytes = nullptr;
    return obj;
}

template <class T, box_caps Caps>
constexpr box_ops make_box_ops()
{
    box_ops ops;
    ops.type = tmap::type_id_of<T>();
    ops.size = isize(sizeof(T));
    ops.alignment = isize(alignof(T));

    if constexpr (!std::is_trivially_destructible_v<T>)
        ops.destroy = [](void* p) noexcept { static_cast<T*>(p)->~T(); };

    if constexpr (tmap::has_caps(Caps, box_caps::clone))
    {
        static_assert(std::is_copy_constructible_v<T>, "boxes with box_caps::clone only accept copy constructible types");
        ops.clone = [](void const* p, memory_resource const* resource) -> void*
        { return impl::box_allocate_and_construct<T>(resource, *static_cast<T const*>(p)); };
    }

    if constexpr (tmap::has_caps(Caps, box_caps::debug))
        ops.debug_string = [](void const* p) -> std::string { return tmap::to_debug_string(*static_cast<T const*>(p)); };

    return ops;
}

template <class T, box_caps Caps>
inline constexpr box_ops box_ops_for = impl::make_box_ops<T, Caps>();
} // namespace impl
} // namespace tmap

/// Owning, type-erased holder of exactly one value (or nothing).
/// Like a std::unique_ptr<void> that remembers how to destroy, copy and print its pointee.
///
/// The boxed type is recorded as a tmap::type_id at creation.
/// Typed access (get<T>, take<T>) asserts that T is exactly the boxed type: recovering a value
/// under a different type is a programmer error, never a runtime condition callers handle.
/// Containers like tmap::basic_type_map guarantee the match statically and rely on the assertion
/// only as a safety net in debug builds.
///
/// The value lives in its own allocation from a tmap::memory_resource, so moving a box never moves
/// the value: references obtained via get<T>() stay valid until the box is destroyed, reset or taken.
///
/// Move-only unless Caps contains box_caps::clone, in which case copying deep-copies the value.
/// Like unique_ptr<T>, const-ness of the box does not imply const-ness of access through get() on a non-const box.
template <tmap::box_caps Caps>
struct tmap::any_box
{
    // factory
public:
    /// Boxes a T constructed from args, allocating from resource (nullptr = default resource).
    /// If the constructor throws, nothing is leaked and the exception propagates.
    template <class T, class... Args>
    [[nodiscard]] static any_box create(memory_resource const* resource, Args&&... args)
    {
        static_assert(std::is_object_v<T> && !std::is_array_v<T>, "only non-array object types can be boxed");
        static_assert(std::is_same_v<T, std::remove_cv_t<T>>, "cv-qualified types cannot be boxed");
        static_assert(std::is_constructible_v<T, Args...>, "T is not constructible from the provided argument types");

        any_box b;
        b._ptr = impl::box_allocate_and_construct<T>(resource, tmap::forward<Args>(args)...);
        b._ops = &impl::box_ops_for<T, Caps>;
        b._resource = resource;
        return b;
    }

    // properties
public:
    [[nodiscard]] bool is_valid() const { return _ptr != nullptr; }
    explicit operator bool() const { return _ptr != nullptr; }

    /// The id of the boxed type, or an invalid type_id for an empty box.
    [[nodiscard]] type_id type() const { return _ops != nullptr ? _ops->type : type_id(); }

    /// True if the box is non-empty and holds exactly a T.
    template <class T>
    [[nodiscard]] bool holds() const
    {
        return _ops != nullptr && _ops->type == tmap::type_id_of<T>();
    }

    /// The resource this box allocates from (nullptr = default resource).
    [[nodiscard]] memory_resource const* resource() const { return _resource; }

    // typed access
public:
    /// Returns the boxed value.
    /// Precondition: holds<T>().
    template <class T>
    [[nodiscard]] T& get()
    {
        TMAP_ASSERT(is_valid(), "cannot access the value of an empty any_box");
        TMAP_ASSERT(holds<T>(), "any_box holds a different type than requested. type-erasure invariant violated");
        return *static_cast<T*>(_ptr);
    }
    template <class T>
    [[nodiscard]] T const& get() const
    {
        TMAP_ASSERT(is_valid(), "cannot access the value of an empty any_box");
        TMAP_ASSERT(holds<T>(), "any_box holds a different type than requested. type-erasure invariant violated");
        return *static_cast<T const*>(_ptr);
    }

    /// Moves the boxed value out, frees its storage and leaves the box empty.
    /// Precondition: holds<T>().
    template <class T>
    [[nodiscard]] T take()
    {
        T value = tmap::move(get<T>());
        reset();
        return value;
    }

    /// Destroys the boxed value (if any) and leaves the box empty.
    void reset() noexcept
    {
        if (_ptr == nullptr)
            return;

        if (_ops->destroy != nullptr)
            _ops->destroy(_ptr);

        auto const res = tmap::resource_or_default(_resource);
        res->deallocate_bytes(static_cast<tmap::byte*>(_ptr), _ops->size, _ops->alignment, res->userdata);

        _ptr = nullptr;
        _ops = nullptr;
    }

    // capabilities
public:
    /// Deep copy of the box, allocated from the same resource.
    [[nodiscard]] any_box clone() const
        requires(tmap::has_caps(Caps, box_caps::clone))
    {
        any_box b;
        b._resource = _resource;
        if (_ptr != nullptr)
        {
            b._ptr = _ops->clone(_ptr, _resource);
            b._ops = _ops;
        }
        return b;
    }

    /// Renders the boxed value via tmap::to_debug_string, "<empty>" for an empty box.
    [[nodiscard]] std::string to_debug_string() const
        requires(tmap::has_caps(Caps, box_caps::debug))
    {
        if (_ptr == nullptr)
            return "<empty>";
        return _ops->debug_string(_ptr);
    }

    // ctors/dtor
public:
    any_box() = default;

    any_box(any_box&& rhs) noexcept
      : _ptr(tmap::exchange(rhs._ptr, nullptr)), _ops(tmap::exchange(rhs._ops, nullptr)), _resource(rhs._resource)
    {
    }
    any_box& operator=(any_box&& rhs) noexcept
    {
        if (this != &rhs)
        {
            reset();
            _ptr = tmap::exchange(rhs._ptr, nullptr);
            _ops = tmap::exchange(rhs._ops, nullptr);
            _resource = rhs._resource;
        }
        return *this;
    }

    any_box(any_box const& rhs)
        requires(tmap::has_caps(Caps, box_caps::clone))
      : any_box(rhs.clone())
    {
    }
    any_box& operator=(any_box const& rhs)
        requires(tmap::has_caps(Caps, box_caps::clone))
    {
        if (this != &rhs)
            *this = rhs.clone();
        return *this;
    }

    ~any_box() { reset(); }

    // members
private:
    /// Pointer to the boxed value; nullptr indicates an empty box.
    void* _ptr = nullptr;

    /// Operations of the boxed type; nullptr iff _ptr is nullptr.
    impl::box_ops const* _ops = nullptr;

    /// Resource the value was allocated from (nullptr = default resource).
    memory_resource const* _resource = nullptr;
};
