#pragma once

#include <type-map/assert.hh>
#include <type-map/fwd.hh>

#include <new>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Alignment:
//   is_power_of_two(value)      - check if value is a power of 2
//
// Object storage:
//   placement_new               - tag for our non-allocating placement new
//   storage_for<T>              - uninitialized, properly aligned storage for exactly one T
//
// Template metaprogramming:
//   always_false_t<T...>        - dependent false for static_asserts
//   function_ptr<Signature>     - convert function signature to function pointer type
//

namespace tmap
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Casts a value to an rvalue reference so it can be moved from
/// Same as std::move but without pulling in <utility>
/// Usage:
///   T b = tmap::move(a);
template <class T>
[[nodiscard]] TMAP_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding of template arguments
/// Usage:
///   template <class... Args> void f(Args&&... args) { g(tmap::forward<Args>(args)...); }
template <class T>
[[nodiscard]] TMAP_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] TMAP_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replaces obj with new_val and returns the old value of obj
/// Usage:
///   auto ptr = tmap::exchange(p, nullptr);     // take ownership of p, set p to null
template <class T, class U = T>
[[nodiscard]] TMAP_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = tmap::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of a and b (a if they are equivalent)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (a < b) ? b : a;
}

/// Returns the smaller of a and b (a if they are equivalent)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a;
}

// =========================================================================================================
// Alignment
// =========================================================================================================

/// Checks if value is a power of two (0 is not)
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    return value > 0 && (value & (value - 1)) == 0;
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
/// Always evaluates to false, but only after template instantiation
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   tmap::function_ptr<void(void*)>          -> void (*)(void*)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;
} // namespace tmap

// =========================================================================================================
// Object storage
// =========================================================================================================

/// Tag type selecting our placement new overload
/// We use a custom tag instead of the global "void*" placement new so that a user-provided
/// operator new overload can never accidentally hijack object construction inside containers.
struct tmap::placement_new_t
{
};

namespace tmap
{
constexpr placement_new_t placement_new = {};
}

[[nodiscard]] inline void* operator new(std::size_t, tmap::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
// only called if a constructor throws during placement new, nothing to free
inline void operator delete(void*, tmap::placement_new_t, void*) noexcept {}

/// Uninitialized storage with proper size and alignment for exactly one T
/// The value is constructed via placement new and destroyed manually by the owner.
/// Trivially destructible (and trivially copyable) whenever T is, so that owners can stay trivial.
template <class T>
union tmap::storage_for
{
    constexpr storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    T value;
};
