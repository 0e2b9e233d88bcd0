#pragma once

#include <type-map/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Key types and their value types
// =========================================================================================================
//
// A key type is a marker type that indexes a tmap::basic_type_map at compile time.
// Each key type is bound to exactly one value type, which is what the map stores under it.
//
// Two ways to bind a key:
//
//   // 1. nested alias (preferred when you own the key type)
//   struct Age
//   {
//       using value_type = Value;
//   };
//
//   // 2. external binding (for keys you cannot modify or that are only forward declared)
//   struct Age;
//   TMAP_BIND_KEY(Age, Value);
//
// TMAP_BIND_KEY must be used at global scope.
// Using both forms for the same key is a compile error.
// Binding the same key twice is a redefinition error (or an ODR violation across translation units).
//
// Key types are never instantiated by the map, so they may stay incomplete.
// Value types must be non-const, non-array object types that are move constructible and destructible.
//

/// Binds key type K to a value type, see the overview above.
/// The primary template is empty: unbound keys have no value_type and fail the tmap::type_key concept.
template <class K>
struct tmap::key_traits
{
};

/// Keys declaring a nested value_type
template <class K>
    requires requires { typename K::value_type; }
struct tmap::key_traits<K>
{
    using value_type = typename K::value_type;
};

namespace tmap
{
namespace impl
{
template <class K>
concept has_nested_value_type = requires { typename K::value_type; };

template <class V>
concept storable_value = std::is_object_v<V> && !std::is_array_v<V> && !std::is_const_v<V> && !std::is_volatile_v<V>
                      && std::is_move_constructible_v<V> && std::is_destructible_v<V>;
} // namespace impl

/// Satisfied if K is bound to a storable value type
template <class K>
concept type_key = requires { typename key_traits<K>::value_type; } && impl::storable_value<typename key_traits<K>::value_type>;

/// The value type bound to key type K
template <type_key K>
using value_of = typename key_traits<K>::value_type;
} // namespace tmap

/// Binds key type K to value type V without modifying K
/// Explicitly specializes tmap::key_traits<K>, so it must appear at global scope,
/// before the first use of K with a map.
/// Usage:
///   struct Age;
///   TMAP_BIND_KEY(Age, Value);
#define TMAP_BIND_KEY(K, V)                                                                                                    \
    template <>                                                                                                                \
    struct tmap::key_traits<K>                                                                                                 \
    {                                                                                                                          \
        static_assert(!tmap::impl::has_nested_value_type<K>, "key type already declares its value type via a nested alias"); \
        using value_type = V;                                                                                                  \
    }
