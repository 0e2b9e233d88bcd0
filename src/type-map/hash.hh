#pragma once

#include <type-map/fwd.hh>
#include <type-map/type_id.hh>

#include <type_traits>

// =========================================================================================================
// Hashing for tmap::map
// =========================================================================================================
//
// tmap::hash<T> is a stateless function object: u64 operator()(T const&).
// Provided for integers, enums, pointers and tmap::type_id.
// Other key types specialize tmap::hash<T> (or pass their own hasher to tmap::map).
//
// Hashes are NOT stable across runs or platforms and must never be persisted.
// tmap::map uses the low bits for bucket selection, so every hash here is passed through mix_bits.
//

namespace tmap
{
/// Finalizer that spreads entropy over all 64 bits (splitmix64 finalizer).
/// Pointers are aligned and integers are often small, so their low bits alone make bad bucket indices.
[[nodiscard]] constexpr u64 mix_bits(u64 h)
{
    h ^= h >> 30;
    h *= 0xbf58476d1ce4e5b9ull;
    h ^= h >> 27;
    h *= 0x94d049bb133111ebull;
    h ^= h >> 31;
    return h;
}

/// Combines a running hash with the hash of another value.
/// Usage:
///   auto h = tmap::hash<int>{}(a);
///   h = tmap::hash_combine(h, tmap::hash<int>{}(b));
[[nodiscard]] constexpr u64 hash_combine(u64 seed, u64 h)
{
    return mix_bits(seed ^ (h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2)));
}
} // namespace tmap

template <class T>
struct tmap::hash
{
    static_assert(std::is_integral_v<T> || std::is_enum_v<T> || std::is_pointer_v<T>,
                  "no tmap::hash<T> for this type. specialize tmap::hash<T> or pass a hasher to tmap::map");

    [[nodiscard]] u64 operator()(T const& value) const
    {
        if constexpr (std::is_pointer_v<T>)
            return tmap::mix_bits(u64(reinterpret_cast<uintptr_t>(value))); // NOLINT
        else
            return tmap::mix_bits(u64(value));
    }
};

template <>
struct tmap::hash<tmap::type_id>
{
    [[nodiscard]] u64 operator()(type_id const& id) const { return tmap::mix_bits(id.hash_value()); }
};
