#pragma once

#include <cstddef>
#include <cstdint>


namespace tmap
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout
// and happily use "int" for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes and indices are signed: "size - 1" on an empty container must not wrap around,
// and mixed signed/unsigned arithmetic is a reliable source of bugs.
// We only target 64-bit platforms, so i64 has plenty of range.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;

//
// Utility
//

struct placement_new_t;
template <class T>
union storage_for;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct hash;
template <class K, class V, class H = hash<K>>
struct map;

//
// Type erasure
//

struct type_id;
enum class box_caps : u8;
template <box_caps Caps>
struct any_box;

//
// Type map
//

template <class K>
struct key_traits;
template <box_caps Caps>
struct basic_type_map;
template <class K, class MapT>
struct type_map_entry;

} // namespace tmap
