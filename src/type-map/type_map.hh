#pragma once

#include <type-map/any_box.hh>
#include <type-map/assert.hh>
#include <type-map/fwd.hh>
#include <type-map/hash.hh>
#include <type-map/key.hh>
#include <type-map/map.hh>
#include <type-map/optional.hh>
#include <type-map/type_id.hh>
#include <type-map/utility.hh>

#include <string>
#include <string_view>

namespace tmap
{
namespace impl
{
template <box_caps Caps>
struct type_map_slot
{
    any_box<Caps> box;

    // only read for debug rendering
    std::string_view key_name;
};
} // namespace impl

/// Type map without extra capabilities: move-only
using type_map = basic_type_map<box_caps::none>;

/// Type map that can be copied; every stored value must be copy constructible
using clone_type_map = basic_type_map<box_caps::clone>;

/// Type map that can be rendered via tmap::to_debug_string
using debug_type_map = basic_type_map<box_caps::debug>;

using clone_debug_type_map = basic_type_map<box_caps::clone | box_caps::debug>;
} // namespace tmap

/// Heterogeneous associative container indexed by key types instead of key values.
/// Each key type K is bound to a value type (see tmap::key_traits and TMAP_BIND_KEY),
/// and the map stores at most one value of that type per key type.
///
/// Usage:
///
///   struct Age { using value_type = Value; };
///
///   tmap::type_map m;
///   m.insert<Age>(Value(42));         // returns empty optional
///   m.get<Age>();                     // optional<Value const&> referring to Value(42)
///   m.insert<Age>(Value(7));          // returns Value(42)
///   m.remove<Age>();                  // returns Value(7)
///
/// Storing a value of the wrong type for a key does not compile; absence is an empty optional.
///
/// Internally a tmap::map from tmap::type_id to tmap::any_box.
/// Every value lives in its own node, so references returned by get, get_mut, emplace or entries
/// stay valid until that key is overwritten or removed, or the map is cleared, moved from or destroyed.
/// Operations on other keys never invalidate them.
///
/// Caps adds optional capabilities (box_caps::clone, box_caps::debug), see the aliases above.
/// Not thread-safe.
template <tmap::box_caps Caps>
struct tmap::basic_type_map
{
    // construction
public:
    /// Empty map, does not allocate.
    basic_type_map() = default;

    /// Empty map that allocates its table and values from resource (nullptr = default resource).
    explicit basic_type_map(memory_resource const* resource) : _entries(resource) {}

    // queries
public:
    [[nodiscard]] isize size() const { return _entries.size(); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }

    [[nodiscard]] memory_resource const* resource() const { return _entries.resource(); }

    /// True if a value is stored under K.
    template <type_key K>
    [[nodiscard]] bool contains() const
    {
        return _entries.contains(tmap::type_id_of<K>());
    }

    /// Returns the value stored under K, or empty if there is none.
    template <type_key K>
    [[nodiscard]] optional<value_of<K> const&> get() const
    {
        auto const slot = _entries.get(tmap::type_id_of<K>());
        if (!slot.has_value())
            return nullopt;
        return slot.value().box.template get<value_of<K>>();
    }

    /// Returns the value stored under K for modification, or empty if there is none.
    template <type_key K>
    [[nodiscard]] optional<value_of<K>&> get_mut()
    {
        auto const slot = _entries.get(tmap::type_id_of<K>());
        if (!slot.has_value())
            return nullopt;
        return slot.value().box.template get<value_of<K>>();
    }

    template <type_key K>
    [[deprecated("renamed to get")]] [[nodiscard]] optional<value_of<K> const&> find() const
    {
        return get<K>();
    }

    template <type_key K>
    [[deprecated("renamed to get_mut")]] [[nodiscard]] optional<value_of<K>&> find_mut()
    {
        return get_mut<K>();
    }

    // modifiers
public:
    /// Stores value under K.
    /// Returns the previously stored value if there was one, otherwise empty.
    /// If moving either value throws, the map is unchanged.
    template <type_key K>
    optional<value_of<K>> insert(value_of<K> value)
    {
        using V = value_of<K>;

        // box first: everything that may throw happens before the map is touched
        auto box = any_box<Caps>::template create<V>(resource(), tmap::move(value));

        auto const existing = _entries.get(tmap::type_id_of<K>());
        if (existing.has_value())
        {
            // the previous value is moved out while its box is still in place,
            // swapping the boxes afterwards cannot throw
            auto& slot = existing.value();
            optional<V> previous = tmap::move(slot.box.template get<V>());
            slot.box = tmap::move(box);
            return previous;
        }

        add_slot<K>(tmap::move(box));
        return nullopt;
    }

    /// Constructs the value for K in place from args, destroying any previously stored value.
    /// Returns the new value.
    template <type_key K, class... Args>
    value_of<K>& emplace(Args&&... args)
    {
        using V = value_of<K>;

        auto box = any_box<Caps>::template create<V>(resource(), tmap::forward<Args>(args)...);
        auto& value = box.template get<V>();

        auto const existing = _entries.get(tmap::type_id_of<K>());
        if (existing.has_value())
            existing.value().box = tmap::move(box);
        else
            add_slot<K>(tmap::move(box));

        return value;
    }

    /// Removes the value stored under K and returns it, or returns empty if there was none.
    template <type_key K>
    optional<value_of<K>> remove()
    {
        auto slot = _entries.remove(tmap::type_id_of<K>());
        if (!slot.has_value())
            return nullopt;
        return slot.value().box.template take<value_of<K>>();
    }

    /// Entry for K, for in-place manipulation without repeating the key.
    /// Usage:
    ///   m.entry<Hits>().or_insert(0) += 1;
    template <type_key K>
    [[nodiscard]] type_map_entry<K, basic_type_map> entry()
    {
        return type_map_entry<K, basic_type_map>(*this);
    }

    /// Destroys all stored values.
    void clear() { _entries.clear(); }

    // diagnostics
public:
    /// Renders the map as {Key: value, ...} in unspecified order.
    /// Key names come from tmap::type_name_of and are compiler dependent.
    [[nodiscard]] std::string to_debug_string() const
        requires(tmap::has_caps(Caps, box_caps::debug))
    {
        auto s = std::string("{");
        _entries.for_each(
            [&](type_id const&, impl::type_map_slot<Caps> const& slot)
            {
                if (s.size() > 1)
                    s += ", ";
                s += slot.key_name;
                s += ": ";
                s += slot.box.to_debug_string();
            });
        s += "}";
        return s;
    }

    // implementation
private:
    // precondition: K is not present
    template <type_key K>
    void add_slot(any_box<Caps> box)
    {
        _entries.get_or_emplace(tmap::type_id_of<K>(), impl::type_map_slot<Caps>{tmap::move(box), tmap::type_name_of<K>()});
    }

    // members
private:
    tmap::map<type_id, impl::type_map_slot<Caps>> _entries;
};

/// View onto the slot for key type K in a type map.
/// Obtained via map.entry<K>(). Does not own anything and only stores a reference to the map,
/// so it stays usable while the map is modified through it.
/// Must not outlive the map.
template <class K, class MapT>
struct tmap::type_map_entry
{
    using value_type = value_of<K>;

    // queries
public:
    [[nodiscard]] bool is_occupied() const { return _map->template contains<K>(); }
    [[nodiscard]] bool is_vacant() const { return !_map->template contains<K>(); }

    /// Returns the stored value.
    /// Precondition: is_occupied().
    [[nodiscard]] value_type& value() const
    {
        auto const v = _map->template get_mut<K>();
        TMAP_ASSERT(v.has_value(), "entry is vacant");
        return v.value();
    }

    // modifiers
public:
    /// Returns the stored value, storing value first if the entry is vacant.
    /// An occupied entry is never overwritten.
    value_type& or_insert(value_type value) const
    {
        auto const v = _map->template get_mut<K>();
        if (v.has_value())
            return v.value();
        return _map->template emplace<K>(tmap::move(value));
    }

    /// Returns the stored value, constructing it from args first if the entry is vacant.
    /// args are only used when the entry is vacant.
    template <class... Args>
    value_type& or_emplace(Args&&... args) const
    {
        auto const v = _map->template get_mut<K>();
        if (v.has_value())
            return v.value();
        return _map->template emplace<K>(tmap::forward<Args>(args)...);
    }

    /// Stores value, overwriting the current one, and returns the stored value.
    value_type& insert(value_type value) const { return _map->template emplace<K>(tmap::move(value)); }

    /// Removes and returns the stored value, the entry becomes vacant.
    optional<value_type> take() const { return _map->template remove<K>(); }

    // construction
public:
    explicit type_map_entry(MapT& map) : _map(&map) {}

    // members
private:
    MapT* _map;
};
