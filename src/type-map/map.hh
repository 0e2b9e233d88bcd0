#pragma once

#include <type-map/assert.hh>
#include <type-map/fwd.hh>
#include <type-map/hash.hh>
#include <type-map/memory_resource.hh>
#include <type-map/optional.hh>
#include <type-map/utility.hh>

#include <type_traits>


/// Associative container mapping keys of type K to values of type V
/// Hash map with open addressing and linear probing:
/// - capacity is zero or a power of two, the bucket of a key is hash & (capacity - 1)
/// - the table grows (doubling) before the load factor would exceed 3/4
/// - removal uses backward-shift deletion, so there are no tombstones and probe chains stay short
///
/// Lookups return optional references instead of iterators; absence is a normal result.
/// Entries have no defined order. for_each visits every entry exactly once.
///
/// Memory comes from a tmap::memory_resource (nullptr = tmap::default_memory_resource).
/// Any insertion may rehash, which moves keys and values and invalidates all references into the map.
/// (tmap::basic_type_map stores heap boxes as values, so its stored objects never move.)
///
/// K and V must be nothrow move constructible: rehashing moves every entry and cannot roll back.
/// The map is copyable iff V is copy constructible and K is nothrow copy constructible.
template <class K, class V, class H>
struct tmap::map
{
    static_assert(std::is_nothrow_move_constructible_v<K>, "keys must be nothrow move constructible");
    static_assert(std::is_nothrow_move_constructible_v<V>, "values must be nothrow move constructible");

    // construction
public:
    map() = default;

    /// Empty map that allocates from the given resource (nullptr = default resource).
    /// Does not allocate until the first insertion.
    explicit map(memory_resource const* resource) : _resource(resource) {}

    map(map&& rhs) noexcept
      : _slots(tmap::exchange(rhs._slots, nullptr)),
        _capacity(tmap::exchange(rhs._capacity, 0)),
        _size(tmap::exchange(rhs._size, 0)),
        _resource(rhs._resource)
    {
    }

    map& operator=(map&& rhs) noexcept
    {
        if (this != &rhs)
        {
            destroy_and_deallocate();
            _slots = tmap::exchange(rhs._slots, nullptr);
            _capacity = tmap::exchange(rhs._capacity, 0);
            _size = tmap::exchange(rhs._size, 0);
            _resource = rhs._resource;
        }
        return *this;
    }

    /// Deep copy. The copy uses the same resource and capacity, so every entry lands in the same slot.
    /// Delegates to the resource constructor so that a throwing copy still destroys what was built.
    map(map const& rhs)
        requires(std::is_nothrow_copy_constructible_v<K> && std::is_copy_constructible_v<V>)
      : map(rhs._resource)
    {
        if (rhs._capacity == 0)
            return;

        allocate_slots(rhs._capacity);
        for (isize i = 0; i < rhs._capacity; ++i)
        {
            auto const& src = rhs._slots[i];
            if (!src.occupied)
                continue;

            // value first: if its copy throws, this slot is still free
            auto& dst = _slots[i];
            new (tmap::placement_new, &dst.value.value) V(src.value.value);
            new (tmap::placement_new, &dst.key.value) K(src.key.value);
            dst.occupied = true;
            ++_size;
        }
    }

    map& operator=(map const& rhs)
        requires(std::is_nothrow_copy_constructible_v<K> && std::is_copy_constructible_v<V>)
    {
        if (this != &rhs)
            *this = map(rhs);
        return *this;
    }

    ~map() { destroy_and_deallocate(); }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Number of slots in the table (zero or a power of two).
    [[nodiscard]] isize capacity() const { return _capacity; }

    [[nodiscard]] memory_resource const* resource() const { return _resource; }

    // lookup
public:
    [[nodiscard]] bool contains(K const& key) const { return find_index(key) >= 0; }

    /// Returns a reference to the value for key, or empty if there is none.
    [[nodiscard]] optional<V&> get(K const& key)
    {
        auto const idx = find_index(key);
        if (idx < 0)
            return nullopt;
        return _slots[idx].value.value;
    }
    [[nodiscard]] optional<V const&> get(K const& key) const
    {
        auto const idx = find_index(key);
        if (idx < 0)
            return nullopt;
        return _slots[idx].value.value;
    }

    // modifiers
public:
    /// Stores value under key.
    /// Returns the previous value for key if there was one, otherwise empty.
    optional<V> insert_or_assign(K key, V value)
    {
        auto const idx = find_index(key);
        if (idx >= 0)
        {
            optional<V> previous = tmap::move(_slots[idx].value.value);
            _slots[idx].value.value = tmap::move(value);
            return previous;
        }

        emplace_new(tmap::move(key), tmap::move(value));
        return nullopt;
    }

    /// Returns the value for key, constructing it from args first if key is not present.
    /// args are only used (and V only constructed) when the key is absent.
    template <class... Args>
    V& get_or_emplace(K key, Args&&... args)
    {
        auto const idx = find_index(key);
        if (idx >= 0)
            return _slots[idx].value.value;

        return emplace_new(tmap::move(key), tmap::forward<Args>(args)...);
    }

    /// Removes the entry for key and returns its value, or returns empty if there was none.
    optional<V> remove(K const& key)
    {
        auto const idx = find_index(key);
        if (idx < 0)
            return nullopt;

        optional<V> removed = tmap::move(_slots[idx].value.value);
        erase_at(idx);
        return removed;
    }

    /// Destroys all entries. Keeps the allocated table for reuse.
    void clear()
    {
        for (isize i = 0; i < _capacity; ++i)
        {
            auto& s = _slots[i];
            if (s.occupied)
                destroy_slot(s);
        }
        _size = 0;
    }

    /// Makes sure that at least `count` entries fit without rehashing.
    void reserve(isize count)
    {
        TMAP_ASSERT(count >= 0, "cannot reserve a negative count");
        if (count == 0)
            return;

        auto new_capacity = _capacity == 0 ? min_capacity : _capacity;
        while (count * max_load_den > new_capacity * max_load_num)
            new_capacity *= 2;

        if (new_capacity != _capacity)
            rehash(new_capacity);
    }

    // iteration
public:
    /// Calls f(K const&, V&) for every entry, in unspecified order.
    /// f must not insert into or remove from this map.
    template <class F>
    void for_each(F&& f)
    {
        for (isize i = 0; i < _capacity; ++i)
            if (_slots[i].occupied)
                f(static_cast<K const&>(_slots[i].key.value), _slots[i].value.value);
    }

    /// Calls f(K const&, V const&) for every entry, in unspecified order.
    template <class F>
    void for_each(F&& f) const
    {
        for (isize i = 0; i < _capacity; ++i)
            if (_slots[i].occupied)
                f(static_cast<K const&>(_slots[i].key.value), static_cast<V const&>(_slots[i].value.value));
    }

    // implementation
private:
    struct slot
    {
        tmap::storage_for<K> key;
        tmap::storage_for<V> value;
        bool occupied = false;
    };

    static constexpr isize min_capacity = 8;

    // grow before size / capacity would exceed 3/4
    static constexpr isize max_load_num = 3;
    static constexpr isize max_load_den = 4;

    [[nodiscard]] isize bucket_of(K const& key) const { return isize(H{}(key) & u64(_capacity - 1)); }

    // index of the slot holding key, or -1
    [[nodiscard]] isize find_index(K const& key) const
    {
        if (_size == 0)
            return -1;

        auto const mask = _capacity - 1;
        auto idx = bucket_of(key);
        for (isize probes = 0; probes < _capacity; ++probes)
        {
            auto const& s = _slots[idx];
            if (!s.occupied)
                return -1;
            if (s.key.value == key)
                return idx;
            idx = (idx + 1) & mask;
        }

        // the load factor guarantees free slots, so every probe chain ends
        TMAP_ASSERT(false, "hash table has no free slot. indicates a tmap::map bug");
        return -1;
    }

    // precondition: key is not present
    template <class... Args>
    V& emplace_new(K&& key, Args&&... args)
    {
        if ((_size + 1) * max_load_den > _capacity * max_load_num)
            rehash(_capacity == 0 ? min_capacity : _capacity * 2);

        auto const mask = _capacity - 1;
        auto idx = bucket_of(key);
        while (_slots[idx].occupied)
            idx = (idx + 1) & mask;

        auto& s = _slots[idx];
        // construct the value first: if it throws, the slot is still free and the map unchanged
        new (tmap::placement_new, &s.value.value) V(tmap::forward<Args>(args)...);
        new (tmap::placement_new, &s.key.value) K(tmap::move(key));
        s.occupied = true;
        ++_size;
        return s.value.value;
    }

    // backward-shift deletion:
    // walks the probe chain after idx and moves every entry that would become unreachable into the hole
    void erase_at(isize idx)
    {
        auto const mask = _capacity - 1;
        destroy_slot(_slots[idx]);
        --_size;

        auto hole = idx;
        auto next = (hole + 1) & mask;
        while (_slots[next].occupied)
        {
            auto const home = bucket_of(_slots[next].key.value);

            // the entry at next may stay iff its home bucket lies cyclically in (hole, next]
            auto const stays = hole <= next ? (hole < home && home <= next) : (hole < home || home <= next);
            if (!stays)
            {
                move_slot(_slots[next], _slots[hole]);
                hole = next;
            }

            next = (next + 1) & mask;
        }
    }

    void rehash(isize new_capacity)
    {
        TMAP_ASSERT(tmap::is_power_of_two(new_capacity), "capacity must be a power of two");
        TMAP_ASSERT(new_capacity * max_load_num >= _size * max_load_den, "new capacity too small");

        auto const old_slots = _slots;
        auto const old_capacity = _capacity;

        allocate_slots(new_capacity);

        auto const mask = _capacity - 1;
        for (isize i = 0; i < old_capacity; ++i)
        {
            auto& src = old_slots[i];
            if (!src.occupied)
                continue;

            auto idx = bucket_of(src.key.value);
            while (_slots[idx].occupied)
                idx = (idx + 1) & mask;

            move_slot(src, _slots[idx]);
        }

        deallocate_slots(old_slots, old_capacity);
    }

    // moves an occupied slot into a free one, src becomes free
    static void move_slot(slot& src, slot& dst) noexcept
    {
        new (tmap::placement_new, &dst.key.value) K(tmap::move(src.key.value));
        new (tmap::placement_new, &dst.value.value) V(tmap::move(src.value.value));
        dst.occupied = true;
        destroy_slot(src);
    }

    static void destroy_slot(slot& s) noexcept
    {
        TMAP_ASSERT(s.occupied, "slot is not occupied");
        s.value.value.~V();
        s.key.value.~K();
        s.occupied = false;
    }

    // replaces _slots with a fresh table of free slots, does not touch the old one
    void allocate_slots(isize capacity)
    {
        auto const resource = tmap::resource_or_default(_resource);
        auto const bytes = resource->allocate_bytes(capacity * isize(sizeof(slot)), isize(alignof(slot)), resource->userdata);

        _slots = reinterpret_cast<slot*>(bytes); // NOLINT
        for (isize i = 0; i < capacity; ++i)
            new (tmap::placement_new, &_slots[i]) slot();
        _capacity = capacity;
    }

    void deallocate_slots(slot* slots, isize capacity)
    {
        if (slots == nullptr)
            return;

        auto const resource = tmap::resource_or_default(_resource);
        resource->deallocate_bytes(reinterpret_cast<tmap::byte*>(slots), capacity * isize(sizeof(slot)), // NOLINT
                                   isize(alignof(slot)), resource->userdata);
    }

    void destroy_and_deallocate()
    {
        clear();
        deallocate_slots(_slots, _capacity);
        _slots = nullptr;
        _capacity = 0;
    }

    // members
private:
    slot* _slots = nullptr;
    isize _capacity = 0;
    isize _size = 0;
    memory_resource const* _resource = nullptr;
};
