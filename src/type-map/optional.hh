#pragma once

#include <type-map/assert.hh>
#include <type-map/fwd.hh>
#include <type-map/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as tmap::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct tmap::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace tmap
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
/// Usage: optional<int> opt = nullopt; or if (opt == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace tmap

/// Sum type representing either a value of type T or no value (T | none), similar to std::optional.
/// This is the result type of every lookup in the library: "absent" is a normal outcome, never an error.
/// Provides a safer subset of std::optional's API: no operator* or operator-> to avoid misuse.
/// Equality comparison available; other relational operators deliberately omitted.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
/// optional<T&> is a separate specialization (see below).
template <class T>
struct tmap::optional
{
    static_assert(!std::is_void_v<T>, "optional<void> is not supported");
    static_assert(!std::is_array_v<T>, "optional of arrays is not supported");

    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    /// Forwarding constructor: perfect-forwards the value into internal storage.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (tmap::placement_new, &_storage.value) T(tmap::forward<U>(value));
    }

    /// Constructs an empty optional from tmap::nullopt; allows explicit empty initialization.
    optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy - custom implementation when T requires special handling
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    /// After this operation, rhs.has_value() == false; avoids double-destruction.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (tmap::placement_new, &_storage.value) T(tmap::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    /// Copy constructor for non-trivial T: copy-constructs value when rhs holds one.
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (tmap::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move assignment for non-trivial T: moves or constructs from rhs, handling all state combinations.
    /// Like the move constructor, rhs is empty afterwards. Self-move is a no-op.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = tmap::move(rhs._storage.value);
            else
                new (tmap::placement_new, &_storage.value) T(tmap::move(rhs._storage.value));

            _has_value = true;
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    /// Copy assignment for non-trivial T: copies or constructs from rhs, handling all state combinations.
    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (tmap::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns a reference to the held value, preserving the value category of the optional itself.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        TMAP_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        TMAP_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        TMAP_ASSERT(_has_value, "attempted to access value of empty optional");
        return tmap::move(_storage.value);
    }

    /// Returns the held value or the provided fallback when empty.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(tmap::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? tmap::move(_storage.value) : static_cast<T>(tmap::forward<U>(fallback));
    }

    // comparison
public:
    /// Two optionals are equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An optional is equal to a value if it holds an equal value.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted when T is not bool to prevent optional<int> from comparing with true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    /// Uninitialized storage with proper size and alignment for T.
    tmap::storage_for<T> _storage;

    /// True when _storage.value holds a live T object.
    bool _has_value = false;
};

/// Optional reference: either refers to an existing T or to nothing.
/// This is what lookups return (optional<V const&> from get, optional<V&> from get_mut).
/// Never rebinds through assignment of a T; assigning another optional<T&> copies the reference itself.
/// The referred-to object is not owned: the optional is invalidated together with its referent.
/// Comparison compares the referred-to values, not the addresses.
template <class T>
struct tmap::optional<T&>
{
    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    /// Refers to the given object.
    /// Binding to temporaries is rejected to avoid dangling references.
    constexpr optional(T& ref) : _ptr(&ref) {} // NOLINT
    optional(std::remove_const_t<T>&&) = delete;

    /// optional<U&> converts to optional<U const&>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _ptr != nullptr; }

    /// Returns the referred-to object.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() const
    {
        TMAP_ASSERT(_ptr != nullptr, "attempted to access value of empty optional");
        return *_ptr;
    }

    /// Returns the address of the referred-to object, nullptr if empty.
    [[nodiscard]] T* value_or_null() const { return _ptr; }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        if (lhs.has_value())
            return *lhs._ptr == *rhs._ptr;
        return true;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_const_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_const_t<T>, bool>)
    = delete;

    // members
private:
    T* _ptr = nullptr;
};
