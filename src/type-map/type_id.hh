#pragma once

#include <type-map/fwd.hh>
#include <type-map/macros.hh>

#include <string_view>

namespace tmap
{
namespace impl
{
struct type_id_anchor
{
    // non-empty so that distinct anchors can never share an address
    char unused = 0;
};

// one distinct object per type T
// inline variables are merged across translation units, so &type_id_anchor_for<T> is program-wide unique
// mutable so that identical-data folding in the linker cannot merge the anchors of different types
template <class T>
inline type_id_anchor type_id_anchor_for = {};
} // namespace impl

/// Returns the runtime identity of T.
/// Equal for equal types, distinct for distinct types, the same value on every call.
/// Does not require RTTI and works for incomplete types (only the type itself is named, never inspected).
/// cv-qualifiers and references are part of the identity: type_id_of<int>() != type_id_of<int const>().
template <class T>
[[nodiscard]] constexpr type_id type_id_of();

/// Returns a best-effort human-readable name of T, e.g. "my_ns::Age".
/// Derived from the compiler's pretty function signature: intended for diagnostics only,
/// the exact spelling is compiler dependent and not stable.
template <class T>
[[nodiscard]] constexpr std::string_view type_name_of();
} // namespace tmap

/// Runtime identity of a type.
/// Only supports equality comparison and hashing; there is no ordering.
/// Trivially copyable, pointer sized.
/// A default constructed type_id is "no type" and compares unequal to every type_id_of<T>().
struct tmap::type_id
{
public:
    constexpr type_id() = default;

    [[nodiscard]] constexpr bool is_valid() const { return _anchor != nullptr; }

    /// A value suitable for hashing; not stable across runs.
    [[nodiscard]] u64 hash_value() const { return u64(reinterpret_cast<uintptr_t>(_anchor)); } // NOLINT

    [[nodiscard]] friend constexpr bool operator==(type_id const&, type_id const&) = default;

private:
    explicit constexpr type_id(impl::type_id_anchor const* anchor) : _anchor(anchor) {}

    template <class T>
    friend constexpr type_id tmap::type_id_of();

    impl::type_id_anchor const* _anchor = nullptr;
};

template <class T>
constexpr tmap::type_id tmap::type_id_of()
{
    return type_id(&impl::type_id_anchor_for<T>);
}

namespace tmap::impl
{
template <class T>
constexpr std::string_view pretty_function_for()
{
    return TMAP_PRETTY_FUNC;
}

// locates the "T" inside the pretty function of pretty_function_for<T> by looking at pretty_function_for<double>:
// its spelling is the same on every compiler and does not occur anywhere else in the signature
constexpr std::string_view type_name_marker = "double";

constexpr isize type_name_prefix_size()
{
    auto const marked = pretty_function_for<double>();
    auto const pos = marked.find(type_name_marker);
    return pos == std::string_view::npos ? -1 : isize(pos);
}

constexpr isize type_name_suffix_size()
{
    auto const marked = pretty_function_for<double>();
    return isize(marked.size()) - type_name_prefix_size() - isize(type_name_marker.size());
}

static_assert(type_name_prefix_size() >= 0, "cannot locate the type inside TMAP_PRETTY_FUNC");
static_assert(type_name_suffix_size() >= 0, "cannot locate the type inside TMAP_PRETTY_FUNC");
} // namespace tmap::impl

template <class T>
constexpr std::string_view tmap::type_name_of()
{
    auto name = impl::pretty_function_for<T>();
    name.remove_prefix(size_t(impl::type_name_prefix_size()));
    name.remove_suffix(size_t(impl::type_name_suffix_size()));
    return name;
}
