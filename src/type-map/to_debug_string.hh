#pragma once

#include <type-map/fwd.hh>
#include <type-map/optional.hh>

#include <charconv>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for tuple_size

namespace tmap
{
struct debug_string_config
{
    // not strict, collections stop appending once this is exceeded
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics (e.g. printing a tmap::debug_type_map).
//
// Strategy (in order):
//   - v.to_debug_string() if available (boxes and debug type maps render themselves)
//   - String-likes: wrap in double quotes "..." (never empty output)
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - bool: true / false
//   - arithmetic: shortest round-trip decimal representation
//   - optionals: the value, or "nullopt"
//   - Use to_string(v) if available (ADL)
//   - Use v.to_string() if available
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit raw memory dump as 0x... hex bytes
//
// No stability, completeness, or user-facing guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
inline void append_hex_byte(std::string& s, unsigned char b)
{
    constexpr char digits[] = "0123456789ABCDEF";
    s += digits[b >> 4];
    s += digits[b & 0xF];
}

template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += tmap::to_debug_string(v, cfg);

    return true;
}
template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    (void)(tmap::impl::to_debug_string_append_elem(s, get<I>(v), cfg) && ...);
}

template <class T>
struct is_optional : std::false_type
{
};
template <class T>
struct is_optional<tmap::optional<T>> : std::true_type
{
};
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string(v.to_debug_string()); })
    {
        return std::string(v.to_debug_string());
    }
    else if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        // Escape control and non-printable characters
        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if (v < 32 || v == 127) // Other control characters
        {
            s += "\\x";
            impl::append_hex_byte(s, static_cast<unsigned char>(v));
        }
        else // Printable characters (including space)
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        char buffer[64];
        auto const result = std::to_chars(buffer, buffer + sizeof(buffer), v);
        TMAP_ASSERT(result.ec == std::errc(), "64 chars are enough for every arithmetic type");
        return std::string(buffer, result.ptr);
    }
    else if constexpr (impl::is_optional<T>::value)
    {
        if (!v.has_value())
            return "nullopt";
        return tmap::to_debug_string(v.value(), cfg);
    }
    else if constexpr (requires { std::string(to_string(v)); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { std::string(v.to_string()); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v); // NOLINT
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            impl::append_hex_byte(s, p_v[i]);
        }
        return s;
    }
}
} // namespace tmap
