#pragma once

#include <stable-vec/fwd.hh>
#include <stable-vec/optional.hh>
#include <stable-vec/stable_vector.hh>

#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for tuple_size

namespace sv
{
struct debug_string_config
{
    // soft limit, the element that crosses it is still printed
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort and intended only for diagnostics (assertion messages, test output).
//
// Strategy (in order):
//   - stable_vector: slots in order as [v0, _, v2] where _ marks an empty slot
//   - optional: the value, or "nullopt"
//   - String-likes: wrapped in double quotes "..."
//   - char: wrapped in single quotes, control characters escaped
//   - Use to_string(v) if available
//   - Use v.to_string() if available
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Use std::format("{}", v) if available
//   - Otherwise emit raw memory dump
//
// Output may change, be lossy, or depend on build/configuration.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
template <class T>
struct is_stable_vector : std::false_type
{
};
template <class T>
struct is_stable_vector<stable_vector<T>> : std::true_type
{
};

template <class T>
struct is_optional : std::false_type
{
};
template <class T>
struct is_optional<optional<T>> : std::true_type
{
};

// returns false if the length limit was hit
inline bool to_debug_string_begin_elem(std::string& s, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    return true;
}

template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (!to_debug_string_begin_elem(s, cfg))
        return false;

    s += sv::to_debug_string(v, cfg);
    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(impl::to_debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (impl::is_stable_vector<T>::value)
    {
        auto s = std::string("[");
        for (isize i = 0; i < v.next_index(); ++i)
        {
            if (!impl::to_debug_string_begin_elem(s, cfg))
                break;

            if (auto const* e = v.get(i))
                s += sv::to_debug_string(*e, cfg);
            else
                s += '_';
        }
        s += ']';
        return s;
    }
    else if constexpr (impl::is_optional<T>::value)
    {
        if (!v.has_value())
            return "nullopt";
        return sv::to_debug_string(v.value(), cfg);
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
        else if (v < 32 || v == 127) // other control characters
            s += std::format("\\x{:02X}", static_cast<unsigned char>(v));
        else
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
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
        {
            if (!impl::to_debug_string_begin_elem(s, cfg))
                break;
            s += sv::to_debug_string(e, cfg);
        }
        s += ']';
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ')';
        return s;
    }
    else if constexpr (std::is_default_constructible_v<std::formatter<T, char>>)
    {
        return std::format("{}", v);
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += '_';
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}
} // namespace sv
