#pragma once

#include <circular-array/fwd.hh>

#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace ca
{
struct debug_string_config
{
    // soft limit: ranges stop adding elements once the output is this long
    isize max_length = 100;
};

/// Human-readable rendering of v for diagnostics and test output.
/// The format is not stable and must not be parsed.
///
///   "abc"          string-likes, quoted
///   'x' / '\n'     char, escaped
///   42 / true      arithmetic via std::format
///   to_string(v)   found by ADL, e.g. ca::circular_array_error_kind
///   v.to_string()  e.g. ca::circular_array, ca::circular_array_error
///   [a, b, ...]    anything iterable, elements rendered recursively
///
/// Other types do not compile.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});
} // namespace ca

namespace ca::impl
{
inline void append_escaped_char(std::string& s, char c)
{
    switch (c)
    {
    case '\0': s += "\\0"; return;
    case '\n': s += "\\n"; return;
    case '\r': s += "\\r"; return;
    case '\t': s += "\\t"; return;
    case '\\': s += "\\\\"; return;
    case '\'': s += "\\'"; return;
    default: break;
    }

    if ((c >= 0 && c < 32) || c == 127)
        s += std::format("\\x{:02X}", static_cast<unsigned char>(c));
    else
        s += c;
}
} // namespace ca::impl

template <class T>
std::string ca::to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (std::is_convertible_v<T const&, std::string_view>)
    {
        return std::format("\"{}\"", std::string_view(v));
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");
        ca::impl::append_escaped_char(s, v);
        s += '\'';
        return s;
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::format("{}", v);
    }
    else if constexpr (requires { std::string(to_string(v)); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { std::string(v.to_string()); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires { std::ranges::begin(v); std::ranges::end(v); })
    {
        auto s = std::string("[");
        auto first = true;
        for (auto const& e : v)
        {
            if (!first)
                s += ", ";
            if (isize(s.size()) >= cfg.max_length)
            {
                s += "...";
                break;
            }
            s += ca::to_debug_string(e, cfg);
            first = false;
        }
        s += ']';
        return s;
    }
    else
    {
        static_assert(sizeof(T) == 0, "no debug rendering for this type");
        return {};
    }
}
