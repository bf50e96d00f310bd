#pragma once

#include <ordo/fwd.hh>

#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

/// Controls how much text ordo::render produces.
/// The defaults render everything; diagnostics (e.g. key_not_found_error) pass a bounded config.
struct ordo::render_config
{
    /// Collections stop appending elements once the output reaches this many characters and end with ", ...".
    /// Values <= 0 mean unbounded.
    isize max_length = 0;
};

namespace ordo
{
// Renders a key, a value or a whole container as deterministic text.
//
// The output is diagnostic text in the shape of a C++ initializer, e.g. ordo::ordered_map{{"a", 1}, {"b", 2}}.
// It is not parsed back: to rebuild a map, pass m.to_pairs() to create_from().
//
// Dispatch (in order):
//   - string-likes: double-quoted with C escape sequences
//   - char: single-quoted with C escape sequences
//   - bool, integers, floating point: their literal spelling
//   - std::nullopt / std::optional: "std::nullopt" or the rendered value
//   - v.to_string() if available
//   - ordered maps: "ordo::ordered_map" followed by the braced entry list
//   - other ranges: braced element list {e0, e1, ...}
//   - tuple-likes (including pairs): braced element list {a, b}
//   - anything else: hex dump of the object representation
template <class T>
[[nodiscard]] std::string render(T const& v, render_config const& cfg = {});

//
// Implementation
//

namespace impl
{
[[nodiscard]] std::string render_quoted(std::string_view s, char quote);
[[nodiscard]] std::string render_scalar(bool b);
[[nodiscard]] std::string render_scalar(char c);
[[nodiscard]] std::string render_scalar(signed char i);
[[nodiscard]] std::string render_scalar(unsigned char i);
[[nodiscard]] std::string render_scalar(signed short i);
[[nodiscard]] std::string render_scalar(unsigned short i);
[[nodiscard]] std::string render_scalar(signed int i);
[[nodiscard]] std::string render_scalar(unsigned int i);
[[nodiscard]] std::string render_scalar(signed long i);
[[nodiscard]] std::string render_scalar(unsigned long i);
[[nodiscard]] std::string render_scalar(signed long long i);
[[nodiscard]] std::string render_scalar(unsigned long long i);
[[nodiscard]] std::string render_scalar(float f);
[[nodiscard]] std::string render_scalar(double f);
[[nodiscard]] std::string render_scalar(long double f);
[[nodiscard]] std::string render_bytes(void const* p, isize size, isize align);

template <class T>
struct is_std_optional : std::false_type
{
};
template <class T>
struct is_std_optional<std::optional<T>> : std::true_type
{
};

// returns false once the output is full and the caller should stop
template <class T>
bool render_append_elem(std::string& s, T const& v, render_config const& cfg)
{
    if (cfg.max_length > 0 && isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 0 && s.back() != '{')
        s += ", ";

    s += ordo::render(v, cfg);
    return true;
}

template <class T, std::size_t... I>
void render_append_tuple(std::string& s, T const& v, render_config const& cfg, std::index_sequence<I...>)
{
    (void)(ordo::impl::render_append_elem(s, std::get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string render(T const& v, render_config const& cfg)
{
    if constexpr (std::is_same_v<T, char>)
    {
        return impl::render_quoted(std::string_view(&v, 1), '\'');
    }
    else if constexpr (std::is_convertible_v<T const&, std::string_view>)
    {
        return impl::render_quoted(std::string_view(v), '"');
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return impl::render_scalar(v);
    }
    else if constexpr (std::is_same_v<T, std::nullopt_t>)
    {
        return "std::nullopt";
    }
    else if constexpr (impl::is_std_optional<T>::value)
    {
        if (!v.has_value())
            return "std::nullopt";
        return ordo::render(*v, cfg);
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
        auto s = std::string();
        if constexpr (requires { T::is_ordered_map; })
            s += "ordo::ordered_map";
        s += "{";
        for (auto const& e : v)
            if (!impl::render_append_elem(s, e, cfg))
                break;
        s += "}";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("{");
        impl::render_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += "}";
        return s;
    }
    else
    {
        return impl::render_bytes(&v, isize(sizeof(T)), isize(alignof(T)));
    }
}
} // namespace ordo
