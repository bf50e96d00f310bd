#pragma once

#include <ordo/errors.hh>
#include <ordo/fwd.hh>
#include <ordo/macros.hh>
#include <ordo/render.hh>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

// Key path access
//
// Containers that implement the three access primitives
//   - try_get(key)             pointer to the value or nullptr ("not found" is not "empty value")
//   - get_and_update(key, fn)  single-step read-modify-write, fn may drop the key
//   - pop(key)                 removal returning the old value
// model ordo::key_accessible. The helpers below walk chains of keys through nested containers:
//
//     auto m = ordo::ordered_map<std::string, ordo::ordered_map<std::string, int>>();
//     ordo::put_in(m, 1, "config", "retries");              // inserts "config" on the way
//     ordo::update_in(m, [](int v) { return v + 1; }, "config", "retries");
//     int const* retries = ordo::get_in(m, "config", "retries");
//
// Writing to a missing key appends it at the tail of its container, exactly like put().

namespace ordo
{
template <class M>
concept key_accessible = requires(M& m, M const& cm, typename M::key_type const& key) {
    typename M::mapped_type;
    { cm.try_get(key) } -> std::same_as<typename M::mapped_type const*>;
    { m.try_get(key) } -> std::same_as<typename M::mapped_type*>;
    { m.pop(key) } -> std::same_as<std::optional<typename M::mapped_type>>;
    {
        m.get_and_update(key,
                         std::declval<std::optional<typename M::mapped_type> (*)(typename M::mapped_type const*)>())
    } -> std::same_as<std::optional<typename M::mapped_type>>;
};

namespace impl
{
// mapped type reached after walking Depth levels of nested containers
template <class M, std::size_t Depth>
struct nested_mapped
{
    using type = typename nested_mapped<typename M::mapped_type, Depth - 1>::type;
};
template <class M>
struct nested_mapped<M, 1>
{
    using type = typename M::mapped_type;
};
template <class M, std::size_t Depth>
using nested_mapped_t = typename nested_mapped<M, Depth>::type;

template <class M, class Key>
[[noreturn]] ORDO_COLD_FUNC void throw_key_not_found(M const& m, Key const& key)
{
    throw key_not_found_error(ordo::render(typename M::key_type(key)),
                              ordo::render(m, render_config{.max_length = error_render_max_length}));
}
} // namespace impl

/// Copy of the value under key, std::nullopt if absent.
template <key_accessible M>
[[nodiscard]] std::optional<typename M::mapped_type> fetch(M const& m, typename M::key_type const& key)
{
    if (auto const* v = m.try_get(key))
        return *v;
    return std::nullopt;
}

/// Pointer to the value at the end of a key path, nullptr if any key along the way is missing.
template <key_accessible M, class Key, class... Rest>
[[nodiscard]] impl::nested_mapped_t<M, 1 + sizeof...(Rest)> const* get_in(M const& m, Key const& key, Rest const&... rest)
{
    auto const* inner = m.try_get(key);
    if constexpr (sizeof...(Rest) == 0)
    {
        return inner;
    }
    else
    {
        if (inner == nullptr)
            return nullptr;
        return ordo::get_in(*inner, rest...);
    }
}

/// Stores value at the end of a key path.
/// Missing intermediate keys are appended to their container with an empty nested container.
template <key_accessible M, class T, class Key, class... Rest>
void put_in(M& m, T&& value, Key const& key, Rest const&... rest)
{
    using mapped = typename M::mapped_type;

    if constexpr (sizeof...(Rest) == 0)
    {
        m.get_and_update(key, [&](mapped const*) { return std::optional<mapped>(std::forward<T>(value)); });
    }
    else
    {
        auto* inner = m.try_get(key);
        if (inner == nullptr)
        {
            m.get_and_update(key, [](mapped const*) { return std::optional<mapped>(mapped()); });
            inner = m.try_get(key);
        }
        ordo::put_in(*inner, std::forward<T>(value), rest...);
    }
}

/// Replaces the value at the end of a key path with fn(current value).
/// Throws ordo::key_not_found_error if any key along the way is missing; nothing is modified then.
template <key_accessible M, class F, class Key, class... Rest>
void update_in(M& m, F&& fn, Key const& key, Rest const&... rest)
{
    auto* inner = m.try_get(key);
    if (inner == nullptr)
        impl::throw_key_not_found(m, key);

    if constexpr (sizeof...(Rest) == 0)
    {
        typename M::mapped_type next = std::invoke(std::forward<F>(fn), std::as_const(*inner));
        *inner = std::move(next);
    }
    else
    {
        ordo::update_in(*inner, std::forward<F>(fn), rest...);
    }
}

/// Removes the key at the end of a key path and returns its value.
/// Returns std::nullopt if any key along the way is missing.
template <key_accessible M, class Key, class... Rest>
std::optional<impl::nested_mapped_t<M, 1 + sizeof...(Rest)>> pop_in(M& m, Key const& key, Rest const&... rest)
{
    if constexpr (sizeof...(Rest) == 0)
    {
        return m.pop(key);
    }
    else
    {
        auto* inner = m.try_get(key);
        if (inner == nullptr)
            return std::nullopt;
        return ordo::pop_in(*inner, rest...);
    }
}
} // namespace ordo
