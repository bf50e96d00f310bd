#pragma once

#include <ordo/fwd.hh>

#include <stdexcept>
#include <string>

/// Thrown by the checked operations (update_existing, at, update_in) when the requested key is absent.
/// Carries the rendered key and a bounded rendering of the map at the time of the failure.
/// The map itself is never modified by a failing checked operation.
struct ordo::key_not_found_error : std::out_of_range
{
    key_not_found_error(std::string rendered_key, std::string rendered_container);

    /// The missing key, rendered with ordo::render (e.g. "\"c\"" or "42").
    [[nodiscard]] std::string const& key() const noexcept { return _key; }

    /// The map the key was looked up in, e.g. ordo::ordered_map{{"a", 1}, {"b", 2}}.
    [[nodiscard]] std::string const& container() const noexcept { return _container; }

private:
    std::string _key;
    std::string _container;
};

namespace ordo
{
/// Rendering budget for the container snapshot stored in a key_not_found_error.
inline constexpr isize error_render_max_length = 256;
} // namespace ordo
