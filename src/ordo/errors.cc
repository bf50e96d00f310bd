#include "errors.hh"

#include <utility>

namespace
{
std::string make_message(std::string const& key, std::string const& container)
{
    auto msg = std::string("key ");
    msg += key;
    msg += " not found in: ";
    msg += container;
    return msg;
}
} // namespace

ordo::key_not_found_error::key_not_found_error(std::string rendered_key, std::string rendered_container)
  : std::out_of_range(make_message(rendered_key, rendered_container)),
    _key(std::move(rendered_key)),
    _container(std::move(rendered_container))
{
}
