#include "assert.hh"

#include <ordo/assert-handler.hh>

#include <cstdlib>
#include <iostream>
#include <vector>

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(ordo::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(ordo::impl::assertion_info const& info)
{
    std::cerr << "ordo assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
    std::cerr.flush();
}
} // namespace

void ordo::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ordo::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

int ordo::impl::assertion_handler_count()
{
    return int(g_assertion_handlers.size());
}

ordo::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

ordo::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

ORDO_COLD_FUNC void ordo::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

[[noreturn]] void ordo::impl::perform_abort() noexcept
{
    std::abort();
}
