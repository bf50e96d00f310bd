#pragma once

#include <ordo/macros.hh>

#include <functional>
#include <source_location>
#include <string>

namespace ordo::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example (turning a violated precondition into an exception in a test):
//   {
//       auto handler = ordo::impl::scoped_assertion_handler([](ordo::impl::assertion_info const& info) {
//           throw std::logic_error(info.message);
//       });
//
//       map.slice(0, 3, 0); // step must be positive
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    std::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
void pop_assertion_handler();

// Number of handlers currently installed
[[nodiscard]] int assertion_handler_count();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ordo::impl
