#pragma once

#include <stable-vec/macros.hh>
#include <stable-vec/source_location.hh>

#include <functional>
#include <string>

namespace sv::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = sv::impl::scoped_assertion_handler([](sv::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw stale_index_error{info.message};
//       });
//
//       // a lookup through a removed jailed_index now throws instead of aborting
//       use_jailed_container();
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    sv::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers are allowed to throw to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// prefer scoped_assertion_handler, which also pops when unwinding
void pop_assertion_handler();

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
} // namespace sv::impl
