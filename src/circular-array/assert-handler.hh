#pragma once

#include <functional>
#include <source_location>
#include <string>

namespace ca::impl
{
/// Everything a handler learns about a failed assertion.
struct assertion_info
{
    std::string expression; ///< stringified condition, e.g. "0 <= i && i < size()"
    std::string message;    ///< already formatted
    std::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Handlers form a stack, only the topmost one is called.
/// Without any handler, failures are printed to stderr together with a stacktrace.
/// A handler may throw to unwind out of the failing call (tests do this),
/// if it returns the process is aborted.
/// The stack is global and not synchronized.
void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

/// Installs a handler for the lifetime of this object.
///
///   auto guard = ca::impl::scoped_assertion_handler([](ca::impl::assertion_info const& info) {
///       throw my_failure{info.message};
///   });
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(std::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ca::impl
