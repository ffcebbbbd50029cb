#include "assert.hh"

#include <circular-array/assert-handler.hh>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stacktrace>
#include <string>
#include <vector>

#ifdef CA_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<ca::impl::assertion_handler>& handler_stack()
{
    static std::vector<ca::impl::assertion_handler> handlers;
    return handlers;
}

void print_to_stderr(ca::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "assertion failed: " << info.expression << '\n'
              << "  message:  " << info.message << '\n'
              << "  location: " << loc.file_name() << ':' << loc.line() << ':' << loc.column() << " ("
              << loc.function_name() << ")\n"
              << "stacktrace:\n"
              << std::stacktrace::current(1) << std::endl;
}
} // namespace

void ca::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void ca::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

void ca::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info);
}

bool ca::impl::is_debugger_connected() noexcept
{
#if defined(CA_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(CA_OS_LINUX)
    // "TracerPid:\t<pid>" is non-zero while ptrace'd
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
        if (line.starts_with("TracerPid:"))
            return std::strtol(line.c_str() + 10, nullptr, 10) != 0;
    return false;
#else
    return false;
#endif
}

void ca::impl::perform_abort() noexcept
{
    std::abort();
}
