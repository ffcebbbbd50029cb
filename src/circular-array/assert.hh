#pragma once

#include <circular-array/macros.hh>

#include <source_location>

// CA_ASSERT(cond, msg)
//
// Checks a precondition or invariant, e.g. that a logical index refers to a live element.
// On failure the active assertion handler receives the expression, msg and call site,
// then the process breaks into an attached debugger and aborts.
// Compiled out (but still type-checked) when CA_ASSERT_ENABLED is 0.
//
// Expected failures are not assertions: they are reported through ca::result,
// see circular_array::replace.
//
//   CA_ASSERT(!is_exhausted(), "dereferencing an exhausted iterator");
//
// Formatted messages: CA_ASSERTF in <circular-array/assertf.hh>.
#define CA_ASSERT(cond, msg) CA_IMPL_ASSERT(cond, msg)

// CA_ASSERT_ALWAYS(cond, msg)
//
// Same as CA_ASSERT, but active in every build configuration.
#define CA_ASSERT_ALWAYS(cond, msg) CA_IMPL_ASSERT_ALWAYS(cond, msg)


namespace ca::impl
{
/// Reports a failed assertion to the topmost handler (see assert-handler.hh).
/// Returns normally unless the handler throws; the macro aborts afterwards.
CA_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

[[nodiscard]] bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace ca::impl

// breaking must happen inside the macro so the debugger stops at the failing line
#if defined(CA_COMPILER_MSVC)
#define CA_IMPL_DEBUG_BREAK() (::ca::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// 5 == SIGTRAP, declared here to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define CA_IMPL_DEBUG_BREAK() (::ca::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

#define CA_IMPL_FAIL(expr_str, msg)                                                     \
    (::ca::impl::handle_assert_failure(expr_str, msg, std::source_location::current()), \
     CA_IMPL_DEBUG_BREAK(), ::ca::impl::perform_abort())

#define CA_IMPL_ASSERT_ALWAYS(cond, msg) \
    do                                   \
    {                                    \
        if (!(cond)) [[unlikely]]        \
            CA_IMPL_FAIL(#cond, msg);    \
    } while (false)

#if CA_ASSERT_ENABLED
#define CA_IMPL_ASSERT(cond, msg) CA_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define CA_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        CA_UNUSED(cond);          \
        CA_UNUSED(msg);           \
    } while (false)
#endif
