#pragma once

#include <circular-array/assert.hh>

#include <format>

// CA_ASSERTF(cond, fmt, args...)
//
// CA_ASSERT with a std::format message. The arguments are only formatted on failure.
//
//   CA_ASSERTF(i < size(), "index {} out of bounds (size: {})", i, size());
#define CA_ASSERTF(cond, fmt, ...) CA_IMPL_ASSERTF(cond, fmt __VA_OPT__(, ) __VA_ARGS__)

// CA_ASSERTF_ALWAYS(cond, fmt, args...)
//
// CA_ASSERTF that stays active in release builds.
#define CA_ASSERTF_ALWAYS(cond, fmt, ...) CA_IMPL_ASSERTF_ALWAYS(cond, fmt __VA_OPT__(, ) __VA_ARGS__)


#define CA_IMPL_ASSERTF_ALWAYS(cond, fmt, ...)                                     \
    do                                                                             \
    {                                                                              \
        if (!(cond)) [[unlikely]]                                                  \
            CA_IMPL_FAIL(#cond, std::format(fmt __VA_OPT__(, ) __VA_ARGS__).c_str()); \
    } while (false)

#if CA_ASSERT_ENABLED
#define CA_IMPL_ASSERTF(cond, fmt, ...) CA_IMPL_ASSERTF_ALWAYS(cond, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
// the format string is still checked against the arguments
#define CA_IMPL_ASSERTF(cond, fmt, ...)                         \
    do                                                          \
    {                                                           \
        CA_UNUSED(cond);                                        \
        CA_UNUSED(std::format(fmt __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)
#endif
