#pragma once

#include <cstddef>
#include <cstdint>


namespace ca
{
//
// Primitives
//

using i64 = std::int64_t;

// Sizes, indices and the push counter are signed:
// logical index -1 is simply out of range, and "x - 1" near zero needs no care.
using isize = i64;

//
// Vocabulary
//

struct nullopt_t;
template <class T>
struct optional; // only optional<T&> is defined

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

//
// Containers
//

template <class T, isize N>
struct fixed_array;

template <class T, isize N>
struct circular_array;
template <class T, isize N>
struct circular_array_iterator;

struct circular_array_error;
} // namespace ca
