#pragma once

#include <circular-array/assert.hh>
#include <circular-array/fwd.hh>

#include <new>

namespace ca
{
//
// value categories
//

/// static_cast to T&&, without pulling in <utility>
template <class T>
[[nodiscard]] constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Assigns new_val to obj and returns what obj held before.
template <class T, class U = T>
[[nodiscard]] constexpr T exchange(T& obj, U&& new_val)
{
    T old_val = ca::move(obj);
    obj = ca::forward<U>(new_val);
    return old_val;
}

//
// ring arithmetic
//

/// (pos + 1) % max without a division, for pos in [0, max).
///   wrapped_increment(1, 3) == 2
///   wrapped_increment(2, 3) == 0
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T max)
{
    CA_ASSERT(0 <= pos && pos < max, "position must be in [0, max)");
    ++pos;
    return pos == max ? T(0) : pos;
}

/// (pos + max - 1) % max without a division, for pos in [0, max).
///   wrapped_decrement(1, 3) == 0
///   wrapped_decrement(0, 3) == 2
template <class T>
[[nodiscard]] constexpr T wrapped_decrement(T pos, T max)
{
    CA_ASSERT(0 <= pos && pos < max, "position must be in [0, max)");
    return pos == 0 ? max - 1 : pos - 1;
}

//
// raw storage
//

/// Selects ca's placement new below: new (ca::placement_new, ptr) T(...)
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

//
// ranges
//

/// End marker for ranges whose iterators know when they are done.
/// Iterators compare equal to it once exhausted.
struct sentinel
{
};
} // namespace ca

[[nodiscard]] inline void* operator new(std::size_t, ca::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
inline void operator delete(void*, ca::placement_new_t, void*) noexcept {}
