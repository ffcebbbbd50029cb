#pragma once

#include <circular-array/assertf.hh>
#include <circular-array/fwd.hh>

/// N elements of T stored inline, an aggregate like std::array:
///   auto arr = ca::fixed_array<int, 3>{1, 2, 3};
/// Indices are isize and bounds-checked with CA_ASSERTF.
///
/// Slot storage of circular_array, and the snapshot type returned by circular_array::to_array().
template <class T, ca::isize N>
struct ca::fixed_array
{
    static_assert(N > 0, "fixed_array needs at least one element");

    // public so that aggregate initialization works
    T _data[N];

    [[nodiscard]] constexpr T& operator[](isize i)
    {
        CA_ASSERTF(0 <= i && i < N, "index {} out of bounds (size: {})", i, N);
        return _data[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        CA_ASSERTF(0 <= i && i < N, "index {} out of bounds (size: {})", i, N);
        return _data[i];
    }

    [[nodiscard]] constexpr T& front() { return _data[0]; }
    [[nodiscard]] constexpr T const& front() const { return _data[0]; }
    [[nodiscard]] constexpr T& back() { return _data[N - 1]; }
    [[nodiscard]] constexpr T const& back() const { return _data[N - 1]; }

    [[nodiscard]] constexpr T* begin() { return _data; }
    [[nodiscard]] constexpr T* end() { return _data + N; }
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T const* end() const { return _data + N; }

    [[nodiscard]] static constexpr isize size() { return N; }

    [[nodiscard]] friend constexpr bool operator==(fixed_array const& lhs, fixed_array const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        for (isize i = 0; i < N; ++i)
            if (!(lhs._data[i] == rhs._data[i]))
                return false;
        return true;
    }
};
