#pragma once

#include <circular-array/fwd.hh>
#include <circular-array/result.hh>

#include <string>

namespace ca
{
enum class circular_array_error_kind
{
    // a capacity below 1 was requested
    invalid_capacity,
    // a logical index outside [0, size()) was used for a checked access
    index_out_of_range,
};

[[nodiscard]] char const* to_string(circular_array_error_kind kind);

/// Validates a capacity computed at runtime before it is used to pick a circular_array<T, N>.
/// Returns the capacity unchanged if it is at least 1, otherwise an invalid_capacity error.
/// circular_array itself rejects N < 1 at compile time.
[[nodiscard]] result<isize, circular_array_error> check_capacity(isize capacity);
} // namespace ca

/// Expected failure of a checked circular_array operation.
/// For index_out_of_range, index is the rejected logical index and size the number of live elements.
/// For invalid_capacity, index is the rejected capacity and size is 0.
struct ca::circular_array_error
{
    circular_array_error_kind kind = circular_array_error_kind::index_out_of_range;
    isize index = 0;
    isize size = 0;

    /// e.g. "index_out_of_range: logical index 5 not in [0, 3)"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(circular_array_error const&, circular_array_error const&) = default;
};
