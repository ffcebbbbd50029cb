#include "circular_array_error.hh"

#include <format>

char const* ca::to_string(circular_array_error_kind kind)
{
    switch (kind)
    {
    case circular_array_error_kind::invalid_capacity:
        return "invalid_capacity";
    case circular_array_error_kind::index_out_of_range:
        return "index_out_of_range";
    }
    return "<unknown circular_array_error_kind>";
}

ca::result<ca::isize, ca::circular_array_error> ca::check_capacity(isize capacity)
{
    if (capacity < 1)
        return ca::error(circular_array_error{
            .kind = circular_array_error_kind::invalid_capacity,
            .index = capacity,
            .size = 0,
        });

    return capacity;
}

std::string ca::circular_array_error::to_string() const
{
    switch (kind)
    {
    case circular_array_error_kind::invalid_capacity:
        return std::format("invalid_capacity: capacity must be at least 1, got {}", index);
    case circular_array_error_kind::index_out_of_range:
        return std::format("index_out_of_range: logical index {} not in [0, {})", index, size);
    }
    return std::format("{}: index {}, size {}", ca::to_string(kind), index, size);
}
