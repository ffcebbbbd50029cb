#include <circular-array/circular_array.hh>
#include <circular-array/to_debug_string.hh>

#include <nexus/test.hh>

#include <string>
#include <string_view>
#include <vector>

namespace
{
struct named
{
    std::string to_string() const { return "named!"; }
};
} // namespace

TEST("to_debug_string - scalars")
{
    CHECK(ca::to_debug_string(42) == "42");
    CHECK(ca::to_debug_string(-7) == "-7");
    CHECK(ca::to_debug_string(true) == "true");
    CHECK(ca::to_debug_string(1.5) == "1.5");
}

TEST("to_debug_string - text")
{
    CHECK(ca::to_debug_string(std::string("hi")) == "\"hi\"");
    CHECK(ca::to_debug_string(std::string_view("sv")) == "\"sv\"");
    CHECK(ca::to_debug_string("lit") == "\"lit\"");

    CHECK(ca::to_debug_string('a') == "'a'");
    CHECK(ca::to_debug_string('\n') == "'\\n'");
    CHECK(ca::to_debug_string('\'') == "'\\''");
    CHECK(ca::to_debug_string('\x01') == "'\\x01'");
}

TEST("to_debug_string - to_string lookups")
{
    CHECK(ca::to_debug_string(named{}) == "named!");
    CHECK(ca::to_debug_string(ca::circular_array_error_kind::index_out_of_range) == "index_out_of_range");

    auto const err = ca::circular_array_error{
        .kind = ca::circular_array_error_kind::index_out_of_range,
        .index = 5,
        .size = 3,
    };
    CHECK(ca::to_debug_string(err) == "index_out_of_range: logical index 5 not in [0, 3)");
}

TEST("to_debug_string - ranges")
{
    auto const empty = std::vector<int>();
    auto const three = std::vector<int>{1, 2, 3};
    CHECK(ca::to_debug_string(empty) == "[]");
    CHECK(ca::to_debug_string(three) == "[1, 2, 3]");

    auto const nested = std::vector<std::vector<char>>{{'a'}, {'b', 'c'}};
    CHECK(ca::to_debug_string(nested) == "[['a'], ['b', 'c']]");

    SECTION("long ranges are cut off")
    {
        auto const many = std::vector<int>(100, 1);
        auto const s = ca::to_debug_string(many, {.max_length = 10});
        CHECK(s.size() < 30);
        CHECK(s.ends_with(", ...]"));
    }

    SECTION("circular_array iteration")
    {
        auto const arr = ca::circular_array<int, 3>::create_from({1, 2, 3, 4, 5});
        CHECK(ca::to_debug_string(arr.iter()) == "[3, 4, 5]");
        CHECK(ca::to_debug_string(arr) == "circular_array<3>{len: 5, [3, 4, 5]}");
    }
}
