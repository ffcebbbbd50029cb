#include <circular-array/circular_array.hh>

#include <nexus/test.hh>

#include <iterator>
#include <numeric>
#include <string>
#include <vector>

using iter3 = ca::circular_array_iterator<int, 3>;

static_assert(std::input_iterator<iter3>);
static_assert(std::sentinel_for<ca::sentinel, iter3>);
static_assert(std::is_same_v<std::iter_reference_t<iter3>, int const&>);
static_assert(std::is_trivially_copyable_v<iter3>);

TEST("circular_array_iterator - next")
{
    SECTION("filling buffer yields pushes in order, then stays exhausted")
    {
        auto arr = ca::circular_array<int, 3>();
        arr.push(1);
        arr.push(2);
        arr.push(3);

        auto it = arr.iter();
        CHECK(it.next() == 1);
        CHECK(it.next() == 2);
        CHECK(it.next() == 3);
        CHECK(!it.next().has_value());
        CHECK(!it.next().has_value());
        CHECK(it.is_exhausted());
    }

    SECTION("partially filled buffer stops at len")
    {
        auto arr = ca::circular_array<int, 5>::create_from({7, 8});
        auto it = arr.iter();
        CHECK(it.remaining() == 2);
        CHECK(it.next() == 7);
        CHECK(it.remaining() == 1);
        CHECK(it.next() == 8);
        CHECK(it.remaining() == 0);
        CHECK(it.next() == ca::nullopt);
    }

    SECTION("wrapped buffer yields the most recent N, oldest first")
    {
        auto arr = ca::circular_array<int, 3>();
        for (int i = 1; i <= 8; ++i)
            arr.push(i);

        auto it = arr.iter();
        CHECK(it.index() == 0);
        CHECK(it.next() == 6);
        CHECK(it.next() == 7);
        CHECK(it.index() == 2);
        CHECK(it.next() == 8);
        CHECK(!it.next().has_value());
    }

    SECTION("empty buffer")
    {
        auto const arr = ca::circular_array<int, 3>();
        auto it = arr.iter();
        CHECK(it.is_exhausted());
        CHECK(it.remaining() == 0);
        CHECK(!it.next().has_value());
    }

    SECTION("default-constructed iterator is exhausted")
    {
        auto it = iter3();
        CHECK(it.is_exhausted());
        CHECK(!it.next().has_value());
        CHECK(it == ca::sentinel{});
    }

    SECTION("next returns references into the buffer")
    {
        auto arr = ca::circular_array<int, 2>::create_from({1, 2, 3});
        auto it = arr.iter();
        auto first = it.next();
        REQUIRE(first.has_value());
        CHECK(&first.value() == &arr[0]);
    }
}

TEST("circular_array_iterator - restart")
{
    auto arr = ca::circular_array<int, 3>::create_from({1, 2, 3, 4});

    auto a = arr.iter();
    while (a.next().has_value())
    {
    }
    CHECK(a.is_exhausted());

    // a fresh iterator starts from the oldest element again
    auto b = arr.iter();
    CHECK(b.next() == 2);

    // iterators are independent cursors
    auto c = arr.iter();
    auto d = c;
    CHECK(c.next() == 2);
    CHECK(c.next() == 3);
    CHECK(d.next() == 2);
}

TEST("circular_array_iterator - consumption patterns")
{
    auto arr = ca::circular_array<int, 4>();
    for (int i = 1; i <= 6; ++i)
        arr.push(i);

    SECTION("range-for over the buffer")
    {
        std::vector<int> seen;
        for (auto v : arr)
            seen.push_back(v);
        REQUIRE(seen.size() == 4);
        CHECK(seen.front() == 3);
        CHECK(seen.back() == 6);
    }

    SECTION("range-for over iter()")
    {
        int sum = 0;
        for (auto v : arr.iter())
            sum += v;
        CHECK(sum == 3 + 4 + 5 + 6);
    }

    SECTION("explicit iterator loop")
    {
        int count = 0;
        int product = 1;
        for (auto it = arr.begin(); it != arr.end(); ++it)
        {
            product *= *it;
            ++count;
        }
        CHECK(count == 4);
        CHECK(product == 3 * 4 * 5 * 6);
    }

    SECTION("postfix increment")
    {
        auto it = arr.begin();
        auto const prev = it++;
        CHECK(*prev == 3);
        CHECK(*it == 4);
    }

    SECTION("collect into a vector")
    {
        auto it = arr.iter();
        std::vector<int> collected;
        for (auto v = it.next(); v.has_value(); v = it.next())
            collected.push_back(v.value());
        REQUIRE(collected.size() == 4);
        CHECK(collected[0] == 3);
        CHECK(collected[3] == 6);
    }

    SECTION("iteration count matches size")
    {
        CHECK(std::ranges::distance(arr.begin(), arr.end()) == arr.size());
    }

    SECTION("non-trivial elements")
    {
        auto strs = ca::circular_array<std::string, 2>::create_from({"a", "b", "c"});
        std::string joined;
        for (auto const& s : strs.iter())
            joined += s;
        CHECK(joined == "bc");
    }
}
