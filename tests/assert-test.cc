#include <circular-array/assert-handler.hh>
#include <circular-array/assertf.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
struct assert_failed
{
};
} // namespace

TEST("assert - failure reaches the handler")
{
    std::optional<ca::impl::assertion_info> captured;
    int line = 0;

    {
        auto handler = ca::impl::scoped_assertion_handler(
            [&](ca::impl::assertion_info const& info)
            {
                captured = info;
                throw assert_failed{}; // returning would abort
            });

        try
        {
            auto const slots = 3;
            line = __LINE__ + 1;
            CA_ASSERTF_ALWAYS(slots > 4, "need {} slots, have {}", 5, slots);
        }
        catch (assert_failed const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression == "slots > 4");
    CHECK(captured->message == "need 5 slots, have 3");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(int(captured->location.line()) == line);
}

TEST("assert - passing assertions are silent")
{
    auto called = false;
    auto evaluated = 0;
    auto arg = [&]
    {
        ++evaluated;
        return 7;
    };

    auto handler = ca::impl::scoped_assertion_handler([&](ca::impl::assertion_info const&) { called = true; });
    CA_ASSERT_ALWAYS(1 + 1 == 2, "arithmetic");
    CA_ASSERTF_ALWAYS(true, "never formatted {}", arg());

    CHECK(!called);
    CHECK(evaluated == 0);
}

TEST("assert - only the innermost handler runs")
{
    std::vector<char> calls;

    auto outer = ca::impl::scoped_assertion_handler(
        [&](ca::impl::assertion_info const&)
        {
            calls.push_back('o');
            throw assert_failed{};
        });

    {
        auto inner = ca::impl::scoped_assertion_handler(
            [&](ca::impl::assertion_info const&)
            {
                calls.push_back('i');
                throw assert_failed{};
            });

        try
        {
            CA_ASSERT_ALWAYS(false, "inner");
        }
        catch (assert_failed const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    // inner popped at scope exit
    try
    {
        CA_ASSERT_ALWAYS(false, "outer");
    }
    catch (assert_failed const&) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == 'i');
    CHECK(calls[1] == 'o');
}

TEST("assert - enabled configuration")
{
    auto fired = false;
    auto handler = ca::impl::scoped_assertion_handler(
        [&](ca::impl::assertion_info const&)
        {
            fired = true;
            throw assert_failed{};
        });

    try
    {
        CA_ASSERT(false, "debug-only check");
    }
    catch (assert_failed const&) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(fired == bool(CA_ASSERT_ENABLED));
}
