#include <ordo/assert-handler.hh>
#include <ordo/assert.hh>
#include <ordo/ordered_map.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>


TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<ordo::impl::assertion_info> captured;
    // CAREFUL: this is a bit brittle wrt. formatting but it should be fine
    int const test_line = __LINE__ + 11; // line where ORDO_ASSERT_ALWAYS is called

    {
        auto handler = ordo::impl::scoped_assertion_handler(
            [&](ordo::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            ORDO_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "arithmetic is broken");

    auto file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;

    {
        auto handler = ordo::impl::scoped_assertion_handler([&](ordo::impl::assertion_info const&)
                                                            { handler_called = true; });
        ORDO_ASSERT_ALWAYS(true, "should not matter");
        ORDO_ASSERT(2 > 1, "should not matter either");
    }

    CHECK(!handler_called);
}

TEST("assertions - handler stack is LIFO and pops on scope exit")
{
    std::vector<int> events;
    auto const count_before = ordo::impl::assertion_handler_count();

    auto handler_a = ordo::impl::scoped_assertion_handler(
        [&](ordo::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto handler_b = ordo::impl::scoped_assertion_handler(
            [&](ordo::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });
        CHECK(ordo::impl::assertion_handler_count() == count_before + 2);

        try
        {
            ORDO_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    CHECK(ordo::impl::assertion_handler_count() == count_before + 1);

    try
    {
        ORDO_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

#if ORDO_ASSERT_ENABLED
TEST("assertions - container preconditions report through the handler")
{
    std::vector<std::string> messages;

    auto handler = ordo::impl::scoped_assertion_handler(
        [&](ordo::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw 0;
        });

    auto const empty = ordo::ordered_map<int, int>();
    auto const m = ordo::ordered_map<int, int>{{1, 1}};

    try
    {
        (void)empty.front();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)empty.back();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)m.slice(0, 1, -1);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        auto const other = ordo::ordered_map<int, int>{{1, 1}};
        (void)m.resume(other.cursor(), 0, [](int acc, auto const&) { return ordo::cont(acc); });
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(messages.size() == 4);
    CHECK(messages.back() == "cursor belongs to a different ordered_map");
}
#endif
