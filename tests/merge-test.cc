#include <ordo/ordered_map.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
using smap = ordo::ordered_map<std::string, int>;
using keys_t = std::vector<std::string>;

struct conflict_failure
{
};
} // namespace

TEST("merge - order semantics")
{
    SECTION("disjoint keys are appended in the other map's order")
    {
        auto m = smap{{"a", 1}, {"b", 2}};
        m.merge(smap{{"c", 3}, {"d", 4}});
        CHECK(m.key_list() == (keys_t{"a", "b", "c", "d"}));
        CHECK(m.is_consistent());
    }

    SECTION("shared keys keep their position and take the incoming value")
    {
        auto m = smap{{"a", 1}, {"b", 2}};
        m.merge(smap{{"c", 3}, {"a", 4}});
        CHECK(m.key_list() == (keys_t{"a", "b", "c"}));
        CHECK(m.get("a", 0) == 4);
    }

    SECTION("incoming order decides the order of new keys")
    {
        auto m = smap{{"a", 1}, {"b", 2}};
        m.merge(smap{{"c", 3}, {"b", 4}});
        CHECK(m == (smap{{"a", 1}, {"b", 4}, {"c", 3}}));
    }

    SECTION("merging an empty map is identity")
    {
        auto m = smap{{"a", 1}};
        m.merge(smap());
        CHECK(m == (smap{{"a", 1}}));

        auto e = smap();
        e.merge(m);
        CHECK(e == m);
    }

    SECTION("merging a map into itself")
    {
        auto m = smap{{"a", 1}, {"b", 2}};
        m.merge(m);
        CHECK(m == (smap{{"a", 1}, {"b", 2}}));

        m.merge(m, [](std::string const&, int x, int y) { return x + y; });
        CHECK(m == (smap{{"a", 2}, {"b", 4}}));
    }
}

TEST("merge - conflict function")
{
    SECTION("receives key, existing and incoming value")
    {
        auto seen = std::vector<std::string>();
        auto m = smap{{"a", 1}, {"b", 2}};
        m.merge(smap{{"c", 3}, {"b", 4}},
                [&](std::string const& key, int existing, int incoming)
                {
                    seen.push_back(key);
                    return existing + incoming;
                });

        CHECK(m == (smap{{"a", 1}, {"b", 6}, {"c", 3}}));
        CHECK(seen == (keys_t{"b"}));
    }

    SECTION("a failing conflict function rolls back the whole merge")
    {
        auto m = smap{{"a", 1}, {"b", 2}};
        auto const before = m;

        bool threw = false;
        try
        {
            // "x" is appended and "a" overwritten before "b" fails
            m.merge(smap{{"x", 9}, {"a", 5}, {"y", 8}, {"b", 7}},
                    [](std::string const& key, int, int incoming) -> int
                    {
                        if (key == "b")
                            throw conflict_failure{};
                        return incoming;
                    });
        }
        catch (conflict_failure const&)
        {
            threw = true;
        }

        CHECK(threw);
        CHECK(m == before);
        CHECK(m.is_consistent());
    }
}

TEST("merge - value-returning form")
{
    auto const a = smap{{"a", 1}, {"b", 2}};
    auto const b = smap{{"c", 3}, {"a", 4}};

    auto const m = ordo::merged(a, b);
    CHECK(m == (smap{{"a", 4}, {"b", 2}, {"c", 3}}));

    // inputs are untouched
    CHECK(a == (smap{{"a", 1}, {"b", 2}}));
    CHECK(b == (smap{{"c", 3}, {"a", 4}}));

    auto const summed = ordo::merged(a, b, [](std::string const&, int x, int y) { return x + y; });
    CHECK(summed == (smap{{"a", 5}, {"b", 2}, {"c", 3}}));
}
