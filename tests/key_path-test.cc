#include <ordo/key_path.hh>
#include <ordo/ordered_map.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{
using smap = ordo::ordered_map<std::string, int>;
using nested = ordo::ordered_map<std::string, smap>;
using keys_t = std::vector<std::string>;

// smallest container that models the access protocol, nothing beyond it
struct pair_list
{
    using key_type = std::string;
    using mapped_type = int;

    std::vector<std::pair<std::string, int>> entries;

    int const* try_get(std::string const& key) const
    {
        for (auto const& [k, v] : entries)
            if (k == key)
                return &v;
        return nullptr;
    }
    int* try_get(std::string const& key)
    {
        for (auto& [k, v] : entries)
            if (k == key)
                return &v;
        return nullptr;
    }

    std::optional<int> pop(std::string const& key)
    {
        for (auto it = entries.begin(); it != entries.end(); ++it)
            if (it->first == key)
            {
                auto v = it->second;
                entries.erase(it);
                return v;
            }
        return std::nullopt;
    }

    template <class F>
    std::optional<int> get_and_update(std::string const& key, F&& fn)
    {
        auto* v = try_get(key);
        std::optional<int> next = fn(static_cast<int const*>(v));
        if (!next.has_value())
            return pop(key);
        if (v == nullptr)
        {
            entries.emplace_back(key, *next);
            return std::nullopt;
        }
        return std::exchange(*v, *next);
    }

    auto begin() const { return entries.begin(); }
    auto end() const { return entries.end(); }
};

static_assert(ordo::key_accessible<pair_list>);
static_assert(ordo::key_accessible<smap>);
static_assert(ordo::key_accessible<nested>);
static_assert(!ordo::key_accessible<std::vector<int>>);

nested make_config()
{
    auto m = nested();
    m.put("net", smap{{"port", 80}, {"retries", 3}});
    m.put("log", smap{{"level", 2}});
    return m;
}
} // namespace

TEST("key path - fetch")
{
    auto const m = smap{{"a", 1}};
    CHECK(ordo::fetch(m, "a") == 1);
    CHECK(!ordo::fetch(m, "b").has_value());
}

TEST("key path - get_in")
{
    auto const m = make_config();

    auto const* port = ordo::get_in(m, "net", "port");
    REQUIRE(port != nullptr);
    CHECK(*port == 80);

    auto const* log = ordo::get_in(m, "log");
    REQUIRE(log != nullptr);
    CHECK(log->size() == 1);

    CHECK(ordo::get_in(m, "net", "missing") == nullptr);
    CHECK(ordo::get_in(m, "missing", "port") == nullptr);
}

TEST("key path - put_in")
{
    SECTION("existing path keeps positions")
    {
        auto m = make_config();
        ordo::put_in(m, 8080, "net", "port");
        CHECK(*ordo::get_in(m, "net", "port") == 8080);
        CHECK(m.key_list() == (keys_t{"net", "log"}));
        CHECK(m.at("net").key_list() == (keys_t{"port", "retries"}));
    }

    SECTION("missing keys are appended at the tail of their level")
    {
        auto m = make_config();
        ordo::put_in(m, 5, "net", "timeout");
        ordo::put_in(m, 1, "db", "pool");

        CHECK(m.key_list() == (keys_t{"net", "log", "db"}));
        CHECK(m.at("net").key_list() == (keys_t{"port", "retries", "timeout"}));
        CHECK(*ordo::get_in(m, "db", "pool") == 1);
    }

    SECTION("single level")
    {
        auto m = smap{{"a", 1}};
        ordo::put_in(m, 2, "b");
        ordo::put_in(m, 3, "a");
        CHECK(m == (smap{{"a", 3}, {"b", 2}}));
    }
}

TEST("key path - update_in")
{
    SECTION("applies the function at the end of the path")
    {
        auto m = make_config();
        ordo::update_in(m, [](int v) { return v + 1; }, "net", "retries");
        CHECK(*ordo::get_in(m, "net", "retries") == 4);
        CHECK(m.at("net").key_list() == (keys_t{"port", "retries"}));
    }

    SECTION("missing keys throw and leave the map unchanged")
    {
        auto m = make_config();
        auto const before = m;

        auto threw_inner = false;
        try
        {
            ordo::update_in(m, [](int v) { return v + 1; }, "net", "missing");
        }
        catch (ordo::key_not_found_error const& e)
        {
            threw_inner = true;
            CHECK(e.key() == "\"missing\"");
        }

        auto threw_outer = false;
        try
        {
            ordo::update_in(m, [](int v) { return v + 1; }, "missing", "port");
        }
        catch (ordo::key_not_found_error const& e)
        {
            threw_outer = true;
            CHECK(e.key() == "\"missing\"");
        }

        CHECK(threw_inner);
        CHECK(threw_outer);
        CHECK(m == before);
    }
}

TEST("key path - pop_in")
{
    auto m = make_config();

    CHECK(ordo::pop_in(m, "net", "port") == 80);
    CHECK(m.at("net").key_list() == (keys_t{"retries"}));

    CHECK(!ordo::pop_in(m, "net", "port").has_value());
    CHECK(!ordo::pop_in(m, "missing", "port").has_value());

    auto const log = ordo::pop_in(m, "log");
    REQUIRE(log.has_value());
    CHECK(*log == (smap{{"level", 2}}));
    CHECK(m.key_list() == (keys_t{"net"}));
}

TEST("key path - get_and_update")
{
    SECTION("returns the previous value and keeps the position")
    {
        auto m = smap{{"a", 1}, {"b", 2}};
        auto const prev = m.get_and_update("a", [](int const* v) { return std::optional<int>(*v * 10); });
        CHECK(prev == 1);
        CHECK(m == (smap{{"a", 10}, {"b", 2}}));
    }

    SECTION("absent key is appended")
    {
        auto m = smap{{"a", 1}};
        auto const prev = m.get_and_update("z",
                                           [](int const* v)
                                           {
                                               CHECK(v == nullptr);
                                               return std::optional<int>(26);
                                           });
        CHECK(!prev.has_value());
        CHECK(m.key_list() == (keys_t{"a", "z"}));
    }

    SECTION("nullopt removes the key")
    {
        auto m = smap{{"a", 1}, {"b", 2}};
        auto const prev = m.get_and_update("a", [](int const*) { return std::optional<int>(); });
        CHECK(prev == 1);
        CHECK(m == (smap{{"b", 2}}));
    }
}

TEST("key path - helpers only rely on the access protocol")
{
    auto m = pair_list();
    ordo::put_in(m, 1, "a");
    ordo::put_in(m, 2, "b");

    ordo::update_in(m, [](int v) { return v * 10; }, "b");
    CHECK(*ordo::get_in(m, "b") == 20);
    CHECK(ordo::fetch(m, "a") == 1);

    auto threw = false;
    try
    {
        ordo::update_in(m, [](int v) { return v + 1; }, "z");
    }
    catch (ordo::key_not_found_error const& e)
    {
        threw = true;
        CHECK(e.key() == "\"z\"");
        CHECK(e.container() == "{{\"a\", 1}, {\"b\", 20}}");
    }
    CHECK(threw);

    CHECK(ordo::pop_in(m, "a") == 1);
    CHECK(m.entries.size() == 1);
}
