#include <clean-iter/immutable_list.hh>
#include <clean-iter/iterate.hh>

#include <nexus/test.hh>

#include <compare>
#include <deque>
#include <list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace
{
using entry = std::pair<int, std::string>;

std::vector<entry> entries(std::initializer_list<entry> values) { return values; }

template <class R>
std::vector<entry> as_entries(R const& r)
{
    return std::vector<entry>(r.begin(), r.end());
}

struct counting_pred
{
    int* calls;
    int needle;

    bool operator()(int i) const
    {
        ++*calls;
        return i == needle;
    }
};

struct user_error : std::runtime_error
{
    user_error() : std::runtime_error("user") {}
};

// any_satisfy with the first match at index k calls the predicate exactly k + 1 times
template <class S>
void check_short_circuit()
{
    S const src = {10, 11, 12, 13, 14};

    int calls = 0;
    CHECK(ci::any_satisfy(src, counting_pred{&calls, 12}));
    CHECK(calls == 3);

    calls = 0;
    CHECK(!ci::all_satisfy(src,
                           [&](int i)
                           {
                               ++calls;
                               return i < 11;
                           }));
    CHECK(calls == 2);

    calls = 0;
    CHECK(!ci::none_satisfy(src, counting_pred{&calls, 10}));
    CHECK(calls == 1);

    calls = 0;
    CHECK(ci::detect(src, counting_pred{&calls, 13}) == 13);
    CHECK(calls == 4);

    calls = 0;
    CHECK(ci::detect_index(src, counting_pred{&calls, 11}) == 1);
    CHECK(calls == 2);

    calls = 0;
    CHECK(ci::detect_if_none(src, counting_pred{&calls, 10}, -1) == 10);
    CHECK(calls == 1);

    // no match: every element is tested once
    calls = 0;
    CHECK(!ci::any_satisfy(src, counting_pred{&calls, 99}));
    CHECK(calls == 5);
}

template <class S>
void check_stable_sort()
{
    S values = {{1, "a"}, {1, "b"}, {0, "c"}};
    ci::sort_this_by(values, [](entry const& e) { return e.first; });
    CHECK(as_entries(values) == entries({{0, "c"}, {1, "a"}, {1, "b"}}));

    S more = {{2, "x"}, {1, "y"}, {2, "z"}, {1, "w"}};
    ci::sort_this(more, [](entry const& a, entry const& b) { return a.first < b.first; });
    CHECK(as_entries(more) == entries({{1, "y"}, {1, "w"}, {2, "x"}, {2, "z"}}));
}
} // namespace

TEST("contracts - short-circuiting")
{
    SECTION("std::list") { check_short_circuit<std::list<int>>(); }
    SECTION("std::deque") { check_short_circuit<std::deque<int>>(); }
    SECTION("ci::vector") { check_short_circuit<ci::vector<int>>(); }
    SECTION("ci::immutable_list") { check_short_circuit<ci::immutable_list<int>>(); }
}

TEST("contracts - partition is exact")
{
    std::list<int> const src = {7, 2, 9, 4, 4, 1};

    int calls = 0;
    auto const parts = ci::partition(src,
                                     [&](int i)
                                     {
                                         ++calls;
                                         return i > 3;
                                     });

    CHECK(calls == 6);
    CHECK(parts.selected == (std::list<int>{7, 9, 4, 4}));
    CHECK(parts.rejected == (std::list<int>{2, 1}));
    CHECK(ci::size_of(parts.selected) + ci::size_of(parts.rejected) == ci::size_of(src));

    SECTION("empty source")
    {
        auto const none = ci::partition(std::vector<int>{}, [](int) { return true; });
        CHECK(none.selected.empty());
        CHECK(none.rejected.empty());
    }
}

TEST("contracts - stable sort")
{
    SECTION("std::list") { check_stable_sort<std::list<entry>>(); }
    SECTION("std::deque") { check_stable_sort<std::deque<entry>>(); }
    SECTION("std::vector") { check_stable_sort<std::vector<entry>>(); }
    SECTION("ci::vector") { check_stable_sort<ci::vector<entry>>(); }

    SECTION("three-way comparators")
    {
        std::vector<int> values = {3, 1, 2};
        ci::sort_this(values, [](int a, int b) { return a <=> b; });
        CHECK(values == (std::vector<int>{1, 2, 3}));

        ci::sort_this(values, [](int a, int b) { return b - a; });
        CHECK(values == (std::vector<int>{3, 2, 1}));
    }

    SECTION("to_sorted_list leaves the source alone")
    {
        std::list<entry> const values = {{1, "a"}, {1, "b"}, {0, "c"}};
        auto const sorted = ci::to_sorted_list(values, [](entry const& a, entry const& b) { return a.first < b.first; });
        CHECK(as_entries(sorted) == entries({{0, "c"}, {1, "a"}, {1, "b"}}));
        CHECK(as_entries(values) == entries({{1, "a"}, {1, "b"}, {0, "c"}}));
    }
}

TEST("contracts - min and max keep the first of equal elements")
{
    std::vector<entry> const values = {{2, "first two"}, {1, "first one"}, {2, "second two"}, {1, "second one"}};
    auto const by_first = [](entry const& e) { return e.first; };

    CHECK(ci::min_by(values, by_first).value().second == "first one");
    CHECK(ci::max_by(values, by_first).value().second == "first two");

    auto const cmp = [](entry const& a, entry const& b) { return a.first < b.first; };
    CHECK(ci::min(values, cmp).value().second == "first one");
    CHECK(ci::max(values, cmp).value().second == "first two");

    CHECK(ci::max(std::list<int>{4}) == 4);
}

TEST("contracts - to_map keeps the last write")
{
    std::vector<entry> const values = {{1, "x"}, {2, "y"}, {1, "z"}};

    auto const by_key = ci::to_map(values, [](entry const& e) { return e.first; });
    CHECK(by_key.size() == 2);
    CHECK(by_key.at(1).second == "z");

    auto const names = ci::to_map(values, [](entry const& e) { return e.second; }, [](entry const& e) { return e.first; });
    CHECK(names.size() == 3);

    std::vector<std::pair<std::string, int>> const xs = {{"x", 1}, {"x", 2}};
    auto const last = ci::to_map(xs, [](auto const& p) { return p.first; });
    REQUIRE(last.size() == 1);
    CHECK(last.at("x").second == 2);
}

TEST("contracts - aggregation merges instead of overwriting")
{
    std::list<std::string> const words = {"apple", "avocado", "banana", "blueberry", "cherry"};
    auto const initial = [](std::string const& s) { return s.front(); };

    auto const lengths = ci::aggregate_by(
        words, initial, [] { return 0; }, [](int acc, std::string const& s) { return acc + int(s.size()); });
    CHECK(lengths.size() == 3);
    CHECK(lengths.at('a') == 12);
    CHECK(lengths.at('b') == 15);
    CHECK(lengths.at('c') == 6);

    auto const joined = ci::aggregate_in_place_by(
        words, initial, [] { return std::string(); }, [](std::string& acc, std::string const& s) { acc += s; });
    CHECK(joined.at('a') == "appleavocado");
    CHECK(joined.at('b') == "bananablueberry");

    // to_map on the same input keeps only the last word per letter
    auto const last = ci::to_map(words, initial);
    CHECK(last.at('a') == "avocado");
}

TEST("contracts - group_by_each")
{
    std::vector<int> const values = {6, 10, 15};
    auto const divisors = [](int i)
    {
        std::vector<int> result;
        for (int d : {2, 3, 5})
            if (i % d == 0)
                result.push_back(d);
        return result;
    };

    auto const groups = ci::group_by_each(values, divisors);
    CHECK(groups.key_count() == 3);
    CHECK(groups.get(2) == (ci::vector<int>{6, 10}));
    CHECK(groups.get(3) == (ci::vector<int>{6, 15}));
    CHECK(groups.get(5) == (ci::vector<int>{10, 15}));
    CHECK(groups.size() == 6);
}

TEST("contracts - zip truncates to the shorter source")
{
    std::list<int> const numbers = {1, 2, 3};
    std::vector<std::string> const letters = {"a", "b"};

    auto const zipped = ci::zip(numbers, letters);
    REQUIRE(zipped.size() == 2);
    CHECK(zipped[0] == (ci::pair<int, std::string>{1, "a"}));
    CHECK(zipped[1] == (ci::pair<int, std::string>{2, "b"}));

    auto const reversed = ci::zip(letters, numbers);
    REQUIRE(reversed.size() == 2);
    CHECK(reversed[1].second == 2);

    CHECK(ci::zip(numbers, std::vector<int>{}).empty());
}

TEST("contracts - chunk")
{
    ci::vector<int> const values = {1, 2, 3, 4, 5, 6, 7};

    auto const threes = ci::chunk(values, 3);
    REQUIRE(threes.size() == 3);
    CHECK(threes[0] == (ci::vector<int>{1, 2, 3}));
    CHECK(threes[2] == (ci::vector<int>{7}));

    CHECK(ci::chunk(values, 7).size() == 1);
    CHECK(ci::chunk(values, 100).size() == 1);
    CHECK(ci::chunk(std::list<int>{}, 2).empty());
}

TEST("contracts - inject_into is a left fold")
{
    std::deque<std::string> const parts = {"a", "b", "c"};
    auto const folded
        = ci::inject_into(parts, std::string(), [](std::string acc, std::string const& s) { return "(" + acc + s + ")"; });
    CHECK(folded == "(((a)b)c)");

    CHECK(ci::inject_into(std::list<int>{}, 17, [](int acc, int i) { return acc * i; }) == 17);
}

TEST("contracts - user errors propagate unchanged")
{
    std::list<int> values = {1, 2, 3};
    auto const thrower = [](int i)
    {
        if (i == 2)
            throw user_error();
        return true;
    };

    auto const throws_user_error = [](auto&& fn)
    {
        try
        {
            fn();
        }
        catch (user_error const&)
        {
            return true;
        }
        return false;
    };

    CHECK(throws_user_error([&] { (void)ci::select(values, thrower); }));
    CHECK(throws_user_error([&] { (void)ci::count(values, thrower); }));
    CHECK(throws_user_error([&] { (void)ci::collect(values, thrower); }));
    CHECK(throws_user_error([&] { (void)ci::remove_if(values, [&](int i) { return !thrower(i); }); }));
    CHECK(throws_user_error([&] { (void)ci::all_satisfy(ci::vector<int>{1, 2}, thrower); }));

    // nothing was removed
    CHECK(values.size() == 3);
}

TEST("contracts - list_multimap keeps insertion order per key")
{
    ci::list_multimap<std::string, int> map;
    CHECK(map.empty());
    CHECK(map.get("missing").empty());

    map.put("a", 3);
    map.put("b", 1);
    map.put("a", 2);

    CHECK(map.key_count() == 2);
    CHECK(map.size() == 3);
    CHECK(map.contains_key("a"));
    CHECK(!map.contains_key("c"));
    CHECK(map.get("a") == (ci::vector<int>{3, 2}));

    auto other = map;
    CHECK(other == map);
    other.put("b", 5);
    CHECK(!(other == map));

    map.clear();
    CHECK(map.empty());
    CHECK(map.size() == 0);
}
