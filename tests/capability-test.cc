#include <clean-iter/capability.hh>
#include <clean-iter/immutable_list.hh>
#include <clean-iter/immutable_map.hh>
#include <clean-iter/interval.hh>
#include <clean-iter/iterate.hh>
#include <clean-iter/target.hh>

#include <nexus/test.hh>

#include <array>
#include <deque>
#include <forward_list>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace
{
using cap = ci::iteration_capability;

struct counter_range
{
    static constexpr ci::iteration_capability iteration_capability = ci::iteration_capability::sequential;

    std::vector<int> values;

    auto begin() const { return values.begin(); }
    auto end() const { return values.end(); }
};

struct reserving_target
{
    std::vector<int> values;
    ci::isize reserved = 0;

    void reserve_back(ci::isize n) { reserved += n; }
    void push_back(int v) { values.push_back(v); }
};

struct insert_only_target
{
    std::set<int> values;

    void insert(int v) { values.insert(v); }
};

// has a key-lookup operator[] and size() but only forward iterators
struct keyed_lookup
{
    std::map<ci::isize, int> values;

    int operator[](ci::isize key) const { return values.at(key); }
    ci::isize size() const { return ci::isize(values.size()); }
    auto begin() const { return values.begin(); }
    auto end() const { return values.end(); }
};
} // namespace

// classification is purely static
static_assert(ci::capability_of<ci::vector<int>> == cap::array_backed);
static_assert(ci::capability_of<ci::vector<int> const> == cap::array_backed);
static_assert(ci::capability_of<std::vector<int>> == cap::random_access);
static_assert(ci::capability_of<std::deque<int>> == cap::random_access);
static_assert(ci::capability_of<std::array<int, 3>> == cap::random_access);
static_assert(ci::capability_of<ci::span<int const>> == cap::random_access);
static_assert(ci::capability_of<std::list<int>> == cap::sequential);
static_assert(ci::capability_of<std::forward_list<int>> == cap::sequential);
static_assert(ci::capability_of<std::set<int>> == cap::sequential);
static_assert(ci::capability_of<std::map<int, int>> == cap::sequential);
static_assert(ci::capability_of<std::unordered_map<int, int>> == cap::sequential);
static_assert(ci::capability_of<keyed_lookup> == cap::sequential);
static_assert(ci::capability_of<counter_range> == cap::sequential);
static_assert(ci::capability_of<ci::immutable_list<int>> == cap::native_rich);
static_assert(ci::capability_of<ci::interval> == cap::native_rich);

static_assert(ci::is_mutable_source<std::vector<int>>);
static_assert(!ci::is_mutable_source<std::vector<int> const>);
static_assert(!ci::is_mutable_source<ci::immutable_list<int>>);
static_assert(!ci::is_mutable_source<ci::immutable_map<int, int>>);
static_assert(!ci::is_mutable_source<ci::interval>);

static_assert(ci::is_source_pointer<std::vector<int>*>);
static_assert(ci::is_source_pointer<std::unique_ptr<std::list<int>>>);
static_assert(ci::is_source_pointer<std::shared_ptr<std::set<int>> const>);
static_assert(!ci::is_source_pointer<std::vector<int>>);

static_assert(ci::source_argument<std::vector<int>&>);
static_assert(ci::source_argument<std::vector<int> const&>);
static_assert(ci::source_argument<std::list<int>*>);
static_assert(ci::source_argument<ci::interval>);
static_assert(!ci::source_argument<int>);
static_assert(!ci::source_argument<double&>);

static_assert(std::is_same_v<ci::element_t<std::list<int> const>, int>);
static_assert(std::is_same_v<ci::element_t<ci::interval>, ci::i64>);
static_assert(std::is_same_v<ci::element_t<int[3]>, int>);

static_assert(std::is_same_v<ci::same_family_t<std::set<int>>, std::set<int>>);
static_assert(std::is_same_v<ci::same_family_t<std::set<int, std::greater<>>>, std::set<int, std::greater<>>>);
static_assert(std::is_same_v<ci::same_family_t<std::unordered_set<int>>, std::unordered_set<int>>);
static_assert(std::is_same_v<ci::same_family_t<std::list<int> const>, std::list<int>>);
static_assert(std::is_same_v<ci::same_family_t<std::deque<int>>, std::deque<int>>);
static_assert(std::is_same_v<ci::same_family_t<std::vector<int>>, ci::vector<int>>);
static_assert(std::is_same_v<ci::same_family_t<std::array<int, 2>>, ci::vector<int>>);
static_assert(std::is_same_v<ci::same_family_t<ci::interval>, ci::vector<ci::i64>>);
static_assert(std::is_same_v<ci::same_family_t<std::list<int>, std::string>, std::list<std::string>>);
static_assert(std::is_same_v<ci::list_target_t<std::string>, ci::vector<std::string>>);

TEST("capability - declared capability is honored")
{
    counter_range const range = {{1, 2, 3, 4}};

    CHECK(ci::count(range, [](int i) { return i > 2; }) == 2);
    CHECK(ci::get_last(range) == 4);
    CHECK(ci::select(range, [](int i) { return i != 2; }) == (ci::vector<int>{1, 3, 4}));
}

TEST("capability - operator[] is not trusted without random access iterators")
{
    keyed_lookup lookup;
    lookup.values = {{10, 1}, {20, 2}};

    // traversal goes through begin()/end(), never lookup[0]
    CHECK(ci::size_of(lookup) == 2);
    CHECK(ci::count(lookup, [](auto const& e) { return e.first >= 10; }) == 2);
}

TEST("capability - C arrays")
{
    int values[] = {5, 3, 8};

    CHECK(ci::size_of(values) == 3);
    CHECK(ci::max(values) == 8);
    CHECK(ci::select(values, [](int i) { return i > 4; }) == (ci::vector<int>{5, 8}));

    ci::sort_this(values);
    CHECK(values[0] == 3);
    CHECK(values[2] == 8);
}

TEST("target - append_to")
{
    SECTION("push_back")
    {
        std::vector<int> target;
        ci::append_to(target, 1);
        ci::append_to(target, 2);
        CHECK(target == (std::vector<int>{1, 2}));
    }

    SECTION("insert")
    {
        std::set<int> target;
        ci::append_to(target, 2);
        ci::append_to(target, 1);
        ci::append_to(target, 2);
        CHECK(target == (std::set<int>{1, 2}));

        insert_only_target custom;
        ci::append_to(custom, 4);
        CHECK(custom.values.size() == 1);
    }

    SECTION("moves rvalues")
    {
        ci::vector<std::string> target;
        std::string s = "a long enough string to not be stored inline";
        ci::append_to(target, ci::move(s));
        CHECK(target.size() == 1);
        CHECK(target[0] == "a long enough string to not be stored inline");
    }
}

TEST("target - reserve_for")
{
    reserving_target target;
    ci::reserve_for(target, 3);
    CHECK(target.reserved == 3);

    // sized sources announce their size to the target
    std::vector<int> const values = {1, 2, 3, 4};
    ci::add_all_to(values, target);
    CHECK(target.reserved == 7);
    CHECK(target.values == (std::vector<int>{1, 2, 3, 4}));

    std::vector<int> std_target;
    ci::reserve_for(std_target, 10);
    CHECK(std_target.capacity() >= 10);

    // repeated appends keep geometric growth
    SECTION("growth over many calls")
    {
        auto const capacity_changes = [&](auto& grown)
        {
            int changes = 0;
            auto capacity = grown.capacity();
            for (int i = 0; i < 16; ++i)
            {
                ci::add_all_to(values, grown);
                if (grown.capacity() != capacity)
                    ++changes;
                capacity = grown.capacity();
            }
            return changes;
        };

        std::vector<int> std_grown;
        CHECK(capacity_changes(std_grown) <= 6);
        CHECK(std_grown.size() == 64);

        ci::vector<int> ci_grown;
        CHECK(capacity_changes(ci_grown) <= 6);
        CHECK(ci_grown.size() == 64);
    }

    // no reserve at all is fine
    std::list<int> list_target;
    ci::reserve_for(list_target, 10);
    CHECK(list_target.empty());
}
