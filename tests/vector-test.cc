#include <clean-iter/span.hh>
#include <clean-iter/vector.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

static_assert(std::is_nothrow_move_constructible_v<ci::vector<int>>);
static_assert(std::is_copy_constructible_v<ci::vector<std::string>>);
static_assert(sizeof(ci::vector<int>) == 4 * sizeof(void*));

namespace
{
// tracks construction and destruction order
struct lifetime_probe
{
    static inline int alive = 0;
    static inline std::string destroyed;

    char tag = '?';

    explicit lifetime_probe(char t) : tag(t) { ++alive; }
    lifetime_probe(lifetime_probe const& rhs) : tag(rhs.tag) { ++alive; }
    lifetime_probe(lifetime_probe&& rhs) noexcept : tag(rhs.tag)
    {
        rhs.tag = '-';
        ++alive;
    }
    lifetime_probe& operator=(lifetime_probe const&) = default;
    lifetime_probe& operator=(lifetime_probe&& rhs) noexcept
    {
        tag = rhs.tag;
        rhs.tag = '-';
        return *this;
    }
    ~lifetime_probe()
    {
        --alive;
        if (tag != '-')
            destroyed += tag;
    }
};

struct move_only
{
    int value = 0;

    explicit move_only(int v) : value(v) {}
    move_only(move_only const&) = delete;
    move_only(move_only&&) noexcept = default;
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&&) noexcept = default;
};
} // namespace

TEST("vector - default construction invariants")
{
    ci::vector<int> v;
    CHECK(v.empty());
    CHECK(v.size() == 0);
    CHECK(v.capacity() == 0);
    CHECK(v.begin() == v.end());
}

TEST("vector - initializer list construction")
{
    ci::vector<std::string> v = {"a", "b", "c"};
    REQUIRE(v.size() == 3);
    CHECK(v.front() == "a");
    CHECK(v.back() == "c");
    CHECK(v.capacity() == 3);
}

TEST("vector - factories")
{
    SECTION("create_copy_of")
    {
        int raw[] = {1, 2, 3};
        auto v = ci::vector<int>::create_copy_of(ci::span<int const>(raw));
        CHECK(v == (ci::vector<int>{1, 2, 3}));
        CHECK(v.data() != raw);

        auto const none = ci::vector<int>::create_copy_of(ci::span<int const>());
        CHECK(none.empty());
    }

    SECTION("create_filled")
    {
        auto v = ci::vector<std::string>::create_filled(3, "x");
        CHECK(v.size() == 3);
        CHECK(v[2] == "x");
    }

    SECTION("create_with_capacity")
    {
        auto v = ci::vector<int>::create_with_capacity(5);
        CHECK(v.empty());
        CHECK(v.capacity() >= 5);
        CHECK(v.has_capacity_back_for(5));
    }
}

TEST("vector - copy and move")
{
    ci::vector<std::string> a = {"x", "y"};

    auto b = a;
    CHECK(b == a);
    CHECK(b.data() != a.data());
    b.push_back("z");
    CHECK(a.size() == 2);

    auto const* data = b.data();
    auto c = ci::move(b);
    CHECK(c.data() == data);
    CHECK(c.size() == 3);

    a = c;
    CHECK(a == c);

    c = ci::vector<std::string>();
    CHECK(c.empty());
}

TEST("vector - push_back growth keeps elements")
{
    ci::vector<int> v;
    for (int i = 0; i < 100; ++i)
        v.push_back(i);

    REQUIRE(v.size() == 100);
    for (int i = 0; i < 100; ++i)
        CHECK(v[i] == i);
    CHECK(v.capacity() >= 100);

    SECTION("pushing an own element across reallocation")
    {
        ci::vector<std::string> s = {"keep me"};
        for (int i = 0; i < 10; ++i)
            s.push_back(s[0]);
        CHECK(s.size() == 11);
        CHECK(s.back() == "keep me");
    }
}

TEST("vector - stable appends and emplace")
{
    ci::vector<move_only> v;
    v.reserve_back(2);
    auto const* data = v.data();
    v.emplace_back_stable(1);
    v.push_back_stable(move_only(2));
    CHECK(v.data() == data);
    CHECK(v[1].value == 2);

    auto& third = v.emplace_back(3);
    CHECK(&third == &v.back());
    CHECK(v.size() == 3);
}

TEST("vector - removals")
{
    ci::vector<int> v = {1, 2, 3, 4, 5};

    CHECK(v.pop_back() == 5);
    v.remove_back();
    CHECK(v == (ci::vector<int>{1, 2, 3}));

    v.remove_at(0);
    CHECK(v == (ci::vector<int>{2, 3}));

    v.push_back(4);
    v.truncate_to(1);
    CHECK(v == (ci::vector<int>{2}));

    auto const capacity = v.capacity();
    v.clear();
    CHECK(v.empty());
    CHECK(v.capacity() == capacity);
}

TEST("vector - destruction order")
{
    lifetime_probe::alive = 0;
    lifetime_probe::destroyed.clear();
    {
        ci::vector<lifetime_probe> v;
        v.reserve_back(4);
        v.emplace_back('a');
        v.emplace_back('b');
        v.emplace_back('c');
        v.emplace_back('d');

        v.truncate_to(2);
        CHECK(lifetime_probe::destroyed == "dc");

        v.remove_at(0);
        CHECK(v.size() == 1);
        CHECK(v[0].tag == 'b');
        CHECK(lifetime_probe::alive == 1);
    }
    CHECK(lifetime_probe::alive == 0);
    CHECK(lifetime_probe::destroyed == "dcb"); // "a" was overwritten by a move
}
