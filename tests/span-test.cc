#include <clean-iter/span.hh>
#include <clean-iter/vector.hh>

#include <nexus/test.hh>

#include <type_traits>
#include <vector>

// span stays trivial
static_assert(std::is_trivially_copyable_v<ci::span<int>>);
static_assert(std::is_trivially_destructible_v<ci::span<int>>);
static_assert(std::is_convertible_v<ci::span<int>, ci::span<int const>>);
static_assert(!std::is_convertible_v<ci::span<int const>, ci::span<int>>);
static_assert(!std::is_convertible_v<std::vector<int>&, ci::span<int>>, "container construction is explicit");

namespace
{
int sum_of(ci::span<int const> values)
{
    int sum = 0;
    for (auto v : values)
        sum += v;
    return sum;
}
} // namespace

TEST("span - construction")
{
    SECTION("default")
    {
        ci::span<int> s;
        CHECK(s.empty());
        CHECK(s.size() == 0);
        CHECK(s.data() == nullptr);
        CHECK(s.begin() == s.end());
    }

    SECTION("pointer and size")
    {
        int arr[] = {1, 2, 3};
        auto s = ci::span<int>(arr, 2);
        CHECK(s.size() == 2);
        CHECK(s.data() == arr);
    }

    SECTION("pointer range")
    {
        int arr[] = {1, 2, 3};
        auto s = ci::span<int>(arr + 1, arr + 3);
        CHECK(s.size() == 2);
        CHECK(s[0] == 2);
    }

    SECTION("C array")
    {
        int arr[] = {4, 5, 6, 7};
        ci::span<int> s = arr;
        CHECK(s.size() == 4);
        CHECK(s.back() == 7);
    }

    SECTION("containers")
    {
        std::vector<int> std_values = {1, 2};
        ci::vector<int> ci_values = {3, 4, 5};

        auto a = ci::span<int>(std_values);
        auto b = ci::span<int const>(ci_values);
        CHECK(a.size() == 2);
        CHECK(a.data() == std_values.data());
        CHECK(b.size() == 3);
        CHECK(b.data() == ci_values.data());
    }
}

TEST("span - element access")
{
    int arr[] = {10, 20, 30};
    ci::span<int> s = arr;

    CHECK(s[1] == 20);
    CHECK(s.front() == 10);
    CHECK(s.back() == 30);

    // writes go through to the viewed memory
    s[1] = 21;
    CHECK(arr[1] == 21);
}

TEST("span - subviews")
{
    int arr[] = {0, 1, 2, 3, 4};
    ci::span<int const> s = arr;

    CHECK(s.first(2).size() == 2);
    CHECK(s.first(2).back() == 1);
    CHECK(s.first(0).empty());
    CHECK(s.subspan(3).size() == 2);
    CHECK(s.subspan(3).front() == 3);
    CHECK(s.subspan(5).empty());
    CHECK(s.subspan(1, 3).size() == 3);
    CHECK(s.subspan(1, 3).back() == 3);
}

TEST("span - function arguments")
{
    int arr[] = {1, 2, 3};
    ci::vector<int> values = {4, 5};

    CHECK(sum_of(arr) == 6);
    CHECK(sum_of(ci::span<int const>(values)) == 9);
    CHECK(sum_of({7, 8}) == 15);

    ci::span<int> mutable_view = arr;
    CHECK(sum_of(mutable_view) == 6);
}
