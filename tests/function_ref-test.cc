#include <clean-iter/function_ref.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

static_assert(std::is_trivially_copyable_v<ci::function_ref<int(int)>>);
static_assert(sizeof(ci::function_ref<int(int)>) == 2 * sizeof(void*));

namespace
{
int twice(int x) { return 2 * x; }

struct counter
{
    int count = 0;

    int operator()(int step)
    {
        count += step;
        return count;
    }
};

struct person
{
    std::string name;
    int age = 0;

    bool is_older_than(int years) const { return age > years; }
};

int apply(ci::function_ref<int(int)> fn, int value) { return fn(value); }
} // namespace

TEST("function_ref - default construction creates invalid state")
{
    ci::function_ref<void()> fn;
    CHECK(!fn.is_valid());
    CHECK(!fn);
}

TEST("function_ref - callables")
{
    SECTION("function pointer")
    {
        auto const ptr = &twice;
        ci::function_ref<int(int)> fn = ptr;
        CHECK(fn.is_valid());
        CHECK(fn(21) == 42);
    }

    SECTION("lambda")
    {
        int const offset = 10;
        auto add = [&](int x) { return x + offset; };
        ci::function_ref<int(int)> fn = add;
        CHECK(fn(5) == 15);
    }

    SECTION("functor keeps its state by reference")
    {
        counter c;
        ci::function_ref<int(int)> fn = c;
        fn(2);
        fn(3);
        CHECK(c.count == 5);
    }

    SECTION("member pointers")
    {
        person const p{"ann", 31};

        ci::function_ref<bool(person const&, int)> older = &person::is_older_than;
        CHECK(older(p, 30));
        CHECK(!older(p, 31));

        ci::function_ref<std::string const&(person const&)> name = &person::name;
        CHECK(name(p) == "ann");
    }
}

TEST("function_ref - temporaries as immediate arguments")
{
    CHECK(apply([](int x) { return x * x; }, 7) == 49);
    CHECK(apply(&twice, 4) == 8);
    CHECK(apply(counter{}, 3) == 3);
}

TEST("function_ref - return type conversions")
{
    auto const half = [](int x) { return x / 2; };
    ci::function_ref<double(int)> widen = half;
    CHECK(widen(5) == 2.0);

    auto const identity = [](int x) { return x; };
    ci::function_ref<void(int)> ignore = identity;
    ignore(1);

    static_assert(!std::is_constructible_v<ci::function_ref<int(int)>, void (*)(int)>);
    static_assert(!std::is_constructible_v<ci::function_ref<int(std::string)>, int (*)(int)>);
}

TEST("function_ref - copies reference the same callable")
{
    counter c;
    ci::function_ref<int(int)> a = c;
    auto b = a;
    a(1);
    b(1);
    CHECK(c.count == 2);

    ci::function_ref<int(int)> d;
    d = b;
    CHECK(d(1) == 3);
}
