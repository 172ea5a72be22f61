#include <clean-iter/immutable_list.hh>
#include <clean-iter/interval.hh>
#include <clean-iter/iterate.hh>
#include <clean-iter/to_string.hh>

#include <nexus/test.hh>

#include <list>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace geo
{
struct point
{
    int x = 0;
    int y = 0;
};

// found through ADL by make_string
std::string to_string(point const& p) { return ci::to_string(p.x) + "/" + ci::to_string(p.y); }

struct label
{
    std::string text;

    std::string to_string() const { return "#" + text; }
};
} // namespace geo

TEST("to_string - elements")
{
    CHECK(ci::to_string(true) == "true");
    CHECK(ci::to_string(false) == "false");
    CHECK(ci::to_string('x') == "x");
    CHECK(ci::to_string(ci::byte(0xAB)) == "0xAB");
    CHECK(ci::to_string(ci::byte(0x05)) == "0x05");

    CHECK(ci::to_string(0) == "0");
    CHECK(ci::to_string(-17) == "-17");
    CHECK(ci::to_string(ci::i8(-128)) == "-128");
    CHECK(ci::to_string(ci::u8(200)) == "200");
    CHECK(ci::to_string(ci::i64(-9'000'000'000)) == "-9000000000");
    CHECK(ci::to_string(ci::u64(18'446'744'073'709'551'615ull)) == "18446744073709551615");

    CHECK(ci::to_string(1.5) == "1.5");
    CHECK(ci::to_string(0.1) == "0.1");
    CHECK(ci::to_string(0.25f) == "0.25");
    CHECK(ci::to_string(-2.0) == "-2");

    CHECK(ci::to_string("text") == "text");
    CHECK(ci::to_string(std::string("text")) == "text");
    CHECK(ci::to_string(std::string_view("text")) == "text");

    CHECK(ci::to_string(static_cast<void const*>(nullptr)) == "0x0");
}

TEST("make_string - separators")
{
    std::vector<int> const values = {1, 2, 3};

    CHECK(ci::make_string(values) == "1, 2, 3");
    CHECK(ci::make_string(values, "/") == "1/2/3");
    CHECK(ci::make_string(values, "[", "; ", "]") == "[1; 2; 3]");
    CHECK(ci::make_string(values, "") == "123");

    SECTION("empty and single element sources")
    {
        CHECK(ci::make_string(std::list<int>{}) == "");
        CHECK(ci::make_string(std::list<int>{}, "<", ",", ">") == "<>");
        CHECK(ci::make_string(std::list<int>{7}, "<", ",", ">") == "<7>");
    }

    SECTION("element types")
    {
        CHECK(ci::make_string(std::set<std::string>{"b", "a"}) == "a, b");
        CHECK(ci::make_string(ci::vector<bool>{true, false}) == "true, false");
        CHECK(ci::make_string(ci::vector<double>{1.5, 0.1}) == "1.5, 0.1");
        CHECK(ci::make_string(ci::immutable_list<char>{'a', 'b'}, "") == "ab");
        CHECK(ci::make_string(ci::interval::from_to_by(0, 20, 10)) == "0, 10, 20");
    }
}

TEST("make_string - append_string")
{
    std::string out = "values: ";
    ci::append_string(std::vector<int>{4, 5}, out, "{", ", ", "}");
    CHECK(out == "values: {4, 5}");

    ci::append_string(std::list<int>{}, out, "{", ", ", "}");
    CHECK(out == "values: {4, 5}{}");

    ci::immutable_list<int> const list = {1, 2};
    list.append_string(out, " (", " ", ")");
    CHECK(out == "values: {4, 5}{} (1 2)");
}

TEST("make_string - user element types")
{
    SECTION("free to_string in the element's namespace")
    {
        std::vector<geo::point> points = {{1, 2}, {3, 4}};
        CHECK(ci::make_string(points) == "1/2, 3/4");
        CHECK(ci::make_string(points, "[", " ", "]") == "[1/2 3/4]");
    }

    SECTION("member to_string")
    {
        std::list<geo::label> labels = {{"a"}, {"b"}};
        CHECK(ci::make_string(labels, "|") == "#a|#b");
    }

    SECTION("pairs from zip and zip_with_index")
    {
        ci::vector<std::string> names = {"ann", "bob"};
        ci::vector<int> ages = {31, 42};

        auto const zipped = ci::zip(names, ages);
        CHECK(ci::make_string(zipped) == "(ann, 31), (bob, 42)");

        auto const indexed = ci::zip_with_index(names);
        CHECK(ci::make_string(indexed, "; ") == "(ann, 0); (bob, 1)");

        std::vector<geo::point> points = {{5, 6}};
        auto const nested = ci::zip_with_index(points);
        CHECK(ci::make_string(nested) == "(5/6, 0)");
    }

    SECTION("optionals")
    {
        std::vector<ci::optional<int>> values = {ci::optional<int>(1), ci::optional<int>(), ci::optional<int>(3)};
        CHECK(ci::make_string(values) == "1, nullopt, 3");
        CHECK(ci::to_string(ci::optional<std::string>("x")) == "x");
    }
}
