#include <clean-iter/immutable_list.hh>
#include <clean-iter/iterate.hh>

#include <nexus/test.hh>

#include <list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
template <class ErrorT>
std::string message_of(auto&& fn)
{
    try
    {
        fn();
    }
    catch (ErrorT const& e)
    {
        return e.what();
    }
    return "<no error>";
}

bool contains_text(std::string const& s, std::string const& part) { return s.find(part) != std::string::npos; }
} // namespace

TEST("errors - null sources")
{
    std::vector<int>* raw = nullptr;
    std::unique_ptr<std::list<int>> unique;
    std::shared_ptr<ci::vector<int>> shared;
    ci::immutable_list<int> const* rich = nullptr;

    auto const pred = [](int i) { return i > 0; };

    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::select(raw, pred); }) == "cannot perform select on null");
    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::count(unique, pred); }) == "cannot perform count on null");
    CHECK(message_of<ci::invalid_argument_error>([&] { ci::for_each(shared, pred); })
          == "cannot perform for_each on null");
    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::detect(rich, pred); }) == "cannot perform detect on null");
    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::remove_if(raw, pred); })
          == "cannot perform remove_if on null");
    CHECK(message_of<ci::invalid_argument_error>([&] { ci::sort_this(unique); }) == "cannot perform sort_this on null");

    SECTION("emptiness queries treat null as empty")
    {
        CHECK(ci::is_empty(raw));
        CHECK(ci::is_empty(unique));
        CHECK(ci::is_empty(shared));
        CHECK(ci::is_empty(rich));
        CHECK(!ci::not_empty(raw));
        CHECK(!ci::not_empty(shared));

        CHECK(ci::is_empty(nullptr));
        CHECK(!ci::not_empty(nullptr));
    }

    SECTION("non-null pointers are sources")
    {
        std::vector<int> values = {-1, 2, 3};
        raw = &values;
        unique = std::make_unique<std::list<int>>(std::list<int>{4});

        CHECK(ci::count(raw, pred) == 2);
        CHECK(ci::not_empty(raw));
        CHECK(ci::get_only(unique) == 4);
    }
}

TEST("errors - invalid arguments")
{
    std::list<int> const values = {1, 2, 3};

    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::take(values, -1); })
          == "take count must not be negative, but was -1");
    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::drop(ci::vector<int>{1}, -3); })
          == "drop count must not be negative, but was -3");
    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::chunk(values, 0); })
          == "chunk size must be greater than zero, but was 0");
    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::get_only(values); })
          == "get_only needs exactly one element, but the source has more");
    CHECK(message_of<ci::invalid_argument_error>([&] { (void)ci::get_only(std::vector<int>{}); })
          == "get_only needs exactly one element, but the source is empty");

    // zero counts are fine
    CHECK(ci::take(values, 0).empty());
    CHECK(ci::drop(values, 0) == values);
    CHECK(ci::take(values, 10) == values);
    CHECK(ci::drop(values, 10).empty());
}

TEST("errors - unsupported operations")
{
    ci::immutable_list<int> frozen = {3, 1, 2};

    CHECK(message_of<ci::unsupported_operation_error>([&] { (void)ci::remove_if(frozen, [](int) { return true; }); })
          == "cannot perform remove_if on an immutable source");
    CHECK(message_of<ci::unsupported_operation_error>([&] { ci::sort_this_by(frozen, [](int i) { return i; }); })
          == "cannot perform sort_this_by on an immutable source");

    std::vector<int> const read_only = {1};
    CHECK(message_of<ci::unsupported_operation_error>([&] { ci::sort_this(read_only); })
          == "cannot perform sort_this on an immutable source");
}

TEST("errors - site and description")
{
    std::vector<int>* none = nullptr;

    try
    {
        (void)ci::collect(none, [](int i) { return i; });
        CHECK(false);
    }
    catch (ci::invalid_argument_error const& e)
    {
        CHECK(e.site().line() > 0);
        CHECK(contains_text(e.site().file_name(), "iterate.hh"));

        auto const text = e.to_string();
        CHECK(text.starts_with("error: cannot perform collect on null\n"));
        CHECK(contains_text(text, "iterate.hh:"));
    }

    ci::unsupported_operation_error const error("custom");
    CHECK(std::string(error.what()) == "custom");
    CHECK(contains_text(error.site().file_name(), "errors-test.cc"));
    CHECK(error.to_string().starts_with("error: custom\n"));

    // both derive from the standard hierarchy
    std::logic_error const& as_logic = error;
    CHECK(std::string(as_logic.what()) == "custom");
    ci::invalid_argument_error const invalid("bad");
    std::invalid_argument const& as_invalid = invalid;
    CHECK(std::string(as_invalid.what()) == "bad");
}
