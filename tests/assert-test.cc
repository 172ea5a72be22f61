#include <clean-iter/assert-handler.hh>
#include <clean-iter/assert.hh>
#include <clean-iter/function_ref.hh>
#include <clean-iter/optional.hh>
#include <clean-iter/span.hh>
#include <clean-iter/vector.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>

namespace
{
struct assertion_failure
{
    std::string message;
};

// runs fn and returns the message of the first failing assertion, if any
template <class F>
std::optional<std::string> failed_assertion(F&& fn)
{
    auto handler = ci::impl::scoped_assertion_handler([](ci::impl::assertion_info const& info)
                                                      { throw assertion_failure{info.message}; });
    try
    {
        fn();
    }
    catch (assertion_failure const& f)
    {
        return f.message;
    }
    return std::nullopt;
}
} // namespace

TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<ci::impl::assertion_info> captured;
    int const test_line = __LINE__ + 11; // line of CI_ASSERT_ALWAYS

    {
        auto handler = ci::impl::scoped_assertion_handler(
            [&](ci::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // must throw, the macro aborts otherwise
            });
        try
        {
            CI_ASSERT_ALWAYS(1 + 1 == 3, "math is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "math is broken");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - passing assertions do not call the handler")
{
    auto const msg = failed_assertion(
        []
        {
            CI_ASSERT_ALWAYS(true, "never");
            CI_ASSERT(2 > 1, "never");
        });
    CHECK(!msg.has_value());
}

TEST("assertions - innermost handler wins and is popped on scope exit")
{
    std::string seen;

    auto outer = ci::impl::scoped_assertion_handler([&](ci::impl::assertion_info const&)
                                                    { seen += "outer"; throw assertion_failure{}; });
    {
        auto inner = ci::impl::scoped_assertion_handler([&](ci::impl::assertion_info const&)
                                                        { seen += "inner"; throw assertion_failure{}; });
        try
        {
            CI_ASSERT_ALWAYS(false, "first");
        }
        catch (assertion_failure const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        CI_ASSERT_ALWAYS(false, "second");
    }
    catch (assertion_failure const&) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(seen == "innerouter");
}

#if CI_ASSERT_ENABLED
TEST("assertions - building block preconditions")
{
    ci::vector<int> values = {1, 2};
    ci::vector<int> empty;
    ci::optional<int> none;
    ci::function_ref<void()> invalid;

    CHECK(failed_assertion([&] { (void)values[2]; }) == "index out of bounds");
    CHECK(failed_assertion([&] { (void)ci::span<int>(values).first(3); }) == "subspan out of bounds");
    CHECK(failed_assertion([&] { (void)none.value(); }) == "attempted to access value of empty optional");
    CHECK(failed_assertion([&] { invalid(); }) == "calling invalid function_ref is UB");
    CHECK(failed_assertion([&] { empty.push_back_stable(1); }).has_value());

    // in bounds is fine
    CHECK(!failed_assertion([&] { (void)values[1]; }).has_value());
}
#endif
