#include "errors.hh"

#include <clean-iter/to_string.hh>

namespace
{
std::string describe(char const* message, ci::source_location site)
{
    std::string result = "error: ";
    result += message;
    result += "\n  at ";
    result += site.file_name();
    result += ":";
    result += ci::to_string(site.line());
    result += " - ";
    result += site.function_name();
    result += "\n";
    return result;
}
} // namespace

ci::invalid_argument_error::invalid_argument_error(std::string const& message, ci::source_location site)
  : std::invalid_argument(message), _site(site)
{
}

std::string ci::invalid_argument_error::to_string() const
{
    return describe(what(), _site);
}

ci::unsupported_operation_error::unsupported_operation_error(std::string const& message, ci::source_location site)
  : std::logic_error(message), _site(site)
{
}

std::string ci::unsupported_operation_error::to_string() const
{
    return describe(what(), _site);
}

void ci::impl::throw_null_source(char const* operation, ci::source_location site)
{
    throw ci::invalid_argument_error(std::string("cannot perform ") + operation + " on null", site);
}

void ci::impl::throw_immutable_source(char const* operation, ci::source_location site)
{
    throw ci::unsupported_operation_error(std::string("cannot perform ") + operation + " on an immutable source", site);
}

void ci::impl::throw_invalid_argument(std::string const& message, ci::source_location site)
{
    throw ci::invalid_argument_error(message, site);
}

void ci::impl::throw_unsupported_operation(std::string const& message, ci::source_location site)
{
    throw ci::unsupported_operation_error(message, site);
}
