#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/macros.hh>
#include <clean-iter/source_location.hh>

#include <stdexcept>
#include <string>

// =========================================================================================================
// Errors reported by the iteration API
// =========================================================================================================
//
// invalid_argument_error       - the call itself is invalid:
//                                null source, chunk size <= 0, negative take/drop count,
//                                get_only on a source that does not have exactly one element
// unsupported_operation_error  - the call is valid but the source or target cannot do it:
//                                sort_this / remove_if on an immutable or read-only source,
//                                any structural mutation of an immutable collaborator
//
// Both remember where they were raised (site()).
// A failed operation leaves source and target as they were.
//
// Exceptions thrown by user operations (predicates, functions, comparators) are never caught,
// wrapped or translated: they reach the caller unchanged.
//
// Usage:
//   try
//   {
//       ci::remove_if(frozen, is_odd);
//   }
//   catch (ci::unsupported_operation_error const& e)
//   {
//       std::cerr << e.to_string();
//   }

class ci::invalid_argument_error : public std::invalid_argument
{
public:
    explicit invalid_argument_error(std::string const& message, ci::source_location site = ci::source_location::current());

    /// Where the error was raised.
    [[nodiscard]] ci::source_location site() const noexcept { return _site; }

    /// "error: <message>" followed by the site.
    [[nodiscard]] std::string to_string() const;

private:
    ci::source_location _site;
};

class ci::unsupported_operation_error : public std::logic_error
{
public:
    explicit unsupported_operation_error(std::string const& message,
                                         ci::source_location site = ci::source_location::current());

    /// Where the error was raised.
    [[nodiscard]] ci::source_location site() const noexcept { return _site; }

    /// "error: <message>" followed by the site.
    [[nodiscard]] std::string to_string() const;

private:
    ci::source_location _site;
};

namespace ci::impl
{
// "cannot perform <operation> on null"
[[noreturn]] CI_COLD_FUNC void throw_null_source(char const* operation,
                                                 ci::source_location site = ci::source_location::current());

// "cannot perform <operation> on an immutable source"
[[noreturn]] CI_COLD_FUNC void throw_immutable_source(char const* operation,
                                                      ci::source_location site = ci::source_location::current());

// message is used verbatim
[[noreturn]] CI_COLD_FUNC void throw_invalid_argument(std::string const& message,
                                                      ci::source_location site = ci::source_location::current());
[[noreturn]] CI_COLD_FUNC void throw_unsupported_operation(std::string const& message,
                                                           ci::source_location site = ci::source_location::current());
} // namespace ci::impl
