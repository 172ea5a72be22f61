#pragma once

#include <clean-iter/macros.hh>
#include <clean-iter/source_location.hh>

#include <functional>
#include <string>

namespace ci::impl
{
// Customizable assertion handler stack
// NOTE: Handlers are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = ci::impl::scoped_assertion_handler([](ci::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw assertion_failure_exception{info.message};
//       });
//
//       risky_operation(); // any failing CI_ASSERT in here calls the handler
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    ci::source_location location;
};

using assertion_handler = std::function<void(assertion_info const&)>;

// Push a custom assertion handler onto the handler stack
// Handlers may throw to unwind to a recovery point (this is how the tests observe assertions)
void push_assertion_handler(assertion_handler handler);

// Pop the topmost assertion handler from the stack
// prefer scoped_assertion_handler, which also pops during unwinding
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ci::impl
