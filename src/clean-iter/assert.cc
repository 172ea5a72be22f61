#include "assert.hh"

#include <clean-iter/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef CI_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef CI_OS_LINUX
#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<ci::impl::assertion_handler> g_assertion_handlers;

void default_assert_handler(ci::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
}
} // namespace

void ci::impl::push_assertion_handler(assertion_handler handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ci::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

ci::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

ci::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

CI_COLD_FUNC void ci::impl::handle_assert_failure(char const* expression, char const* message, ci::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    // topmost handler wins, the default handler only prints
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool ci::impl::is_debugger_connected() noexcept
{
#ifdef CI_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(CI_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void ci::impl::perform_abort() noexcept
{
    std::abort();
}
