#include "assert.hh"

#include <ordered-list/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#ifdef OL_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef OL_OS_APPLE
#include <sys/sysctl.h>
#include <unistd.h>
#endif

#ifdef OL_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, must be externally synchronized
std::vector<ol::impl::assertion_handler> g_assertion_handlers;

void default_assert_handler(ol::impl::assertion_info const& info)
{
    std::cerr << ol::impl::to_string(info);
    std::cerr.flush();
}
} // namespace

std::string ol::impl::to_string(assertion_info const& info)
{
    std::string result = "Assertion failed: ";
    result += info.expression;
    result += "\n  Message: ";
    result += info.message;
    result += "\n  Location: ";
    result += info.location.file_name();
    result += ':';
    result += std::to_string(info.location.line());
    result += ':';
    result += std::to_string(info.location.column());
    result += " (";
    result += info.location.function_name();
    result += ")\n";
    return result;
}

void ol::impl::push_assertion_handler(assertion_handler handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ol::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

ol::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

ol::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

OL_COLD_FUNC void ol::impl::handle_assert_failure(char const* expression, char const* message, ol::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    // Call the topmost handler if available, otherwise use default handler
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool ol::impl::is_debugger_connected() noexcept
{
#ifdef OL_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(OL_OS_LINUX)
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
#elif defined(OL_OS_APPLE)
    int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PID, getpid()};
    kinfo_proc info{};
    size_t size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) == 0)
        return (info.kp_proc.p_flag & P_TRACED) != 0;
    return false;
#else
    return false;
#endif
}

[[noreturn]] void ol::impl::perform_abort() noexcept
{
    std::abort();
}
