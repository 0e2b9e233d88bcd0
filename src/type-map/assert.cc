#include "assert.hh"

#include <type-map/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>
#include <version>

#if defined(__cpp_lib_stacktrace) && __cpp_lib_stacktrace >= 202011L
#include <stacktrace>
#endif

#ifdef TMAP_OS_LINUX
#include <cstring>
#endif

#ifdef TMAP_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<tmap::impl::assertion_handler> g_handlers;

void report_to_stderr(tmap::impl::assertion_info const& info)
{
    std::cerr << info.to_report() << '\n';
#if defined(__cpp_lib_stacktrace) && __cpp_lib_stacktrace >= 202011L
    std::cerr << std::stacktrace::current() << '\n';
#endif
}
} // namespace

std::string tmap::impl::assertion_info::to_report() const
{
    auto s = std::string("type-map assertion failed: `");
    s += expression;
    s += '`';
    if (!message.empty())
    {
        s += " (";
        s += message;
        s += ')';
    }
    s += " at ";
    s += location.file_name();
    s += ':';
    s += std::to_string(location.line());
    s += " in ";
    s += location.function_name();
    return s;
}

void tmap::impl::push_assertion_handler(assertion_handler handler)
{
    g_handlers.push_back(std::move(handler));
}

void tmap::impl::pop_assertion_handler()
{
    if (!g_handlers.empty())
        g_handlers.pop_back();
}

void tmap::impl::report_assertion_failure(char const* expression, char const* message, tmap::source_location location)
{
    auto const info = assertion_info{expression, message, location};

    if (g_handlers.empty())
        report_to_stderr(info);
    else
        g_handlers.back()(info); // may throw
}

bool tmap::impl::is_debugger_attached() noexcept
{
#if defined(TMAP_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(TMAP_OS_LINUX)
    // a traced process has a non-zero TracerPid
    auto const f = std::fopen("/proc/self/status", "r");
    if (f == nullptr)
        return false;

    auto attached = false;
    char line[256];
    while (std::fgets(line, sizeof(line), f) != nullptr)
    {
        if (std::strncmp(line, "TracerPid:", 10) != 0)
            continue;

        int pid = 0;
        attached = std::sscanf(line + 10, "%d", &pid) == 1 && pid != 0;
        break;
    }
    std::fclose(f);
    return attached;
#else
    return false;
#endif
}

void tmap::impl::abort_after_assertion() noexcept
{
    std::abort();
}
