#include "assert.hh"

#include <stable-vec/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>
#include <version>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

#ifdef SV_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef SV_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

#ifdef SV_OS_APPLE
extern "C" int sysctl(int*, unsigned int, void*, unsigned long*, void*, unsigned long) noexcept;
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(sv::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(sv::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

#ifdef __cpp_lib_stacktrace
    std::cerr << "\nStacktrace:\n";
    std::cerr << std::to_string(std::stacktrace::current()) << '\n';
#endif
}
} // namespace

void sv::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void sv::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

sv::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

sv::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

SV_COLD_FUNC void sv::impl::handle_assert_failure(char const* expression, char const* message, sv::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool sv::impl::is_debugger_connected() noexcept
{
#ifdef SV_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(SV_OS_LINUX)
    // TracerPid is non-zero while a debugger is attached
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
#elif defined(SV_OS_APPLE)
    int mib[4] = {1 /* CTL_KERN */, 14 /* KERN_PROC */, 1 /* KERN_PROC_PID */, 0};
    mib[3] = getpid();

    struct kinfo_proc
    {
        char pad[32];
        int p_flag;
    } info{};

    unsigned long size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) == 0)
        return (info.p_flag & 0x00000800 /* P_TRACED */) != 0;

    return false;
#else
    return false;
#endif
}

[[noreturn]] void sv::impl::perform_abort() noexcept
{
    std::abort();
}
