#include "assert.hh"

#include <bounded-buffer/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#ifdef BB_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<bb::impl::assertion_handler>& handler_stack()
{
    static std::vector<bb::impl::assertion_handler> handlers;
    return handlers;
}
} // namespace

void bb::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void bb::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

std::string bb::impl::format_assertion(assertion_info const& info)
{
    std::string s = "bounded-buffer assertion failed: ";
    s += info.expression;
    s += "\n  message:  ";
    s += info.message;
    s += "\n  location: ";
    s += info.location.file_name();
    s += ':';
    s += std::to_string(info.location.line());
    s += ':';
    s += std::to_string(info.location.column());
    s += " (";
    s += info.location.function_name();
    s += ")\n";
    return s;
}

void bb::impl::handle_assert_failure(char const* expression, char const* message, bb::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
    {
        std::cerr << format_assertion(info) << std::flush;
        return;
    }

    handlers.back()(info);
}

bool bb::impl::is_debugger_connected() noexcept
{
#if defined(BB_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(BB_OS_LINUX)
    // non-zero TracerPid while ptrace'd
    auto const f = std::fopen("/proc/self/status", "r");
    if (f == nullptr)
        return false;

    int tracer = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), f))
    {
        if (std::strncmp(line, "TracerPid:", 10) != 0)
            continue;

        if (std::sscanf(line + 10, "%d", &tracer) != 1)
            tracer = 0;
        break;
    }

    std::fclose(f);
    return tracer != 0;
#else
    return false;
#endif
}

void bb::impl::perform_abort() noexcept
{
    std::abort();
}
