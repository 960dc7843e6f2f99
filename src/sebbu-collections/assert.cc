#include "assert.hh"

#include <sebbu-collections/assert-handler.hh>
#include <sebbu-collections/vector.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

#ifdef SC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// innermost handler is at the back
sc::vector<sc::impl::assertion_handler> g_handlers;

void print_violation(sc::impl::assertion_info const& info)
{
    std::cerr << "sebbu-collections contract violation: " << info.message << '\n'
              << "  check:  " << info.expression << '\n'
              << "  at:     " << info.location.file_name() << ':' << info.location.line() << '\n'
              << "  in:     " << info.location.function_name() << std::endl;
}
} // namespace

sc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    g_handlers.push_back(sc::move(handler));
}

sc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    g_handlers.remove_back();
}

void sc::impl::report_contract_violation(char const* expression, char const* message, std::source_location where)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = where,
    };

    if (g_handlers.empty())
        print_violation(info);
    else
        g_handlers.back()(info);
}

bool sc::impl::debugger_attached() noexcept
{
#if defined(SC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(SC_OS_LINUX)
    // a tracer shows up as a non-zero TracerPid line
    auto* const status = std::fopen("/proc/self/status", "r");
    if (status == nullptr)
        return false;

    auto tracer_pid = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), status) != nullptr)
        if (std::strncmp(line, "TracerPid:", 10) == 0)
        {
            tracer_pid = std::atoi(line + 10);
            break;
        }

    std::fclose(status);
    return tracer_pid != 0;
#else
    return false;
#endif
}

void sc::impl::abort_after_violation() noexcept
{
    std::abort();
}
