#pragma once

#include <sebbu-collections/macros.hh>

#include <source_location>

// =========================================================================================================
// Contract violations
// =========================================================================================================
//
// The containers report three kinds of outcomes, each through its own channel:
//
//   misuse (a broken precondition)     -> SC_ASSERT, reaches the handler stack (assert-handler.hh), then aborts
//       ringbuffer::create_with_capacity(n) with n <= 2
//       pop_front / pop_back / front / back / remove_* on an empty ring or devector
//       logical index outside [0, size()) in a ring, devector, array, vector or span
//       bitset of size <= 0, bit index outside [0, size())
//       parallel_map with negative parallelism or block size
//       optional::value() on an empty optional
//
//   expected absence                   -> bool / sc::optional result, no assertion
//       try_push_* on a full ring returns false
//       try_pop_* on an empty ring or devector returns sc::nullopt
//       ticket_map::get / pop / find with an unknown or removed id
//       binary_search without a match
//
//   failures inside user code          -> exceptions, propagated unchanged
//       throwing element constructors, the callables of map_to_array and parallel_map,
//       std::system_error when parallel_map cannot start a worker thread
//
// SC_ASSERT compiles to nothing in plain release builds (see SC_ASSERT_ENABLED in macros.hh),
// the condition is then type-checked but never evaluated.
// SC_ASSERT_ALWAYS stays active everywhere and guards states that would corrupt memory,
// such as the system allocator returning null.
//
// Usage:
//   SC_ASSERT(!empty(), "cannot pop from empty container");

#define SC_ASSERT(cond, msg) SC_IMPL_ASSERT(cond, msg)
#define SC_ASSERT_ALWAYS(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)

namespace sc::impl
{
// runs the innermost handler, or prints the violation to stderr if none is installed
// returns if that handler returns, the macro aborts afterwards
SC_COLD_FUNC void report_contract_violation(char const* expression, char const* message, std::source_location where);

[[nodiscard]] bool debugger_attached() noexcept;
[[noreturn]] void abort_after_violation() noexcept;
} // namespace sc::impl

// the break happens inside the macro so the debugger stops at the failing line

#if defined(SC_COMPILER_MSVC)
#define SC_IMPL_BREAK_IF_DEBUGGED() (::sc::impl::debugger_attached() ? __debugbreak() : void(0))
#else
// SIGTRAP, declared by hand so this header stays free of <csignal>
extern "C" int raise(int) noexcept;
#define SC_IMPL_BREAK_IF_DEBUGGED() (::sc::impl::debugger_attached() ? (void)::raise(5) : void(0))
#endif

#define SC_IMPL_ASSERT_ALWAYS(cond, msg)                                                         \
    do                                                                                           \
    {                                                                                            \
        if (!(cond)) [[unlikely]]                                                                \
        {                                                                                        \
            ::sc::impl::report_contract_violation(#cond, msg, std::source_location::current()); \
            SC_IMPL_BREAK_IF_DEBUGGED();                                                         \
            ::sc::impl::abort_after_violation();                                                 \
        }                                                                                        \
    } while (false)

#if SC_ASSERT_ENABLED
#define SC_IMPL_ASSERT(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define SC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SC_UNUSED(cond);          \
        SC_UNUSED(msg);           \
    } while (false)
#endif
