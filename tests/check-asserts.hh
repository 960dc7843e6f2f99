#pragma once

#include <sebbu-collections/assert-handler.hh>

#include <nexus/test.hh>

namespace sc::test
{
// thrown by the handler installed in SC_CHECK_ASSERTS to unwind out of the failing call
struct assertion_triggered
{
};
} // namespace sc::test

// CHECKs that evaluating the expression fails an SC_ASSERT
// A throwing handler is active while the expression runs, so the process does not abort.
// Usage:
//   SC_CHECK_ASSERTS(ring.pop_front()); // ring is empty
#define SC_CHECK_ASSERTS(...)                                                                                \
    do                                                                                                       \
    {                                                                                                        \
        bool sc_test_asserted = false;                                                                       \
        {                                                                                                    \
            auto sc_test_handler = ::sc::impl::scoped_assertion_handler(                                     \
                [](::sc::impl::assertion_info const&) { throw ::sc::test::assertion_triggered{}; });         \
            try                                                                                              \
            {                                                                                                \
                (void)(__VA_ARGS__);                                                                         \
            }                                                                                                \
            catch (::sc::test::assertion_triggered const&)                                                   \
            {                                                                                                \
                sc_test_asserted = true;                                                                     \
            }                                                                                                \
        }                                                                                                    \
        CHECK(sc_test_asserted);                                                                             \
    } while (false)
