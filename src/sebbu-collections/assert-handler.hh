#pragma once

#include <functional>
#include <source_location>
#include <string>

namespace sc::impl
{
/// Describes one failed SC_ASSERT, e.g.
///   expression "!empty()", message "cannot pop from empty container", where = the failing line
struct assertion_info
{
    std::string expression;
    std::string message;
    std::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Installs handler as the innermost contract-violation handler for the lifetime of this object.
/// A handler that throws unwinds out of the violating container call instead of aborting,
/// which is how tests check that misuse is detected:
///
///   auto guard = sc::impl::scoped_assertion_handler([](sc::impl::assertion_info const& info) {
///       throw misuse{info.message};
///   });
///   (void)ring.pop_front(); // empty ring: throws misuse
///
/// Handlers are process-global and not synchronized. Install them before spawning threads.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace sc::impl
