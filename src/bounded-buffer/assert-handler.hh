#pragma once

#include <bounded-buffer/source_location.hh>

#include <functional>
#include <string>
#include <utility>

// Interception of failed assertions.
//
// Handlers form a stack; only the topmost one sees a failure. Without any handler the report goes
// to std::cerr. A handler may throw to unwind out of the failing operation (tests rely on this to
// observe BB_ASSERT_ALWAYS without terminating). Returning normally still aborts.
//
// The stack is global and unsynchronized.
//
//   {
//       auto guard = bb::impl::scoped_assertion_handler([](bb::impl::assertion_info const& info) {
//           throw contract_violation(bb::impl::format_assertion(info));
//       });
//       (void)buffer.pop_at(idx); // an invalid idx now throws contract_violation
//   }

namespace bb::impl
{
struct assertion_info
{
    std::string expression; // stringified condition
    std::string message;
    bb::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

/// Report as printed by the default handler:
///   bounded-buffer assertion failed: <expression>
///     message:  <message>
///     location: <file>:<line>:<column> (<function>)
[[nodiscard]] std::string format_assertion(assertion_info const& info);

/// Pushes on construction, pops on destruction (also when unwinding from a throwing handler).
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(std::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace bb::impl
