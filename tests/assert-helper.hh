#pragma once

#include <bounded-buffer/assert-handler.hh>

namespace test
{
struct assertion_triggered
{
};

/// Runs f with a throwing assertion handler installed.
/// Returns true iff f triggered an assertion (BB_ASSERT or BB_ASSERT_ALWAYS).
/// The handler throws before the abort is reached, so the process keeps running.
template <class F>
bool triggers_assertion(F&& f)
{
    auto handler = bb::impl::scoped_assertion_handler([](bb::impl::assertion_info const&) { throw assertion_triggered{}; });
    try
    {
        f();
    }
    catch (assertion_triggered const&)
    {
        return true;
    }
    return false;
}
} // namespace test
