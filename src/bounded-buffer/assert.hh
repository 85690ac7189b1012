#pragma once

// Included by every container header, so it only pulls in macros and source_location.
#include <bounded-buffer/macros.hh>
#include <bounded-buffer/source_location.hh>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// Two levels, both taking a condition and a string literal:
//
//   BB_ASSERT(cond, msg)         caller obligations that are too hot to check in release builds:
//                                the *_unchecked members, lossy insert indices, span/optional access.
//                                Stripped when BB_RELEASE is defined, unless BB_ENABLE_ASSERT_IN_RELEASE is.
//
//   BB_ASSERT_ALWAYS(cond, msg)  contract violations that must never continue, in any build:
//                                out-of-bounds pop_at/remove_at/operator[], unrepresentable capacities,
//                                out of memory.
//
// A failing assertion reports through the active handler (see assert-handler.hh), then breaks into an
// attached debugger and aborts. A handler that throws unwinds before the abort.
//
// Full buffers, missing elements and empty pops are NOT assertions: they are reported through
// bool / nullptr / nullopt return values.
//
// Usage:
//   BB_ASSERT(0 <= idx && idx <= size(), "emplace_at_unchecked: index out of bounds");
//   BB_ASSERT_ALWAYS(p != nullptr, "allocation failed: out of memory");

#ifndef BB_ASSERT_ENABLED
#if defined(BB_RELEASE) && !defined(BB_ENABLE_ASSERT_IN_RELEASE)
#define BB_ASSERT_ENABLED 0
#else
#define BB_ASSERT_ENABLED 1
#endif
#endif

#define BB_ASSERT_ALWAYS(cond, msg)                                                          \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::bb::impl::handle_assert_failure(#cond, msg, ::bb::source_location::current()); \
            BB_IMPL_DEBUG_BREAK();                                                           \
            ::bb::impl::perform_abort();                                                     \
        }                                                                                    \
    } while (false)

#if BB_ASSERT_ENABLED
#define BB_ASSERT(cond, msg) BB_ASSERT_ALWAYS(cond, msg)
#else
// stripped, but cond and msg must still compile
#define BB_ASSERT(cond, msg) \
    do                       \
    {                        \
        BB_UNUSED(cond);     \
        BB_UNUSED(msg);      \
    } while (false)
#endif

namespace bb::impl
{
// Reports a failed assertion to the topmost handler, or to stderr if none is installed.
// Returns normally unless the handler throws; the caller aborts afterwards.
BB_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, bb::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace bb::impl

// break at the assertion site rather than inside a helper
#if defined(BB_COMPILER_MSVC)
#define BB_IMPL_DEBUG_BREAK() (::bb::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// SIGTRAP is 5 on every posix target; declared here to keep <csignal> out of all headers
extern "C" int raise(int) noexcept;
#define BB_IMPL_DEBUG_BREAK() (::bb::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif
