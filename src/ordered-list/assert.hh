#pragma once

// No string or container includes, list_base.hh and result.hh pull this into every TU.
#include <ordered-list/macros.hh>
#include <ordered-list/source_location.hh>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// OL_ASSERT(cond, msg)         checks a precondition or invariant, compiled out when OL_ASSERT_ENABLED is 0
// OL_ASSERT_ALWAYS(cond, msg)  same, but active in every build mode
// OL_DEBUG_BREAK()             stops in an attached debugger, no-op otherwise
// OL_BREAK_AND_ABORT()         OL_DEBUG_BREAK() and then terminate
//
// `msg` is a string literal. A failure goes to the active handler (see assert-handler.hh),
// then the process breaks and aborts unless the handler threw.
//
// Assertions are reserved for programmer errors:
//   list[i] with i outside [0, count)
//   result::value() on an error, result::error() on a value
// Everything a caller is expected to handle (index out of range on item_at, mutating a locked list, ...)
// is an ol::list_error inside an ol::result instead. Nothing in ordered-list throws.
//
// Usage:
//   OL_ASSERT(0 <= i && i < count(), "index out of bounds");
//
#define OL_ASSERT(cond, msg) OL_IMPL_ASSERT(cond, msg)
#define OL_ASSERT_ALWAYS(cond, msg) OL_IMPL_ASSERT_ALWAYS(cond, msg)
#define OL_DEBUG_BREAK() OL_IMPL_DEBUG_BREAK()
#define OL_BREAK_AND_ABORT() (OL_DEBUG_BREAK(), ::ol::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ol::impl
{
// Called when an assertion fails
// Dispatches to the top-most assertion handler (see assert-handler.hh) or prints to stderr
// Note: does not abort, caller must follow with OL_BREAK_AND_ABORT()
OL_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ol::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ol::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef OL_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define OL_IMPL_DEBUG_BREAK() (::ol::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(OL_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// declared here to avoid pulling a posix header into every TU
extern "C" int raise(int) noexcept;
#define OL_IMPL_DEBUG_BREAK() (::ol::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define OL_IMPL_DEBUG_BREAK() void(0)

#endif

#define OL_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ol::impl::handle_assert_failure(#cond, msg, ::ol::source_location::current()); \
            OL_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if OL_ASSERT_ENABLED

#define OL_IMPL_ASSERT(cond, msg) OL_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the arguments must still compile
#define OL_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OL_UNUSED(cond);          \
        OL_UNUSED(msg);           \
    } while (false)

#endif
