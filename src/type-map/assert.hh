#pragma once

#include <type-map/macros.hh>
#include <type-map/source_location.hh>

// TMAP_ASSERT(cond, msg)
//   Checks a precondition or invariant of the library, e.g. that an any_box is only ever
//   recovered as the type it was created with. msg must be a string literal.
//   Compiled out when TMAP_ASSERT_ENABLED is 0 (cond and msg are still type checked).
//
// TMAP_ASSERT_ALWAYS(cond, msg)
//   Same, but active in every configuration. Used where continuing is impossible (allocation failure).
//
// A failed assertion is reported to the topmost handler (see assert-handler.hh), then the
// process breaks into an attached debugger and aborts. A handler can only recover by throwing.
// Absent keys are never assertion failures: lookups return an empty optional.

#define TMAP_ASSERT_ALWAYS(cond, msg)                                                             \
    do                                                                                            \
    {                                                                                             \
        if (!(cond)) [[unlikely]]                                                                 \
        {                                                                                         \
            ::tmap::impl::report_assertion_failure(#cond, msg, ::tmap::source_location::current()); \
            TMAP_DEBUG_BREAK();                                                                   \
            ::tmap::impl::abort_after_assertion();                                                \
        }                                                                                         \
    } while (false)

#if TMAP_ASSERT_ENABLED
#define TMAP_ASSERT(cond, msg) TMAP_ASSERT_ALWAYS(cond, msg)
#else
#define TMAP_ASSERT(cond, msg) \
    do                         \
    {                          \
        TMAP_UNUSED(cond);     \
        TMAP_UNUSED(msg);      \
    } while (false)
#endif

// breaks inside the macro (not a helper function) so the debugger stops at the failing line
#if defined(TMAP_COMPILER_MSVC)
#define TMAP_DEBUG_BREAK() (::tmap::impl::is_debugger_attached() ? __debugbreak() : void(0))
#else
// SIGTRAP is 5; raise is declared directly to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define TMAP_DEBUG_BREAK() (::tmap::impl::is_debugger_attached() ? (void)::raise(5) : void(0))
#endif

namespace tmap::impl
{
TMAP_COLD_FUNC void report_assertion_failure(char const* expression, char const* message, tmap::source_location location);

[[nodiscard]] bool is_debugger_attached() noexcept;

[[noreturn]] void abort_after_assertion() noexcept;
} // namespace tmap::impl
