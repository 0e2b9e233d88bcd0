#pragma once

// compiler
// one of: TMAP_COMPILER_MSVC, TMAP_COMPILER_CLANG, TMAP_COMPILER_GCC
// TMAP_COMPILER_POSIX is additionally defined for clang and gcc (including MinGW)

#if defined(_MSC_VER)
#define TMAP_COMPILER_MSVC
#elif defined(__clang__)
#define TMAP_COMPILER_CLANG
#define TMAP_COMPILER_POSIX
#elif defined(__GNUC__)
#define TMAP_COMPILER_GCC
#define TMAP_COMPILER_POSIX
#else
#error "type-map: unsupported compiler"
#endif

// operating system
// one of: TMAP_OS_WINDOWS, TMAP_OS_LINUX, TMAP_OS_APPLE, TMAP_OS_BSD

#if defined(_WIN32)
#define TMAP_OS_WINDOWS
#elif defined(__APPLE__)
#define TMAP_OS_APPLE
#elif defined(__linux__)
#define TMAP_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define TMAP_OS_BSD
#else
#error "type-map: unsupported platform"
#endif

// build configuration
// TMAP_DEBUG / TMAP_RELEASE / TMAP_RELWITHDEBINFO and TMAP_ENABLE_ASSERT_IN_RELEASE come from CMake.
// TMAP_ASSERT_ENABLED is always 0 or 1; a consumer that defines none of them gets assertions.

#if defined(TMAP_RELEASE) && !defined(TMAP_ENABLE_ASSERT_IN_RELEASE)
#define TMAP_ASSERT_ENABLED 0
#else
#define TMAP_ASSERT_ENABLED 1
#endif

// TMAP_PRETTY_FUNC: signature of the enclosing function, including template arguments.
// tmap::type_name_of<T>() cuts key names out of it.
// TMAP_FORCE_INLINE: for the tiny cast helpers in utility.hh.
// TMAP_COLD_FUNC: for assertion reporting.
// TMAP_UNUSED(expr): marks expr as used without evaluating it.

#if defined(TMAP_COMPILER_MSVC)
#define TMAP_PRETTY_FUNC __FUNCSIG__
#define TMAP_FORCE_INLINE __forceinline
#define TMAP_COLD_FUNC
#else
#define TMAP_PRETTY_FUNC __PRETTY_FUNCTION__
#define TMAP_FORCE_INLINE __attribute__((always_inline)) inline
#define TMAP_COLD_FUNC __attribute__((cold))
#endif

#define TMAP_UNUSED(expr) (void)(sizeof((expr)))
