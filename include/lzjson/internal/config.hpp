// Config macros and platform support.

#ifndef LZJSON_CONFIG_HPP
#define LZJSON_CONFIG_HPP

// If enabled, std::logic_errors will be used in place of 
// assert()s where appropriate.
// This may cause significant runtime overhead.
//
// Cursor misuse (reading a member value before its name,
// advancing past an unfinished child, etc.) always throws
// std::logic_error and is not affected by this.
//
#ifndef LZJSON_USE_LOGIC_ERRORS
#define LZJSON_USE_LOGIC_ERRORS 0
#endif

// If enabled, stack-traces will be included in exception
// messages. This may cause significant runtime overhead.
//
#ifndef LZJSON_EXC_STACKTRACE
#define LZJSON_EXC_STACKTRACE 0
#endif

// Maximum number of nested objects and arrays.
// whole() recurses once per level.
//
#ifndef LZJSON_MAX_DEPTH
#define LZJSON_MAX_DEPTH 1000
#endif


#include <cstddef>
#include <cassert>

#ifdef _MSC_VER
#define LZJSON_CPLUSPLUS _MSVC_LANG
#else
#define LZJSON_CPLUSPLUS __cplusplus
#endif

#define LZJSON_STRFY(...) #__VA_ARGS__
#define LZJSON_XSTRFY(x) LZJSON_STRFY(x)

#define LZJSON_SRCLOC __FILE__ ":" LZJSON_XSTRFY(__LINE__)

#ifdef __has_include
#define LZJSON_HAS_INCLUDE(x) __has_include(x)
#else
#define LZJSON_HAS_INCLUDE(x) 0
#endif

#ifdef __has_attribute
#define LZJSON_HAS_ATTRIBUTE(x) __has_attribute(x)
#else
#define LZJSON_HAS_ATTRIBUTE(x) 0
#endif

#if LZJSON_HAS_INCLUDE(<version>)
#include <version>
#endif

#if LZJSON_HAS_INCLUDE(<string_view>) && LZJSON_CPLUSPLUS >= 201703L
#define LZJSON_HAS_STRING_VIEW 1
#endif

// gcc is non-conforming: has_include succeeds but header is
// unusable unless __cpp_lib_stacktrace is defined
#if LZJSON_HAS_INCLUDE(<stacktrace>) && defined(__cpp_lib_stacktrace) && __cpp_lib_stacktrace >= 202011L
#define LZJSON_HAS_STACKTRACE 1
#endif

#ifdef _MSC_VER
#define LZJSON_ALWAYS_INLINE __forceinline
#elif LZJSON_HAS_ATTRIBUTE(always_inline)
#define LZJSON_ALWAYS_INLINE __attribute__((always_inline)) inline
#else
#define LZJSON_ALWAYS_INLINE inline
#endif

#ifdef _MSC_VER
#define LZJSON_NEVER_INLINE __declspec(noinline)
#elif LZJSON_HAS_ATTRIBUTE(noinline)
#define LZJSON_NEVER_INLINE __attribute__((noinline))
#else
#define LZJSON_NEVER_INLINE
#endif


// Enable runtime asserts in library code.
// 
// By default this is tied to NDEBUG, but you can change
// this by defining the macro yourself
// (if you want asserts in a Release build, for example)
// 
// You can also provide a custom assert by defining LZJSON_ASSERT().
// 
#ifndef LZJSON_USE_ASSERTS
#ifdef NDEBUG
#define LZJSON_USE_ASSERTS 0
#else
#define LZJSON_USE_ASSERTS 1
#endif
#endif

#if !defined(LZJSON_ASSERT) && LZJSON_USE_ASSERTS
#ifdef NDEBUG
#include <cstdio>
#include <exception>

namespace lzjson {
namespace internal {

LZJSON_NEVER_INLINE inline 
void assert_fail(const char* src_loc, const char* msg)
{
    std::fprintf(stderr, "\n%s: Assertion '%s' failed.", src_loc, msg);
    std::terminate();
}
}}
#define LZJSON_ASSERT(cond) \
(void)( \
    (!!(cond)) || \
    (::lzjson::internal::assert_fail(LZJSON_SRCLOC, #cond), 0) \
)
#else
#define LZJSON_ASSERT(cond) assert(cond)
#endif
#elif !defined(LZJSON_ASSERT)
#define LZJSON_ASSERT(cond)
#endif

#endif
