/*
Module Name:
- attributes.hpp

Abstract:
- Cross-compiler wrappers for the branch and inlining hints used on the hot
  paths (URL encoding, UTF-8 validation, chunk accumulation).
- Unifies spelling across MSVC, Clang, and GCC so call sites stay portable.

Provided Macros:
- COURIER_FORCE_INLINE
- COURIER_LIKELY(x), COURIER_UNLIKELY(x)

Notes:
- Hints guide code generation only and do not change semantics.
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

// COURIER_FORCE_INLINE
#if !defined(COURIER_NO_FORCE_INLINE)
#if defined(_MSC_VER)
#define COURIER_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#if __has_attribute(always_inline) || defined(__GNUC__)
#define COURIER_FORCE_INLINE inline __attribute__((always_inline))
#else
#define COURIER_FORCE_INLINE inline
#endif
#else
#define COURIER_FORCE_INLINE inline
#endif
#else
#define COURIER_FORCE_INLINE inline
#endif

// COURIER_LIKELY / COURIER_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define COURIER_LIKELY(x) (__builtin_expect(!!(x), 1))
#define COURIER_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define COURIER_LIKELY(x) (x)
#define COURIER_UNLIKELY(x) (x)
#endif
