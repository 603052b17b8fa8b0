#pragma once

/// @file config.hpp
/// @brief Configuration macros for the lexjson library.
///
/// Controls:
///   - Branch prediction hints
///   - Parser nesting limit
///   - Object hash-index threshold

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define LEXJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define LEXJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define LEXJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define LEXJSON_LIKELY(x)   (x)
    #define LEXJSON_UNLIKELY(x) (x)
    #define LEXJSON_NOINLINE    __declspec(noinline)
#else
    #define LEXJSON_LIKELY(x)   (x)
    #define LEXJSON_UNLIKELY(x) (x)
    #define LEXJSON_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================

#if !defined(LEXJSON_MAX_DEPTH)
    #define LEXJSON_MAX_DEPTH 512
#endif

// =====================================================================
// Small object threshold for linear vs hash lookup
// =====================================================================

#if !defined(LEXJSON_OBJECT_INDEX_THRESHOLD)
    #define LEXJSON_OBJECT_INDEX_THRESHOLD 16
#endif
