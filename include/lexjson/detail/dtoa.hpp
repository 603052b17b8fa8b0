#pragma once

/// @file detail/dtoa.hpp
/// @brief Double-to-text conversion for the formatter.
///
/// Output is the shortest digit string that reads back to the same double,
/// always in plain positional notation: the lexer has no exponent syntax, so
/// 1e21 prints as "1000000000000000000000" and 1e-7 as "0.0000001".
///
/// Paths:
///   1. Integer fast path: integral values up to 2^53 via the digit-pair table.
///   2. General case: std::to_chars (shortest round-trip, scientific form),
///      then the exponent is expanded into leading/trailing zeros.

#include "../config.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace lexjson::detail {

// ─── Tables ──────────────────────────────────────────────────────────────────

/// Two-digit pair table "00".."99".
inline constexpr char kDigitPairs[201] =
    "00010203040506070809"
    "10111213141516171819"
    "20212223242526272829"
    "30313233343536373839"
    "40414243444546474849"
    "50515253545556575859"
    "60616263646566676869"
    "70717273747576777879"
    "80818283848586878889"
    "90919293949596979899";

/// Maximum safe integer representable in IEEE 754 double (2^53).
inline constexpr double kMaxSafeInteger = 9007199254740992.0;

/// Decimal point position range of finite doubles: 5e-324 .. 1.8e308.
inline constexpr int kMinDecimalPoint = -323;
inline constexpr int kMaxDecimalPoint = 309;

/// Longest plain-notation double: sign, "0.", 323 zeros, 17 digits.
inline constexpr size_t kMaxNumberChars = 352;

// ─── Integer formatting ─────────────────────────────────────────────────────────

inline int count_digits(uint64_t val) noexcept {
    int count = 1;
    while (val >= 10) {
        val /= 10;
        ++count;
    }
    return count;
}

/// @brief uint64_t to decimal ASCII, two digits per step.
/// @return Pointer past the last written character.
inline char* write_u64(char* buf, uint64_t val) noexcept {
    const int len = count_digits(val);
    char* p = buf + len;

    while (val >= 100) {
        const auto idx = static_cast<unsigned>((val % 100) * 2);
        val /= 100;
        p -= 2;
        std::memcpy(p, kDigitPairs + idx, 2);
    }
    if (val >= 10) {
        std::memcpy(buf, kDigitPairs + val * 2, 2);
    } else {
        *buf = static_cast<char>('0' + val);
    }
    return buf + len;
}

// ─── Double to string conversion ───────────────────────────────────────────

/// @brief Shortest significant digits of `val` (> 0, finite) and the decimal
/// exponent of the first digit: val = 0.d1d2d3... * 10^(point).
/// @return Number of digits written to `digits` (>= 32 bytes).
inline int shortest_digits(double val, char* digits, int& point) noexcept {
    char sci[40];
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    auto [end, ec] = std::to_chars(sci, sci + sizeof(sci), val, std::chars_format::scientific);
    (void)ec;
    const int len = static_cast<int>(end - sci);
#else
    const int len = std::snprintf(sci, sizeof(sci), "%.16e", val);
#endif
    // sci = d[.ddd]e[+-]XX, not NUL-terminated
    int n = 0;
    int i = 0;
    for (; i < len && sci[i] != 'e'; ++i) {
        if (sci[i] != '.') digits[n++] = sci[i];
    }
    while (n > 1 && digits[n - 1] == '0') --n;  // %.16e pads with zeros

    int exp10 = 0;
    bool exp_negative = false;
    if (++i < len && (sci[i] == '+' || sci[i] == '-')) exp_negative = sci[i++] == '-';
    for (; i < len && sci[i] >= '0' && sci[i] <= '9'; ++i) exp10 = exp10 * 10 + (sci[i] - '0');
    if (exp_negative) exp10 = -exp10;

    point = std::clamp(exp10 + 1, kMinDecimalPoint, kMaxDecimalPoint);
    return n;
}

/// @brief Format a finite double in plain notation.
///
/// Guarantees:
///   - Output matches the lexer's number rule [+-]?(\d*\.)?\d+
///   - Roundtrip: the lexed text converts back to exactly `val`
///   - Integral values have no fractional part; -0 prints "0"
///
/// @param buf Output buffer (>= kMaxNumberChars bytes).
/// @return Number of characters written.
inline size_t format_double(char* buf, double val) noexcept {
    char* const start = buf;

    if (val == 0.0) {
        *buf = '0';
        return 1;
    }
    if (val < 0) {
        *buf++ = '-';
        val = -val;
    }

    if (val <= kMaxSafeInteger && val == std::floor(val)) {
        buf = write_u64(buf, static_cast<uint64_t>(val));
        return static_cast<size_t>(buf - start);
    }

    char digits[32];
    int point = 0;
    const int n = shortest_digits(val, digits, point);

    if (point >= n) {
        // Integer beyond 2^53: digits then zeros.
        std::memcpy(buf, digits, static_cast<size_t>(n));
        buf += n;
        for (int i = n; i < point; ++i) *buf++ = '0';
    } else if (point > 0) {
        std::memcpy(buf, digits, static_cast<size_t>(point));
        buf += point;
        *buf++ = '.';
        std::memcpy(buf, digits + point, static_cast<size_t>(n - point));
        buf += n - point;
    } else {
        *buf++ = '0';
        *buf++ = '.';
        for (int i = 0; i < -point; ++i) *buf++ = '0';
        std::memcpy(buf, digits, static_cast<size_t>(n));
        buf += n;
    }
    return static_cast<size_t>(buf - start);
}

} // namespace lexjson::detail
