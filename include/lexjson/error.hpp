#pragma once

/// @file error.hpp
/// @brief Error types for lexjson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError (default)
///   - Via error_code: lexjson::errc enum + json_category() (exception-free)
///
/// Use try_parse(input) for exception-free parsing.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace lexjson {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief JSON error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Lexical errors (1-19)
    invalid_token           = 1,
    invalid_number          = 2,
    invalid_escape          = 3,
    unterminated_string     = 4,

    // Syntax errors (20-49)
    unexpected_end_of_input = 20,
    unexpected_token        = 21,
    expected_string         = 22,
    expected_colon          = 23,
    expected_comma          = 24,
    unterminated_array      = 25,
    unterminated_object     = 26,
    trailing_content        = 27,
    max_depth_exceeded      = 28,

    // Value access errors (50-79)
    type_mismatch           = 50,
    out_of_range            = 51,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class json_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "json";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::invalid_token:           return "invalid token";
            case errc::invalid_number:          return "invalid number";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_token:        return "unexpected token";
            case errc::expected_string:         return "expected string key";
            case errc::expected_colon:          return "expected colon";
            case errc::expected_comma:          return "expected comma";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::trailing_content:        return "trailing content after JSON";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::type_mismatch:           return "type mismatch";
            case errc::out_of_range:            return "index out of range";
            default:                            return "unknown json error";
        }
    }
};

} // namespace detail

/// @brief Get the json error category singleton.
inline const std::error_category& json_category() noexcept {
    static const detail::json_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from lexjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

/// @brief True for codes raised by the lexer rather than the grammar.
inline bool is_lexical_error(errc e) noexcept {
    const int v = static_cast<int>(e);
    return v > 0 && v < 20;
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Lexical or syntax error with source position information.
///
/// what() reads "JSON parse error at line L, column C: <message>", where the
/// message usually carries the offending source line and a caret (see
/// Lexer::format_error).
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_token)
        : std::system_error(make_error_code(code))
        , message_(format_message(message, loc))
        , location_(loc) {}

    /// system_error would append the category message; keep ours verbatim.
    const char* what() const noexcept override { return message_.c_str(); }

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    std::string message_;
    SourceLocation location_;
};

/// @brief Wrong input type, or type mismatch when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch)), message_(msg) {}

    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::out_of_range)), message_(msg) {}

    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = lexjson::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace lexjson

// Register lexjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<lexjson::errc> : true_type {};
} // namespace std
