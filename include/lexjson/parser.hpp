#pragma once

/// @file parser.hpp
/// @brief Recursive-descent parser over the lexjson token stream.
///
/// Features:
///   - Pulls tokens one at a time from a Lexer it owns (no shared state)
///   - Whitespace and newline tokens are legal between any two tokens
///   - Position-aware diagnostics with the offending source line and caret
///   - Exception-free parsing via try_parse() with error_code
///   - Recursion depth limiting to protect against stack overflow

#include "config.hpp"
#include "error.hpp"
#include "lexer.hpp"
#include "parse_options.hpp"
#include "token.hpp"
#include "value.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace lexjson {
namespace detail {

/// @brief Convert a number token ([+-]?(\d*\.)?\d+) to a double.
///
/// Up to 19 significant digits with at most 22 fractional digits are exact
/// in one multiply/divide; anything else goes through std::from_chars.
/// Magnitudes beyond double range become +-infinity, underflow becomes +-0.
inline double number_from_token(std::string_view text) noexcept {
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    static constexpr double kPow10[] = {
        1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,
        1e10, 1e11, 1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19,
        1e20, 1e21, 1e22
    };
    constexpr int kMaxMantissaDigits = 19;
    constexpr uint64_t kMaxExactMantissa = uint64_t{1} << 53;

    uint64_t mantissa = 0;
    int digits = 0;
    int frac_digits = 0;
    bool in_fraction = false;
    bool int_nonzero = false;
    bool fast = true;
    for (char c : text) {
        if (c == '.') { in_fraction = true; continue; }
        const auto d = static_cast<uint64_t>(c - '0');
        if (!in_fraction && d != 0) int_nonzero = true;
        if (mantissa == 0 && d == 0) {
            if (in_fraction) ++frac_digits;  // leading zeros carry no digits
            continue;
        }
        if (++digits > kMaxMantissaDigits) { fast = false; continue; }
        mantissa = mantissa * 10 + d;
        if (in_fraction) ++frac_digits;
    }

    if (LEXJSON_LIKELY(fast && mantissa <= kMaxExactMantissa && frac_digits <= 22)) {
        double d = static_cast<double>(mantissa) / kPow10[frac_digits];
        return negative ? -d : d;
    }

    double d = 0.0;
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
    (void)ptr;
    if (ec == std::errc::result_out_of_range) {
        d = int_nonzero ? std::numeric_limits<double>::infinity() : 0.0;
    }
#else
    // strtod needs a terminator; the token is a view into the source.
    const std::string buf(text);
    d = std::strtod(buf.c_str(), nullptr);
    if (std::isinf(d) && !int_nonzero) d = 0.0;
#endif
    return negative ? -d : d;
}

/// @brief Recursive-descent JSON parser.
class Parser {
public:
    /// @brief Parse a JSON string (with exceptions).
    [[nodiscard]] static Value parse(std::string_view input,
                                     const ParseOptions& opts = {}) {
        Parser p(input, opts);
        return p.parse_document();
    }

    /// @brief Parse a JSON string (no exceptions, error_code).
    [[nodiscard]] static result<Value> try_parse(std::string_view input,
                                                 const ParseOptions& opts = {}) {
        try {
            return {parse(input, opts), {}};
        } catch (const ParseError& e) {
            return {Value{}, e.code()};
        }
    }

private:
    Lexer lexer_;
    ParseOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;
    bool truncated_ = false;  ///< Lenient mode closed a container at end of input

    Parser(std::string_view input, const ParseOptions& opts) noexcept
        : lexer_(input), opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : LEXJSON_MAX_DEPTH) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    static std::string describe(const Token& tok) {
        constexpr size_t kMaxShown = 32;
        switch (tok.type) {
            case TokenType::LeftBrace:
            case TokenType::RightBrace:
            case TokenType::LeftBracket:
            case TokenType::RightBracket:
            case TokenType::Comma:
            case TokenType::Colon:
                return token_type_name(tok.type);
            default:
                break;
        }
        std::string shown(tok.text.substr(0, kMaxShown));
        if (tok.text.size() > kMaxShown) shown += "...";
        return std::string(token_type_name(tok.type)) + " '" + shown + "'";
    }

    [[noreturn]] LEXJSON_NOINLINE void fail(const Token& tok, const std::string& msg,
                                            errc code) const {
        throw ParseError(lexer_.format_error(tok, msg), tok.location, code);
    }

    [[noreturn]] LEXJSON_NOINLINE void fail_at_end(const std::string& msg, errc code) const {
        throw ParseError(lexer_.format_error(msg), lexer_.eof_location(), code);
    }

    [[noreturn]] LEXJSON_NOINLINE void fail_lexical(const Token& tok) const {
        switch (tok.error) {
            case errc::invalid_escape:
                fail(tok, "invalid escape sequence in string (only \\\" and \\\\ are allowed)",
                     tok.error);
            case errc::unterminated_string:
                fail(tok, "unterminated string", tok.error);
            case errc::invalid_number:
                fail(tok, "invalid number '" + std::string(tok.text) + "'", tok.error);
            default:
                fail(tok, "invalid token '" + std::string(tok.text) + "'", errc::invalid_token);
        }
    }

    // ─── Token stream ────────────────────────────────────────────────────

    /// Next token that is not whitespace or newline; lexical errors raise here.
    std::optional<Token> next_token() {
        for (;;) {
            auto tok = lexer_.next();
            if (!tok) return std::nullopt;
            if (tok->is_space()) continue;
            if (LEXJSON_UNLIKELY(tok->type == TokenType::Error)) fail_lexical(*tok);
            return tok;
        }
    }

    /// End of input where a value or key would start. In lenient mode the
    /// enclosing container is closed; otherwise it is an error.
    void end_of_container(errc code, const char* what) {
        if (opts_.allow_truncated_input) {
            truncated_ = true;
            return;
        }
        fail_at_end(std::string("unterminated ") + what, code);
    }

    /// End of input where a separator is required.
    void end_before_separator(errc code, const char* expected) {
        if (truncated_) return;  // an inner container already ran out of input
        fail_at_end(std::string("unexpected end of input, expected ") + expected, code);
    }

    // ─── Depth tracking ──────────────────────────────────────────────────

    void push_depth(const Token& open) {
        if (LEXJSON_UNLIKELY(++depth_ > max_depth_)) {
            fail(open, "maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }

    void pop_depth() noexcept { --depth_; }

    // ─── Grammar ─────────────────────────────────────────────────────────

    Value parse_document() {
        auto tok = next_token();
        if (!tok) return Value{};  // empty or whitespace-only source

        Value result = parse_value(*tok);
        if (!opts_.allow_trailing_content && !truncated_) {
            if (auto rest = next_token()) {
                fail(*rest, "unexpected trailing content " + describe(*rest),
                     errc::trailing_content);
            }
        }
        return result;
    }

    Value parse_value(const Token& tok) {
        switch (tok.type) {
            case TokenType::Boolean:
                return Value(tok.text == "true");
            case TokenType::Null:
                return Value(nullptr);
            case TokenType::Number:
                return Value(number_from_token(tok.text));
            case TokenType::String:
                return Value(tok.value);
            case TokenType::LeftBracket:
                return parse_array(tok);
            case TokenType::LeftBrace:
                return parse_object(tok);
            case TokenType::Error:
                fail_lexical(tok);
            default:
                fail(tok, "unexpected " + describe(tok) + ", expected a value",
                     errc::unexpected_token);
        }
    }

    Value parse_array(const Token& open) {
        push_depth(open);
        Array values;

        auto tok = next_token();
        if (!tok) {
            end_of_container(errc::unterminated_array, "array");
        } else if (tok->type != TokenType::RightBracket) {
            for (;;) {
                values.push_back(parse_value(*tok));

                auto sep = next_token();
                if (!sep) {
                    end_before_separator(errc::unterminated_array, "',' or ']'");
                    break;
                }
                if (sep->type == TokenType::RightBracket) break;
                if (sep->type != TokenType::Comma) {
                    fail(*sep, "expected comma or ']', got " + describe(*sep),
                         errc::expected_comma);
                }

                tok = next_token();
                if (!tok) {
                    end_of_container(errc::unterminated_array, "array");
                    break;
                }
            }
        }

        pop_depth();
        return Value(std::move(values));
    }

    Value parse_object(const Token& open) {
        push_depth(open);
        Object members;

        auto tok = next_token();
        if (!tok) {
            end_of_container(errc::unterminated_object, "object");
        } else if (tok->type != TokenType::RightBrace) {
            for (;;) {
                if (tok->type != TokenType::String) {
                    fail(*tok, "expected string key, got " + describe(*tok),
                         errc::expected_string);
                }
                std::string key(tok->value);

                auto colon = next_token();
                if (!colon) {
                    fail_at_end("unexpected end of input, expected ':'",
                                errc::unterminated_object);
                }
                if (colon->type != TokenType::Colon) {
                    fail(*colon, "expected colon, got " + describe(*colon),
                         errc::expected_colon);
                }

                tok = next_token();
                if (!tok) {
                    end_of_container(errc::unterminated_object, "object");
                    break;  // the dangling key is dropped
                }
                members.insert(std::move(key), parse_value(*tok));

                auto sep = next_token();
                if (!sep) {
                    end_before_separator(errc::unterminated_object, "',' or '}'");
                    break;
                }
                if (sep->type == TokenType::RightBrace) break;
                if (sep->type != TokenType::Comma) {
                    fail(*sep, "expected comma or '}', got " + describe(*sep),
                         errc::expected_comma);
                }

                tok = next_token();
                if (!tok) {
                    end_of_container(errc::unterminated_object, "object");
                    break;
                }
            }
        }

        pop_depth();
        return Value(std::move(members));
    }
};

} // namespace detail

// ─── Public parsing API ─────────────────────────────────────────────────────

/// @brief Parse JSON text (with exceptions).
/// @throws ParseError on a lexical or syntax error.
[[nodiscard]] inline Value parse(std::string_view input,
                                 const ParseOptions& opts = {}) {
    return detail::Parser::parse(input, opts);
}

/// @brief Parse a NUL-terminated string.
/// @throws TypeError if `input` is null.
[[nodiscard]] inline Value parse(const char* input,
                                 const ParseOptions& opts = {}) {
    if (LEXJSON_UNLIKELY(input == nullptr))
        throw TypeError("parse() expects text, got a null pointer");
    return detail::Parser::parse(std::string_view(input), opts);
}

/// @brief Parse JSON (no exceptions on bad input; result carries the errc).
[[nodiscard]] inline result<Value> try_parse(std::string_view input,
                                             const ParseOptions& opts = {}) {
    return detail::Parser::try_parse(input, opts);
}

/// @brief try_parse() for a NUL-terminated string; a null pointer yields
/// errc::type_mismatch.
[[nodiscard]] inline result<Value> try_parse(const char* input,
                                             const ParseOptions& opts = {}) {
    if (LEXJSON_UNLIKELY(input == nullptr)) return {Value{}, errc::type_mismatch};
    return detail::Parser::try_parse(std::string_view(input), opts);
}

} // namespace lexjson
