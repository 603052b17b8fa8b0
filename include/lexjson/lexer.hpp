#pragma once

/// @file lexer.hpp
/// @brief Pull-based tokenizer for the JSON subset accepted by lexjson.
///
/// Token rules, tried in order at each position:
///   WS       [ \t]+
///   NL       \n                      (advances the line counter)
///   number   [+-]?(\d*\.)?\d+        (no exponent)
///   string   "(\\["\\]|[^\n"\\])*"   (value is the raw content, not unescaped)
///   symbols  { } [ ] , :
///   keywords null, true, false
///
/// Input matching no rule comes back as a TokenType::Error token; the lexer
/// never throws.

#include "config.hpp"
#include "error.hpp"
#include "token.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexjson {

class Lexer {
public:
    explicit Lexer(std::string_view source) noexcept
        : src_(source) {}

    /// @brief Next token, or std::nullopt at end of input.
    std::optional<Token> next() noexcept {
        if (pos_ >= src_.size()) return std::nullopt;

        Token tok;
        tok.location = location();
        const size_t start = pos_;
        const char c = src_[pos_];

        if (c == ' ' || c == '\t') {
            while (pos_ < src_.size() && (src_[pos_] == ' ' || src_[pos_] == '\t')) ++pos_;
            tok.type = TokenType::Whitespace;
        } else if (c == '\n') {
            ++pos_;
            tok.type = TokenType::Newline;
        } else if (match_number()) {
            tok.type = TokenType::Number;
        } else if (c == '"') {
            lex_string(tok);
        } else if (const auto sym = symbol(c)) {
            ++pos_;
            tok.type = *sym;
        } else if (match_literal("null")) {
            tok.type = TokenType::Null;
        } else if (match_literal("true") || match_literal("false")) {
            tok.type = TokenType::Boolean;
        } else {
            skip_invalid_run();
            tok.type = TokenType::Error;
            tok.error = (c == '+' || c == '-' || c == '.') ? errc::invalid_number
                                                           : errc::invalid_token;
        }

        tok.text = src_.substr(start, pos_ - start);
        if (tok.type == TokenType::String) {
            tok.value = tok.text.substr(1, tok.text.size() - 2);
        } else {
            tok.value = tok.text;
        }
        advance_location(tok.text);
        return tok;
    }

    /// @brief Position of the next unread character.
    [[nodiscard]] SourceLocation location() const noexcept {
        SourceLocation loc;
        loc.line = line_;
        loc.column = column_;
        loc.offset = pos_;
        return loc;
    }

    [[nodiscard]] std::string_view source() const noexcept { return src_; }

    /// @brief Build a diagnostic for `tok`: the message, the token's source
    /// line, and a caret under the token's first column.
    [[nodiscard]] std::string format_error(const Token& tok, std::string_view message) const {
        return format_at(tok.location, message);
    }

    /// @brief Diagnostic for the end of input.
    [[nodiscard]] std::string format_error(std::string_view message) const {
        return format_at(eof_location(), message);
    }

    /// @brief Location just past the last character of the source.
    [[nodiscard]] SourceLocation eof_location() const noexcept {
        SourceLocation loc;
        loc.offset = src_.size();
        for (char c : src_) {
            if (c == '\n') { ++loc.line; loc.column = 1; }
            else ++loc.column;
        }
        return loc;
    }

private:
    std::string_view src_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    static bool is_digit(char c) noexcept {
        return static_cast<unsigned>(c - '0') <= 9u;
    }

    static std::optional<TokenType> symbol(char c) noexcept {
        switch (c) {
            case '{': return TokenType::LeftBrace;
            case '}': return TokenType::RightBrace;
            case '[': return TokenType::LeftBracket;
            case ']': return TokenType::RightBracket;
            case ',': return TokenType::Comma;
            case ':': return TokenType::Colon;
            default:  return std::nullopt;
        }
    }

    /// Characters that end an unmatched run.
    static bool is_boundary(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '"' || symbol(c).has_value();
    }

    bool match_literal(std::string_view word) noexcept {
        if (src_.compare(pos_, word.size(), word) != 0) return false;
        pos_ += word.size();
        return true;
    }

    /// [+-]?(\d*\.)?\d+: longest match; leaves pos_ untouched on failure.
    bool match_number() noexcept {
        size_t p = pos_;
        const size_t n = src_.size();
        if (p < n && (src_[p] == '+' || src_[p] == '-')) ++p;
        const size_t int_start = p;
        while (p < n && is_digit(src_[p])) ++p;
        const bool has_int = p > int_start;
        if (p + 1 < n && src_[p] == '.' && is_digit(src_[p + 1])) {
            p += 2;
            while (p < n && is_digit(src_[p])) ++p;
        } else if (!has_int) {
            return false;
        }
        pos_ = p;
        return true;
    }

    void lex_string(Token& tok) noexcept {
        size_t p = pos_ + 1;
        const size_t n = src_.size();
        while (p < n) {
            const char c = src_[p];
            if (c == '"') {
                pos_ = p + 1;
                tok.type = TokenType::String;
                return;
            }
            if (c == '\n') break;
            if (c == '\\') {
                if (p + 1 < n && (src_[p + 1] == '"' || src_[p + 1] == '\\')) {
                    p += 2;
                    continue;
                }
                if (p + 1 < n && src_[p + 1] != '\n') {
                    // Only \" and \\ are recognised.
                    pos_ = p + 2;
                    tok.type = TokenType::Error;
                    tok.error = errc::invalid_escape;
                    return;
                }
                ++p;
                break;
            }
            ++p;
        }
        pos_ = p;
        tok.type = TokenType::Error;
        tok.error = errc::unterminated_string;
    }

    void skip_invalid_run() noexcept {
        ++pos_;
        while (pos_ < src_.size() && !is_boundary(src_[pos_])) ++pos_;
    }

    void advance_location(std::string_view text) noexcept {
        for (char c : text) {
            if (c == '\n') { ++line_; column_ = 1; }
            else ++column_;
        }
    }

    std::string format_at(const SourceLocation& loc, std::string_view message) const {
        size_t line_start = loc.offset;
        while (line_start > 0 && src_[line_start - 1] != '\n') --line_start;
        size_t line_end = loc.offset;
        while (line_end < src_.size() && src_[line_end] != '\n') ++line_end;

        std::string out(message);
        out += '\n';
        out.append(src_.data() + line_start, line_end - line_start);
        out += '\n';
        out.append(loc.offset - line_start, ' ');
        out += '^';
        return out;
    }
};

/// @brief Drain a lexer over `source` into a vector, Error tokens included.
[[nodiscard]] inline std::vector<Token> tokenize(std::string_view source) {
    std::vector<Token> tokens;
    Lexer lexer(source);
    while (auto tok = lexer.next()) tokens.push_back(*tok);
    return tokens;
}

} // namespace lexjson
