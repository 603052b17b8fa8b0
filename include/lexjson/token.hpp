#pragma once

/// @file token.hpp
/// @brief Lexical token produced by lexjson::Lexer.

#include "error.hpp"

#include <cstdint>
#include <string_view>

namespace lexjson {

/// Token classes, in the order the lexer tries them.
enum class TokenType : uint8_t {
    Whitespace,
    Newline,
    Number,
    String,
    LeftBrace,
    RightBrace,
    LeftBracket,
    RightBracket,
    Comma,
    Colon,
    Null,
    Boolean,
    Error
};

/// @brief Short name of a token type, as used in error messages.
inline const char* token_type_name(TokenType t) noexcept {
    switch (t) {
        case TokenType::Whitespace:   return "whitespace";
        case TokenType::Newline:      return "newline";
        case TokenType::Number:       return "number";
        case TokenType::String:       return "string";
        case TokenType::LeftBrace:    return "'{'";
        case TokenType::RightBrace:   return "'}'";
        case TokenType::LeftBracket:  return "'['";
        case TokenType::RightBracket: return "']'";
        case TokenType::Comma:        return "comma";
        case TokenType::Colon:        return "colon";
        case TokenType::Null:         return "null";
        case TokenType::Boolean:      return "boolean";
        case TokenType::Error:        return "invalid input";
    }
    return "unknown";
}

/// @brief One classified lexical unit.
///
/// text and value are views into the lexer's source buffer and stay valid
/// only as long as that buffer does.
struct Token {
    TokenType type = TokenType::Error;
    std::string_view text;   ///< Raw matched characters
    std::string_view value;  ///< text, minus the quotes for strings
    SourceLocation location;
    errc error = errc::ok;   ///< Set for TokenType::Error only

    [[nodiscard]] bool is_space() const noexcept {
        return type == TokenType::Whitespace || type == TokenType::Newline;
    }
};

} // namespace lexjson
