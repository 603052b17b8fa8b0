#pragma once

/// @file lexjson.hpp
/// @brief Main header file for the lexjson library.
///
/// Entry points:
///   - parse(text)          text -> Value
///   - format(value, pretty) Value -> text
///   - beautify(text)       format(parse(text), true)

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "value.hpp"
#include "token.hpp"
#include "lexer.hpp"
#include "parse_options.hpp"
#include "parser.hpp"
#include "formatter.hpp"

#include <string>
#include <string_view>

namespace lexjson {

/// @brief Re-format JSON text in pretty mode.
/// @throws ParseError if `source` does not parse.
[[nodiscard]] inline std::string beautify(std::string_view source,
                                          const ParseOptions& opts = {}) {
    return format(parse(source, opts), true);
}

/// @brief beautify() for a NUL-terminated string.
/// @throws TypeError if `source` is null.
[[nodiscard]] inline std::string beautify(const char* source,
                                          const ParseOptions& opts = {}) {
    return format(parse(source, opts), true);
}

/// @brief beautify() without exceptions for bad input.
[[nodiscard]] inline result<std::string> try_beautify(std::string_view source,
                                                      const ParseOptions& opts = {}) {
    auto parsed = try_parse(source, opts);
    if (!parsed) return {std::string(), parsed.ec};
    return {format(parsed.value, true), {}};
}

/// @brief try_beautify() for a NUL-terminated string; a null pointer yields
/// errc::type_mismatch.
[[nodiscard]] inline result<std::string> try_beautify(const char* source,
                                                      const ParseOptions& opts = {}) {
    if (LEXJSON_UNLIKELY(source == nullptr)) return {std::string(), errc::type_mismatch};
    return try_beautify(std::string_view(source), opts);
}

} // namespace lexjson
