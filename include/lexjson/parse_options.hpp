#pragma once

/// @file parse_options.hpp
/// @brief Parser leniency switches and limits.
///
/// The grammar itself is fixed (no comments, no trailing commas, no
/// exponents). The switches only relax how the end of the document is
/// treated.

#include <cstddef>

namespace lexjson {

/// @brief Parser configuration.
struct ParseOptions {
    /// End of input where the next array element, object key or object value
    /// would start closes the open containers instead of raising
    /// unterminated_array / unterminated_object. A key left without a value
    /// is dropped.
    bool allow_truncated_input  = false;

    /// Ignore whatever follows the first complete top-level value instead of
    /// raising trailing_content. The remainder is not lexed.
    bool allow_trailing_content = false;

    /// Maximum nesting depth (0 = use LEXJSON_MAX_DEPTH from config.hpp)
    size_t max_depth = 0;

    /// Strict mode: both switches off.
    static constexpr ParseOptions strict() noexcept {
        return {};
    }

    /// Lenient mode: truncated documents and trailing garbage tolerated.
    static constexpr ParseOptions lenient() noexcept {
        ParseOptions opts;
        opts.allow_truncated_input  = true;
        opts.allow_trailing_content = true;
        return opts;
    }
};

} // namespace lexjson
