#pragma once

/// @file formatter.hpp
/// @brief Value -> JSON text, compact or shallow-pretty.
///
/// Pretty mode only changes separators: ", " between array elements,
/// ": " after keys and ",\n" between object members. Nested levels are not
/// indented.
///
/// Strings are written between quotes exactly as stored. Parsed strings keep
/// their raw \" and \\ escapes, so parse -> format round-trips; trees built by
/// hand that contain quotes or control characters need escape_strings.

#include "config.hpp"
#include "detail/dtoa.hpp"
#include "value.hpp"

#include <cmath>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>

namespace lexjson {

/// @brief Formatting options.
struct FormatOptions {
    bool pretty = false;         ///< Spaces after ':' and ',', newline between members
    bool escape_strings = false; ///< Escape '"', '\\' and control characters
    bool allow_nan_inf = false;  ///< Write NaN/Infinity instead of null
};

namespace detail {

inline constexpr char kHexDigits[16] = {
    '0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'
};

/// @brief Output adapter: buffered writing to std::string.
class StringOutput {
public:
    StringOutput() = default;
    StringOutput(const StringOutput&) = delete;
    StringOutput& operator=(const StringOutput&) = delete;

    void write(char c) {
        if (LEXJSON_UNLIKELY(pos_ >= kBufSize)) flush();
        buf_[pos_++] = c;
    }

    void write(const char* s, size_t n) {
        if (LEXJSON_LIKELY(pos_ + n <= kBufSize)) {
            std::memcpy(buf_ + pos_, s, n);
            pos_ += n;
        } else {
            flush();
            result_.append(s, n);
        }
    }

    std::string& result() {
        flush();
        return result_;
    }

private:
    static constexpr size_t kBufSize = 4096;

    char buf_[kBufSize];
    size_t pos_ = 0;
    std::string result_;

    void flush() {
        if (pos_ > 0) {
            result_.append(buf_, pos_);
            pos_ = 0;
        }
    }
};

/// @brief Output adapter: writes straight through to a std::ostream.
class StreamOutput {
public:
    explicit StreamOutput(std::ostream& os) noexcept : os_(os) {}

    StreamOutput(const StreamOutput&) = delete;
    StreamOutput& operator=(const StreamOutput&) = delete;

    void write(char c) { os_.put(c); }
    void write(const char* s, size_t n) { os_.write(s, static_cast<std::streamsize>(n)); }

private:
    std::ostream& os_;
};

/// @brief Structural walk; Pretty is fixed at compile time so compact mode
/// carries no separator branches.
template <typename Output, bool Pretty>
class FormatterCore {
public:
    FormatterCore(Output& out, const FormatOptions& opts) noexcept
        : out_(out), opts_(opts) {}

    void write_value(const Value& v) {
        switch (v.type()) {
            case Type::Null:
                out_.write("null", 4);
                break;
            case Type::Boolean:
                if (v.as_bool()) out_.write("true", 4);
                else out_.write("false", 5);
                break;
            case Type::Number:
                write_number(v.as_number());
                break;
            case Type::String:
                write_string(v.as_string_view());
                break;
            case Type::Array:
                write_array(v.as_array());
                break;
            case Type::Object:
                write_object(v.as_object());
                break;
        }
    }

private:
    Output& out_;
    const FormatOptions& opts_;

    void write_number(double val) {
        if (LEXJSON_UNLIKELY(!std::isfinite(val))) {
            if (!opts_.allow_nan_inf) {
                out_.write("null", 4);
            } else if (std::isnan(val)) {
                out_.write("NaN", 3);
            } else {
                if (val < 0) out_.write('-');
                out_.write("Infinity", 8);
            }
            return;
        }
        char buf[kMaxNumberChars];
        out_.write(buf, format_double(buf, val));
    }

    void write_string(std::string_view s) {
        out_.write('"');
        if (opts_.escape_strings) write_escaped(s);
        else out_.write(s.data(), s.size());
        out_.write('"');
    }

    void write_escaped(std::string_view s) {
        const char* run = s.data();
        const char* const end = s.data() + s.size();
        for (const char* p = run; p < end; ++p) {
            const auto c = static_cast<unsigned char>(*p);
            if (c >= 0x20 && c != '"' && c != '\\') continue;
            out_.write(run, static_cast<size_t>(p - run));
            run = p + 1;
            switch (c) {
                case '"':  out_.write("\\\"", 2); break;
                case '\\': out_.write("\\\\", 2); break;
                case '\b': out_.write("\\b", 2); break;
                case '\f': out_.write("\\f", 2); break;
                case '\n': out_.write("\\n", 2); break;
                case '\r': out_.write("\\r", 2); break;
                case '\t': out_.write("\\t", 2); break;
                default: {
                    const char esc[6] = {'\\', 'u', '0', '0',
                                         kHexDigits[c >> 4], kHexDigits[c & 0xF]};
                    out_.write(esc, 6);
                }
            }
        }
        out_.write(run, static_cast<size_t>(end - run));
    }

    void write_array(const Array& arr) {
        out_.write('[');
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                if constexpr (Pretty) out_.write(", ", 2);
                else out_.write(',');
            }
            write_value(arr[i]);
        }
        out_.write(']');
    }

    void write_object(const Object& obj) {
        out_.write('{');
        bool first = true;
        for (const auto& [key, value] : obj) {
            if (!first) {
                if constexpr (Pretty) out_.write(",\n", 2);
                else out_.write(',');
            }
            first = false;
            write_string(key);
            if constexpr (Pretty) out_.write(": ", 2);
            else out_.write(':');
            write_value(value);
        }
        out_.write('}');
    }
};

template <typename Output>
void format_to(Output& out, const Value& value, const FormatOptions& opts) {
    if (opts.pretty) FormatterCore<Output, true>(out, opts).write_value(value);
    else             FormatterCore<Output, false>(out, opts).write_value(value);
}

} // namespace detail

// ─── Public formatting API ──────────────────────────────────────────────────

/// @brief Format with explicit options.
[[nodiscard]] inline std::string format(const Value& value, const FormatOptions& opts) {
    detail::StringOutput out;
    detail::format_to(out, value, opts);
    return std::move(out.result());
}

/// @brief Format compact (default) or pretty.
[[nodiscard]] inline std::string format(const Value& value, bool pretty = false) {
    FormatOptions opts;
    opts.pretty = pretty;
    return format(value, opts);
}

/// @brief Format to a stream.
inline void format(std::ostream& os, const Value& value, const FormatOptions& opts = {}) {
    detail::StreamOutput out(os);
    detail::format_to(out, value, opts);
}

/// @brief Stream a value as compact JSON.
inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    format(os, value);
    return os;
}

inline std::string Value::dump(bool pretty) const {
    return format(*this, pretty);
}

inline std::string Value::dump(const FormatOptions& opts) const {
    return format(*this, opts);
}

} // namespace lexjson
