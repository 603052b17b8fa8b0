#pragma once

/// @file hash.hpp
/// @brief String hashing for the Object key index.
///
/// Multiply-xorshift mixing over 8-byte words; JSON keys are short, so most
/// keys hash in one or two loads.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace lexjson::detail {

/// @brief Transparent string hasher used by Object's lazy index.
struct StringHash {
    using is_transparent = void;

    static uint64_t mix(uint64_t h, uint64_t word) noexcept {
        constexpr uint64_t kMul = 0x9e3779b97f4a7c15ULL;
        h ^= word;
        h *= kMul;
        return h ^ (h >> 31);
    }

    static size_t hash(const char* data, size_t len) noexcept {
        uint64_t h = 0xcbf29ce484222325ULL ^ len;
        size_t i = 0;
        for (; i + 8 <= len; i += 8) {
            uint64_t word;
            std::memcpy(&word, data + i, 8);
            h = mix(h, word);
        }
        if (i < len) {
            uint64_t tail = 0;
            std::memcpy(&tail, data + i, len - i);
            h = mix(h, tail);
        }
        h ^= h >> 29;
        return static_cast<size_t>(h);
    }

    size_t operator()(std::string_view sv) const noexcept {
        return hash(sv.data(), sv.size());
    }

    size_t operator()(const std::string& s) const noexcept {
        return hash(s.data(), s.size());
    }
};

/// @brief Transparent comparator for heterogeneous lookup.
struct StringEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace lexjson::detail
