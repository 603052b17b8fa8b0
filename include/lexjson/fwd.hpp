#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for lexjson.

#include "config.hpp"
#include "detail/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lexjson {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;

/// JSON value types
enum class Type : uint8_t {
    Null    = 0,
    Boolean = 1,
    Number  = 2,
    String  = 3,
    Array   = 4,
    Object  = 5
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:    return "null";
        case Type::Boolean: return "boolean";
        case Type::Number:  return "number";
        case Type::String:  return "string";
        case Type::Array:   return "array";
        case Type::Object:  return "object";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// JSON array: ordered collection of values.
using Array = std::vector<Value>;

/// @brief JSON object: insertion-ordered key-value pairs, keys unique.
///
/// Entries live in a vector so iteration follows insertion order. Once the
/// object reaches kIndexThreshold entries a hash index (key -> position) is
/// built lazily and dropped on any mutation that shifts positions.
struct Object {
    using value_type   = std::pair<std::string, Value>;
    using storage_type = std::vector<value_type>;
    using size_type    = size_t;
    /// Keys are views into entries[i].first; rebuilt whenever entries move.
    using index_type   = std::unordered_map<std::string_view, size_type,
                                            detail::StringHash,
                                            detail::StringEqual>;

    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}. Later duplicates
    /// overwrite earlier ones.
    Object(std::initializer_list<value_type> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries_.empty(); }
    size_type size() const noexcept { return entries_.size(); }
    void reserve(size_type n) { entries_.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries_.begin(); }
    auto end()   noexcept { return entries_.end(); }
    auto begin()  const noexcept { return entries_.begin(); }
    auto end()    const noexcept { return entries_.end(); }
    auto cbegin() const noexcept { return entries_.cbegin(); }
    auto cend()   const noexcept { return entries_.cend(); }

    // ─── Lookup and mutation (defined in value.hpp) ─────────────────────

    Value* find(std::string_view key) noexcept;
    const Value* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Access or create (as null) an element by key.
    Value& operator[](std::string_view key);

    /// Const access by key. Throws OutOfRangeError if not found.
    const Value& at(std::string_view key) const;

    /// Insert or overwrite. An existing key keeps its position.
    void insert(std::string key, Value value);

    bool erase(std::string_view key);

    void clear() noexcept {
        entries_.clear();
        index_.reset();
    }

    /// Mapping equality: same key set, equal values, order ignored.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

    const storage_type& storage() const noexcept { return entries_; }

private:
    static constexpr size_type kIndexThreshold = LEXJSON_OBJECT_INDEX_THRESHOLD;

    storage_type entries_;
    mutable std::unique_ptr<index_type> index_;

    bool use_index() const noexcept { return entries_.size() >= kIndexThreshold; }
    void rebuild_index() const;
    void append(std::string key, Value value);
};

} // namespace lexjson
