#pragma once

/// @file value.hpp
/// @brief Library core: Value, a tagged union over the six JSON variants.
///
/// Implementation:
///   - Type tag + union payload; scalars stored inline
///   - String, Array and Object payloads heap-allocated and exclusively owned
///   - Deep copy on copy, pointer steal on move
///   - Numbers are always IEEE doubles

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace lexjson {

struct FormatOptions;

class Value {
public:
    Value() noexcept : kind_(Type::Null) { u_.d = 0.0; }
    Value(std::nullptr_t) noexcept : kind_(Type::Null) { u_.d = 0.0; }
    Value(bool v) noexcept : kind_(Type::Boolean) { u_.d = 0.0; u_.b = v; }
    Value(int v) noexcept : kind_(Type::Number) { u_.d = static_cast<double>(v); }
    Value(int64_t v) noexcept : kind_(Type::Number) { u_.d = static_cast<double>(v); }
    Value(unsigned v) noexcept : kind_(Type::Number) { u_.d = static_cast<double>(v); }
    Value(uint64_t v) noexcept : kind_(Type::Number) { u_.d = static_cast<double>(v); }
    Value(double v) noexcept : kind_(Type::Number) { u_.d = v; }
    /// Remaining integer kinds (long long on LP64, long on LLP64, short, ...).
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T v) noexcept : kind_(Type::Number) { u_.d = static_cast<double>(v); }
    Value(const char* v) : kind_(Type::String) { u_.str = new std::string(v ? v : ""); }
    Value(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }
    Value(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    Value(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    Value(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    Value(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    Value(const Value& o) : kind_(o.kind_) { copy_payload(o); }
    Value(Value&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;  // destroy() on the source becomes a no-op
    }
    Value& operator=(const Value& o) {
        if (this != &o) { Value tmp(o); swap(tmp); }
        return *this;
    }
    Value& operator=(Value&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~Value() { destroy(); }

    void swap(Value& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static Value array() { return Value(Array{}); }
    [[nodiscard]] static Value object() { return Value(Object{}); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()   const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return kind_ == Type::Boolean; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == Type::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()  const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Type::Object; }

    bool as_bool() const {
        if (LEXJSON_UNLIKELY(!is_bool())) type_mismatch("boolean");
        return u_.b;
    }
    double as_number() const {
        if (LEXJSON_UNLIKELY(!is_number())) type_mismatch("number");
        return u_.d;
    }
    [[nodiscard]] std::string_view as_string_view() const {
        if (LEXJSON_UNLIKELY(!is_string())) type_mismatch("string");
        return *u_.str;
    }
    [[nodiscard]] const std::string& as_string() const {
        if (LEXJSON_UNLIKELY(!is_string())) type_mismatch("string");
        return *u_.str;
    }
    [[nodiscard]] const Array& as_array() const {
        if (LEXJSON_UNLIKELY(!is_array())) type_mismatch("array");
        return *u_.arr;
    }
    Array& as_array() {
        if (LEXJSON_UNLIKELY(!is_array())) type_mismatch("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (LEXJSON_UNLIKELY(!is_object())) type_mismatch("object");
        return *u_.obj;
    }
    Object& as_object() {
        if (LEXJSON_UNLIKELY(!is_object())) type_mismatch("object");
        return *u_.obj;
    }

    Value& operator[](size_t index) {
        auto& a = as_array();
        if (LEXJSON_UNLIKELY(index >= a.size())) index_out_of_range(index, a.size());
        return a[index];
    }
    const Value& operator[](size_t index) const {
        const auto& a = as_array();
        if (LEXJSON_UNLIKELY(index >= a.size())) index_out_of_range(index, a.size());
        return a[index];
    }
    Value& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    Value& operator[](std::string_view key) { return as_object()[key]; }
    const Value& operator[](std::string_view key) const { return as_object().at(key); }
    Value& operator[](const char* key) { return operator[](std::string_view(key)); }
    const Value& operator[](const char* key) const { return operator[](std::string_view(key)); }
    Value& operator[](const std::string& key) { return operator[](std::string_view(key)); }
    const Value& operator[](const std::string& key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const Value* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] Value* find(std::string_view key) {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        return false;
    }

    void push_back(const Value& v) { as_array().push_back(v); }
    void push_back(Value&& v)      { as_array().push_back(std::move(v)); }

    void insert(std::string key, Value v) { as_object().insert(std::move(key), std::move(v)); }
    bool erase(std::string_view key) { return as_object().erase(key); }
    void clear() {
        if (is_array())  { u_.arr->clear(); return; }
        if (is_object()) { u_.obj->clear(); return; }
    }

    [[nodiscard]] bool operator==(const Value& other) const {
        if (kind_ != other.kind_) return false;
        switch (kind_) {
            case Type::Null:    return true;
            case Type::Boolean: return u_.b == other.u_.b;
            case Type::Number:  return u_.d == other.u_.d;
            case Type::String:  return *u_.str == *other.u_.str;
            case Type::Array:   return *u_.arr == *other.u_.arr;
            case Type::Object:  return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

    /// Defined in formatter.hpp.
    [[nodiscard]] std::string dump(bool pretty = false) const;
    [[nodiscard]] std::string dump(const FormatOptions& opts) const;

private:
    Type kind_;
    union Payload {
        bool b;
        double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    [[noreturn]] LEXJSON_NOINLINE void type_mismatch(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    [[noreturn]] LEXJSON_NOINLINE static void index_out_of_range(size_t index, size_t size) {
        throw OutOfRangeError("array index " + std::to_string(index) +
                              " out of range (size=" + std::to_string(size) + ")");
    }

    void copy_payload(const Value& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default:           u_ = o.u_; break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
    }
};

// ─── Object member functions ──────────────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries_(o.entries_) {}
inline Object::Object(Object&& o) noexcept
    : entries_(std::move(o.entries_)), index_(std::move(o.index_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) { entries_ = o.entries_; index_.reset(); }
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) { entries_ = std::move(o.entries_); index_ = std::move(o.index_); }
    return *this;
}
inline Object::Object(std::initializer_list<value_type> init) {
    for (const auto& [k, v] : init) insert(k, v);
}

inline void Object::rebuild_index() const {
    if (!index_) {
        index_ = std::make_unique<index_type>(entries_.size() * 2);
    } else {
        index_->clear();
    }
    for (size_type i = 0; i < entries_.size(); ++i)
        (*index_)[std::string_view(entries_[i].first)] = i;
}

inline void Object::append(std::string key, Value value) {
    const auto* old_data = entries_.data();
    entries_.emplace_back(std::move(key), std::move(value));
    if (!index_) return;
    if (entries_.data() != old_data) {
        // Reallocation moved every key; the views are dangling.
        rebuild_index();
    } else {
        index_->emplace(std::string_view(entries_.back().first), entries_.size() - 1);
    }
}

inline Value* Object::find(std::string_view key) noexcept {
    return const_cast<Value*>(static_cast<const Object&>(*this).find(key));
}
inline const Value* Object::find(std::string_view key) const noexcept {
    if (use_index()) {
        if (!index_) rebuild_index();
        auto it = index_->find(key);
        return it != index_->end() ? &entries_[it->second].second : nullptr;
    }
    for (const auto& [k, v] : entries_) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

inline Value& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    append(std::string(key), Value{});
    return entries_.back().second;
}
inline const Value& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (LEXJSON_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}
inline void Object::insert(std::string key, Value value) {
    if (auto* p = find(key)) { *p = std::move(value); return; }
    append(std::move(key), std::move(value));
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            index_.reset();  // positions shifted
            return true;
        }
    }
    return false;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, val] : entries_) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace lexjson
