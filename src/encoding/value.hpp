#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "utf8.hpp"

struct Value;

// Fixed-arity ordered sequence.
struct Tuple {
    std::vector<Value> items;
};

// Variable-length ordered sequence.
struct List {
    std::vector<Value> items;
};

// Key -> value mapping. Keys are unique; equality ignores insertion order.
// Members are defined out of line because Value is incomplete here.
class Mapping {
public:
    using Entry = std::pair<Value, Value>;

    Mapping() = default;
    // Later entries replace earlier ones with an equal key.
    explicit Mapping(std::vector<Entry> entries);

    // Insert or replace.
    void set(Value key, Value value);

    // nullptr when absent.
    const Value* find(const Value& key) const;

    size_t size() const;
    bool empty() const;
    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
};

bool operator==(const Tuple& a, const Tuple& b);
bool operator==(const List& a, const List& b);
bool operator==(const Mapping& a, const Mapping& b);
inline bool operator!=(const Tuple& a, const Tuple& b) { return !(a == b); }
inline bool operator!=(const List& a, const List& b) { return !(a == b); }
inline bool operator!=(const Mapping& a, const Mapping& b) { return !(a == b); }

// A value crossing the boundary between the text and byte representations.
struct Value {
    enum class Kind { None, Bool, Int, Float, Text, Bytes, Tuple, List, Mapping };

    using Variant = std::variant<std::monostate, bool, std::int64_t, double,
                                 Text, Bytes, Tuple, List, Mapping>;
    Variant v;

    Value() = default;
    explicit Value(Variant data) : v(std::move(data)) {}

    static Value none() { return Value{}; }
    static Value boolean(bool b) { return Value(Variant(b)); }
    static Value integer(std::int64_t i) { return Value(Variant(i)); }
    static Value real(double d) { return Value(Variant(d)); }
    // Decodes a UTF-8 literal; throws EncodingError when it is not valid UTF-8.
    static Value text(const std::string& utf8);
    static Value text(Text t) { return Value(Variant(std::move(t))); }
    static Value bytes(Bytes b) { return Value(Variant(std::move(b))); }
    static Value tuple(std::vector<Value> items);
    static Value list(std::vector<Value> items);
    static Value mapping(std::vector<Mapping::Entry> entries);

    Kind kind() const { return static_cast<Kind>(v.index()); }

    bool is_text() const { return kind() == Kind::Text; }
    bool is_bytes() const { return kind() == Kind::Bytes; }

    // Throw std::bad_variant_access on a kind mismatch.
    const Text& as_text() const { return std::get<Text>(v); }
    const Bytes& as_bytes() const { return std::get<Bytes>(v); }
    const Tuple& as_tuple() const { return std::get<Tuple>(v); }
    const List& as_list() const { return std::get<List>(v); }
    const Mapping& as_mapping() const { return std::get<Mapping>(v); }
};

inline bool operator==(const Value& a, const Value& b) { return a.v == b.v; }
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// None, false, zero and empty strings/containers are falsy.
bool is_truthy(const Value& value);

// Human-readable rendering for messages. Text and Bytes are written raw
// (Text as UTF-8, unencodable code points replaced by U+FFFD).
std::string to_display(const Value& value);

const char* kind_name(Value::Kind kind);
