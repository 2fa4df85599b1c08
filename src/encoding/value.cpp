#include "value.hpp"
#include <fmt/format.h>
#include <algorithm>

Mapping::Mapping(std::vector<Entry> entries) {
    for (auto& e : entries) {
        set(std::move(e.first), std::move(e.second));
    }
}

void Mapping::set(Value key, Value value) {
    for (auto& e : entries_) {
        if (e.first == key) {
            e.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Mapping::find(const Value& key) const {
    for (const auto& e : entries_) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

size_t Mapping::size() const { return entries_.size(); }
bool Mapping::empty() const { return entries_.empty(); }

bool operator==(const Tuple& a, const Tuple& b) { return a.items == b.items; }
bool operator==(const List& a, const List& b) { return a.items == b.items; }

bool operator==(const Mapping& a, const Mapping& b) {
    if (a.size() != b.size()) return false;
    for (const auto& [key, value] : a.entries()) {
        const Value* other = b.find(key);
        if (!other || !(*other == value)) return false;
    }
    return true;
}

Value Value::text(const std::string& utf8) {
    return Value(Variant(decode_utf8(utf8)));
}

Value Value::tuple(std::vector<Value> items) {
    return Value(Variant(Tuple{std::move(items)}));
}

Value Value::list(std::vector<Value> items) {
    return Value(Variant(List{std::move(items)}));
}

Value Value::mapping(std::vector<Mapping::Entry> entries) {
    return Value(Variant(Mapping(std::move(entries))));
}

bool is_truthy(const Value& value) {
    return std::visit([](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return false;
        else if constexpr (std::is_same_v<T, bool>) return x;
        else if constexpr (std::is_same_v<T, std::int64_t>) return x != 0;
        else if constexpr (std::is_same_v<T, double>) return x != 0.0;
        else if constexpr (std::is_same_v<T, Tuple> || std::is_same_v<T, List>) return !x.items.empty();
        else return !x.empty();
    }, value.v);
}

static std::string display_text(const Text& t) {
    Text safe = t;
    std::replace_if(safe.begin(), safe.end(), [](char32_t c) {
        return (c >= 0xD800 && c <= 0xDFFF) || c > 0x10FFFF;
    }, U'\uFFFD');
    return encode_utf8(safe);
}

static std::string join_items(const std::vector<Value>& items) {
    std::string s;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) s += ", ";
        s += to_display(items[i]);
    }
    return s;
}

std::string to_display(const Value& value) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return "none";
        else if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
        else if constexpr (std::is_same_v<T, std::int64_t>) return std::to_string(x);
        else if constexpr (std::is_same_v<T, double>) return fmt::format("{}", x);
        else if constexpr (std::is_same_v<T, Text>) return display_text(x);
        else if constexpr (std::is_same_v<T, Bytes>) return x;
        else if constexpr (std::is_same_v<T, Tuple>) return "(" + join_items(x.items) + ")";
        else if constexpr (std::is_same_v<T, List>) return "[" + join_items(x.items) + "]";
        else {
            std::string s = "{";
            bool first = true;
            for (const auto& [k, v] : x.entries()) {
                if (!first) s += ", ";
                first = false;
                s += to_display(k) + ": " + to_display(v);
            }
            return s + "}";
        }
    }, value.v);
}

const char* kind_name(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::None:    return "none";
        case Value::Kind::Bool:    return "bool";
        case Value::Kind::Int:     return "int";
        case Value::Kind::Float:   return "float";
        case Value::Kind::Text:    return "text";
        case Value::Kind::Bytes:   return "bytes";
        case Value::Kind::Tuple:   return "tuple";
        case Value::Kind::List:    return "list";
        case Value::Kind::Mapping: return "mapping";
    }
    return "unknown";
}
